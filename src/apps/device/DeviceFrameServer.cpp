// DeviceFrameServer.cpp
#include "apps/device/DeviceFrameServer.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>

#include "net/Socket.hpp"
#include "os/rtos.hpp"

namespace device {

static inline DeviceFrameServerConfig sanitise(const DeviceFrameServerConfig& in) {
    DeviceFrameServerConfig cfg = in;

    if (cfg.backlog < 1) cfg.backlog = 1;
    if (cfg.recv_buf_bytes < 16) cfg.recv_buf_bytes = 16;
    if (cfg.recv_buf_bytes > 64 * 1024) cfg.recv_buf_bytes = 64 * 1024;
    if (cfg.recv_timeout_ms == 0) cfg.recv_timeout_ms = 1000;

    if (cfg.bitmap_w == 0) cfg.bitmap_w = 240;
    if (cfg.bitmap_h == 0) cfg.bitmap_h = 320;

    return cfg;
}

DeviceFrameServer::DeviceFrameServer(cam::CameraService& camera, const DeviceFrameServerConfig& cfg)
: m_camera(camera)
, m_cfg(sanitise(cfg)) {}

DeviceFrameServer::~DeviceFrameServer() {
    Stop();
}

bool DeviceFrameServer::Start() {
    if (m_listen_fd >= 0) return true;

    m_status = Status::OK;
    m_errno  = 0;

    m_listen_fd = net::ListenTcp(m_cfg.port, m_cfg.backlog, &m_bound_port);
    if (m_listen_fd < 0) {
        (void)fail(Status::LISTEN_FAIL);
        std::cerr << "[DEVICE] listen on port " << m_cfg.port << " failed errno=" << m_errno
                  << " " << std::strerror(m_errno) << "\n";
        return false;
    }

    m_running.store(true);
    std::cout << "[DEVICE] listening on port " << m_bound_port
              << " (bitmap " << m_cfg.bitmap_w << "x" << m_cfg.bitmap_h << ")\n";
    return true;
}

void DeviceFrameServer::Run() {
    if (m_listen_fd < 0) {
        (void)fail(Status::NOT_RUNNING);
        return;
    }

    while (m_running.load()) {
        std::string peer;
        int fd = net::AcceptClient(m_listen_fd, &peer);
        if (fd < 0) {
            if (!m_running.load()) break;
            (void)fail(Status::ACCEPT_FAIL);
            std::cerr << "[DEVICE] accept failed errno=" << m_errno
                      << " " << std::strerror(m_errno) << "\n";
            Rtos::SleepMs(100);
            continue;
        }

        ++m_sessions;
        std::cout << "[DEVICE] client connected: " << peer << "\n";

        m_session_fd.store(fd);
        serveConnection(fd);
        m_session_fd.store(-1);

        net::Close(fd);
        std::cout << "[DEVICE] client disconnected: " << peer << "\n";
    }

    std::cout << "[DEVICE] stopped (served=" << m_frames_served.load()
              << " failed=" << m_cmds_failed.load() << ")\n";
}

void DeviceFrameServer::RequestStop() {
    m_running.store(false);
    if (m_listen_fd >= 0) net::Shutdown(m_listen_fd);

    const int sfd = m_session_fd.load();
    if (sfd >= 0) net::Shutdown(sfd);
}

void DeviceFrameServer::Stop() {
    m_running.store(false);
    net::Close(m_listen_fd);
}

void DeviceFrameServer::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self) return;

    ctx->self->Run();
}

// -------------------- protocol --------------------

DeviceFrameServer::Command DeviceFrameServer::ParseCommand(const uint8_t* data, std::size_t n) {
    std::size_t b = 0;
    std::size_t e = n;
    while (b < e && std::isspace(data[b])) ++b;
    while (e > b && std::isspace(data[e - 1])) --e;

    if (b == e) return Command::EMPTY;

    const std::size_t len = e - b;
    if (len == std::strlen(CMD_GET_FRAME) && std::memcmp(data + b, CMD_GET_FRAME, len) == 0) {
        return Command::GET_FRAME;
    }
    return Command::UNKNOWN;
}

void DeviceFrameServer::BuildFrameResponse(const msg::Bitmap1bpp& bmp, std::vector<uint8_t>& out) {
    const uint32_t n = static_cast<uint32_t>(bmp.bits.size());
    const std::size_t ok_len = std::strlen(RESP_OK);

    out.clear();
    out.reserve(ok_len + LEN_PREFIX_BYTES + n);
    out.insert(out.end(), RESP_OK, RESP_OK + ok_len);

    out.push_back(static_cast<uint8_t>(n & 0xFF));
    out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((n >> 24) & 0xFF));

    out.insert(out.end(), bmp.bits.begin(), bmp.bits.end());
}

// -------------------- private helpers --------------------

void DeviceFrameServer::serveConnection(int fd) {
    (void)net::SetRecvTimeout(fd, m_cfg.recv_timeout_ms);

    std::vector<uint8_t> buf(m_cfg.recv_buf_bytes);

    while (m_running.load()) {
        std::size_t got = 0;
        const net::IoStatus io = net::RecvSome(fd, buf.data(), buf.size(), got);

        if (io == net::IoStatus::TIMEOUT) continue;
        if (io == net::IoStatus::CLOSED) return;
        if (io == net::IoStatus::ERROR) {
            (void)fail(Status::RECV_FAIL);
            return;
        }

        const Command cmd = ParseCommand(buf.data(), got);
        if (cmd == Command::EMPTY) continue;

        if (!handleCommand(fd, cmd)) return;
    }
}

bool DeviceFrameServer::handleCommand(int fd, Command cmd) {
    if (cmd == Command::GET_FRAME) {
        msg::Bitmap1bpp bmp;
        cam::CameraService::Status why = cam::CameraService::Status::OK;
        if (m_camera.CaptureDeviceBitmap(m_cfg.bitmap_w, m_cfg.bitmap_h, bmp, &why)) {
            std::vector<uint8_t> resp;
            BuildFrameResponse(bmp, resp);
            if (!net::SendAll(fd, resp.data(), resp.size())) return fail(Status::SEND_FAIL);
            ++m_frames_served;
            return true;
        }
        std::cerr << "[DEVICE] GET_FRAME failed: "
                  << cam::CameraService::StatusStr(why) << "\n";
    } else {
        std::cerr << "[DEVICE] unknown command\n";
    }

    ++m_cmds_failed;
    if (!net::SendStr(fd, RESP_ERROR)) return fail(Status::SEND_FAIL);
    return true;
}

bool DeviceFrameServer::fail(Status s) {
    m_status = s;
    m_errno  = errno;
    return false;
}

const char* DeviceFrameServer::StatusStr(DeviceFrameServer::Status s) {
    switch (s) {
        case DeviceFrameServer::Status::OK:          return "OK";
        case DeviceFrameServer::Status::LISTEN_FAIL: return "LISTEN_FAIL";
        case DeviceFrameServer::Status::ACCEPT_FAIL: return "ACCEPT_FAIL";
        case DeviceFrameServer::Status::SEND_FAIL:   return "SEND_FAIL";
        case DeviceFrameServer::Status::RECV_FAIL:   return "RECV_FAIL";
        case DeviceFrameServer::Status::NOT_RUNNING: return "NOT_RUNNING";
        default:                                     return "UNKNOWN";
    }
}

} // namespace device
