// MjpegStreamServer.cpp
#include "apps/stream/MjpegStreamServer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "net/Socket.hpp"
#include "os/rtos.hpp"

namespace stream {

static inline MjpegStreamServerConfig sanitise(const MjpegStreamServerConfig& in) {
    MjpegStreamServerConfig cfg = in;

    if (cfg.backlog < 1) cfg.backlog = 1;
    if (cfg.width == 0)  cfg.width  = 240;
    if (cfg.height == 0) cfg.height = 320;
    cfg.quality = std::min(100, std::max(1, cfg.quality));
    if (cfg.frame_period_ms == 0) cfg.frame_period_ms = 200;

    return cfg;
}

MjpegStreamServer::MjpegStreamServer(cam::CameraService& camera, const MjpegStreamServerConfig& cfg)
: m_camera(camera)
, m_cfg(sanitise(cfg)) {}

MjpegStreamServer::~MjpegStreamServer() {
    Stop();
}

bool MjpegStreamServer::Start() {
    if (m_listen_fd >= 0) return true;

    m_status = Status::OK;
    m_errno  = 0;

    m_listen_fd = net::ListenTcp(m_cfg.port, m_cfg.backlog, &m_bound_port);
    if (m_listen_fd < 0) {
        (void)fail(Status::LISTEN_FAIL);
        std::cerr << "[STREAM] listen on port " << m_cfg.port << " failed errno=" << m_errno
                  << " " << std::strerror(m_errno) << "\n";
        return false;
    }

    m_running.store(true);
    std::cout << "[STREAM] raw MJPEG on port " << m_bound_port << " ("
              << m_cfg.width << "x" << m_cfg.height << " q" << m_cfg.quality << ")\n";
    return true;
}

void MjpegStreamServer::Run() {
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
            Rtos::SleepMs(100);
            continue;
        }

        ++m_clients;
        std::cout << "[STREAM] client connected: " << peer << "\n";

        m_client_fd.store(fd);
        streamTo(fd);
        m_client_fd.store(-1);

        net::Close(fd);
        std::cout << "[STREAM] client disconnected: " << peer << "\n";
    }
}

void MjpegStreamServer::RequestStop() {
    m_running.store(false);
    if (m_listen_fd >= 0) net::Shutdown(m_listen_fd);

    const int cfd = m_client_fd.load();
    if (cfd >= 0) net::Shutdown(cfd);
}

void MjpegStreamServer::Stop() {
    m_running.store(false);
    net::Close(m_listen_fd);
}

void MjpegStreamServer::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self) return;

    ctx->self->Run();
}

void MjpegStreamServer::streamTo(int fd) {
    std::vector<uint8_t> jpg;
    cam::CameraService::Status why = cam::CameraService::Status::OK;

    while (m_running.load()) {
        if (!m_camera.CaptureDisplayJpeg(m_cfg.width, m_cfg.height, m_cfg.quality, jpg, &why)) {
            std::cerr << "[STREAM] capture failed: " << cam::CameraService::StatusStr(why) << "\n";
            Rtos::SleepMs(int(m_cfg.retry_ms));
            continue;
        }

        // Peer gone (EPIPE / ECONNRESET): end this session.
        if (!net::SendAll(fd, jpg.data(), jpg.size())) return;
        ++m_frames_sent;

        Rtos::SleepMs(int(m_cfg.frame_period_ms));
    }
}

bool MjpegStreamServer::fail(Status s) {
    m_status = s;
    m_errno  = errno;
    return false;
}

const char* MjpegStreamServer::StatusStr(MjpegStreamServer::Status s) {
    switch (s) {
        case MjpegStreamServer::Status::OK:          return "OK";
        case MjpegStreamServer::Status::LISTEN_FAIL: return "LISTEN_FAIL";
        case MjpegStreamServer::Status::ACCEPT_FAIL: return "ACCEPT_FAIL";
        case MjpegStreamServer::Status::NOT_RUNNING: return "NOT_RUNNING";
        default:                                     return "UNKNOWN";
    }
}

} // namespace stream
