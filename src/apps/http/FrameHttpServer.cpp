// FrameHttpServer.cpp
#include "apps/http/FrameHttpServer.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

#include "net/Socket.hpp"
#include "os/rtos.hpp"

namespace http {

static inline FrameHttpServerConfig sanitise(const FrameHttpServerConfig& in) {
    FrameHttpServerConfig cfg = in;

    if (cfg.backlog < 1) cfg.backlog = 1;
    if (cfg.stream_period_ms == 0) cfg.stream_period_ms = 100;
    if (cfg.compressed_period_ms == 0) cfg.compressed_period_ms = 150;
    if (cfg.request_timeout_ms == 0) cfg.request_timeout_ms = 5000;
    if (cfg.max_request_bytes < 256) cfg.max_request_bytes = 256;

    return cfg;
}

// -------------------- wire helpers --------------------

const char* RouteStr(Route r) {
    switch (r) {
        case Route::INDEX:             return "/";
        case Route::HEALTH:            return "/health";
        case Route::FRAME:             return "/frame";
        case Route::FRAME_GRAY:        return "/frame_gray";
        case Route::FRAME_COMPRESSED:  return "/frame_compressed";
        case Route::STREAM:            return "/stream";
        case Route::STREAM_GRAY:       return "/stream_gray";
        case Route::STREAM_COMPRESSED: return "/stream_compressed";
        case Route::NOT_FOUND:         return "NOT_FOUND";
        case Route::BAD_METHOD:        return "BAD_METHOD";
        default:                       return "UNKNOWN";
    }
}

Route ParseRoute(const std::string& request_head) {
    const size_t eol = request_head.find("\r\n");
    const std::string line = request_head.substr(0, eol);

    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) return Route::NOT_FOUND;
    const size_t sp2 = line.find(' ', sp1 + 1);

    const std::string method = line.substr(0, sp1);
    std::string path = line.substr(sp1 + 1, (sp2 == std::string::npos) ? std::string::npos : sp2 - sp1 - 1);

    const size_t q = path.find('?');
    if (q != std::string::npos) path.resize(q);

    if (method != "GET") return Route::BAD_METHOD;

    if (path == "/" || path == "/index.html") return Route::INDEX;
    if (path == "/health")            return Route::HEALTH;
    if (path == "/frame")             return Route::FRAME;
    if (path == "/frame_gray")        return Route::FRAME_GRAY;
    if (path == "/frame_compressed")  return Route::FRAME_COMPRESSED;
    if (path == "/stream")            return Route::STREAM;
    if (path == "/stream_gray")       return Route::STREAM_GRAY;
    if (path == "/stream_compressed") return Route::STREAM_COMPRESSED;
    return Route::NOT_FOUND;
}

std::string JpegResponseHead(std::size_t body_len) {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: image/jpeg\r\n"
           "Cache-Control: no-cache, no-store, must-revalidate\r\n"
           "Pragma: no-cache\r\n"
           "Expires: 0\r\n"
           "Connection: close\r\n"
           "Content-Length: " + std::to_string(body_len) + "\r\n\r\n";
}

std::string StreamResponseHead() {
    return std::string("HTTP/1.1 200 OK\r\n"
                       "Content-Type: multipart/x-mixed-replace; boundary=") + BOUNDARY + "\r\n"
           "Cache-Control: no-cache\r\n"
           "Pragma: no-cache\r\n"
           "Connection: close\r\n\r\n";
}

std::string MultipartPartHead(std::size_t jpeg_len) {
    std::string part;
    part += std::string("--") + BOUNDARY + "\r\n";
    part += "Content-Type: image/jpeg\r\n";
    part += "Content-Length: " + std::to_string(jpeg_len) + "\r\n\r\n";
    return part;
}

std::string TextResponse(int code, const char* reason, const std::string& body, const char* content_type) {
    return "HTTP/1.1 " + std::to_string(code) + " " + reason + "\r\n"
           "Content-Type: " + content_type + "\r\n"
           "Cache-Control: no-cache\r\n"
           "Connection: close\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::string IndexHtml() {
    return "<!doctype html><html><head><meta charset='utf-8'>"
           "<title>picamlink</title></head><body>"
           "<h3>picamlink camera</h3>"
           "<p><img src='/stream' style='max-width:100%; height:auto;'/></p>"
           "<ul>"
           "<li><a href='/frame'>/frame</a> single JPEG</li>"
           "<li><a href='/frame_gray'>/frame_gray</a> single grayscale JPEG</li>"
           "<li><a href='/frame_compressed'>/frame_compressed</a> single size-bounded JPEG</li>"
           "<li><a href='/stream'>/stream</a> MJPEG</li>"
           "<li><a href='/stream_gray'>/stream_gray</a> grayscale MJPEG</li>"
           "<li><a href='/stream_compressed'>/stream_compressed</a> size-bounded MJPEG</li>"
           "</ul>"
           "</body></html>";
}

// -------------------- server --------------------

FrameHttpServer::FrameHttpServer(cam::CameraService& camera, const FrameHttpServerConfig& cfg)
: m_camera(camera)
, m_cfg(sanitise(cfg)) {}

FrameHttpServer::~FrameHttpServer() {
    Stop();

    // Client threads hold 'this' until their final decrement.
    while (m_active.load() > 0) {
        Rtos::SleepMs(10);
    }
}

bool FrameHttpServer::Start() {
    if (m_listen_fd >= 0) return true;

    m_status = Status::OK;
    m_errno  = 0;

    m_listen_fd = net::ListenTcp(m_cfg.port, m_cfg.backlog, &m_bound_port);
    if (m_listen_fd < 0) {
        (void)fail(Status::LISTEN_FAIL);
        std::cerr << "[HTTP] listen on port " << m_cfg.port << " failed errno=" << m_errno
                  << " " << std::strerror(m_errno) << "\n";
        return false;
    }

    m_running.store(true);
    std::cout << "[HTTP] server started on port " << m_bound_port << "\n";
    return true;
}

void FrameHttpServer::Run() {
    if (m_listen_fd < 0) {
        (void)fail(Status::NOT_RUNNING);
        return;
    }

    while (m_running.load()) {
        int cfd = net::AcceptClient(m_listen_fd);
        if (cfd < 0) {
            if (!m_running.load()) break;
            (void)fail(Status::ACCEPT_FAIL);
            std::cerr << "[HTTP] accept failed errno=" << m_errno << " " << std::strerror(m_errno) << "\n";
            Rtos::SleepMs(100);
            continue;
        }

        {
            std::lock_guard<std::mutex> lk(m_clients_mtx);
            m_client_fds.insert(cfd);
        }
        ++m_active;

        try {
            std::thread([this, cfd]() { handleClient(cfd); }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[HTTP] cannot spawn client thread: " << e.what() << "\n";
            {
                std::lock_guard<std::mutex> lk(m_clients_mtx);
                m_client_fds.erase(cfd);
            }
            int fd = cfd;
            net::Close(fd);
            --m_active;
        }
    }
}

void FrameHttpServer::RequestStop() {
    m_running.store(false);
    if (m_listen_fd >= 0) net::Shutdown(m_listen_fd);

    std::lock_guard<std::mutex> lk(m_clients_mtx);
    for (int fd : m_client_fds) net::Shutdown(fd);
}

void FrameHttpServer::Stop() {
    RequestStop();

    const uint64_t deadline_us = Rtos::NowUs() + uint64_t(m_cfg.drain_timeout_ms) * 1000ull;
    while (m_active.load() > 0 && Rtos::NowUs() < deadline_us) {
        Rtos::SleepMs(10);
    }
    if (m_active.load() > 0) {
        std::cerr << "[HTTP] WARN: " << m_active.load() << " client thread(s) still running\n";
    }

    net::Close(m_listen_fd);
}

void FrameHttpServer::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self) return;

    ctx->self->Run();
}

// -------------------- private helpers --------------------

void FrameHttpServer::handleClient(int fd) {
    std::string head;
    if (readRequestHead(fd, head)) {
        const Route route = ParseRoute(head);
        ++m_requests;
        try {
            dispatch(fd, route);
        } catch (const std::exception& e) {
            std::cerr << "[HTTP] " << RouteStr(route) << " error: " << e.what() << "\n";
            (void)net::SendStr(fd, TextResponse(500, "Internal Server Error",
                                                std::string("Server error: ") + e.what()));
        }
    }

    {
        std::lock_guard<std::mutex> lk(m_clients_mtx);
        m_client_fds.erase(fd);
    }
    net::Close(fd);
    --m_active;
}

void FrameHttpServer::dispatch(int fd, Route route) {
    switch (route) {
        case Route::INDEX:
            (void)net::SendStr(fd, TextResponse(200, "OK", IndexHtml(), "text/html; charset=utf-8"));
            return;

        case Route::HEALTH:
            (void)net::SendStr(fd, TextResponse(200, "OK", "OK"));
            return;

        case Route::FRAME:
        case Route::FRAME_GRAY:
        case Route::FRAME_COMPRESSED:
            if (sendFrame(fd, route)) ++m_frames_sent;
            return;

        case Route::STREAM:
        case Route::STREAM_GRAY:
        case Route::STREAM_COMPRESSED:
            std::cout << "[HTTP] stream " << RouteStr(route) << " opened\n";
            sendStream(fd, route);
            std::cout << "[HTTP] stream " << RouteStr(route) << " closed\n";
            return;

        case Route::BAD_METHOD:
            (void)net::SendStr(fd, TextResponse(405, "Method Not Allowed", "Method Not Allowed\n"));
            return;

        case Route::NOT_FOUND:
        default:
            (void)net::SendStr(fd, TextResponse(404, "Not Found", "Not Found\n"));
            return;
    }
}

bool FrameHttpServer::captureFor(Route route, std::vector<uint8_t>& jpg, cam::CameraService::Status* why) {
    switch (route) {
        case Route::FRAME:
        case Route::STREAM:
            return m_camera.CaptureJpeg(jpg, why);
        case Route::FRAME_GRAY:
        case Route::STREAM_GRAY:
            return m_camera.CaptureGrayJpeg(jpg, why);
        case Route::FRAME_COMPRESSED:
        case Route::STREAM_COMPRESSED:
            return m_camera.CaptureCompressedJpeg(jpg, why);
        default:
            return false;
    }
}

bool FrameHttpServer::sendFrame(int fd, Route route) {
    std::vector<uint8_t> jpg;
    cam::CameraService::Status why = cam::CameraService::Status::OK;
    if (!captureFor(route, jpg, &why) || jpg.empty()) {
        std::cerr << "[HTTP] " << RouteStr(route) << ": no camera data ("
                  << cam::CameraService::StatusStr(why) << ")\n";
        (void)net::SendStr(fd, TextResponse(503, "Service Unavailable", "Camera not available"));
        return false;
    }

    if (!net::SendStr(fd, JpegResponseHead(jpg.size()))) return false;
    return net::SendAll(fd, jpg.data(), jpg.size());
}

void FrameHttpServer::sendStream(int fd, Route route) {
    if (!net::SendStr(fd, StreamResponseHead())) return;

    const uint32_t period_ms = (route == Route::STREAM_COMPRESSED)
        ? m_cfg.compressed_period_ms
        : m_cfg.stream_period_ms;

    while (m_running.load()) {
        std::vector<uint8_t> jpg;
        if (captureFor(route, jpg) && !jpg.empty()) {
            if (!net::SendStr(fd, MultipartPartHead(jpg.size()))) return;
            if (!net::SendAll(fd, jpg.data(), jpg.size())) return;
            if (!net::SendStr(fd, "\r\n")) return;
            ++m_frames_sent;
        } else {
            Rtos::SleepMs(int(m_cfg.stream_retry_ms));
        }

        Rtos::SleepMs(int(period_ms));
    }
}

bool FrameHttpServer::readRequestHead(int fd, std::string& head) {
    (void)net::SetRecvTimeout(fd, m_cfg.request_timeout_ms);

    head.clear();
    char buf[1024];
    while (head.size() < m_cfg.max_request_bytes) {
        std::size_t got = 0;
        const net::IoStatus io = net::RecvSome(fd, reinterpret_cast<uint8_t*>(buf), sizeof(buf), got);
        if (io != net::IoStatus::OK) return false;

        head.append(buf, got);
        if (head.find("\r\n\r\n") != std::string::npos) return true;
    }

    (void)net::SendStr(fd, TextResponse(431, "Request Header Fields Too Large", "Request too large\n"));
    return false;
}

bool FrameHttpServer::fail(Status s) {
    m_status = s;
    m_errno  = errno;
    return false;
}

const char* FrameHttpServer::StatusStr(FrameHttpServer::Status s) {
    switch (s) {
        case FrameHttpServer::Status::OK:          return "OK";
        case FrameHttpServer::Status::LISTEN_FAIL: return "LISTEN_FAIL";
        case FrameHttpServer::Status::ACCEPT_FAIL: return "ACCEPT_FAIL";
        case FrameHttpServer::Status::NOT_RUNNING: return "NOT_RUNNING";
        default:                                   return "UNKNOWN";
    }
}

} // namespace http
