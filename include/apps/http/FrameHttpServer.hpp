#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "apps/camera/CameraService.hpp"

namespace http {

static constexpr const char* BOUNDARY = "frame";

// ------------------------------
// Config
// ------------------------------
struct FrameHttpServerConfig {
    uint16_t port    = 5000;    // 0 = ephemeral (tests)
    int      backlog = 8;

    // Pacing between multipart parts.
    uint32_t stream_period_ms     = 100;
    uint32_t compressed_period_ms = 150;

    // Extra pause after a failed capture inside a stream.
    uint32_t stream_retry_ms = 100;

    // Request head must arrive within this time and size.
    uint32_t    request_timeout_ms = 5000;
    std::size_t max_request_bytes  = 4096;

    // Upper bound Stop() waits for client threads to leave.
    uint32_t drain_timeout_ms = 2000;
};

enum class Route : uint8_t {
    INDEX = 0,
    HEALTH,
    FRAME,
    FRAME_GRAY,
    FRAME_COMPRESSED,
    STREAM,
    STREAM_GRAY,
    STREAM_COMPRESSED,
    NOT_FOUND,
    BAD_METHOD,
};

const char* RouteStr(Route r);

// ------------------------------
// Wire helpers (no I/O)
// ------------------------------

// Route from the request line ("GET /path?query HTTP/1.1").
Route ParseRoute(const std::string& request_head);

// Headers of a single-frame image/jpeg response (no-cache, Content-Length).
std::string JpegResponseHead(std::size_t body_len);

// Headers opening a multipart/x-mixed-replace stream.
std::string StreamResponseHead();

// Headers of one multipart part; the JPEG bytes and "\r\n" follow.
std::string MultipartPartHead(std::size_t jpeg_len);

// Complete text/plain (or text/html) response with Content-Length.
std::string TextResponse(int code, const char* reason, const std::string& body,
                         const char* content_type = "text/plain");

std::string IndexHtml();

// ---------------------------------------------------------------------------
// FrameHttpServer: minimal HTTP/1.1 server for single frames and MJPEG
// streams. One detached thread per client; each frame comes from the shared
// CameraService, which serialises access to the camera.
// ---------------------------------------------------------------------------
class FrameHttpServer {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        FrameHttpServer* self = nullptr;
    };

public:
    FrameHttpServer(cam::CameraService& camera, const FrameHttpServerConfig& cfg = {});
    ~FrameHttpServer();

    FrameHttpServer(const FrameHttpServer&) = delete;
    FrameHttpServer& operator=(const FrameHttpServer&) = delete;

    bool Start();

    // Accept loop; spawns a client thread per connection. Returns after
    // RequestStop().
    void Run();

    // Thread-safe. Unblocks accept() and every open client socket.
    void RequestStop();

    // Close the listener and wait (bounded) for client threads to finish.
    // The destructor waits for every client thread without a bound.
    void Stop();

    static void TaskEntry(void* arg);

    uint16_t boundPort() const { return m_bound_port; }

    uint64_t requestsServed() const { return m_requests.load(); }
    uint64_t framesSent()     const { return m_frames_sent.load(); }
    uint32_t activeClients()  const { return m_active.load(); }

    enum class Status : uint8_t {
        OK = 0,
        LISTEN_FAIL,
        ACCEPT_FAIL,
        NOT_RUNNING,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    cam::CameraService& m_camera;
    FrameHttpServerConfig m_cfg{};

    int m_listen_fd = -1;
    uint16_t m_bound_port = 0;

    std::atomic<bool> m_running{false};

    std::mutex    m_clients_mtx;
    std::set<int> m_client_fds;         // open client sockets, for RequestStop()
    std::atomic<uint32_t> m_active{0};

    std::atomic<uint64_t> m_requests{0};
    std::atomic<uint64_t> m_frames_sent{0};

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;

private:
    void handleClient(int fd);
    void dispatch(int fd, Route route);

    // Capture per route; false on camera/encode failure.
    bool captureFor(Route route, std::vector<uint8_t>& jpg, cam::CameraService::Status* why = nullptr);

    bool sendFrame(int fd, Route route);
    void sendStream(int fd, Route route);

    bool readRequestHead(int fd, std::string& head);

    bool fail(Status s);
};

} // namespace http
