#pragma once
#include <atomic>
#include <cstdint>

#include "apps/camera/CameraService.hpp"

namespace stream {

// ------------------------------
// Config
// ------------------------------
struct MjpegStreamServerConfig {
    uint16_t port    = 10002;   // 0 = ephemeral (tests)
    int      backlog = 1;

    // Per-frame transform: grayscale -> width x height -> JPEG at quality.
    uint32_t width   = 240;
    uint32_t height  = 320;
    int      quality = 50;

    uint32_t frame_period_ms = 200;     // 5 fps cap
    uint32_t retry_ms        = 500;     // pause after a failed capture
};

// ---------------------------------------------------------------------------
// MjpegStreamServer: raw MJPEG over TCP.
//
// Writes complete JPEGs back to back with no length prefix or separator;
// clients split them with a FrameDemuxer. One client at a time; after the
// peer leaves the server goes back to accept().
// ---------------------------------------------------------------------------
class MjpegStreamServer {
public:
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        MjpegStreamServer* self = nullptr;
    };

public:
    MjpegStreamServer(cam::CameraService& camera, const MjpegStreamServerConfig& cfg = {});
    ~MjpegStreamServer();

    MjpegStreamServer(const MjpegStreamServer&) = delete;
    MjpegStreamServer& operator=(const MjpegStreamServer&) = delete;

    bool Start();
    void Run();
    void RequestStop();
    void Stop();

    static void TaskEntry(void* arg);

    uint16_t boundPort()  const { return m_bound_port; }
    uint64_t framesSent() const { return m_frames_sent.load(); }
    uint64_t clients()    const { return m_clients.load(); }

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
    MjpegStreamServerConfig m_cfg{};

    int m_listen_fd = -1;
    uint16_t m_bound_port = 0;

    std::atomic<bool> m_running{false};
    std::atomic<int>  m_client_fd{-1};

    std::atomic<uint64_t> m_frames_sent{0};
    std::atomic<uint64_t> m_clients{0};

    Status m_status = Status::OK;
    int    m_errno  = 0;

private:
    void streamTo(int fd);
    bool fail(Status s);
};

} // namespace stream
