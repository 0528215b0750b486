#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "apps/camera/CameraService.hpp"
#include "msg/Bitmap1bpp.hpp"

namespace device {

// ------------------------------
// Wire constants
// ------------------------------
static constexpr const char* CMD_GET_FRAME = "GET_FRAME";
static constexpr const char* RESP_OK       = "OK\n";
static constexpr const char* RESP_ERROR    = "ERROR\n";
static constexpr std::size_t LEN_PREFIX_BYTES = 4;      // u32 little-endian

// ------------------------------
// Config
// ------------------------------
struct DeviceFrameServerConfig {
    uint16_t port    = 10001;   // 0 = ephemeral (tests)
    int      backlog = 1;

    // One recv() per command.
    std::size_t recv_buf_bytes = 1024;

    // Read timeout on the session socket. Expiry is not an error; it only
    // lets the session loop notice RequestStop().
    uint32_t recv_timeout_ms = 1000;

    // Bitmap geometry sent to the device (portrait display).
    uint32_t bitmap_w = 240;
    uint32_t bitmap_h = 320;
};

// ---------------------------------------------------------------------------
// DeviceFrameServer: half-duplex command/response protocol for the
// microcontroller display.
//
// Per connection:
//   AwaitCommand --recv 0 bytes / reset--> Closed
//   AwaitCommand --"GET_FRAME"--> "OK\n" + u32le len + bitmap  (or "ERROR\n")
//   AwaitCommand --other text--> "ERROR\n"
//   AwaitCommand --whitespace only--> (no response)
//
// One connection is served at a time; Run() goes back to accept() when the
// peer goes away. A failed command never closes the connection.
// ---------------------------------------------------------------------------
class DeviceFrameServer {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        DeviceFrameServer* self = nullptr;
    };

    enum class Command : uint8_t {
        EMPTY = 0,      // nothing but whitespace
        GET_FRAME,
        UNKNOWN,
    };

public:
    DeviceFrameServer(cam::CameraService& camera, const DeviceFrameServerConfig& cfg = {});
    ~DeviceFrameServer();

    DeviceFrameServer(const DeviceFrameServer&) = delete;
    DeviceFrameServer& operator=(const DeviceFrameServer&) = delete;

    // Bind + listen. Returns false if the port cannot be opened.
    bool Start();

    // Accept loop. Returns after RequestStop() (or if the listener fails).
    void Run();

    // Thread-safe. Unblocks accept() and any open session.
    void RequestStop();

    // Close the listener. Call after Run() has returned.
    void Stop();

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    // Port actually bound (differs from cfg.port when cfg.port == 0).
    uint16_t boundPort() const { return m_bound_port; }

    uint64_t sessions()       const { return m_sessions.load(); }
    uint64_t framesServed()   const { return m_frames_served.load(); }
    uint64_t commandsFailed() const { return m_cmds_failed.load(); }

    // Protocol helpers (no I/O)
    static Command ParseCommand(const uint8_t* data, std::size_t n);
    static void    BuildFrameResponse(const msg::Bitmap1bpp& bmp, std::vector<uint8_t>& out);

    enum class Status : uint8_t {
        OK = 0,
        LISTEN_FAIL,
        ACCEPT_FAIL,
        SEND_FAIL,
        RECV_FAIL,
        NOT_RUNNING,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    cam::CameraService& m_camera;
    DeviceFrameServerConfig m_cfg{};

    int m_listen_fd = -1;
    uint16_t m_bound_port = 0;

    std::atomic<bool> m_running{false};
    std::atomic<int>  m_session_fd{-1};     // published so RequestStop() can shut it down

    std::atomic<uint64_t> m_sessions{0};
    std::atomic<uint64_t> m_frames_served{0};
    std::atomic<uint64_t> m_cmds_failed{0};

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;

private:
    void serveConnection(int fd);

    // Returns false when the transport failed (session must end).
    bool handleCommand(int fd, Command cmd);

    bool fail(Status s);
};

} // namespace device
