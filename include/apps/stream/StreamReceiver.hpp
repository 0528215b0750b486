#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <string>

#include "os/rtos.hpp"
#include "apps/stream/FrameDemuxer.hpp"
#include "apps/stream/FrameSink.hpp"

namespace stream {

// ------------------------------
// Config
// ------------------------------
struct StreamReceiverConfig {
    std::string host = "127.0.0.1";
    uint16_t    port = 10002;

    uint32_t connect_timeout_ms = 5000;

    // Receiver task: one recv() of at most this many bytes per iteration.
    std::size_t recv_chunk_bytes = 4096;

    // Receiver read timeout; expiry only re-checks the running flag.
    uint32_t recv_timeout_ms = 1000;

    // Consumer dequeue timeout; expiry only re-checks the running flag.
    uint32_t consume_timeout_ms = 1000;

    // Bound on each task join in Stop().
    uint32_t join_timeout_ms = 2000;
};

// ---------------------------------------------------------------------------
// StreamReceiver: TCP MJPEG client split into two tasks.
//
//   Receiver: socket -> FrameDemuxer -> FrameQueue.try_send()  (drop newest)
//   Consumer: FrameQueue.receive(timeout) -> IFrameSink
//
// The tasks share only the queue and the running flag. The receiver clears
// the flag and closes the queue when the stream ends; the consumer keeps
// draining until the queue is closed and empty, so buffered frames are not
// lost on shutdown.
// ---------------------------------------------------------------------------
class StreamReceiver {
public:
    StreamReceiver(IFrameSink& sink, const StreamReceiverConfig& cfg = {});
    ~StreamReceiver();

    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    // Connect and spawn both tasks. False if the connection is refused.
    // One session per instance: the queue stays closed after the stream ends.
    bool Start();

    // Block until the stream ends and the consumer has drained the queue.
    void Wait();

    // Stop receiving, let the consumer drain, join both tasks (bounded).
    // Returns false if a task did not finish within join_timeout_ms; the
    // destructor then waits for it without a bound.
    bool Stop();

    bool running() const { return m_running.load(); }

    uint64_t bytesReceived()  const { return m_bytes_rx.load(); }
    uint64_t framesReceived() const { return m_frames_rx.load(); }
    uint64_t framesDropped()  const { return m_frames_dropped.load(); }
    uint64_t framesConsumed() const { return m_frames_consumed.load(); }

    enum class Status : uint8_t {
        OK = 0,
        CONNECT_FAIL,
        TASK_FAIL,
        RECV_FAIL,
        SINK_FAIL,
        JOIN_TIMEOUT,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status.load(); }
    int    lastErrno()  const { return m_errno.load(); }

private:
    IFrameSink& m_sink;
    StreamReceiverConfig m_cfg{};

    FrameQueue   m_queue;
    FrameDemuxer m_demux;         // receiver task only

    Rtos::Task m_rx_task;
    Rtos::Task m_consumer_task;

    std::atomic<int>  m_fd{-1};
    std::atomic<bool> m_running{false};
    bool m_started = false;

    std::atomic<uint64_t> m_bytes_rx{0};
    std::atomic<uint64_t> m_frames_rx{0};
    std::atomic<uint64_t> m_frames_dropped{0};
    std::atomic<uint64_t> m_frames_consumed{0};

    // FDIR (written from either task)
    std::atomic<Status> m_status{Status::OK};
    std::atomic<int>    m_errno{0};

private:
    static void ReceiverEntry(void* arg);
    static void ConsumerEntry(void* arg);

    void receiveLoop();
    void consumeLoop();

    bool fail(Status s);
};

} // namespace stream
