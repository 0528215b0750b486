// StreamReceiver.cpp
#include "apps/stream/StreamReceiver.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include "net/Socket.hpp"

namespace stream {

static inline StreamReceiverConfig sanitise(const StreamReceiverConfig& in) {
    StreamReceiverConfig cfg = in;

    if (cfg.host.empty()) cfg.host = "127.0.0.1";
    if (cfg.recv_chunk_bytes < 64) cfg.recv_chunk_bytes = 64;
    if (cfg.recv_timeout_ms == 0) cfg.recv_timeout_ms = 1000;
    if (cfg.consume_timeout_ms == 0) cfg.consume_timeout_ms = 1000;
    if (cfg.join_timeout_ms == 0) cfg.join_timeout_ms = 2000;

    return cfg;
}

StreamReceiver::StreamReceiver(IFrameSink& sink, const StreamReceiverConfig& cfg)
: m_sink(sink)
, m_cfg(sanitise(cfg)) {}

StreamReceiver::~StreamReceiver() {
    if (Stop()) return;

    // A task outlived the bounded join and still uses the queue, the sink
    // and the counters: block until it is gone.
    std::cerr << "[STREAM] waiting for tasks before release\n";
    m_running.store(false);
    m_queue.close();
    m_rx_task.Join();
    m_consumer_task.Join();

    int cfd = m_fd.exchange(-1);
    net::Close(cfd);
    m_started = false;
}

bool StreamReceiver::Start() {
    if (m_started) return true;

    m_status.store(Status::OK);
    m_errno.store(0);

    std::cout << "[STREAM] connecting to " << m_cfg.host << ":" << m_cfg.port << "...\n";
    int fd = net::ConnectTcp(m_cfg.host, m_cfg.port, m_cfg.connect_timeout_ms);
    if (fd < 0) {
        (void)fail(Status::CONNECT_FAIL);
        std::cerr << "[STREAM] could not connect to " << m_cfg.host << ":" << m_cfg.port
                  << " errno=" << m_errno.load() << " " << std::strerror(m_errno.load()) << "\n";
        return false;
    }
    (void)net::SetRecvTimeout(fd, m_cfg.recv_timeout_ms);
    m_fd.store(fd);

    std::cout << "[STREAM] connected, receiving MJPEG stream\n";

    m_running.store(true);
    if (!m_rx_task.Create("StreamRx", ReceiverEntry, this)) {
        m_running.store(false);
        net::Close(fd);
        m_fd.store(-1);
        return fail(Status::TASK_FAIL);
    }
    if (!m_consumer_task.Create("StreamConsume", ConsumerEntry, this)) {
        // Receiver is up: shut it down through the normal path.
        m_running.store(false);
        net::Shutdown(fd);
        m_rx_task.Join();
        net::Close(fd);
        m_fd.store(-1);
        return fail(Status::TASK_FAIL);
    }

    m_started = true;
    return true;
}

void StreamReceiver::Wait() {
    if (!m_started) return;
    m_rx_task.Join();
    m_consumer_task.Join();
}

bool StreamReceiver::Stop() {
    if (!m_started) return true;

    m_running.store(false);
    const int fd = m_fd.load();
    if (fd >= 0) net::Shutdown(fd);     // unblock recv() now

    const bool rx_done = m_rx_task.JoinFor(m_cfg.join_timeout_ms);
    if (!rx_done) {
        // Receiver stuck: close the queue ourselves so the consumer can finish.
        m_queue.close();
    }
    const bool consumer_done = m_consumer_task.JoinFor(m_cfg.join_timeout_ms);

    if (!rx_done || !consumer_done) {
        std::cerr << "[STREAM] WARN: task join timed out (rx=" << rx_done
                  << " consumer=" << consumer_done << ")\n";
        return fail(Status::JOIN_TIMEOUT);
    }

    int cfd = m_fd.exchange(-1);
    net::Close(cfd);
    m_started = false;
    return true;
}

// -------------------- tasks --------------------

void StreamReceiver::ReceiverEntry(void* arg) {
    auto* self = static_cast<StreamReceiver*>(arg);
    if (!self) return;
    self->receiveLoop();
}

void StreamReceiver::ConsumerEntry(void* arg) {
    auto* self = static_cast<StreamReceiver*>(arg);
    if (!self) return;
    self->consumeLoop();
}

void StreamReceiver::receiveLoop() {
    const int fd = m_fd.load();
    std::vector<uint8_t> chunk(m_cfg.recv_chunk_bytes);
    std::vector<msg::Frame> frames;

    while (m_running.load()) {
        std::size_t got = 0;
        const net::IoStatus io = net::RecvSome(fd, chunk.data(), chunk.size(), got);

        if (io == net::IoStatus::TIMEOUT) continue;
        if (io == net::IoStatus::CLOSED) {
            if (m_running.load()) std::cout << "[STREAM] server closed the connection\n";
            break;
        }
        if (io == net::IoStatus::ERROR) {
            if (m_running.load()) {
                (void)fail(Status::RECV_FAIL);
                std::cerr << "[STREAM] receive error errno=" << m_errno.load()
                          << " " << std::strerror(m_errno.load()) << "\n";
            }
            break;
        }

        m_bytes_rx += got;

        frames.clear();
        m_demux.Feed(chunk.data(), got, frames);

        for (msg::Frame& f : frames) {
            ++m_frames_rx;
            if (!m_queue.try_send(f)) ++m_frames_dropped;
        }
    }

    // Partial frame at the tail is never delivered.
    m_demux.Reset();

    m_running.store(false);
    m_queue.close();
}

void StreamReceiver::consumeLoop() {
    bool sink_ok = true;

    while (true) {
        msg::Frame f;
        if (m_queue.receive(f, m_cfg.consume_timeout_ms)) {
            if (sink_ok && !m_sink.consume(f)) {
                (void)fail(Status::SINK_FAIL);
                sink_ok = false;

                // Nothing more can be stored: stop the receiver, keep draining.
                m_running.store(false);
                const int fd = m_fd.load();
                if (fd >= 0) net::Shutdown(fd);
            }
            ++m_frames_consumed;
            continue;
        }

        // Timeout: keep waiting while the receiver may still deliver. The
        // receiver closes the queue on exit, so closed + empty is the end.
        if (!m_running.load() && m_queue.isClosed() && m_queue.size() == 0) break;
    }

    m_sink.finish();
}

bool StreamReceiver::fail(Status s) {
    m_status.store(s);
    m_errno.store(errno);
    return false;
}

const char* StreamReceiver::StatusStr(StreamReceiver::Status s) {
    switch (s) {
        case StreamReceiver::Status::OK:           return "OK";
        case StreamReceiver::Status::CONNECT_FAIL: return "CONNECT_FAIL";
        case StreamReceiver::Status::TASK_FAIL:    return "TASK_FAIL";
        case StreamReceiver::Status::RECV_FAIL:    return "RECV_FAIL";
        case StreamReceiver::Status::SINK_FAIL:    return "SINK_FAIL";
        case StreamReceiver::Status::JOIN_TIMEOUT: return "JOIN_TIMEOUT";
        default:                                   return "UNKNOWN";
    }
}

} // namespace stream
