#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace net {

// Outcome of one socket read.
enum class IoStatus : uint8_t {
    OK = 0,     // got > 0 bytes
    TIMEOUT,    // SO_RCVTIMEO expired; transient, caller retries
    CLOSED,     // orderly shutdown by peer (zero-length read)
    ERROR,      // reset, broken pipe, ... (errno preserved)
};

const char* IoStatusStr(IoStatus s);

// Bind + listen on INADDR_ANY:port (SO_REUSEADDR). port 0 picks an ephemeral
// port; the chosen port is written to bound_port when non-null.
// Returns the listening fd or -1 (errno preserved).
int ListenTcp(uint16_t port, int backlog, uint16_t* bound_port = nullptr);

// Blocking accept, retried on EINTR. Returns -1 when the listener was shut
// down or failed.
int AcceptClient(int listen_fd, std::string* peer = nullptr);

// Connect to host:port (dotted IPv4 or resolvable name). Returns fd or -1.
int ConnectTcp(const std::string& host, uint16_t port, uint32_t timeout_ms);

bool SetRecvTimeout(int fd, uint32_t timeout_ms);
bool SetSendTimeout(int fd, uint32_t timeout_ms);

// Write everything or fail. MSG_NOSIGNAL: a dead peer yields false, not SIGPIPE.
bool SendAll(int fd, const uint8_t* data, std::size_t n);
bool SendStr(int fd, const std::string& s);

// One recv() of at most cap bytes.
IoStatus RecvSome(int fd, uint8_t* buf, std::size_t cap, std::size_t& got);

// Read exactly n bytes; TIMEOUT is returned as is (no retry).
IoStatus RecvExact(int fd, uint8_t* buf, std::size_t n);

// shutdown(SHUT_RDWR): unblocks a thread sitting in accept()/recv() on fd.
void Shutdown(int fd);

// close() and set fd to -1. No-op for fd < 0.
void Close(int& fd);

} // namespace net
