#include "net/Socket.hpp"

// POSIX sockets (Linux)
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace net {

namespace {

timeval toTimeval(uint32_t ms) {
    timeval tv{};
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = suseconds_t(ms % 1000) * 1000;
    return tv;
}

} // anonymous namespace

const char* IoStatusStr(IoStatus s) {
    switch (s) {
        case IoStatus::OK:      return "OK";
        case IoStatus::TIMEOUT: return "TIMEOUT";
        case IoStatus::CLOSED:  return "CLOSED";
        case IoStatus::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

int ListenTcp(uint16_t port, int backlog, uint16_t* bound_port) {
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) return -1;

    int yes = 1;
    (void)::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(sfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(sfd, backlog) < 0) {
        const int e = errno;
        ::close(sfd);
        errno = e;
        return -1;
    }

    if (bound_port) {
        sockaddr_in got{};
        socklen_t len = sizeof(got);
        if (::getsockname(sfd, reinterpret_cast<sockaddr*>(&got), &len) == 0) {
            *bound_port = ntohs(got.sin_port);
        } else {
            *bound_port = port;
        }
    }
    return sfd;
}

int AcceptClient(int listen_fd, std::string* peer) {
    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&caddr), &clen, SOCK_CLOEXEC);
        if (cfd >= 0) {
            if (peer) {
                char ip[INET_ADDRSTRLEN] = {0};
                ::inet_ntop(AF_INET, &caddr.sin_addr, ip, sizeof(ip));
                *peer = std::string(ip) + ":" + std::to_string(ntohs(caddr.sin_port));
            }
            return cfd;
        }
        if (errno == EINTR || errno == ECONNABORTED) continue;
        return -1;
    }
}

int ConnectTcp(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        errno = EHOSTUNREACH;
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;

        // SO_SNDTIMEO also bounds a blocking connect() on Linux.
        if (timeout_ms > 0) (void)SetSendTimeout(fd, timeout_ms);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

        const int e = errno;
        ::close(fd);
        fd = -1;
        errno = e;
    }
    ::freeaddrinfo(res);
    return fd;
}

bool SetRecvTimeout(int fd, uint32_t timeout_ms) {
    const timeval tv = toTimeval(timeout_ms);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool SetSendTimeout(int fd, uint32_t timeout_ms) {
    const timeval tv = toTimeval(timeout_ms);
    return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool SendAll(int fd, const uint8_t* data, std::size_t n) {
    while (n > 0) {
        ssize_t w = ::send(fd, data, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        data += static_cast<std::size_t>(w);
        n -= static_cast<std::size_t>(w);
    }
    return true;
}

bool SendStr(int fd, const std::string& s) {
    return SendAll(fd, reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

IoStatus RecvSome(int fd, uint8_t* buf, std::size_t cap, std::size_t& got) {
    got = 0;
    while (true) {
        ssize_t r = ::recv(fd, buf, cap, 0);
        if (r > 0) {
            got = static_cast<std::size_t>(r);
            return IoStatus::OK;
        }
        if (r == 0) return IoStatus::CLOSED;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::TIMEOUT;
        return IoStatus::ERROR;
    }
}

IoStatus RecvExact(int fd, uint8_t* buf, std::size_t n) {
    while (n > 0) {
        std::size_t got = 0;
        const IoStatus st = RecvSome(fd, buf, n, got);
        if (st != IoStatus::OK) return st;
        buf += got;
        n -= got;
    }
    return IoStatus::OK;
}

void Shutdown(int fd) {
    if (fd >= 0) (void)::shutdown(fd, SHUT_RDWR);
}

void Close(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace net
