// UploadPool.cpp
#include "apps/uplink/UploadPool.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "net/Socket.hpp"

namespace uplink {

static constexpr uint32_t MAX_WORKERS = 8;
static constexpr std::size_t MAX_RESPONSE_HEAD = 4096;

static inline UploadPoolConfig sanitise(const UploadPoolConfig& in) {
    UploadPoolConfig cfg = in;

    if (cfg.workers < 1) cfg.workers = 1;
    if (cfg.workers > MAX_WORKERS) cfg.workers = MAX_WORKERS;
    if (cfg.timeout_ms == 0) cfg.timeout_ms = 5000;

    return cfg;
}

// -------------------- HTTP helpers --------------------

bool ParseUrl(const std::string& url, HttpUrl& out) {
    static const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;

    const std::string rest = url.substr(scheme.size());
    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    const std::string path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    if (authority.empty()) return false;

    HttpUrl u;
    const size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        u.host = authority;
        u.port = 80;
    } else {
        u.host = authority.substr(0, colon);
        const std::string port_s = authority.substr(colon + 1);
        if (port_s.empty() || port_s.find_first_not_of("0123456789") != std::string::npos) return false;
        const unsigned long p = std::strtoul(port_s.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) return false;
        u.port = static_cast<uint16_t>(p);
    }
    if (u.host.empty()) return false;

    u.path = path;
    out = u;
    return true;
}

std::string CaptureFilename(std::time_t t) {
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "camera_image_%Y-%m-%d_at_%H.%M.%S.jpg", &tm);
    return buf;
}

void BuildMultipartBody(const UploadJob& job, const std::string& boundary, std::vector<uint8_t>& body) {
    const std::string head =
        "--" + boundary + "\r\n"
        "Content-Disposition: form-data; name=\"image\"; filename=\"" + job.filename + "\"\r\n"
        "Content-Type: image/jpeg\r\n\r\n";
    const std::string tail = "\r\n--" + boundary + "--\r\n";

    body.clear();
    body.reserve(head.size() + job.jpeg.size() + tail.size());
    body.insert(body.end(), head.begin(), head.end());
    body.insert(body.end(), job.jpeg.begin(), job.jpeg.end());
    body.insert(body.end(), tail.begin(), tail.end());
}

std::string BuildRequestHead(const HttpUrl& url, const std::string& boundary, std::size_t body_len) {
    return "POST " + url.path + " HTTP/1.1\r\n"
           "Host: " + url.host + ":" + std::to_string(url.port) + "\r\n"
           "User-Agent: picamlink\r\n"
           "Accept: */*\r\n"
           "Connection: close\r\n"
           "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n"
           "Content-Length: " + std::to_string(body_len) + "\r\n\r\n";
}

int ParseStatusCode(const std::string& status_line) {
    // "HTTP/1.1 200 OK"
    if (status_line.compare(0, 5, "HTTP/") != 0) return -1;
    const size_t sp = status_line.find(' ');
    if (sp == std::string::npos || sp + 4 > status_line.size()) return -1;

    int code = 0;
    for (size_t i = sp + 1; i < sp + 4; ++i) {
        const char c = status_line[i];
        if (c < '0' || c > '9') return -1;
        code = code * 10 + (c - '0');
    }
    return code;
}

// -------------------- pool --------------------

UploadPool::UploadPool(const UploadPoolConfig& cfg)
: m_cfg(sanitise(cfg)) {}

UploadPool::~UploadPool() {
    Stop();
}

bool UploadPool::Start() {
    if (m_running.load()) return true;
    if (m_queue.isClosed()) return fail(Status::NOT_RUNNING);  // pools are single-use

    if (!ParseUrl(m_cfg.url, m_url)) {
        std::cerr << "[UPLINK] invalid API url: " << m_cfg.url << "\n";
        return fail(Status::BAD_URL);
    }

    m_running.store(true);
    for (uint32_t i = 0; i < m_cfg.workers; ++i) {
        auto t = std::make_unique<Rtos::Task>();
        if (!t->Create("Uplink", WorkerEntry, this)) {
            Stop();
            return fail(Status::TASK_FAIL);
        }
        m_workers.push_back(std::move(t));
    }

    std::cout << "[UPLINK] " << m_cfg.workers << " worker(s) posting to " << m_cfg.url << "\n";
    m_status = Status::OK;
    return true;
}

bool UploadPool::Submit(const UploadJob& job) {
    if (!m_running.load() || !m_queue.try_send(job)) {
        ++m_dropped;
        return false;
    }
    return true;
}

void UploadPool::Stop() {
    m_running.store(false);
    m_queue.close();

    for (auto& t : m_workers) t->Join();
    if (!m_workers.empty()) {
        std::cout << "[UPLINK] stopped (sent=" << m_sent.load() << " failed=" << m_failed.load()
                  << " dropped=" << m_dropped.load() << ")\n";
    }
    m_workers.clear();
}

bool UploadPool::PostOnce(const HttpUrl& url, const UploadJob& job, uint32_t timeout_ms, int& http_status) {
    http_status = -1;

    char boundary[64];
    std::snprintf(boundary, sizeof(boundary), "picamlink%016llx",
                  static_cast<unsigned long long>(Rtos::NowUs()));

    std::vector<uint8_t> body;
    BuildMultipartBody(job, boundary, body);
    const std::string head = BuildRequestHead(url, boundary, body.size());

    int fd = net::ConnectTcp(url.host, url.port, timeout_ms);
    if (fd < 0) return false;

    (void)net::SetRecvTimeout(fd, timeout_ms);

    if (!net::SendStr(fd, head) || !net::SendAll(fd, body.data(), body.size())) {
        net::Close(fd);
        return false;
    }

    // Only the status line matters.
    std::string resp;
    char buf[512];
    while (resp.find("\r\n") == std::string::npos && resp.size() < MAX_RESPONSE_HEAD) {
        std::size_t got = 0;
        if (net::RecvSome(fd, reinterpret_cast<uint8_t*>(buf), sizeof(buf), got) != net::IoStatus::OK) break;
        resp.append(buf, got);
    }
    net::Close(fd);

    const size_t eol = resp.find("\r\n");
    if (eol == std::string::npos) return false;

    http_status = ParseStatusCode(resp.substr(0, eol));
    return http_status == 200;
}

// -------------------- workers --------------------

void UploadPool::WorkerEntry(void* arg) {
    auto* self = static_cast<UploadPool*>(arg);
    if (!self) return;
    self->workerLoop();
}

void UploadPool::workerLoop() {
    UploadJob job;
    // receive() returns false once the queue is closed and drained.
    while (m_queue.receive(job)) {
        int code = -1;
        if (PostOnce(m_url, job, m_cfg.timeout_ms, code)) {
            const uint64_t n = ++m_sent;
            std::cout << "[UPLINK] image " << n << " sent (" << job.filename << ")\n";
        } else {
            ++m_failed;
            if (code > 0) {
                std::cerr << "[UPLINK] " << job.filename << " rejected: HTTP " << code << "\n";
            } else {
                std::cerr << "[UPLINK] " << job.filename << " failed errno=" << errno
                          << " " << std::strerror(errno) << "\n";
            }
        }
    }
}

bool UploadPool::fail(Status s) {
    m_status = s;
    return false;
}

const char* UploadPool::StatusStr(UploadPool::Status s) {
    switch (s) {
        case UploadPool::Status::OK:          return "OK";
        case UploadPool::Status::BAD_URL:     return "BAD_URL";
        case UploadPool::Status::TASK_FAIL:   return "TASK_FAIL";
        case UploadPool::Status::NOT_RUNNING: return "NOT_RUNNING";
        default:                              return "UNKNOWN";
    }
}

} // namespace uplink
