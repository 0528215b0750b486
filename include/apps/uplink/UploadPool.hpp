#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include "os/rtos.hpp"

namespace uplink {

// One captured image waiting to be posted.
struct UploadJob {
    std::vector<uint8_t> jpeg;
    std::string filename;
};

static constexpr std::size_t UPLOAD_Q_CAP = 8;
using UploadQueue = Rtos::Queue<UploadJob, UPLOAD_Q_CAP>;

// ------------------------------
// HTTP helpers (no I/O)
// ------------------------------
struct HttpUrl {
    std::string host;
    uint16_t    port = 80;
    std::string path = "/";
};

// "http://host[:port][/path]". Only plain http is supported.
bool ParseUrl(const std::string& url, HttpUrl& out);

// camera_image_<YYYY-mm-dd>_at_<HH.MM.SS>.jpg in local time.
std::string CaptureFilename(std::time_t t);

// multipart/form-data body with a single "image" file part.
void BuildMultipartBody(const UploadJob& job, const std::string& boundary, std::vector<uint8_t>& body);

// POST request head for a body built by BuildMultipartBody().
std::string BuildRequestHead(const HttpUrl& url, const std::string& boundary, std::size_t body_len);

// Status code from "HTTP/1.x NNN ...", or -1.
int ParseStatusCode(const std::string& status_line);

// ------------------------------
// Config
// ------------------------------
struct UploadPoolConfig {
    std::string url = "http://192.168.18.11:3000/api/capture";

    uint32_t workers = 2;

    // Connect, send and receive timeout per request.
    uint32_t timeout_ms = 5000;
};

// ---------------------------------------------------------------------------
// UploadPool: bounded work queue + fixed worker pool posting JPEGs to the
// API server.
//
// Submit() never blocks: when the queue is full the job is dropped and
// counted. Workers report every outcome through the counters; an upload
// counts as sent only on HTTP 200.
// ---------------------------------------------------------------------------
class UploadPool {
public:
    explicit UploadPool(const UploadPoolConfig& cfg = {});
    ~UploadPool();

    UploadPool(const UploadPool&) = delete;
    UploadPool& operator=(const UploadPool&) = delete;

    // Parse the URL and spawn the workers.
    bool Start();

    // Queue one job. False when dropped (queue full or pool stopped).
    bool Submit(const UploadJob& job);

    // Stop accepting jobs, let workers finish what is queued, join them.
    void Stop();

    // One blocking POST. http_status is the server's code, or -1 when no
    // valid response arrived.
    static bool PostOnce(const HttpUrl& url, const UploadJob& job, uint32_t timeout_ms, int& http_status);

    uint64_t sent()    const { return m_sent.load(); }
    uint64_t failed()  const { return m_failed.load(); }
    uint64_t dropped() const { return m_dropped.load(); }
    std::size_t pending() { return m_queue.size(); }

    enum class Status : uint8_t {
        OK = 0,
        BAD_URL,
        TASK_FAIL,
        NOT_RUNNING,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    UploadPoolConfig m_cfg{};
    HttpUrl m_url{};

    UploadQueue m_queue;
    std::vector<std::unique_ptr<Rtos::Task>> m_workers;

    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_sent{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_dropped{0};

    Status m_status = Status::OK;

private:
    static void WorkerEntry(void* arg);
    void workerLoop();

    bool fail(Status s);
};

} // namespace uplink
