#include "apps/uplink/UploadPool.hpp"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include "net/Socket.hpp"
#include "os/rtos.hpp"

static bool check(bool ok, const char* what) {
    if (!ok) std::cout << "FAIL: " << what << "\n";
    return ok;
}

// Loopback stand-in for the capture API. Serves 'expected' requests, each
// answered with 'status', and checks every body carries an image part.
struct FakeApi {
    int listen_fd = -1;
    uint16_t port = 0;
    int status = 200;
    int expected = 0;
    std::atomic<int> requests{0};
    std::atomic<int> good_bodies{0};
};

static bool readRequest(int fd, std::string& head, std::string& body) {
    std::string all;
    char buf[2048];
    size_t hend = std::string::npos;
    while (hend == std::string::npos) {
        std::size_t got = 0;
        if (net::RecvSome(fd, reinterpret_cast<uint8_t*>(buf), sizeof(buf), got) != net::IoStatus::OK) return false;
        all.append(buf, got);
        hend = all.find("\r\n\r\n");
    }
    head = all.substr(0, hend + 2);

    const size_t cl = head.find("Content-Length: ");
    if (cl == std::string::npos) return false;
    const size_t len = std::strtoul(head.c_str() + cl + 16, nullptr, 10);

    body = all.substr(hend + 4);
    while (body.size() < len) {
        std::size_t got = 0;
        if (net::RecvSome(fd, reinterpret_cast<uint8_t*>(buf), sizeof(buf), got) != net::IoStatus::OK) return false;
        body.append(buf, got);
    }
    return body.size() == len;
}

void FakeApiEntry(void* arg) {
    auto* api = static_cast<FakeApi*>(arg);
    for (int i = 0; i < api->expected; ++i) {
        int fd = net::AcceptClient(api->listen_fd);
        if (fd < 0) return;
        (void)net::SetRecvTimeout(fd, 3000);

        std::string head;
        std::string body;
        if (readRequest(fd, head, body)) {
            ++api->requests;
            if (head.compare(0, 21, "POST /api/capture HTT") == 0 &&
                head.find("multipart/form-data; boundary=") != std::string::npos &&
                body.find("name=\"image\"") != std::string::npos &&
                body.find("JPEGDATA") != std::string::npos) {
                ++api->good_bodies;
            }
            const std::string reason = (api->status == 200) ? "OK" : "Error";
            (void)net::SendStr(fd, "HTTP/1.1 " + std::to_string(api->status) + " " + reason +
                                   "\r\nContent-Length: 2\r\nConnection: close\r\n\r\n{}");
        }
        net::Close(fd);
    }
}

static uplink::UploadJob makeJob(int i) {
    uplink::UploadJob job;
    const std::string data = "\xFF\xD8JPEGDATA" + std::to_string(i) + "\xFF\xD9";
    job.jpeg.assign(data.begin(), data.end());
    job.filename = "img_" + std::to_string(i) + ".jpg";
    return job;
}

int main() {
    std::cout << "=== uplink_uploadpool_test ===\n";

    {
        std::cout << "\n[Test 1] URL parsing\n";
        uplink::HttpUrl u;
        bool ok = true;
        ok &= check(uplink::ParseUrl("http://192.168.18.11:3000/api/capture", u) &&
                    u.host == "192.168.18.11" && u.port == 3000 && u.path == "/api/capture", "full url");
        ok &= check(uplink::ParseUrl("http://example.local", u) &&
                    u.host == "example.local" && u.port == 80 && u.path == "/", "defaults");
        ok &= check(uplink::ParseUrl("http://h:8080", u) && u.port == 8080 && u.path == "/", "port, no path");
        ok &= check(!uplink::ParseUrl("https://h/x", u), "https rejected");
        ok &= check(!uplink::ParseUrl("http://", u), "no host");
        ok &= check(!uplink::ParseUrl("http://h:0/x", u), "port 0");
        ok &= check(!uplink::ParseUrl("http://h:99999/x", u), "port too big");
        ok &= check(!uplink::ParseUrl("http://h:abc/x", u), "port not numeric");
        ok &= check(!uplink::ParseUrl("http://:80/x", u), "empty host");
        if (!ok) return 1;
    }

    {
        std::cout << "\n[Test 2] Status line and file name\n";
        bool ok = true;
        ok &= check(uplink::ParseStatusCode("HTTP/1.1 200 OK") == 200, "200");
        ok &= check(uplink::ParseStatusCode("HTTP/1.0 500 Internal Server Error") == 500, "500");
        ok &= check(uplink::ParseStatusCode("HTTP/1.1 404") == 404, "no reason");
        ok &= check(uplink::ParseStatusCode("HTTP/1.1 2x0 OK") == -1, "non-digit");
        ok &= check(uplink::ParseStatusCode("ICY 200 OK") == -1, "not http");
        ok &= check(uplink::ParseStatusCode("") == -1, "empty");

        std::tm tm{};
        tm.tm_year = 2024 - 1900;
        tm.tm_mon = 2;
        tm.tm_mday = 7;
        tm.tm_hour = 9;
        tm.tm_min = 5;
        tm.tm_sec = 3;
        tm.tm_isdst = -1;
        const std::time_t t = std::mktime(&tm);     // local time, as CaptureFilename formats it
        const std::string name = uplink::CaptureFilename(t);
        std::cout << name << "\n";
        ok &= check(name == "camera_image_2024-03-07_at_09.05.03.jpg", "file name format");
        if (!ok) return 1;
    }

    {
        std::cout << "\n[Test 3] Multipart body and request head\n";
        const uplink::UploadJob job = makeJob(1);
        std::vector<uint8_t> body;
        uplink::BuildMultipartBody(job, "BND", body);
        const std::string b(body.begin(), body.end());

        const std::string expect_head =
            "--BND\r\n"
            "Content-Disposition: form-data; name=\"image\"; filename=\"img_1.jpg\"\r\n"
            "Content-Type: image/jpeg\r\n\r\n";
        bool ok = true;
        ok &= check(b.compare(0, expect_head.size(), expect_head) == 0, "part head");
        ok &= check(b.compare(expect_head.size(), job.jpeg.size(),
                              std::string(job.jpeg.begin(), job.jpeg.end())) == 0, "jpeg bytes verbatim");
        ok &= check(b.substr(b.size() - 11) == "\r\n--BND--\r\n", "closing boundary");

        uplink::HttpUrl u;
        uplink::ParseUrl("http://10.0.0.2:3000/api/capture", u);
        const std::string h = uplink::BuildRequestHead(u, "BND", body.size());
        ok &= check(h.compare(0, 34, "POST /api/capture HTTP/1.1\r\nHost: ") == 0, "request line");
        ok &= check(h.find("Content-Type: multipart/form-data; boundary=BND\r\n") != std::string::npos, "content type");
        ok &= check(h.find("Content-Length: " + std::to_string(body.size()) + "\r\n") != std::string::npos, "length");
        ok &= check(h.substr(h.size() - 4) == "\r\n\r\n", "head terminated");
        if (!ok) return 1;
    }

    {
        std::cout << "\n[Test 4] Jobs posted to a live server\n";
        FakeApi api;
        api.expected = 6;
        api.listen_fd = net::ListenTcp(0, 8, &api.port);
        if (!check(api.listen_fd >= 0, "api listen")) return 1;
        Rtos::Task apiTask;
        apiTask.Create("FakeApi", FakeApiEntry, &api);

        uplink::UploadPoolConfig cfg;
        cfg.url = "http://127.0.0.1:" + std::to_string(api.port) + "/api/capture";
        cfg.workers = 2;
        cfg.timeout_ms = 2000;
        uplink::UploadPool pool(cfg);
        if (!check(pool.Start(), "pool start")) return 1;

        int accepted = 0;
        for (int i = 0; i < 6; ++i) {
            if (pool.Submit(makeJob(i))) ++accepted;
            Rtos::SleepMs(20);
        }
        pool.Stop();    // drains the queue before returning

        std::cout << "accepted=" << accepted << " sent=" << pool.sent() << " failed=" << pool.failed()
                  << " dropped=" << pool.dropped() << "\n";
        if (!check(accepted == 6 && pool.dropped() == 0, "all accepted")) return 1;
        if (!check(pool.sent() == 6 && pool.failed() == 0, "all sent")) return 1;
        if (!check(apiTask.JoinFor(3000), "api served all")) return 1;
        if (!check(api.good_bodies.load() == 6, "every body carried the image")) return 1;
        if (!check(!pool.Submit(makeJob(99)) && pool.dropped() == 1, "submit after stop is dropped")) return 1;
        net::Close(api.listen_fd);
    }

    {
        std::cout << "\n[Test 5] Non-200 replies count as failures\n";
        FakeApi api;
        api.expected = 3;
        api.status = 500;
        api.listen_fd = net::ListenTcp(0, 8, &api.port);
        Rtos::Task apiTask;
        apiTask.Create("FakeApi", FakeApiEntry, &api);

        uplink::HttpUrl u;
        uplink::ParseUrl("http://127.0.0.1:" + std::to_string(api.port) + "/api/capture", u);
        int code = 0;
        if (!check(!uplink::UploadPool::PostOnce(u, makeJob(0), 2000, code) && code == 500, "PostOnce sees 500")) return 1;

        uplink::UploadPoolConfig cfg;
        cfg.url = "http://127.0.0.1:" + std::to_string(api.port) + "/api/capture";
        cfg.workers = 1;
        uplink::UploadPool pool(cfg);
        if (!check(pool.Start(), "pool start")) return 1;
        pool.Submit(makeJob(1));
        pool.Submit(makeJob(2));
        pool.Stop();
        if (!check(pool.sent() == 0 && pool.failed() == 2, "2 failed")) return 1;
        apiTask.JoinFor(3000);
        net::Close(api.listen_fd);
    }

    {
        std::cout << "\n[Test 6] Full queue drops new jobs instead of blocking\n";
        // Listener that never accepts: requests connect but no reply comes.
        uint16_t port = 0;
        int stall_fd = net::ListenTcp(0, 32, &port);
        if (!check(stall_fd >= 0, "stall listen")) return 1;

        uplink::UploadPoolConfig cfg;
        cfg.url = "http://127.0.0.1:" + std::to_string(port) + "/api/capture";
        cfg.workers = 2;
        cfg.timeout_ms = 300;
        uplink::UploadPool pool(cfg);
        if (!check(pool.Start(), "pool start")) return 1;

        int accepted = 0;
        const uint64_t t0 = Rtos::NowUs();
        for (int i = 0; i < 20; ++i) {
            if (pool.Submit(makeJob(i))) ++accepted;
        }
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000;

        std::cout << "accepted=" << accepted << " dropped=" << pool.dropped()
                  << " submit loop " << dt_ms << " ms\n";
        if (!check(dt_ms < 200, "Submit never blocks")) return 1;
        if (!check(uint64_t(accepted) + pool.dropped() == 20, "accepted + dropped == 20")) return 1;
        if (!check(pool.dropped() >= 10, "at most queue + workers accepted")) return 1;

        pool.Stop();
        if (!check(pool.sent() == 0 && pool.failed() == uint64_t(accepted), "accepted jobs time out")) return 1;
        net::Close(stall_fd);
    }

    {
        std::cout << "\n[Test 7] Bad URL\n";
        uplink::UploadPoolConfig cfg;
        cfg.url = "ftp://nowhere";
        uplink::UploadPool pool(cfg);
        if (!check(!pool.Start(), "start fails")) return 1;
        if (!check(pool.lastStatus() == uplink::UploadPool::Status::BAD_URL, "BAD_URL")) return 1;
        if (!check(!pool.Submit(makeJob(0)) && pool.dropped() == 1, "submit on a stopped pool")) return 1;
    }

    std::cout << "\nuplink_uploadpool_test: PASS\n";
    return 0;
}
