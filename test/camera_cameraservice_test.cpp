#include "apps/camera/CameraService.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "platform/linux/OpenCvCamera.hpp"

static bool check(bool ok, const char* what) {
    if (!ok) std::cout << "FAIL: " << what << "\n";
    return ok;
}

// Flags any overlap between two grab() calls.
class OverlapCamera : public platform::ICameraSource {
public:
    bool open() override { return true; }
    bool grab(cv::Mat& frame) override {
        if (m_inside.exchange(true)) overlaps++;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        frame = cv::Mat(120, 160, CV_8UC3, cv::Scalar(30, 160, 90));
        grabs++;
        m_inside.store(false);
        return true;
    }
    void close() override { closed = true; }
    const char* name() const override { return "OverlapCamera"; }

    std::atomic<int> overlaps{0};
    std::atomic<int> grabs{0};
    std::atomic<bool> closed{false};

private:
    std::atomic<bool> m_inside{false};
};

class NoOpenCamera : public platform::ICameraSource {
public:
    bool open() override { return false; }
    bool grab(cv::Mat&) override { return false; }
    void close() override {}
    const char* name() const override { return "NoOpenCamera"; }
};

static bool isJpeg(const std::vector<uint8_t>& b) {
    return b.size() > 4 && b[0] == 0xFF && b[1] == 0xD8 && b[b.size() - 2] == 0xFF && b.back() == 0xD9;
}

int main() {
    std::cout << "=== camera_cameraservice_test ===\n";

    {
        std::cout << "\n[Test 1] Capture before Start() / failed open\n";
        cam::CameraService svc(std::unique_ptr<platform::ICameraSource>(new OverlapCamera()));
        std::vector<uint8_t> jpg;
        if (!check(!svc.CaptureJpeg(jpg) && jpg.empty(), "not running")) return 1;
        if (!check(svc.lastStatus() == cam::CameraService::Status::NOT_RUNNING, "NOT_RUNNING")) return 1;

        cam::CameraService none(std::unique_ptr<platform::ICameraSource>(new NoOpenCamera()));
        if (!check(!none.Start() && !none.running(), "open failure")) return 1;
        if (!check(none.lastStatus() == cam::CameraService::Status::OPEN_FAIL, "OPEN_FAIL")) return 1;

        platform::StillImageCamera missing("/nonexistent/picamlink_test.jpg");
        if (!check(!missing.open(), "missing still image")) return 1;
    }

    {
        std::cout << "\n[Test 2] Every capture variant\n";
        auto* raw = new OverlapCamera();
        cam::CameraService svc{std::unique_ptr<platform::ICameraSource>(raw)};
        if (!check(svc.Start() && svc.running(), "start")) return 1;
        if (!check(!svc.compressionEnabled(), "compression off by default")) return 1;

        std::vector<uint8_t> jpg;
        if (!check(svc.CaptureJpeg(jpg) && isJpeg(jpg), "colour")) return 1;
        cv::Mat img = cv::imdecode(jpg, cv::IMREAD_UNCHANGED);
        if (!check(img.cols == 160 && img.rows == 120 && img.channels() == 3, "native size, 3 channels")) return 1;

        if (!check(svc.CaptureGrayJpeg(jpg) && isJpeg(jpg), "gray")) return 1;
        img = cv::imdecode(jpg, cv::IMREAD_UNCHANGED);
        if (!check(img.channels() == 3, "gray kept 3-channel")) return 1;

        if (!check(svc.CaptureCompressedJpeg(jpg) && isJpeg(jpg), "compressed (fixed quality)")) return 1;

        if (!check(svc.CaptureDisplayJpeg(240, 320, 50, jpg) && isJpeg(jpg), "display")) return 1;
        img = cv::imdecode(jpg, cv::IMREAD_UNCHANGED);
        if (!check(img.cols == 240 && img.rows == 320 && img.channels() == 1, "display 240x320 gray")) return 1;
        if (!check(!svc.CaptureDisplayJpeg(0, 320, 50, jpg), "zero display size")) return 1;
        if (!check(svc.lastStatus() == cam::CameraService::Status::TRANSFORM_FAIL, "TRANSFORM_FAIL")) return 1;

        msg::Bitmap1bpp bmp;
        if (!check(svc.CaptureDeviceBitmap(240, 320, bmp) && bmp.bits.size() == 9600, "device bitmap")) return 1;

        std::cout << "ok=" << svc.capturesOk() << " failed=" << svc.capturesFailed() << "\n";
        if (!check(svc.capturesOk() == 5 && svc.capturesFailed() == 1, "counters")) return 1;

        svc.Stop();
        if (!check(!svc.running() && raw->closed.load(), "stop closes the source")) return 1;
        if (!check(!svc.CaptureJpeg(jpg), "capture after stop")) return 1;
    }

    {
        std::cout << "\n[Test 3] Concurrent captures never overlap on the source\n";
        auto* raw = new OverlapCamera();
        cam::CameraService svc{std::unique_ptr<platform::ICameraSource>(raw)};
        svc.Start();

        std::atomic<int> ok{0};
        std::vector<std::thread> th;
        for (int t = 0; t < 4; ++t) {
            th.emplace_back([&svc, &ok, t]() {
                for (int i = 0; i < 10; ++i) {
                    std::vector<uint8_t> jpg;
                    msg::Bitmap1bpp bmp;
                    bool r = false;
                    switch ((t + i) % 3) {
                        case 0:  r = svc.CaptureJpeg(jpg); break;
                        case 1:  r = svc.CaptureGrayJpeg(jpg); break;
                        default: r = svc.CaptureDeviceBitmap(240, 320, bmp); break;
                    }
                    if (r) ++ok;
                }
            });
        }
        for (auto& t : th) t.join();

        std::cout << "grabs=" << raw->grabs.load() << " overlaps=" << raw->overlaps.load() << "\n";
        if (!check(ok.load() == 40 && raw->grabs.load() == 40, "all 40 captures")) return 1;
        if (!check(raw->overlaps.load() == 0, "no concurrent grab")) return 1;
    }

    {
        std::cout << "\n[Test 4] Budget-fitted compressed variant\n";
        cv::Mat noise(240, 320, CV_8UC3);
        cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));

        cam::CaptureConfig cfg;
        cfg.enable_compression = true;
        cfg.compressed_budget_bytes = 12 * 1024;
        cfg.compressor.log_results = false;
        cam::CameraService svc(std::unique_ptr<platform::ICameraSource>(new platform::StillImageCamera(noise)), cfg);
        if (!check(svc.Start(), "start")) return 1;
        if (!check(svc.compressionEnabled(), "compressor present")) return 1;

        std::vector<uint8_t> fitted;
        std::vector<uint8_t> full;
        if (!check(svc.CaptureCompressedJpeg(fitted) && isJpeg(fitted), "compressed")) return 1;
        if (!check(svc.CaptureJpeg(full) && isJpeg(full), "full quality")) return 1;
        std::cout << "full=" << full.size() << " fitted=" << fitted.size() << "\n";
        if (!check(fitted.size() < full.size(), "compressed variant is smaller")) return 1;
    }

    {
        std::cout << "\n[Test 5] Each caller gets the status of its own capture\n";
        cam::CameraService svc(std::unique_ptr<platform::ICameraSource>(new OverlapCamera()));
        cam::CameraService::Status why = cam::CameraService::Status::OK;
        std::vector<uint8_t> jpg;
        if (!check(!svc.CaptureJpeg(jpg, &why) && why == cam::CameraService::Status::NOT_RUNNING, "why NOT_RUNNING")) return 1;
        svc.Start();

        // Failing and succeeding captures interleave on the shared service.
        std::atomic<int> wrong{0};
        std::vector<std::thread> th;
        for (int t = 0; t < 4; ++t) {
            th.emplace_back([&svc, &wrong, t]() {
                for (int i = 0; i < 15; ++i) {
                    std::vector<uint8_t> out;
                    cam::CameraService::Status s = cam::CameraService::Status::GRAB_FAIL;
                    if (t % 2 == 0) {
                        if (svc.CaptureDisplayJpeg(0, 0, 50, out, &s) ||
                            s != cam::CameraService::Status::TRANSFORM_FAIL) ++wrong;
                    } else {
                        if (!svc.CaptureJpeg(out, &s) || s != cam::CameraService::Status::OK) ++wrong;
                    }
                }
            });
        }
        for (auto& t : th) t.join();

        std::cout << "mismatched statuses=" << wrong.load() << "\n";
        if (!check(wrong.load() == 0, "no status from another thread")) return 1;
    }

    std::cout << "\ncamera_cameraservice_test: PASS\n";
    return 0;
}
