// capture_uploader: periodic capture posted to the API server.
//
// Usage: capture_uploader [api_url] [interval_s] [duration_s] [camera]
//   api_url    REST endpoint (default http://192.168.18.11:3000/api/capture)
//   interval_s capture period in seconds (default 0.5)
//   duration_s stop after this many seconds (default: until Ctrl+C)
//   camera     /dev/video index (default 0) or path to a still image
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"
#include "platform/linux/OpenCvCamera.hpp"
#include "apps/camera/CameraService.hpp"
#include "apps/uplink/UploadPool.hpp"

static volatile std::sig_atomic_t g_stop = 0;

static void onSignal(int) { g_stop = 1; }

static bool parseSeconds(const char* s, double& out) {
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (!end || *end != '\0' || !(v > 0.0)) return false;
    out = v;
    return true;
}

int main(int argc, char** argv) {
    uplink::UploadPoolConfig pool_cfg;
    double interval_s = 0.5;
    double duration_s = 0.0;    // 0 = unlimited
    std::string camera_arg = "0";

    if (argc > 1) {
        const std::string a1 = argv[1];
        if (a1 == "-h" || a1 == "--help") {
            std::cout << "Usage: " << argv[0] << " [api_url] [interval_s] [duration_s] [camera]\n";
            return 0;
        }
        pool_cfg.url = a1;
    }
    if (argc > 2 && !parseSeconds(argv[2], interval_s)) {
        std::cerr << "Error: Invalid interval '" << argv[2] << "'. Must be a positive number.\n";
        return 1;
    }
    if (argc > 3 && !parseSeconds(argv[3], duration_s)) {
        std::cerr << "Error: Invalid duration '" << argv[3] << "'. Must be a positive number.\n";
        return 1;
    }
    if (argc > 4) camera_arg = argv[4];

    std::cout << "=== Image Capture API Client ===\n";
    std::cout << "API URL: " << pool_cfg.url << "\n";
    std::cout << "Capture Interval: " << interval_s << "s\n";
    if (duration_s > 0.0) {
        std::cout << "Duration: " << duration_s << "s\n";
    } else {
        std::cout << "Duration: Unlimited (Ctrl+C to stop)\n";
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::unique_ptr<platform::ICameraSource> source;
    if (!camera_arg.empty() && camera_arg.find_first_not_of("0123456789") == std::string::npos) {
        platform::CameraConfig cam_cfg;
        cam_cfg.device_index = std::atoi(camera_arg.c_str());
        cam_cfg.width  = 1280;
        cam_cfg.height = 720;
        cam_cfg.warmup_ms = 2000;
        source = std::make_unique<platform::OpenCvCamera>(cam_cfg);
    } else {
        source = std::make_unique<platform::StillImageCamera>(camera_arg);
    }

    cam::CameraService camera(std::move(source));
    if (!camera.Start()) {
        std::cerr << "[MAIN] camera start failed\n";
        return 1;
    }

    uplink::UploadPool pool(pool_cfg);
    if (!pool.Start()) {
        std::cerr << "[MAIN] upload pool start failed: "
                  << uplink::UploadPool::StatusStr(pool.lastStatus()) << "\n";
        return 1;
    }

    const uint64_t period_us = uint64_t(interval_s * 1e6);
    const uint64_t start_us = Rtos::NowUs();
    const uint64_t end_us = (duration_s > 0.0) ? start_us + uint64_t(duration_s * 1e6) : 0;

    uint64_t captures = 0;
    uint64_t next_us = start_us;

    while (!g_stop) {
        const uint64_t now = Rtos::NowUs();
        if (end_us && now >= end_us) break;

        if (now >= next_us) {
            uplink::UploadJob job;
            cam::CameraService::Status why = cam::CameraService::Status::OK;
            if (camera.CaptureJpeg(job.jpeg, &why)) {
                job.filename = uplink::CaptureFilename(std::time(nullptr));
                ++captures;
                if (!pool.Submit(job)) {
                    std::cerr << "[MAIN] upload queue full, dropped " << job.filename << "\n";
                }
            } else {
                std::cerr << "[MAIN] capture failed: " << cam::CameraService::StatusStr(why) << "\n";
            }
            next_us += period_us;
            if (next_us < now) next_us = now + period_us;     // fell behind: don't burst
        }

        Rtos::SleepMs(10);
    }

    std::cout << "\nStopping capture...\n";
    pool.Stop();
    camera.Stop();

    std::cout << "Total images captured: " << captures
              << " (sent=" << pool.sent() << " failed=" << pool.failed()
              << " dropped=" << pool.dropped() << ")\n";
    return 0;
}
