// picamlink: camera node.
//
// Usage: picamlink [camera] [http_port] [device_port] [mjpeg_port] [compress]
//   camera      /dev/video index (default 0) or path to a still image
//   http_port   single frames + multipart streams     (default 5000)
//   device_port DeviceFrameProtocol for the display   (default 10001)
//   mjpeg_port  raw back-to-back MJPEG                (default 10002)
//   compress    "compress" enables budget-fitted /frame_compressed
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"
#include "platform/linux/OpenCvCamera.hpp"
#include "apps/camera/CameraService.hpp"
#include "apps/codec/OpenCvEncoder.hpp"
#include "apps/device/DeviceFrameServer.hpp"
#include "apps/http/FrameHttpServer.hpp"
#include "apps/stream/MjpegStreamServer.hpp"

// Define the RTOS task objects
Rtos::Task HttpServerTask;
Rtos::Task DeviceServerTask;
Rtos::Task MjpegServerTask;

static volatile std::sig_atomic_t g_stop = 0;

static void onSignal(int) { g_stop = 1; }

static bool parsePort(const char* s, uint16_t& out) {
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (!end || *end != '\0' || v <= 0 || v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

static bool isIndex(const std::string& s) {
    return !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
}

int main(int argc, char** argv) {
    std::string camera_arg = "0";
    uint16_t http_port   = 5000;
    uint16_t device_port = 10001;
    uint16_t mjpeg_port  = 10002;
    bool compress = false;

    if (argc > 1) {
        const std::string a1 = argv[1];
        if (a1 == "-h" || a1 == "--help") {
            std::cout << "Usage: " << argv[0]
                      << " [camera_index|image_path] [http_port] [device_port] [mjpeg_port] [compress]\n";
            return 0;
        }
        camera_arg = a1;
    }
    if ((argc > 2 && !parsePort(argv[2], http_port)) ||
        (argc > 3 && !parsePort(argv[3], device_port)) ||
        (argc > 4 && !parsePort(argv[4], mjpeg_port))) {
        std::cerr << "[MAIN] invalid port argument\n";
        return 1;
    }
    if (argc > 5) compress = (std::string(argv[5]) == "compress");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Camera
    std::unique_ptr<platform::ICameraSource> source;
    if (isIndex(camera_arg)) {
        platform::CameraConfig cam_cfg;
        cam_cfg.device_index = std::atoi(camera_arg.c_str());
        source = std::make_unique<platform::OpenCvCamera>(cam_cfg);
    } else {
        source = std::make_unique<platform::StillImageCamera>(camera_arg);
    }

    cam::CaptureConfig cap_cfg;
    cap_cfg.enable_compression = compress && codec::OpenCvEncoder::Probe(codec::ImageFormat::JPEG);
    if (compress && !cap_cfg.enable_compression) {
        std::cerr << "[MAIN] JPEG encoder unavailable, compression disabled\n";
    }

    cam::CameraService camera(std::move(source), cap_cfg);
    if (!camera.Start()) {
        std::cerr << "[MAIN] camera start failed: "
                  << cam::CameraService::StatusStr(camera.lastStatus()) << "\n";
        return 1;
    }

    // Servers
    http::FrameHttpServerConfig http_cfg;
    http_cfg.port = http_port;
    http::FrameHttpServer http_server(camera, http_cfg);

    device::DeviceFrameServerConfig dev_cfg;
    dev_cfg.port = device_port;
    device::DeviceFrameServer device_server(camera, dev_cfg);

    stream::MjpegStreamServerConfig mjpeg_cfg;
    mjpeg_cfg.port = mjpeg_port;
    stream::MjpegStreamServer mjpeg_server(camera, mjpeg_cfg);

    if (!http_server.Start() || !device_server.Start() || !mjpeg_server.Start()) {
        std::cerr << "[MAIN] server start failed\n";
        return 1;
    }

    // Task contexts live for the whole of main()
    http::FrameHttpServer::TaskCtx     http_ctx{&http_server};
    device::DeviceFrameServer::TaskCtx dev_ctx{&device_server};
    stream::MjpegStreamServer::TaskCtx mjpeg_ctx{&mjpeg_server};

    HttpServerTask.Create("HttpServer", http::FrameHttpServer::TaskEntry, &http_ctx);
    DeviceServerTask.Create("DeviceServer", device::DeviceFrameServer::TaskEntry, &dev_ctx);
    MjpegServerTask.Create("MjpegServer", stream::MjpegStreamServer::TaskEntry, &mjpeg_ctx);

    std::cout << "[MAIN] endpoints:\n";
    std::cout << "  - http://<pi>:" << http_server.boundPort() << "/frame\n";
    std::cout << "  - http://<pi>:" << http_server.boundPort() << "/stream\n";
    std::cout << "  - tcp  <pi>:" << device_server.boundPort() << " (GET_FRAME)\n";
    std::cout << "  - tcp  <pi>:" << mjpeg_server.boundPort() << " (raw MJPEG)\n";

    constexpr uint64_t STATUS_PERIOD_US = 10'000'000;  // 0.1 Hz
    uint64_t last_status_us = Rtos::NowUs();

    while (!g_stop) {
        Rtos::SleepMs(200);

        const uint64_t now = Rtos::NowUs();
        if (now - last_status_us >= STATUS_PERIOD_US) {
            std::cout << "[MAIN] captures ok=" << camera.capturesOk()
                      << " failed=" << camera.capturesFailed()
                      << " http_frames=" << http_server.framesSent()
                      << " device_frames=" << device_server.framesServed()
                      << " mjpeg_frames=" << mjpeg_server.framesSent() << "\n";
            last_status_us = now;
        }
    }

    std::cout << "\n[MAIN] shutting down\n";
    http_server.RequestStop();
    device_server.RequestStop();
    mjpeg_server.RequestStop();

    // The servers live on this stack: a late task is waited for, never left behind.
    if (!HttpServerTask.JoinFor(2000)) {
        std::cerr << "[MAIN] http task slow to stop, waiting\n";
        HttpServerTask.Join();
    }
    if (!DeviceServerTask.JoinFor(2000)) {
        std::cerr << "[MAIN] device task slow to stop, waiting\n";
        DeviceServerTask.Join();
    }
    if (!MjpegServerTask.JoinFor(2000)) {
        std::cerr << "[MAIN] mjpeg task slow to stop, waiting\n";
        MjpegServerTask.Join();
    }

    http_server.Stop();
    device_server.Stop();
    mjpeg_server.Stop();
    camera.Stop();

    return 0;
}
