// mjpeg_client: receive a raw MJPEG stream and save / split / count it.
//
// Usage: mjpeg_client <server_ip> [mode] [filename|dir] [port]
//   save    write every frame into one .mjpeg file (default)
//   images  save the first 10 frames as frame_NNNN.jpg
//   count   only count frames
#include <arpa/inet.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"
#include "apps/stream/FrameSink.hpp"
#include "apps/stream/StreamReceiver.hpp"

static volatile std::sig_atomic_t g_stop = 0;

static void onSignal(int) { g_stop = 1; }

static void usage(const char* prog) {
    std::cout << "Usage: " << prog << " <server_ip> [mode] [filename|dir] [port]\n"
              << "Example: " << prog << " 192.168.18.66\n"
              << "Example: " << prog << " 192.168.18.66 save video.mjpeg\n"
              << "Example: " << prog << " 192.168.18.66 images out/\n"
              << "\nModes:\n"
              << "  save    - Save as MJPEG file (default)\n"
              << "  images  - Save first 10 frames as individual JPEGs\n"
              << "  count   - Just receive and count frames\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    const std::string server_ip = argv[1];
    const std::string mode = (argc > 2) ? argv[2] : "save";
    const std::string target = (argc > 3) ? argv[3] : "";

    in_addr tmp{};
    if (::inet_pton(AF_INET, server_ip.c_str(), &tmp) != 1) {
        std::cerr << "Error: '" << server_ip << "' is not a valid IP address\n";
        return 1;
    }

    stream::StreamReceiverConfig cfg;
    cfg.host = server_ip;
    if (argc > 4) {
        const long p = std::strtol(argv[4], nullptr, 10);
        if (p <= 0 || p > 65535) {
            std::cerr << "Error: invalid port '" << argv[4] << "'\n";
            return 1;
        }
        cfg.port = static_cast<uint16_t>(p);
    }

    std::unique_ptr<stream::IFrameSink> sink;
    if (mode == "save") {
        auto file_sink = std::make_unique<stream::MjpegFileSink>(target);
        if (!file_sink->open()) return 1;
        sink = std::move(file_sink);
    } else if (mode == "images") {
        sink = std::make_unique<stream::JpegFilesSink>(target.empty() ? "." : target, 10);
    } else if (mode == "count") {
        sink = std::make_unique<stream::CountingSink>();
    } else {
        std::cerr << "Error: Invalid mode '" << mode << "'. Use 'save', 'images', or 'count'\n";
        return 1;
    }

    std::cout << "MJPEG Client - Mode: " << mode << "\n";

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    stream::StreamReceiver rx(*sink, cfg);
    if (!rx.Start()) {
        std::cerr << "Make sure the server is running and the IP address is correct.\n";
        return 1;
    }

    while (!g_stop && rx.running()) {
        Rtos::SleepMs(100);
    }

    if (g_stop) {
        std::cout << "\nStopping stream...\n";
    } else {
        rx.Wait();      // stream ended on its own: let the consumer drain
    }
    if (!rx.Stop()) {
        std::cerr << "[STREAM] shutdown incomplete: "
                  << stream::StreamReceiver::StatusStr(rx.lastStatus()) << "\n";
        return 1;
    }

    std::cout << "[STREAM] bytes=" << rx.bytesReceived()
              << " frames=" << rx.framesReceived()
              << " dropped=" << rx.framesDropped()
              << " consumed=" << rx.framesConsumed() << "\n";

    if (mode == "save") {
        const auto* file_sink = static_cast<const stream::MjpegFileSink*>(sink.get());
        std::cout << "\nTo view the saved stream:\n"
                  << "  vlc " << file_sink->path() << "\n"
                  << "  ffplay " << file_sink->path() << "\n";
    }
    return 0;
}
