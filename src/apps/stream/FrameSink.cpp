// FrameSink.cpp
#include "apps/stream/FrameSink.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace stream {

// -------------------- MjpegFileSink --------------------

static std::string default_mjpeg_name() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&now, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "received_mjpeg_%Y%m%d_%H%M%S.mjpeg", &tm);
    return buf;
}

MjpegFileSink::MjpegFileSink(const std::string& path)
: m_path(path.empty() ? default_mjpeg_name() : path) {}

bool MjpegFileSink::open() {
    m_out.open(m_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_out) {
        std::cerr << "[STREAM] ERROR: could not open " << m_path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return false;
    }
    std::cout << "[STREAM] saving MJPEG stream to: " << m_path << "\n";
    return true;
}

bool MjpegFileSink::consume(const msg::Frame& f) {
    if (!m_out.is_open()) return false;

    m_out.write(reinterpret_cast<const char*>(f.data.data()), std::streamsize(f.size()));
    if (!m_out) {
        std::cerr << "[STREAM] ERROR: write to " << m_path << " failed\n";
        return false;
    }

    ++m_frames;
    m_bytes += f.size();
    if (m_frames % 10 == 0) {
        std::cout << "[STREAM] received " << m_frames << " frames ("
                  << std::fixed << std::setprecision(1) << double(m_bytes) / 1024.0 << " KB)\r"
                  << std::flush;
    }
    return true;
}

void MjpegFileSink::finish() {
    if (m_out.is_open()) {
        m_out.flush();
        m_out.close();
    }
    std::cout << "\n[STREAM] received " << m_frames << " MJPEG frames\n";
    std::cout << "[STREAM] total size: " << std::fixed << std::setprecision(1)
              << double(m_bytes) / 1024.0 << " KB\n";
    std::cout << "[STREAM] stream saved to: " << m_path << "\n";
}

// -------------------- JpegFilesSink --------------------

JpegFilesSink::JpegFilesSink(const std::string& dir, uint32_t max_images)
: m_dir(dir.empty() ? "." : dir)
, m_max(max_images) {}

std::string JpegFilesSink::ImagePath(const std::string& dir, uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%04u.jpg", unsigned(index));
    return (std::filesystem::path(dir) / name).string();
}

bool JpegFilesSink::consume(const msg::Frame& f) {
    ++m_frames;
    m_bytes += f.size();

    if (m_saved >= m_max) return true;

    if (m_saved == 0) {
        std::error_code ec;
        std::filesystem::create_directories(m_dir, ec);
        if (ec) {
            std::cerr << "[STREAM] ERROR: cannot create " << m_dir << ": " << ec.message() << "\n";
            return false;
        }
    }

    const std::string path = ImagePath(m_dir, m_saved);
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "[STREAM] ERROR: could not open " << path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return false;
    }
    out.write(reinterpret_cast<const char*>(f.data.data()), std::streamsize(f.size()));
    if (!out) {
        std::cerr << "[STREAM] ERROR: write to " << path << " failed\n";
        return false;
    }

    ++m_saved;
    std::cout << "[STREAM] saved frame " << m_saved << "/" << m_max << ": " << path << "\n";
    return true;
}

void JpegFilesSink::finish() {
    std::cout << "[STREAM] total frames processed: " << m_frames
              << " (saved " << m_saved << ")\n";
}

// -------------------- CountingSink --------------------

bool CountingSink::consume(const msg::Frame& f) {
    ++m_frames;
    m_bytes += f.size();
    if (m_verbose) {
        std::cout << "[STREAM] received frame " << m_frames << "\r" << std::flush;
    }
    return true;
}

void CountingSink::finish() {
    std::cout << "\n[STREAM] total frames: " << m_frames << " ("
              << std::fixed << std::setprecision(1) << double(m_bytes) / 1024.0 << " KB)\n";
}

} // namespace stream
