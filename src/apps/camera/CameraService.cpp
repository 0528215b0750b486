// CameraService.cpp
#include "apps/camera/CameraService.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/imgproc.hpp>

#include "apps/codec/BitmapPacker.hpp"

namespace cam {

static inline CaptureConfig sanitise(const CaptureConfig& in) {
    CaptureConfig cfg = in;

    cfg.jpeg_quality       = std::min(100, std::max(1, cfg.jpeg_quality));
    cfg.gray_quality       = std::min(100, std::max(1, cfg.gray_quality));
    cfg.compressed_quality = std::min(100, std::max(1, cfg.compressed_quality));

    if (cfg.compressed_budget_bytes == 0) cfg.compressed_budget_bytes = 8 * 1024;

    return cfg;
}

CameraService::CameraService(std::unique_ptr<platform::ICameraSource> source, const CaptureConfig& cfg)
: m_source(std::move(source))
, m_cfg(sanitise(cfg)) {
    if (m_cfg.enable_compression) {
        m_compressor = std::make_unique<codec::AdaptiveCompressor>(m_cfg.compressor);
        std::cout << "[CAMERA] adaptive compression enabled (budget="
                  << m_cfg.compressed_budget_bytes << " bytes)\n";
    }
}

CameraService::~CameraService() {
    Stop();
}

bool CameraService::Start() {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_running) return true;
    if (!m_source || !m_source->open()) {
        m_status = Status::OPEN_FAIL;
        return false;
    }
    m_running = true;
    m_status = Status::OK;
    std::cout << "[CAMERA] " << m_source->name() << " started\n";
    return true;
}

void CameraService::Stop() {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (!m_running) return;
    m_source->close();
    m_running = false;
}

bool CameraService::running() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_running;
}

bool CameraService::CaptureJpeg(std::vector<uint8_t>& out, Status* why) {
    std::lock_guard<std::mutex> lk(m_mtx);
    StatusOut report{m_status, why};
    out.clear();

    cv::Mat frame;
    if (!grabLocked(frame)) return false;
    if (!m_jpeg.encode(frame, m_cfg.jpeg_quality, out)) return fail(Status::ENCODE_FAIL);
    return succeed();
}

bool CameraService::CaptureGrayJpeg(std::vector<uint8_t>& out, Status* why) {
    std::lock_guard<std::mutex> lk(m_mtx);
    StatusOut report{m_status, why};
    out.clear();

    cv::Mat frame;
    if (!grabLocked(frame)) return false;

    cv::Mat gray3;
    try {
        cv::Mat gray;
        if (frame.channels() == 1) {
            gray = frame;
        } else {
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        }
        cv::cvtColor(gray, gray3, cv::COLOR_GRAY2BGR);
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] grayscale conversion failed: " << e.what() << "\n";
        return fail(Status::TRANSFORM_FAIL);
    }

    if (!m_jpeg.encode(gray3, m_cfg.gray_quality, out)) return fail(Status::ENCODE_FAIL);
    return succeed();
}

bool CameraService::CaptureCompressedJpeg(std::vector<uint8_t>& out, Status* why) {
    std::lock_guard<std::mutex> lk(m_mtx);
    StatusOut report{m_status, why};
    out.clear();

    cv::Mat frame;
    if (!grabLocked(frame)) return false;

    if (m_compressor) {
        codec::CompressResult res;
        if (!m_compressor->CompressForBudget(frame, m_cfg.compressed_budget_bytes, res)) {
            std::cerr << "[CAMERA] compression failed: "
                      << codec::AdaptiveCompressor::StatusStr(m_compressor->lastStatus()) << "\n";
            return fail(Status::ENCODE_FAIL);
        }
        out = std::move(res.bytes);
        return succeed();
    }

    if (!m_jpeg.encode(frame, m_cfg.compressed_quality, out)) return fail(Status::ENCODE_FAIL);
    return succeed();
}

bool CameraService::CaptureDisplayJpeg(uint32_t width, uint32_t height, int quality, std::vector<uint8_t>& out,
                                       Status* why) {
    std::lock_guard<std::mutex> lk(m_mtx);
    StatusOut report{m_status, why};
    out.clear();
    if (width == 0 || height == 0) return fail(Status::TRANSFORM_FAIL);

    cv::Mat frame;
    if (!grabLocked(frame)) return false;

    cv::Mat resized;
    try {
        cv::Mat gray;
        if (frame.channels() == 1) {
            gray = frame;
        } else {
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        }
        cv::resize(gray, resized, cv::Size(int(width), int(height)), 0, 0, cv::INTER_AREA);
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] display transform failed: " << e.what() << "\n";
        return fail(Status::TRANSFORM_FAIL);
    }

    if (!m_jpeg.encode(resized, quality, out)) return fail(Status::ENCODE_FAIL);
    return succeed();
}

bool CameraService::CaptureDeviceBitmap(uint32_t width, uint32_t height, msg::Bitmap1bpp& out,
                                        Status* why) {
    std::lock_guard<std::mutex> lk(m_mtx);
    StatusOut report{m_status, why};
    out = msg::Bitmap1bpp{};

    cv::Mat frame;
    if (!grabLocked(frame)) return false;
    if (!codec::MakeDeviceBitmap(frame, width, height, out)) return fail(Status::TRANSFORM_FAIL);
    return succeed();
}

uint64_t CameraService::capturesOk() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_ok;
}

uint64_t CameraService::capturesFailed() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_failed;
}

CameraService::Status CameraService::lastStatus() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_status;
}

// -------------------- private helpers --------------------

bool CameraService::grabLocked(cv::Mat& frame) {
    if (!m_running) return fail(Status::NOT_RUNNING);
    if (!m_source->grab(frame) || frame.empty()) return fail(Status::GRAB_FAIL);
    return true;
}

bool CameraService::fail(Status s) {
    m_status = s;
    ++m_failed;
    return false;
}

bool CameraService::succeed() {
    m_status = Status::OK;
    ++m_ok;
    return true;
}

const char* CameraService::StatusStr(CameraService::Status s) {
    switch (s) {
        case CameraService::Status::OK:             return "OK";
        case CameraService::Status::NOT_RUNNING:    return "NOT_RUNNING";
        case CameraService::Status::OPEN_FAIL:      return "OPEN_FAIL";
        case CameraService::Status::GRAB_FAIL:      return "GRAB_FAIL";
        case CameraService::Status::TRANSFORM_FAIL: return "TRANSFORM_FAIL";
        case CameraService::Status::ENCODE_FAIL:    return "ENCODE_FAIL";
        default:                                    return "UNKNOWN";
    }
}

} // namespace cam
