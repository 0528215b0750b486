#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include <opencv2/core.hpp>

#include "platform/ICameraSource.hpp"
#include "apps/codec/AdaptiveCompressor.hpp"
#include "apps/codec/OpenCvEncoder.hpp"
#include "msg/Bitmap1bpp.hpp"

namespace cam {

// ------------------------------
// Config
// ------------------------------
struct CaptureConfig {
    int jpeg_quality = 85;              // /frame, /stream
    int gray_quality = 80;              // grayscale variants

    // Compressed variant. With enable_compression the AdaptiveCompressor
    // fits frames into compressed_budget_bytes; without it frames are
    // encoded once at compressed_quality.
    bool        enable_compression = false;
    std::size_t compressed_budget_bytes = 8 * 1024;
    int         compressed_quality = 50;

    codec::CompressorConfig compressor{};
};

// ---------------------------------------------------------------------------
// CameraService: sole owner of the camera.
//
// Every Capture*() call holds one lock for the whole grab + transform +
// encode cycle, so concurrent request threads never touch the sensor at the
// same time. Construct once at startup and pass by reference.
// ---------------------------------------------------------------------------
class CameraService {
public:
    CameraService(std::unique_ptr<platform::ICameraSource> source, const CaptureConfig& cfg = {});
    ~CameraService();

    CameraService(const CameraService&) = delete;
    CameraService& operator=(const CameraService&) = delete;

    // Open the source. Returns false if it cannot be opened.
    bool Start();
    void Stop();
    bool running() const;

    enum class Status : uint8_t {
        OK = 0,
        NOT_RUNNING,
        OPEN_FAIL,
        GRAB_FAIL,
        TRANSFORM_FAIL,
        ENCODE_FAIL,
    };

    // Each Capture*() writes its own outcome to *why (if given) before the
    // camera lock is released. lastStatus() may already belong to another
    // thread's capture by the time the caller reads it.

    // Colour JPEG at jpeg_quality.
    bool CaptureJpeg(std::vector<uint8_t>& out, Status* why = nullptr);

    // Grayscale (kept 3-channel) JPEG at gray_quality.
    bool CaptureGrayJpeg(std::vector<uint8_t>& out, Status* why = nullptr);

    // Budget-fitted JPEG (see CaptureConfig::enable_compression).
    bool CaptureCompressedJpeg(std::vector<uint8_t>& out, Status* why = nullptr);

    // Grayscale, resized to width x height, JPEG at quality.
    bool CaptureDisplayJpeg(uint32_t width, uint32_t height, int quality, std::vector<uint8_t>& out,
                            Status* why = nullptr);

    // 1bpp bitmap for the device display.
    bool CaptureDeviceBitmap(uint32_t width, uint32_t height, msg::Bitmap1bpp& out,
                             Status* why = nullptr);

    bool compressionEnabled() const { return m_compressor != nullptr; }

    uint64_t capturesOk() const;
    uint64_t capturesFailed() const;

    static const char* StatusStr(Status s);

    // Result of the most recent capture on any thread.
    Status lastStatus() const;

private:
    std::unique_ptr<platform::ICameraSource> m_source;
    CaptureConfig m_cfg{};

    codec::OpenCvEncoder m_jpeg{codec::ImageFormat::JPEG};

    // Present only when compression was enabled at construction.
    std::unique_ptr<codec::AdaptiveCompressor> m_compressor;

    mutable std::mutex m_mtx;   // guards everything below and the source
    bool m_running = false;
    uint64_t m_ok = 0;
    uint64_t m_failed = 0;
    Status m_status = Status::OK;

    // Copies m_status to the caller on scope exit. Declare after the
    // lock_guard so it runs while m_mtx is still held.
    struct StatusOut {
        const Status& src;
        Status* dst;
        ~StatusOut() { if (dst) *dst = src; }
    };

    // Helpers below expect m_mtx held.
    bool grabLocked(cv::Mat& frame);
    bool fail(Status s);
    bool succeed();
};

} // namespace cam
