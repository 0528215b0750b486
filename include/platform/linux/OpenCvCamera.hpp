#pragma once
#include <cstdint>
#include <string>

#include <opencv2/videoio.hpp>

#include "platform/ICameraSource.hpp"

namespace platform {

struct CameraConfig {
    int device_index = 0;           // /dev/video<N>

    uint32_t width  = 320;
    uint32_t height = 240;

    uint32_t warmup_ms = 1000;      // settle time after open
    uint32_t warmup_frames = 2;     // frames read and thrown away
};

// cv::VideoCapture backed camera (V4L2 / libcamera compat layer on the Pi).
class OpenCvCamera : public ICameraSource {
public:
    explicit OpenCvCamera(const CameraConfig& cfg = {});
    ~OpenCvCamera() override;

    bool open() override;
    bool grab(cv::Mat& frame) override;
    void close() override;
    const char* name() const override { return "OpenCvCamera"; }

private:
    CameraConfig m_cfg{};
    cv::VideoCapture m_cap;
};

// Serves one still image over and over (bench testing without a sensor).
// The image is read from disk on open(), or given directly.
class StillImageCamera : public ICameraSource {
public:
    explicit StillImageCamera(const std::string& path);
    explicit StillImageCamera(const cv::Mat& image);

    bool open() override;
    bool grab(cv::Mat& frame) override;
    void close() override {}
    const char* name() const override { return "StillImageCamera"; }

private:
    std::string m_path;
    cv::Mat m_image;
};

} // namespace platform
