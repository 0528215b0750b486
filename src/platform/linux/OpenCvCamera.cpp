#include "platform/linux/OpenCvCamera.hpp"

#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "os/rtos.hpp"

namespace platform {

static inline CameraConfig sanitise(const CameraConfig& in) {
    CameraConfig cfg = in;

    if (cfg.device_index < 0) cfg.device_index = 0;
    if (cfg.width == 0)  cfg.width  = 320;
    if (cfg.height == 0) cfg.height = 240;
    if (cfg.warmup_ms > 10000) cfg.warmup_ms = 10000;

    return cfg;
}

OpenCvCamera::OpenCvCamera(const CameraConfig& cfg)
: m_cfg(sanitise(cfg)) {}

OpenCvCamera::~OpenCvCamera() {
    close();
}

bool OpenCvCamera::open() {
    if (m_cap.isOpened()) return true;

    try {
        if (!m_cap.open(m_cfg.device_index)) {
            std::cerr << "[CAMERA] could not open /dev/video" << m_cfg.device_index << "\n";
            return false;
        }
        m_cap.set(cv::CAP_PROP_FRAME_WIDTH,  double(m_cfg.width));
        m_cap.set(cv::CAP_PROP_FRAME_HEIGHT, double(m_cfg.height));
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] open failed: " << e.what() << "\n";
        return false;
    }

    Rtos::SleepMs(int(m_cfg.warmup_ms));

    cv::Mat scratch;
    for (uint32_t i = 0; i < m_cfg.warmup_frames; ++i) {
        (void)m_cap.read(scratch);
    }

    std::cout << "[CAMERA] /dev/video" << m_cfg.device_index << " ready at "
              << m_cap.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << m_cap.get(cv::CAP_PROP_FRAME_HEIGHT) << "\n";
    return true;
}

bool OpenCvCamera::grab(cv::Mat& frame) {
    if (!m_cap.isOpened()) return false;
    try {
        if (!m_cap.read(frame)) return false;
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] read failed: " << e.what() << "\n";
        return false;
    }
    return !frame.empty();
}

void OpenCvCamera::close() {
    if (m_cap.isOpened()) {
        m_cap.release();
    }
}

// -------------------- StillImageCamera --------------------

StillImageCamera::StillImageCamera(const std::string& path)
: m_path(path) {}

StillImageCamera::StillImageCamera(const cv::Mat& image)
: m_image(image.clone()) {}

bool StillImageCamera::open() {
    if (!m_image.empty()) return true;

    m_image = cv::imread(m_path, cv::IMREAD_COLOR);
    if (m_image.empty()) {
        std::cerr << "[CAMERA] Could not load image " << m_path << "\n";
        return false;
    }
    return true;
}

bool StillImageCamera::grab(cv::Mat& frame) {
    if (m_image.empty()) return false;
    frame = m_image.clone();
    return true;
}

} // namespace platform
