#pragma once

#include <opencv2/core.hpp>

namespace platform {

// A frame source. grab() fills 'frame' with an 8-bit BGR image (OpenCV
// channel order). Implementations are not thread safe; cam::CameraService
// serialises all access.
class ICameraSource {
public:
    virtual bool open() = 0;
    virtual bool grab(cv::Mat& frame) = 0;
    virtual void close() = 0;
    virtual const char* name() const = 0;
    virtual ~ICameraSource() = default;
};

} // namespace platform
