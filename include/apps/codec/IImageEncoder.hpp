#pragma once
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

namespace codec {

// Encodes one image at a given quality (1..100). Returns false when no
// output could be produced at all; 'out' is then left empty.
class IImageEncoder {
public:
    virtual bool encode(const cv::Mat& img, int quality, std::vector<uint8_t>& out) = 0;
    virtual ~IImageEncoder() = default;
};

} // namespace codec
