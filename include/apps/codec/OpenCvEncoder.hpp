#pragma once
#include <cstdint>
#include <vector>

#include "apps/codec/IImageEncoder.hpp"

namespace codec {

enum class ImageFormat : uint8_t {
    JPEG = 0,
    WEBP,
    PNG,
    BMP,
};

const char* FormatStr(ImageFormat f);

// cv::imencode backed encoder.
// JPEG is written baseline (progressive decoding is slow on small MCUs) with
// optimised Huffman tables. PNG maps quality to a zlib level,
// level = clamp((100 - quality) / 11, 0, 9). BMP ignores quality.
class OpenCvEncoder : public IImageEncoder {
public:
    explicit OpenCvEncoder(ImageFormat fmt = ImageFormat::JPEG);

    bool encode(const cv::Mat& img, int quality, std::vector<uint8_t>& out) override;

    ImageFormat format() const { return m_fmt; }

    // Probe-encode a tiny image to find out whether this OpenCV build has
    // a codec for 'fmt'.
    static bool Probe(ImageFormat fmt);

private:
    ImageFormat m_fmt;
};

} // namespace codec
