#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace msg {

// Black/white image, one bit per pixel.
// Rows are packed left to right, 8 pixels per byte, most significant bit
// first. A set bit is a white (255) pixel. Each row starts on a byte
// boundary, so stride = ceil(width / 8); for width % 8 == 0 the payload is
// exactly width * height / 8 bytes.
struct Bitmap1bpp {
    uint32_t width  = 0;    // pixels
    uint32_t height = 0;    // pixels
    uint32_t stride = 0;    // bytes per row

    std::vector<uint8_t> bits;

    static constexpr uint32_t strideFor(uint32_t w) { return (w + 7u) / 8u; }
    std::size_t byteSize() const { return std::size_t(stride) * height; }
};

} // namespace msg
