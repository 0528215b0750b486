#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace msg {

// JPEG start/end-of-image markers delimiting one frame on the wire.
static constexpr uint8_t MARKER_PREFIX = 0xFF;
static constexpr uint8_t SOI_CODE      = 0xD8;
static constexpr uint8_t EOI_CODE      = 0xD9;

// One complete image cut out of a byte stream.
// data runs from the SOI marker (FF D8) up to and including the EOI marker
// (FF D9). Frames are only ever produced whole; ordering is arrival order.
struct Frame {
    std::vector<uint8_t> data;

    uint64_t t_rx_us = 0;   // monotonic time the closing EOI arrived (µs)

    std::size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

} // namespace msg
