#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "os/rtos.hpp"
#include "msg/Frame.hpp"

namespace stream {

// Depth of the receive -> consume hand-off queue.
static constexpr std::size_t FRAME_Q_CAP = 10;

// Frames are handed over with try_send(): when the consumer falls behind the
// newest frame is dropped and the buffered ones are kept.
using FrameQueue = Rtos::Queue<msg::Frame, FRAME_Q_CAP>;

// ---------------------------------------------------------------------------
// FrameDemuxer: cuts an unframed MJPEG byte stream into whole JPEG frames.
//
// Frames are delimited only by SOI (FF D8) ... EOI (FF D9); there is no length
// prefix. Matching is plain byte search and relies on JPEG byte stuffing
// (an FF inside entropy-coded data is always followed by 00).
//
// One instance per connection. Not thread safe.
// ---------------------------------------------------------------------------
class FrameDemuxer {
public:
    FrameDemuxer() = default;

    // Append one chunk and extract every complete frame now available.
    // Frames are appended to 'out' in stream order. Returns the number of
    // frames appended (0 is normal: not enough data yet).
    std::size_t Feed(const uint8_t* chunk, std::size_t len, std::vector<msg::Frame>& out);

    std::size_t Feed(const std::vector<uint8_t>& chunk, std::vector<msg::Frame>& out) {
        return Feed(chunk.data(), chunk.size(), out);
    }

    // Stream ended: drop whatever is buffered. An unterminated frame is
    // never emitted.
    void Reset();

    std::size_t buffered() const { return m_buf.size(); }

    uint64_t framesEmitted() const { return m_frames; }
    uint64_t bytesDiscarded() const { return m_discarded; }

private:
    std::vector<uint8_t> m_buf;   // accumulator: [unmatched bytes][partial frame]

    uint64_t m_frames = 0;
    uint64_t m_discarded = 0;     // bytes between frames that never matched SOI

    // Index of the first two-byte marker FF <code> at or after 'from', or npos.
    std::size_t findMarker(uint8_t code, std::size_t from) const;
};

} // namespace stream
