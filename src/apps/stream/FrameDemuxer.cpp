// FrameDemuxer.cpp
#include "apps/stream/FrameDemuxer.hpp"

#include <cstring>
#include <string>

namespace stream {

std::size_t FrameDemuxer::findMarker(uint8_t code, std::size_t from) const {
    const std::size_t n = m_buf.size();
    if (n < 2) return std::string::npos;

    const uint8_t* base = m_buf.data();
    std::size_t pos = from;
    while (pos + 1 < n) {
        const void* hit = std::memchr(base + pos, msg::MARKER_PREFIX, (n - 1) - pos);
        if (!hit) return std::string::npos;

        pos = static_cast<std::size_t>(static_cast<const uint8_t*>(hit) - base);
        if (base[pos + 1] == code) return pos;
        ++pos;
    }
    return std::string::npos;
}

std::size_t FrameDemuxer::Feed(const uint8_t* chunk, std::size_t len, std::vector<msg::Frame>& out) {
    if (chunk && len > 0) {
        m_buf.insert(m_buf.end(), chunk, chunk + len);
    }

    std::size_t emitted = 0;
    std::size_t search = 0;     // next scan position
    std::size_t consumed = 0;   // end of last emitted frame
    const uint64_t t_us = Rtos::NowUs();

    while (search < m_buf.size()) {
        const std::size_t start = findMarker(msg::SOI_CODE, search);
        if (start == std::string::npos) break;      // nothing that looks like a frame yet

        const std::size_t end = findMarker(msg::EOI_CODE, start + 2);
        if (end == std::string::npos) break;        // partial frame: keep for next Feed()

        msg::Frame f{};
        f.data.assign(m_buf.begin() + static_cast<std::ptrdiff_t>(start),
                      m_buf.begin() + static_cast<std::ptrdiff_t>(end + 2));
        f.t_rx_us = t_us;
        out.push_back(std::move(f));

        m_discarded += start - consumed;
        ++emitted;
        consumed = end + 2;
        search = consumed;
    }

    if (consumed > 0) {
        m_buf.erase(m_buf.begin(), m_buf.begin() + static_cast<std::ptrdiff_t>(consumed));
    }

    m_frames += emitted;
    return emitted;
}

void FrameDemuxer::Reset() {
    m_buf.clear();
}

} // namespace stream
