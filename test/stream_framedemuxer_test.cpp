#include "apps/stream/FrameDemuxer.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

static bool check(bool ok, const char* what) {
    if (!ok) std::cout << "FAIL: " << what << "\n";
    return ok;
}

// SOI + payload + EOI. Payload bytes never contain 0xFF, as in a stuffed
// JPEG entropy segment.
static std::vector<uint8_t> makeFrame(uint32_t seed, std::size_t payload_len) {
    std::vector<uint8_t> f;
    f.reserve(payload_len + 4);
    f.push_back(0xFF);
    f.push_back(0xD8);
    std::mt19937 rng(seed);
    for (std::size_t i = 0; i < payload_len; ++i) {
        f.push_back(static_cast<uint8_t>(rng() % 0xFF));    // 0x00..0xFE
    }
    f.push_back(0xFF);
    f.push_back(0xD9);
    return f;
}

int main() {
    std::cout << "=== stream_framedemuxer_test ===\n";

    const int K = 25;
    std::vector<std::vector<uint8_t>> src;
    std::vector<uint8_t> wire;
    for (int i = 0; i < K; ++i) {
        src.push_back(makeFrame(uint32_t(1000 + i), std::size_t(50 + 37 * i)));
        wire.insert(wire.end(), src.back().begin(), src.back().end());
    }

    {
        std::cout << "\n[Test 1] Whole stream in one Feed()\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        const std::size_t n = d.Feed(wire, out);

        if (!check(n == std::size_t(K) && out.size() == std::size_t(K), "all frames emitted")) return 1;
        for (int i = 0; i < K; ++i) {
            if (!check(out[i].data == src[i], "frame bytes identical")) return 1;
        }
        if (!check(d.buffered() == 0, "nothing left buffered")) return 1;
        if (!check(d.framesEmitted() == uint64_t(K), "framesEmitted")) return 1;
        if (!check(d.bytesDiscarded() == 0, "no bytes discarded")) return 1;
        std::cout << "frames=" << out.size() << "\n";
    }

    {
        std::cout << "\n[Test 2] Arbitrary chunk boundaries (incl. split markers)\n";
        for (uint32_t seed = 1; seed <= 20; ++seed) {
            std::mt19937 rng(seed);
            std::uniform_int_distribution<int> chunk_len(1, 300);

            stream::FrameDemuxer d;
            std::vector<msg::Frame> out;
            std::size_t pos = 0;
            while (pos < wire.size()) {
                const std::size_t n = std::min<std::size_t>(std::size_t(chunk_len(rng)), wire.size() - pos);
                d.Feed(wire.data() + pos, n, out);
                pos += n;
            }

            if (!check(out.size() == std::size_t(K), "frame count independent of chunking")) {
                std::cout << "seed=" << seed << " got=" << out.size() << "\n";
                return 1;
            }
            for (int i = 0; i < K; ++i) {
                if (!check(out[i].data == src[i], "frame bytes identical after chunking")) return 1;
            }
        }
        std::cout << "20 chunkings: OK\n";
    }

    {
        std::cout << "\n[Test 3] Byte-by-byte feed, marker split across every boundary\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        for (uint8_t b : wire) d.Feed(&b, 1, out);
        if (!check(out.size() == std::size_t(K), "byte-by-byte frame count")) return 1;
        if (!check(out.front().data == src.front() && out.back().data == src.back(), "ends intact")) return 1;
    }

    {
        std::cout << "\n[Test 4] SOI without EOI is never emitted\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        std::vector<uint8_t> partial = makeFrame(7, 400);
        partial.resize(partial.size() - 2);     // drop EOI

        for (std::size_t off = 0; off < partial.size(); off += 17) {
            const std::size_t n = std::min<std::size_t>(17, partial.size() - off);
            d.Feed(partial.data() + off, n, out);
        }
        if (!check(out.empty(), "no frame without EOI")) return 1;
        if (!check(d.buffered() == partial.size(), "partial frame kept")) return 1;

        // Lone FF then D9 in the next chunk completes it.
        const uint8_t ff = 0xFF;
        const uint8_t d9 = 0xD9;
        d.Feed(&ff, 1, out);
        if (!check(out.empty(), "FF alone is not EOI")) return 1;
        d.Feed(&d9, 1, out);
        if (!check(out.size() == 1 && out[0].size() == partial.size() + 2, "EOI completes frame")) return 1;
        if (!check(d.buffered() == 0, "buffer empty")) return 1;
    }

    {
        std::cout << "\n[Test 5] Leading garbage is counted as discarded\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        std::vector<uint8_t> bytes = {0x00, 0x11, 0xFF, 0x00, 0x22};     // 5 bytes, no SOI
        bytes.insert(bytes.end(), src[0].begin(), src[0].end());
        bytes.push_back(0x33);                                          // gap
        bytes.push_back(0x44);
        bytes.insert(bytes.end(), src[1].begin(), src[1].end());

        d.Feed(bytes, out);
        if (!check(out.size() == 2, "two frames")) return 1;
        if (!check(out[0].data == src[0] && out[1].data == src[1], "frames intact")) return 1;
        if (!check(d.bytesDiscarded() == 7, "5 leading + 2 gap bytes discarded")) {
            std::cout << "discarded=" << d.bytesDiscarded() << "\n";
            return 1;
        }
    }

    {
        std::cout << "\n[Test 6] Reset() drops the partial frame\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        std::vector<uint8_t> partial = makeFrame(9, 100);
        partial.resize(60);
        d.Feed(partial, out);
        if (!check(d.buffered() == 60, "partial buffered")) return 1;

        d.Reset();
        if (!check(d.buffered() == 0, "buffer cleared")) return 1;

        // A fresh frame after Reset() must not be glued to the dropped prefix.
        d.Feed(src[2], out);
        if (!check(out.size() == 1 && out[0].data == src[2], "clean frame after reset")) return 1;
    }

    {
        std::cout << "\n[Test 7] Receive timestamps are set and monotonic\n";
        stream::FrameDemuxer d;
        std::vector<msg::Frame> out;
        d.Feed(src[0], out);
        Rtos::SleepMs(5);
        d.Feed(src[1], out);
        if (!check(out.size() == 2, "two frames")) return 1;
        if (!check(out[0].t_rx_us > 0 && out[1].t_rx_us > out[0].t_rx_us, "t_rx_us increases")) return 1;
    }

    std::cout << "\nstream_framedemuxer_test: PASS\n";
    return 0;
}
