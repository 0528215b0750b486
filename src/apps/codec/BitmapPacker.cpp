#include "apps/codec/BitmapPacker.hpp"

#include <iostream>

#include <opencv2/imgproc.hpp>

namespace codec {

namespace {

bool toGray(const cv::Mat& frame, cv::Mat& gray) {
    switch (frame.channels()) {
        case 1: gray = frame; return true;
        case 3: cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY); return true;
        case 4: cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY); return true;
        default: return false;
    }
}

} // anonymous namespace

bool MakeDeviceBitmap(const cv::Mat& frame, uint32_t width, uint32_t height, msg::Bitmap1bpp& out) {
    out = msg::Bitmap1bpp{};
    if (frame.empty() || width == 0 || height == 0) return false;

    cv::Mat bw;
    try {
        cv::Mat gray;
        if (!toGray(frame, gray)) {
            std::cerr << "[CODEC] bitmap: unsupported channel count " << frame.channels() << "\n";
            return false;
        }
        if (gray.depth() != CV_8U) {
            gray.convertTo(gray, CV_8U);
        }

        cv::Mat resized;
        cv::resize(gray, resized, cv::Size(int(width), int(height)), 0, 0, cv::INTER_AREA);
        cv::threshold(resized, bw, BITMAP_THRESHOLD, 255, cv::THRESH_BINARY);
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] bitmap transform failed: " << e.what() << "\n";
        return false;
    }

    return Pack1bpp(bw, out);
}

bool Pack1bpp(const cv::Mat& bw, msg::Bitmap1bpp& out) {
    out = msg::Bitmap1bpp{};
    if (bw.empty() || bw.type() != CV_8UC1) return false;

    out.width  = static_cast<uint32_t>(bw.cols);
    out.height = static_cast<uint32_t>(bw.rows);
    out.stride = msg::Bitmap1bpp::strideFor(out.width);
    out.bits.assign(out.byteSize(), 0);

    for (int y = 0; y < bw.rows; ++y) {
        const uint8_t* src = bw.ptr<uint8_t>(y);
        uint8_t* dst = out.bits.data() + std::size_t(y) * out.stride;
        for (int x = 0; x < bw.cols; ++x) {
            if (src[x]) {
                dst[x >> 3] |= static_cast<uint8_t>(0x80u >> (x & 7));
            }
        }
    }
    return true;
}

cv::Mat Unpack1bpp(const msg::Bitmap1bpp& bmp) {
    if (bmp.width == 0 || bmp.height == 0 || bmp.bits.size() < bmp.byteSize()) {
        return cv::Mat();
    }

    cv::Mat bw(int(bmp.height), int(bmp.width), CV_8UC1);
    for (int y = 0; y < bw.rows; ++y) {
        const uint8_t* src = bmp.bits.data() + std::size_t(y) * bmp.stride;
        uint8_t* dst = bw.ptr<uint8_t>(y);
        for (int x = 0; x < bw.cols; ++x) {
            dst[x] = (src[x >> 3] & (0x80u >> (x & 7))) ? 255 : 0;
        }
    }
    return bw;
}

} // namespace codec
