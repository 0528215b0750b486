#include "apps/codec/OpenCvEncoder.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/imgcodecs.hpp>

namespace codec {

namespace {

const char* extFor(ImageFormat f) {
    switch (f) {
        case ImageFormat::JPEG: return ".jpg";
        case ImageFormat::WEBP: return ".webp";
        case ImageFormat::PNG:  return ".png";
        case ImageFormat::BMP:  return ".bmp";
        default:                return ".jpg";
    }
}

std::vector<int> paramsFor(ImageFormat f, int quality) {
    std::vector<int> params;
    switch (f) {
        case ImageFormat::JPEG:
            params = {cv::IMWRITE_JPEG_QUALITY, quality,
                      cv::IMWRITE_JPEG_PROGRESSIVE, 0,
                      cv::IMWRITE_JPEG_OPTIMIZE, 1};
            break;
        case ImageFormat::WEBP:
            params = {cv::IMWRITE_WEBP_QUALITY, quality};
            break;
        case ImageFormat::PNG:
            params = {cv::IMWRITE_PNG_COMPRESSION, std::min(9, std::max(0, (100 - quality) / 11))};
            break;
        case ImageFormat::BMP:
        default:
            break;
    }
    return params;
}

} // anonymous namespace

const char* FormatStr(ImageFormat f) {
    switch (f) {
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::WEBP: return "WEBP";
        case ImageFormat::PNG:  return "PNG";
        case ImageFormat::BMP:  return "BMP";
        default:                return "UNKNOWN";
    }
}

OpenCvEncoder::OpenCvEncoder(ImageFormat fmt)
: m_fmt(fmt) {}

bool OpenCvEncoder::encode(const cv::Mat& img, int quality, std::vector<uint8_t>& out) {
    out.clear();
    if (img.empty()) return false;

    quality = std::min(100, std::max(1, quality));

    try {
        std::vector<uchar> buf;
        if (!cv::imencode(extFor(m_fmt), img, buf, paramsFor(m_fmt, quality))) {
            return false;
        }
        out.assign(buf.begin(), buf.end());
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] imencode(" << FormatStr(m_fmt) << ") failed: " << e.what() << "\n";
        out.clear();
        return false;
    }
    return !out.empty();
}

bool OpenCvEncoder::Probe(ImageFormat fmt) {
    const cv::Mat probe(10, 10, CV_8UC3, cv::Scalar(0, 0, 0));
    OpenCvEncoder enc(fmt);
    std::vector<uint8_t> out;
    return enc.encode(probe, 75, out);
}

} // namespace codec
