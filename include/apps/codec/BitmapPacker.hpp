#pragma once
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "msg/Bitmap1bpp.hpp"

namespace codec {

// Grey level above which a pixel becomes white (cv::THRESH_BINARY).
static constexpr double BITMAP_THRESHOLD = 128.0;

// Camera frame -> fixed size 1bpp bitmap for the device display:
// grayscale (BGR channel order) -> INTER_AREA resize to width x height ->
// binary threshold at BITMAP_THRESHOLD -> MSB-first packing.
// Returns false on empty input, zero dimensions, unsupported channel count
// or an OpenCV error; 'out' is then cleared.
bool MakeDeviceBitmap(const cv::Mat& frame, uint32_t width, uint32_t height, msg::Bitmap1bpp& out);

// Pack a CV_8UC1 0/255 image. Any non-zero pixel sets its bit.
bool Pack1bpp(const cv::Mat& bw, msg::Bitmap1bpp& out);

// Inverse of Pack1bpp: CV_8UC1 image of 0 / 255.
cv::Mat Unpack1bpp(const msg::Bitmap1bpp& bmp);

} // namespace codec
