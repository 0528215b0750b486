#include "apps/codec/BitmapPacker.hpp"

#include <iostream>
#include <random>

#include <opencv2/core.hpp>

static bool check(bool ok, const char* what) {
    if (!ok) std::cout << "FAIL: " << what << "\n";
    return ok;
}

int main() {
    std::cout << "=== codec_bitmappacker_test ===\n";

    {
        std::cout << "\n[Test 1] MSB-first packing of a known row\n";
        // 16 px: W B B B B B B W | B W B W B W B W
        cv::Mat bw(1, 16, CV_8UC1, cv::Scalar(0));
        bw.at<uint8_t>(0, 0) = 255;
        bw.at<uint8_t>(0, 7) = 255;
        for (int x = 9; x < 16; x += 2) bw.at<uint8_t>(0, x) = 255;

        msg::Bitmap1bpp bmp;
        if (!check(codec::Pack1bpp(bw, bmp), "pack")) return 1;
        if (!check(bmp.width == 16 && bmp.height == 1 && bmp.stride == 2, "geometry")) return 1;
        if (!check(bmp.bits.size() == 2, "2 bytes")) return 1;
        if (!check(bmp.bits[0] == 0x81 && bmp.bits[1] == 0x55, "0x81 0x55")) {
            std::cout << std::hex << int(bmp.bits[0]) << " " << int(bmp.bits[1]) << std::dec << "\n";
            return 1;
        }
    }

    {
        std::cout << "\n[Test 2] Pack -> unpack restores a random pattern\n";
        std::mt19937 rng(42);
        cv::Mat bw(20, 64, CV_8UC1);
        for (int y = 0; y < bw.rows; ++y) {
            for (int x = 0; x < bw.cols; ++x) bw.at<uint8_t>(y, x) = (rng() & 1u) ? 255 : 0;
        }

        msg::Bitmap1bpp bmp;
        if (!check(codec::Pack1bpp(bw, bmp), "pack")) return 1;
        if (!check(bmp.byteSize() == 64u * 20u / 8u, "W*H/8 bytes")) return 1;

        const cv::Mat back = codec::Unpack1bpp(bmp);
        if (!check(!back.empty() && back.size() == bw.size(), "unpack size")) return 1;
        if (!check(cv::countNonZero(back != bw) == 0, "identical pixels")) return 1;
    }

    {
        std::cout << "\n[Test 3] Width not a multiple of 8 pads each row\n";
        cv::Mat bw(3, 10, CV_8UC1, cv::Scalar(255));
        msg::Bitmap1bpp bmp;
        if (!check(codec::Pack1bpp(bw, bmp), "pack")) return 1;
        if (!check(bmp.stride == 2 && bmp.bits.size() == 6, "stride 2, 6 bytes")) return 1;
        for (uint32_t y = 0; y < bmp.height; ++y) {
            const uint8_t* row = bmp.bits.data() + y * bmp.stride;
            if (!check(row[0] == 0xFF && row[1] == 0xC0, "padding bits stay clear")) return 1;
        }
        if (!check(cv::countNonZero(codec::Unpack1bpp(bmp) != bw) == 0, "unpack with padding")) return 1;
    }

    {
        std::cout << "\n[Test 4] Device bitmap from a BGR camera frame\n";
        // Landscape 320x240, left half white, right half black.
        cv::Mat frame(240, 320, CV_8UC3, cv::Scalar::all(0));
        frame(cv::Rect(0, 0, 160, 240)).setTo(cv::Scalar::all(255));

        msg::Bitmap1bpp bmp;
        if (!check(codec::MakeDeviceBitmap(frame, 240, 320, bmp), "make bitmap")) return 1;
        if (!check(bmp.width == 240 && bmp.height == 320, "240x320")) return 1;
        if (!check(bmp.bits.size() == 9600, "9600 bytes")) return 1;

        // Resized 240 wide: columns 0..119 white, 120..239 black.
        const cv::Mat back = codec::Unpack1bpp(bmp);
        if (!check(back.at<uint8_t>(0, 0) == 255 && back.at<uint8_t>(319, 100) == 255, "left side white")) return 1;
        if (!check(back.at<uint8_t>(0, 239) == 0 && back.at<uint8_t>(160, 140) == 0, "right side black")) return 1;
        if (!check(bmp.bits[0] == 0xFF && bmp.bits[bmp.stride - 1] == 0x00, "row bytes")) return 1;
    }

    {
        std::cout << "\n[Test 5] Threshold at 128\n";
        msg::Bitmap1bpp bmp;
        cv::Mat dark(16, 16, CV_8UC1, cv::Scalar(127));
        if (!check(codec::MakeDeviceBitmap(dark, 8, 8, bmp), "grey 127")) return 1;
        if (!check(cv::countNonZero(codec::Unpack1bpp(bmp)) == 0, "127 -> black")) return 1;

        cv::Mat light(16, 16, CV_8UC3, cv::Scalar::all(129));
        if (!check(codec::MakeDeviceBitmap(light, 8, 8, bmp), "grey 129")) return 1;
        if (!check(cv::countNonZero(codec::Unpack1bpp(bmp)) == 64, "129 -> white")) return 1;
    }

    {
        std::cout << "\n[Test 6] Bad input is rejected and clears the output\n";
        msg::Bitmap1bpp bmp;
        bmp.width = 1;
        bmp.bits.assign(3, 0xAA);

        if (!check(!codec::MakeDeviceBitmap(cv::Mat(), 240, 320, bmp), "empty frame")) return 1;
        if (!check(bmp.bits.empty() && bmp.width == 0, "output cleared")) return 1;

        const cv::Mat frame(10, 10, CV_8UC3, cv::Scalar::all(255));
        if (!check(!codec::MakeDeviceBitmap(frame, 0, 320, bmp), "zero width")) return 1;

        const cv::Mat two(10, 10, CV_8UC2, cv::Scalar::all(0));
        if (!check(!codec::MakeDeviceBitmap(two, 8, 8, bmp), "2 channels")) return 1;

        const cv::Mat bgr(4, 8, CV_8UC3, cv::Scalar::all(0));
        if (!check(!codec::Pack1bpp(bgr, bmp), "Pack1bpp needs CV_8UC1")) return 1;

        msg::Bitmap1bpp shortBmp;
        shortBmp.width = 16;
        shortBmp.height = 2;
        shortBmp.stride = 2;
        shortBmp.bits.assign(3, 0);
        if (!check(codec::Unpack1bpp(shortBmp).empty(), "truncated bits")) return 1;
    }

    std::cout << "\ncodec_bitmappacker_test: PASS\n";
    return 0;
}
