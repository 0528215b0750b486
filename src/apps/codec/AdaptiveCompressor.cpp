// AdaptiveCompressor.cpp
#include "apps/codec/AdaptiveCompressor.hpp"

#include <algorithm>
#include <iostream>

#include <opencv2/imgproc.hpp>

#include "os/rtos.hpp"

namespace codec {

static inline CompressorConfig sanitise(const CompressorConfig& in) {
    CompressorConfig cfg = in;

    if (cfg.default_budget_bytes == 0) cfg.default_budget_bytes = 8 * 1024;

    if (cfg.thumb_max_w == 0) cfg.thumb_max_w = 160;
    if (cfg.thumb_max_h == 0) cfg.thumb_max_h = 120;
    cfg.thumb_quality = std::min(100, std::max(1, cfg.thumb_quality));

    return cfg;
}

AdaptiveCompressor::AdaptiveCompressor(const CompressorConfig& cfg)
: m_cfg(sanitise(cfg))
, m_encoder(&m_default_encoder) {}

AdaptiveCompressor::AdaptiveCompressor(IImageEncoder& encoder, const CompressorConfig& cfg)
: m_cfg(sanitise(cfg))
, m_encoder(&encoder) {}

bool AdaptiveCompressor::CompressForBudget(const cv::Mat& img, std::size_t budget_bytes, CompressResult& out) {
    out = CompressResult{};
    if (img.empty()) return fail(Status::EMPTY_INPUT);

    std::vector<uint8_t> bytes;

    // 1) Quality ladder at native resolution
    for (int q : CompressionLadder::QUALITIES) {
        if (!encodeTracked(img, q, bytes)) continue;
        if (bytes.size() <= budget_bytes) {
            out.bytes = std::move(bytes);
            out.quality = q;
            out.scale = 1.0f;
            out.met_budget = true;
            if (m_cfg.log_results) {
                std::cout << "[CODEC] budget=" << budget_bytes << " -> " << out.bytes.size()
                          << " bytes at quality " << q << "\n";
            }
            m_status = Status::OK;
            return true;
        }
    }

    // 2) Resolution ladder at the lowest quality
    for (float s : CompressionLadder::SCALES) {
        cv::Mat small;
        if (!downscale(img, s, small)) continue;
        if (!encodeTracked(small, CompressionLadder::FALLBACK_QUALITY, bytes)) continue;
        if (bytes.size() <= budget_bytes) {
            out.bytes = std::move(bytes);
            out.quality = CompressionLadder::FALLBACK_QUALITY;
            out.scale = s;
            out.met_budget = true;
            if (m_cfg.log_results) {
                std::cout << "[CODEC] budget=" << budget_bytes << " -> " << out.bytes.size()
                          << " bytes at scale " << s << "\n";
            }
            m_status = Status::OK;
            return true;
        }
    }

    // 3) Best effort: native resolution, lowest quality, whatever the size
    if (!encodeTracked(img, CompressionLadder::FALLBACK_QUALITY, bytes)) {
        return fail(Status::ENCODE_FAIL);
    }

    std::cout << "[CODEC] WARN: could not reach budget=" << budget_bytes
              << ", best effort " << bytes.size() << " bytes\n";

    out.bytes = std::move(bytes);
    out.quality = CompressionLadder::FALLBACK_QUALITY;
    out.scale = 1.0f;
    out.met_budget = false;
    m_status = Status::OVER_BUDGET;
    return true;
}

bool AdaptiveCompressor::OptimalQualityForBudget(const cv::Mat& img, std::size_t budget_bytes, CompressResult& out) {
    out = CompressResult{};
    if (img.empty()) return fail(Status::EMPTY_INPUT);

    int low  = AdaptiveSearch::MIN_QUALITY;
    int high = AdaptiveSearch::MAX_QUALITY;

    bool have_best = false;
    bool any_encoded = false;
    std::vector<uint8_t> bytes;

    for (int i = 0; i < AdaptiveSearch::ITERATIONS; ++i) {
        // Range exhausted: further probes would leave [MIN_QUALITY, MAX_QUALITY].
        if (low > high) break;

        const int mid = (low + high) / 2;

        if (!encodeTracked(img, mid, bytes)) {
            high = mid - 1;     // cannot encode here, treat as too big
            continue;
        }
        any_encoded = true;

        if (bytes.size() <= budget_bytes) {
            out.bytes.swap(bytes);
            out.quality = mid;
            have_best = true;
            low = mid + 1;
        } else {
            high = mid - 1;
        }
    }

    if (!have_best) {
        out = CompressResult{};
        return fail(any_encoded ? Status::NO_FIT : Status::ENCODE_FAIL);
    }

    out.scale = 1.0f;
    out.met_budget = true;
    if (m_cfg.log_results) {
        std::cout << "[CODEC] adaptive: " << out.bytes.size() << " bytes at quality "
                  << out.quality << " (budget=" << budget_bytes << ")\n";
    }
    m_status = Status::OK;
    return true;
}

bool AdaptiveCompressor::Compress(const cv::Mat& img, int quality, std::vector<uint8_t>& out) {
    out.clear();
    if (img.empty()) return fail(Status::EMPTY_INPUT);
    if (!encodeTracked(img, quality, out)) return fail(Status::ENCODE_FAIL);
    m_status = Status::OK;
    return true;
}

bool AdaptiveCompressor::CreateThumbnail(const cv::Mat& img, std::vector<uint8_t>& out) {
    out.clear();
    if (img.empty()) return fail(Status::EMPTY_INPUT);

    const double scale = std::min(double(m_cfg.thumb_max_w) / img.cols,
                                  double(m_cfg.thumb_max_h) / img.rows);

    cv::Mat thumb = img;
    if (scale < 1.0) {
        const int w = std::max(1, int(img.cols * scale));
        const int h = std::max(1, int(img.rows * scale));
        try {
            cv::resize(img, thumb, cv::Size(w, h), 0, 0, cv::INTER_AREA);
        } catch (const cv::Exception& e) {
            std::cerr << "[CODEC] thumbnail resize failed: " << e.what() << "\n";
            return fail(Status::RESIZE_FAIL);
        }
    }

    if (!encodeTracked(thumb, m_cfg.thumb_quality, out)) return fail(Status::ENCODE_FAIL);
    m_status = Status::OK;
    return true;
}

// -------------------- private helpers --------------------

bool AdaptiveCompressor::encodeTracked(const cv::Mat& img, int quality, std::vector<uint8_t>& out) {
    out.clear();
    const uint64_t t0 = Rtos::NowUs();
    if (!m_encoder->encode(img, quality, out) || out.empty()) {
        out.clear();
        return false;
    }
    const double ms = double(Rtos::NowUs() - t0) / 1000.0;

    const std::size_t in_bytes = img.total() * img.elemSize();
    const double ratio = in_bytes ? double(out.size()) / double(in_bytes) : 0.0;

    m_stats.total_compressions++;
    m_stats.total_bytes_in  += in_bytes;
    m_stats.total_bytes_out += out.size();

    m_stats.avg_compression_ratio = (m_stats.avg_compression_ratio == 0.0)
        ? ratio : m_stats.avg_compression_ratio * 0.9 + ratio * 0.1;
    m_stats.avg_processing_ms = (m_stats.avg_processing_ms == 0.0)
        ? ms : m_stats.avg_processing_ms * 0.9 + ms * 0.1;

    return true;
}

bool AdaptiveCompressor::downscale(const cv::Mat& img, float scale, cv::Mat& out) {
    const int w = int(img.cols * scale);
    const int h = int(img.rows * scale);
    if (w <= 0 || h <= 0) return false;

    try {
        cv::resize(img, out, cv::Size(w, h));
    } catch (const cv::Exception& e) {
        std::cerr << "[CODEC] resize x" << scale << " failed: " << e.what() << "\n";
        return false;
    }
    return !out.empty();
}

bool AdaptiveCompressor::fail(Status s) {
    m_status = s;
    return false;
}

const char* AdaptiveCompressor::StatusStr(AdaptiveCompressor::Status s) {
    switch (s) {
        case AdaptiveCompressor::Status::OK:          return "OK";
        case AdaptiveCompressor::Status::OVER_BUDGET: return "OVER_BUDGET";
        case AdaptiveCompressor::Status::NO_FIT:      return "NO_FIT";
        case AdaptiveCompressor::Status::EMPTY_INPUT: return "EMPTY_INPUT";
        case AdaptiveCompressor::Status::RESIZE_FAIL: return "RESIZE_FAIL";
        case AdaptiveCompressor::Status::ENCODE_FAIL: return "ENCODE_FAIL";
        default:                                      return "UNKNOWN";
    }
}

} // namespace codec
