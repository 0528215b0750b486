#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/codec/IImageEncoder.hpp"
#include "apps/codec/OpenCvEncoder.hpp"

namespace codec {

// ------------------------------
// Search constants
// ------------------------------

// Coarse ladder: qualities tried at native resolution, then downscales tried
// at FALLBACK_QUALITY. Both descending.
struct CompressionLadder {
    static constexpr std::array<int, 7>   QUALITIES{{85, 75, 65, 55, 45, 35, 25}};
    static constexpr std::array<float, 3> SCALES{{0.8f, 0.6f, 0.4f}};
    static constexpr int FALLBACK_QUALITY = 25;
};

// Bisection over quality. ITERATIONS is the stopping rule, not a tolerance.
struct AdaptiveSearch {
    static constexpr int MIN_QUALITY = 10;
    static constexpr int MAX_QUALITY = 95;
    static constexpr int ITERATIONS  = 7;
};

// ------------------------------
// Config
// ------------------------------
struct CompressorConfig {
    // Target used by the convenience overloads (bytes).
    std::size_t default_budget_bytes = 8 * 1024;

    // Thumbnail box
    uint32_t thumb_max_w = 160;
    uint32_t thumb_max_h = 120;
    int      thumb_quality = 75;

    bool log_results = true;
};

// ------------------------------
// Output
// ------------------------------
struct CompressResult {
    std::vector<uint8_t> bytes;
    int   quality = 0;          // quality the bytes were encoded at
    float scale = 1.0f;         // resolution factor applied before encoding
    bool  met_budget = false;   // bytes.size() <= budget
};

struct CompressorStats {
    uint64_t total_compressions = 0;
    uint64_t total_bytes_in = 0;
    uint64_t total_bytes_out = 0;
    double   avg_compression_ratio = 0.0;   // EMA (0.9 old / 0.1 new), out/in
    double   avg_processing_ms = 0.0;       // EMA (0.9 old / 0.1 new)

    double overallRatio() const {
        return total_bytes_in ? double(total_bytes_out) / double(total_bytes_in) : 0.0;
    }
};

// ---------------------------------------------------------------------------
// AdaptiveCompressor: fit an image into a byte budget by trading quality and
// resolution.
//
// The encoder is injected so tests can use a synthetic size model; the
// default is an OpenCvEncoder producing JPEG.
//
// Result contract:
//  - CompressForBudget() always produces bytes when encoding works at all;
//    over-budget best effort is reported through met_budget=false.
//  - OptimalQualityForBudget() produces nothing (NO_FIT) when no probed
//    quality fits.
//  - ENCODE_FAIL (encoder produced nothing for any attempt) is the hard error.
// ---------------------------------------------------------------------------
class AdaptiveCompressor {
public:
    explicit AdaptiveCompressor(const CompressorConfig& cfg = {});
    AdaptiveCompressor(IImageEncoder& encoder, const CompressorConfig& cfg = {});

    AdaptiveCompressor(const AdaptiveCompressor&) = delete;
    AdaptiveCompressor& operator=(const AdaptiveCompressor&) = delete;

    // Coarse ladder search with unconditional best-effort fallback.
    bool CompressForBudget(const cv::Mat& img, std::size_t budget_bytes, CompressResult& out);

    // Highest quality in [10,95] reachable within 7 bisection probes whose
    // size fits the budget.
    bool OptimalQualityForBudget(const cv::Mat& img, std::size_t budget_bytes, CompressResult& out);

    // Plain encode at one quality, accounted in the stats.
    bool Compress(const cv::Mat& img, int quality, std::vector<uint8_t>& out);

    // Aspect-preserving downscale into the configured thumbnail box, then encode.
    bool CreateThumbnail(const cv::Mat& img, std::vector<uint8_t>& out);

    const CompressorStats& stats() const { return m_stats; }
    void ResetStats() { m_stats = CompressorStats{}; }

    const CompressorConfig& config() const { return m_cfg; }

    enum class Status : uint8_t {
        OK = 0,
        OVER_BUDGET,    // best-effort bytes returned, larger than the budget
        NO_FIT,         // no probed quality fit the budget, no bytes returned
        EMPTY_INPUT,
        RESIZE_FAIL,
        ENCODE_FAIL,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    CompressorConfig m_cfg{};

    OpenCvEncoder  m_default_encoder{ImageFormat::JPEG};
    IImageEncoder* m_encoder = nullptr;     // non-owning

    CompressorStats m_stats{};
    Status m_status = Status::OK;

    // Encode via m_encoder and update stats on success.
    bool encodeTracked(const cv::Mat& img, int quality, std::vector<uint8_t>& out);

    bool downscale(const cv::Mat& img, float scale, cv::Mat& out);

    bool fail(Status s);
};

} // namespace codec
