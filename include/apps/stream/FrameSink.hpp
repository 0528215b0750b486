#pragma once
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <string>

#include "msg/Frame.hpp"

namespace stream {

// Consumer-side destination for demuxed frames. Called from the consumer
// task only.
class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    // Returns false on a hard failure (e.g. disk write); the receiver then
    // stops.
    virtual bool consume(const msg::Frame& f) = 0;

    // Called once after the last frame.
    virtual void finish() = 0;

    virtual uint64_t frames() const = 0;
    virtual uint64_t bytes() const = 0;
};

// Appends every frame to one .mjpeg file (playable with vlc / ffplay).
class MjpegFileSink : public IFrameSink {
public:
    // Empty path: received_mjpeg_<YYYYmmdd_HHMMSS>.mjpeg in the cwd.
    explicit MjpegFileSink(const std::string& path = "");

    bool open();
    const std::string& path() const { return m_path; }

    bool consume(const msg::Frame& f) override;
    void finish() override;

    uint64_t frames() const override { return m_frames; }
    uint64_t bytes() const override { return m_bytes; }

private:
    std::string   m_path;
    std::ofstream m_out;
    uint64_t m_frames = 0;
    uint64_t m_bytes = 0;
};

// Writes the first max_images frames to dir/frame_NNNN.jpg, counts the rest.
class JpegFilesSink : public IFrameSink {
public:
    JpegFilesSink(const std::string& dir, uint32_t max_images = 10);

    bool consume(const msg::Frame& f) override;
    void finish() override;

    uint64_t frames() const override { return m_frames; }
    uint64_t bytes() const override { return m_bytes; }
    uint32_t saved() const { return m_saved; }

    // dir/frame_NNNN.jpg
    static std::string ImagePath(const std::string& dir, uint32_t index);

private:
    std::string m_dir;
    uint32_t m_max = 10;
    uint32_t m_saved = 0;
    uint64_t m_frames = 0;
    uint64_t m_bytes = 0;
};

// Counts frames and prints a running tally.
class CountingSink : public IFrameSink {
public:
    explicit CountingSink(bool verbose = true) : m_verbose(verbose) {}

    bool consume(const msg::Frame& f) override;
    void finish() override;

    uint64_t frames() const override { return m_frames; }
    uint64_t bytes() const override { return m_bytes; }

private:
    bool m_verbose = true;
    uint64_t m_frames = 0;
    uint64_t m_bytes = 0;
};

} // namespace stream
