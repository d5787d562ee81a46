#pragma once
#include "vqeval/core/VideoSource.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace vqeval::test {

/* Deterministic textured BGR frame; different seeds give different content. */
inline cv::Mat patternFrame(int w, int h, unsigned seed) {
    cv::Mat m(h, w, CV_8UC3);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> d(0, 255);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            auto& px = m.at<cv::Vec3b>(y, x);
            // smooth gradient plus noise, so SSIM has structure to compare
            px[0] = cv::saturate_cast<std::uint8_t>((x * 255) / std::max(1, w - 1) / 2 + d(rng) / 2);
            px[1] = cv::saturate_cast<std::uint8_t>((y * 255) / std::max(1, h - 1) / 2 + d(rng) / 2);
            px[2] = cv::saturate_cast<std::uint8_t>(((x + y) * 4 + static_cast<int>(seed) * 17) % 256);
        }
    }
    return m;
}

/* Frame list as a video. Decoding can be made to fail from a given index on. */
class MemorySource final : public IVideoSource {
public:
    explicit MemorySource(std::vector<cv::Mat> frames) : frames_(std::move(frames)) {}

    bool isOpen() const override { return open_; }
    std::size_t frameCount() const override { return declared_ ? *declared_ : frames_.size(); }

    std::optional<Frame> read(std::size_t index) override {
        ++reads_;
        if (index >= frames_.size() || index >= failFrom_) return std::nullopt;
        // fresh buffer per read: the previous view dies here, as with real decoders
        current_ = frames_[index].clone();
        const PixelFormat fmt = current_.channels() == 1 ? PixelFormat::Gray8 : PixelFormat::BGR24;
        return Frame{
            std::span<const std::uint8_t>(current_.data, current_.total() * current_.elemSize()),
            static_cast<std::uint32_t>(current_.cols),
            static_cast<std::uint32_t>(current_.rows),
            fmt,
            index
        };
    }

    SourceInfo info() const override {
        SourceInfo si{};
        si.container  = "memory";
        si.frameCount = frameCount();
        return si;
    }

    // metadata claims n frames regardless of what is stored
    void declareFrameCount(std::size_t n) { declared_ = n; }
    void failFrom(std::size_t index)       { failFrom_ = index; }
    void setOpen(bool open)                { open_ = open; }
    std::size_t reads() const              { return reads_; }

private:
    std::vector<cv::Mat> frames_;
    cv::Mat current_;
    std::optional<std::size_t> declared_;
    std::size_t failFrom_{static_cast<std::size_t>(-1)};
    bool open_{true};
    std::size_t reads_{0};
};

inline std::vector<cv::Mat> patternVideo(std::size_t n, int w, int h, unsigned seedBase = 1) {
    std::vector<cv::Mat> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) v.push_back(patternFrame(w, h, seedBase + static_cast<unsigned>(i)));
    return v;
}

/* Same frames with additive noise of the given amplitude. */
inline std::vector<cv::Mat> noisyCopy(const std::vector<cv::Mat>& src, double sigma, unsigned seed = 7) {
    std::vector<cv::Mat> out;
    cv::RNG rng(seed);
    for (const auto& f : src) {
        cv::Mat noise(f.size(), CV_16SC3);
        rng.fill(noise, cv::RNG::NORMAL, 0.0, sigma);
        cv::Mat f16, sum;
        f.convertTo(f16, CV_16SC3);
        sum = f16 + noise;
        cv::Mat back;
        sum.convertTo(back, CV_8UC3);
        out.push_back(back);
    }
    return out;
}

/* Unique scratch directory, removed on destruction. */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("vqeval_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace vqeval::test
