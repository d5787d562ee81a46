#include "vqeval/io/VideoCaptureSource.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <filesystem>
#include <iostream>

namespace vqeval {

VideoCaptureSource::VideoCaptureSource(const std::string& path)
    : path_(path)
{
    if (!cap_.open(path)) {
        std::cerr << "[capture] cannot open " << path << "\n";
        return;
    }
    next_ = 0;
}

VideoCaptureSource::~VideoCaptureSource() {
    if (cap_.isOpened()) cap_.release();
}

std::size_t VideoCaptureSource::frameCount() const {
    if (!cap_.isOpened()) return 0;
    const double n = cap_.get(cv::CAP_PROP_FRAME_COUNT);
    // some backends report -1 or NaN when the container has no index
    if (!std::isfinite(n) || n <= 0.0) return 0;
    return static_cast<std::size_t>(n);
}

std::optional<Frame> VideoCaptureSource::read(std::size_t index) {
    if (!cap_.isOpened()) return std::nullopt;

    if (!next_ || *next_ != index) {
        if (!cap_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(index))) {
            next_.reset();
            return std::nullopt;
        }
    }

    cv::Mat raw;
    if (!cap_.read(raw) || raw.empty()) {
        next_.reset();
        return std::nullopt;
    }
    next_ = index + 1;

    // decoders hand out BGR; anything else is brought to BGR here
    if (raw.type() == CV_8UC3)      frame_ = raw.isContinuous() ? raw : raw.clone();
    else if (raw.type() == CV_8UC1) cv::cvtColor(raw, frame_, cv::COLOR_GRAY2BGR);
    else if (raw.type() == CV_8UC4) cv::cvtColor(raw, frame_, cv::COLOR_BGRA2BGR);
    else {
        std::cerr << "[capture] " << path_ << ": unsupported frame type " << raw.type() << "\n";
        return std::nullopt;
    }

    return Frame{
        std::span<const std::uint8_t>(frame_.data, frame_.total() * frame_.elemSize()),
        static_cast<std::uint32_t>(frame_.cols),
        static_cast<std::uint32_t>(frame_.rows),
        PixelFormat::BGR24,
        index
    };
}

SourceInfo VideoCaptureSource::info() const {
    SourceInfo si{};
    si.path = path_;
    std::string ext = std::filesystem::path(path_).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    si.container = ext;

    std::error_code ec;
    const auto bytes = std::filesystem::file_size(path_, ec);
    if (!ec) si.fileBytes = bytes;

    if (!cap_.isOpened()) return si;
    si.frameCount = frameCount();
    si.fps        = cap_.get(cv::CAP_PROP_FPS);
    si.width      = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    si.height     = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (si.fps > 0.0) si.durationSec = static_cast<double>(si.frameCount) / si.fps;
    return si;
}

} // namespace vqeval
