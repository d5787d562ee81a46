#pragma once

#include "vqeval/core/VideoSource.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vqeval {

/**
 * Folder of still images treated as a video: frame i is the i-th file
 * in name order. Only files whose extension is in `exts` are used.
 */
class ImageSequenceSource final : public IVideoSource {
public:
    static std::vector<std::string> defaultExtensions();

    explicit ImageSequenceSource(const std::string& folder);
    ImageSequenceSource(const std::string& folder, const std::vector<std::string>& exts);

    bool isOpen() const override { return ok_; }
    std::size_t frameCount() const override { return files_.size(); }
    std::optional<Frame> read(std::size_t index) override;
    SourceInfo info() const override;

    const std::vector<std::filesystem::path>& files() const { return files_; }

private:
    std::string folder_;
    bool ok_{false};
    std::vector<std::filesystem::path> files_;
    cv::Mat frame_;   // CV_8UC3 BGR, backing store of the last Frame
};

} // namespace vqeval
