#include "vqeval/io/ImageSequenceSource.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace vqeval {

// ---------------- helpers ----------------

static bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i)
        if (std::tolower(static_cast<unsigned char>(a[i]))!=std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    return e;
}

static std::vector<std::filesystem::path>
list_images_in_folder(const std::filesystem::path& folder,
                      const std::vector<std::string>& allow_exts)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(folder, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto e = ext_of(it->path());
        for (auto& a: allow_exts) {
            if (ieq(e, a)) { files.push_back(it->path()); break; }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ---------------- source ----------------

std::vector<std::string> ImageSequenceSource::defaultExtensions() {
    return {"png", "jpg", "jpeg", "bmp", "tif", "tiff"};
}

ImageSequenceSource::ImageSequenceSource(const std::string& folder)
    : ImageSequenceSource(folder, defaultExtensions()) {}

ImageSequenceSource::ImageSequenceSource(const std::string& folder,
                                         const std::vector<std::string>& exts)
    : folder_(folder)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        std::cerr << "[images] not a directory: " << folder << "\n";
        return;
    }
    files_ = list_images_in_folder(folder, exts);
    ok_ = true;
}

std::optional<Frame> ImageSequenceSource::read(std::size_t index) {
    if (!ok_ || index >= files_.size()) return std::nullopt;

    cv::Mat src = cv::imread(files_[index].string(), cv::IMREAD_COLOR);
    if (src.empty()) {
        std::cerr << "[images] failed to read '" << files_[index].string() << "'\n";
        return std::nullopt;
    }
    frame_ = src.isContinuous() ? src : src.clone();

    return Frame{
        std::span<const std::uint8_t>(frame_.data, frame_.total() * frame_.elemSize()),
        static_cast<std::uint32_t>(frame_.cols),
        static_cast<std::uint32_t>(frame_.rows),
        PixelFormat::BGR24,
        index
    };
}

SourceInfo ImageSequenceSource::info() const {
    SourceInfo si{};
    si.path       = folder_;
    si.container  = "images";
    si.frameCount = files_.size();
    for (const auto& p : files_) {
        std::error_code ec;
        const auto bytes = std::filesystem::file_size(p, ec);
        if (!ec) si.fileBytes += bytes;
    }
    if (!files_.empty()) {
        // header-only decode is not exposed by imgcodecs; read the first image
        cv::Mat first = cv::imread(files_.front().string(), cv::IMREAD_COLOR);
        si.width  = first.cols;
        si.height = first.rows;
    }
    return si;
}

} // namespace vqeval
