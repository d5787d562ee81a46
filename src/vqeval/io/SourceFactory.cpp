#include "vqeval/io/SourceFactory.hpp"
#include "vqeval/core/Errors.hpp"
#include "vqeval/io/ImageSequenceSource.hpp"
#include "vqeval/io/Recording.hpp"
#include "vqeval/io/VideoCaptureSource.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace vqeval {

namespace {
std::string lowerExt(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return std::tolower(c); });
    return e;
}
} // namespace

bool isSupportedVideoExtension(const std::string& ext) {
    return ext == "mp4" || ext == "avi";
}

std::unique_ptr<IVideoSource> openSource(const std::string& path)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw EvalError(ErrorKind::SourceUnavailable, "no such file or directory: " + path);

    std::unique_ptr<IVideoSource> src;
    const std::string ext = lowerExt(path);

    if (fs::is_directory(path, ec))           src = std::make_unique<ImageSequenceSource>(path);
    else if (ext == "vqr")                    src = std::make_unique<RecordingSource>(path);
    else if (isSupportedVideoExtension(ext))  src = std::make_unique<VideoCaptureSource>(path);
    else {
        throw EvalError(ErrorKind::SourceUnavailable,
                        "unsupported container '" + ext + "' (expected .mp4, .avi, .vqr or a folder): " + path);
    }

    if (!src->isOpen())
        throw EvalError(ErrorKind::SourceUnavailable, "cannot open source: " + path);
    return src;
}

} // namespace vqeval
