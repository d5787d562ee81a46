#pragma once

#include "vqeval/core/VideoSource.hpp"

#include <memory>
#include <string>

namespace vqeval {

/* Containers accepted for video files (lower case, no dot). */
bool isSupportedVideoExtension(const std::string& ext);

/*
  Open a source by path:
    - directory            -> ImageSequenceSource
    - *.vqr                -> RecordingSource
    - *.mp4, *.avi         -> VideoCaptureSource
  Throws EvalError{SourceUnavailable} for a missing path, an unsupported
  extension, or a source that fails to open.
*/
std::unique_ptr<IVideoSource> openSource(const std::string& path);

} // namespace vqeval
