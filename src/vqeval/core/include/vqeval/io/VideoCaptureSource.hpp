#pragma once

#include "vqeval/core/VideoSource.hpp"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <optional>
#include <string>

namespace vqeval {

/*
  IVideoSource over a container file decoded by cv::VideoCapture
  (.mp4, .avi, whatever the installed OpenCV backend can open).

  Notes:
    - frameCount() is CAP_PROP_FRAME_COUNT as reported by the container.
    - read(i) seeks with CAP_PROP_POS_FRAMES unless i is the frame right
      after the previous read, then decodes one frame (BGR24).
*/
class VideoCaptureSource final : public IVideoSource {
public:
    explicit VideoCaptureSource(const std::string& path);
    ~VideoCaptureSource() override;

    VideoCaptureSource(const VideoCaptureSource&)            = delete;
    VideoCaptureSource& operator=(const VideoCaptureSource&) = delete;

    bool isOpen() const override { return cap_.isOpened(); }
    std::size_t frameCount() const override;
    std::optional<Frame> read(std::size_t index) override;
    SourceInfo info() const override;

private:
    std::string path_;
    mutable cv::VideoCapture cap_;   // get() is not const in OpenCV
    cv::Mat frame_;                  // last decoded frame, continuous BGR
    std::optional<std::size_t> next_;  // index the decoder is positioned at
};

} // namespace vqeval
