#pragma once

#include <memory>
#include <opencv2/core.hpp>
#include "Config.hpp"

namespace vqeval {

/*
  Backend interface for per-pair quality metrics.

  Both inputs are normalized frames of identical size, CV_8UC3.
  Implementations should provide:
    - psnr(): peak signal-to-noise ratio in dB, +inf for identical frames.
    - ssim(): mean structural similarity over the channels, computed
      on [0..1] data with a window x window mean filter.
*/
class IMetricBackend {
public:
    virtual ~IMetricBackend() = default;

    [[nodiscard]] virtual double psnr(const cv::Mat& ref8u, const cv::Mat& cand8u) = 0;

    [[nodiscard]] virtual double ssim(const cv::Mat& ref8u, const cv::Mat& cand8u, int window) = 0;
};

/* Factory function for creating a backend of the requested type. */
std::unique_ptr<IMetricBackend> makeBackend(BackendType type);

} // namespace vqeval
