#pragma once

#include "vqeval/core/Backend.hpp"

namespace vqeval {

/*
  CPU-based metric backend (OpenCV).

  This class computes:
    - PSNR on the 8-bit data (peak 255),
    - SSIM per channel on [0..1] data with a uniform window.

  Notes:
    - Inputs are expected to be normalized pairs (same size, CV_8UC3).
    - Stateless: one instance may be shared by several worker threads.
*/
class CpuBackend final : public IMetricBackend {
public:
    CpuBackend() = default;

    double psnr(const cv::Mat& ref8u, const cv::Mat& cand8u) override;

    double ssim(const cv::Mat& ref8u, const cv::Mat& cand8u, int window) override;
};

} // namespace vqeval
