#pragma once
#include <opencv2/core.hpp>

namespace vqeval {

/** Peak value of the 8-bit representation used for PSNR. */
inline constexpr double kPsnrPeak = 255.0;

/**
 * PSNR in dB between two 8-bit images of identical size and type:
 *   10 * log10(255^2 / MSE), MSE over every pixel and channel.
 * Identical images give +infinity.
 * Throws std::invalid_argument on size/type mismatch or empty input.
 */
double computePSNR(const cv::Mat& a8u, const cv::Mat& b8u);

/** Mean squared per-channel difference (the PSNR denominator). */
double meanSquaredError(const cv::Mat& a8u, const cv::Mat& b8u);

} // namespace vqeval
