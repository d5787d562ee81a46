#pragma once
#include <opencv2/core.hpp>

namespace vqeval {

/** Parameters of the structural similarity index. */
struct SsimOptions {
    int    window    = 7;     // odd side of the uniform window
    double dataRange = 1.0;   // inputs are scaled to [0..1]
    double k1        = 0.01;
    double k2        = 0.03;
};

/**
 * Mean SSIM of two single-channel CV_64F images in [0..dataRange].
 * Uniform window x window means, sample covariance (N/(N-1)),
 * SSIM map averaged after cropping (window-1)/2 pixels per border.
 */
double ssimSingleChannel(const cv::Mat& a64f, const cv::Mat& b64f,
                         const SsimOptions& opt = {});

/**
 * SSIM of two 8-bit images (1 or 3 channels) of identical size.
 * Each channel is scaled to [0..1] and scored separately; the result is
 * the mean over channels. Returns exactly 1.0 when either side of the
 * image is smaller than the window.
 * Throws std::invalid_argument for an even or < 3 window, or mismatched
 * inputs.
 */
double computeSSIM(const cv::Mat& a8u, const cv::Mat& b8u, int window = 7);

} // namespace vqeval
