#include "vqeval/metrics/Psnr.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace vqeval {

static void checkPair(const cv::Mat& a, const cv::Mat& b) {
    if (a.empty() || b.empty())
        throw std::invalid_argument("computePSNR: empty image");
    if (a.size() != b.size() || a.type() != b.type())
        throw std::invalid_argument("computePSNR: images differ in size or type");
    if (a.depth() != CV_8U)
        throw std::invalid_argument("computePSNR: 8-bit images expected");
}

double meanSquaredError(const cv::Mat& a8u, const cv::Mat& b8u) {
    checkPair(a8u, b8u);
    // sum of squared differences, all channels at once
    const double sse = cv::norm(a8u, b8u, cv::NORM_L2SQR);
    return sse / (static_cast<double>(a8u.total()) * a8u.channels());
}

double computePSNR(const cv::Mat& a8u, const cv::Mat& b8u) {
    const double mse = meanSquaredError(a8u, b8u);
    if (mse <= 0.0) return std::numeric_limits<double>::infinity(); // identical
    return 10.0 * std::log10((kPsnrPeak * kPsnrPeak) / mse);
}

} // namespace vqeval
