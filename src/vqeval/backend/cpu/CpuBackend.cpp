#include "CpuBackend.hpp"

#include "vqeval/metrics/Psnr.hpp"
#include "vqeval/metrics/Ssim.hpp"

namespace vqeval {

double CpuBackend::psnr(const cv::Mat& ref8u, const cv::Mat& cand8u) {
    return computePSNR(ref8u, cand8u);
}

/* Window size checks and the small-frame rule live in computeSSIM. */
double CpuBackend::ssim(const cv::Mat& ref8u, const cv::Mat& cand8u, int window) {
    return computeSSIM(ref8u, cand8u, window);
}

} // namespace vqeval
