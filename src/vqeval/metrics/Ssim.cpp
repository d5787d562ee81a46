#include "vqeval/metrics/Ssim.hpp"
#include "vqeval/sample/FrameNormalizer.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <vector>

namespace vqeval {

/* Local mean over a window x window box, mirrored borders.
   Border values are cropped away by the caller. */
static cv::Mat boxMean(const cv::Mat& src, int window) {
    cv::Mat dst;
    cv::boxFilter(src, dst, CV_64F, cv::Size(window, window),
                  cv::Point(-1, -1), true, cv::BORDER_REFLECT);
    return dst;
}

/*
  Structural similarity of one channel.

  Steps:
    1) local means ux, uy and second moments over the window;
    2) sample (co)variances: (E[xy] - ux*uy) * N/(N-1);
    3) S = (2 ux uy + C1)(2 vxy + C2) / ((ux^2 + uy^2 + C1)(vx + vy + C2));
    4) average S over the interior (border of (window-1)/2 dropped).
*/
double ssimSingleChannel(const cv::Mat& a64f, const cv::Mat& b64f,
                         const SsimOptions& opt)
{
    CV_Assert(a64f.type() == CV_64FC1 && b64f.type() == CV_64FC1);
    CV_Assert(a64f.size() == b64f.size());

    const int    w      = opt.window;
    const double np     = static_cast<double>(w) * w;
    const double covNorm = np / (np - 1.0);
    const double C1 = (opt.k1 * opt.dataRange) * (opt.k1 * opt.dataRange);
    const double C2 = (opt.k2 * opt.dataRange) * (opt.k2 * opt.dataRange);

    cv::Mat ux  = boxMean(a64f, w);
    cv::Mat uy  = boxMean(b64f, w);
    cv::Mat uxx = boxMean(a64f.mul(a64f), w);
    cv::Mat uyy = boxMean(b64f.mul(b64f), w);
    cv::Mat uxy = boxMean(a64f.mul(b64f), w);

    cv::Mat vx  = covNorm * (uxx - ux.mul(ux));
    cv::Mat vy  = covNorm * (uyy - uy.mul(uy));
    cv::Mat vxy = covNorm * (uxy - ux.mul(uy));

    cv::Mat a1 = 2.0 * ux.mul(uy) + C1;
    cv::Mat a2 = 2.0 * vxy + C2;
    cv::Mat b1 = ux.mul(ux) + uy.mul(uy) + C1;
    cv::Mat b2 = vx + vy + C2;

    cv::Mat ssimMap;
    cv::divide(a1.mul(a2), b1.mul(b2), ssimMap);

    const int pad = (w - 1) / 2;
    const cv::Rect inner(pad, pad, ssimMap.cols - 2 * pad, ssimMap.rows - 2 * pad);
    return cv::mean(ssimMap(inner))[0];
}

double computeSSIM(const cv::Mat& a8u, const cv::Mat& b8u, int window) {
    if (window < 3 || (window % 2) == 0)
        throw std::invalid_argument("computeSSIM: window must be odd and >= 3");
    if (a8u.empty() || b8u.empty())
        throw std::invalid_argument("computeSSIM: empty image");
    if (a8u.size() != b8u.size() || a8u.type() != b8u.type())
        throw std::invalid_argument("computeSSIM: images differ in size or type");

    // too small to assess structure: must not penalize the score
    if (a8u.rows < window || a8u.cols < window) return 1.0;

    std::vector<cv::Mat> ca, cb;
    cv::split(toUnitFloat(a8u), ca);
    cv::split(toUnitFloat(b8u), cb);

    SsimOptions opt{};
    opt.window = window;

    double total = 0.0;
    for (std::size_t i = 0; i < ca.size(); ++i)
        total += ssimSingleChannel(ca[i], cb[i], opt);
    return total / static_cast<double>(ca.size());
}

} // namespace vqeval
