#include "vqeval/sample/FrameNormalizer.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace vqeval {

namespace {
/* Any 8-bit layout we accept -> CV_8UC3 BGR. Returns a new buffer. */
cv::Mat toBgr8(const cv::Mat& src) {
    if (src.empty()) throw std::invalid_argument("normalizePair: empty frame");
    if (src.depth() != CV_8U) throw std::invalid_argument("normalizePair: 8-bit frames expected");

    cv::Mat bgr;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR); break;
        case 3: bgr = src.clone();                         break;
        case 4: cv::cvtColor(src, bgr, cv::COLOR_BGRA2BGR); break;
        default:
            throw std::invalid_argument("normalizePair: unsupported channel count");
    }
    return bgr;
}

cv::Mat resizedTo(const cv::Mat& src, const cv::Size& size) {
    if (src.size() == size) return src;
    cv::Mat dst;
    cv::resize(src, dst, size, 0.0, 0.0, cv::INTER_LINEAR);
    return dst;
}
} // namespace

cv::Mat frameToBgr8(const Frame& f) {
    if (!f.valid()) throw std::invalid_argument("frameToBgr8: invalid frame buffer");

    // no copy here: the view only lives for this call, cvtColor/clone below copy
    auto* px = const_cast<std::uint8_t*>(f.data.data());
    const int h = static_cast<int>(f.height);
    const int w = static_cast<int>(f.width);

    cv::Mat out;
    switch (f.format) {
        case PixelFormat::Gray8:
            cv::cvtColor(cv::Mat(h, w, CV_8UC1, px), out, cv::COLOR_GRAY2BGR);
            break;
        case PixelFormat::RGB24:
            cv::cvtColor(cv::Mat(h, w, CV_8UC3, px), out, cv::COLOR_RGB2BGR);
            break;
        case PixelFormat::BGR24:
            out = cv::Mat(h, w, CV_8UC3, px).clone();
            break;
        case PixelFormat::RGBA32:
            cv::cvtColor(cv::Mat(h, w, CV_8UC4, px), out, cv::COLOR_RGBA2BGR);
            break;
        default:
            throw std::invalid_argument("frameToBgr8: unknown pixel format");
    }
    return out;
}

NormalizedPair normalizePair(const Frame& reference,
                             const Frame& candidate,
                             const cv::Size& targetSize)
{
    NormalizedPair p = normalizePair(frameToBgr8(reference), frameToBgr8(candidate), targetSize);
    p.index = reference.index;
    return p;
}

NormalizedPair normalizePair(const cv::Mat& reference,
                             const cv::Mat& candidate,
                             const cv::Size& targetSize)
{
    NormalizedPair p{};
    cv::Mat r = toBgr8(reference);
    cv::Mat c = toBgr8(candidate);

    if (targetSize.width > 0 && targetSize.height > 0) {
        r = resizedTo(r, targetSize);
        c = resizedTo(c, targetSize);
    }
    // metrics need identical dimensions: candidate follows the reference
    if (c.size() != r.size()) c = resizedTo(c, r.size());

    p.reference8u = r;
    p.candidate8u = c;
    return p;
}

cv::Mat toUnitFloat(const cv::Mat& img8u) {
    CV_Assert(img8u.depth() == CV_8U);
    cv::Mat f;
    img8u.convertTo(f, CV_64F, 1.0 / 255.0);
    return f;
}

} // namespace vqeval
