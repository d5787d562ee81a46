#pragma once
#include "vqeval/core/Frame.hpp"

#include <opencv2/core.hpp>

namespace vqeval {

/** Reference/candidate pair ready for metric computation. */
struct NormalizedPair {
    cv::Mat reference8u;   // CV_8UC3, BGR
    cv::Mat candidate8u;   // CV_8UC3, BGR, same size as reference8u
    std::size_t index{0};  // source frame index of the pair
};

/**
 * Wrap a frame buffer into a CV_8UC3 BGR matrix (always a copy).
 * Throws std::invalid_argument for an invalid frame.
 */
cv::Mat frameToBgr8(const Frame& f);

/**
 * Bring both frames to `targetSize` (bilinear). An empty target size keeps
 * the native resolution. If the shapes still differ afterwards, the
 * candidate is resized to the reference's exact pixel size.
 */
NormalizedPair normalizePair(const Frame& reference,
                             const Frame& candidate,
                             const cv::Size& targetSize);

/** Same as above for frames already held as matrices (any supported type). */
NormalizedPair normalizePair(const cv::Mat& reference,
                             const cv::Mat& candidate,
                             const cv::Size& targetSize);

/** 8-bit image to CV_64F in [0..1] (x / 255). Used on the SSIM path only. */
cv::Mat toUnitFloat(const cv::Mat& img8u);

} // namespace vqeval
