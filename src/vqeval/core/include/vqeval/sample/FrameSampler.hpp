#pragma once
#include <cstddef>
#include <vector>

namespace vqeval {

/** Ordered frame indices; the same index is read from both sources. */
struct SamplePlan {
    std::vector<std::size_t> indices;   // strictly increasing, all < n
    std::size_t n{0};                   // min(refFrameCount, candFrameCount)
    std::size_t stride{0};              // 0 only for an empty plan

    bool        empty() const { return indices.empty(); }
    std::size_t size()  const { return indices.size(); }
};

/**
 * Deterministic, content-independent sampling plan.
 *   n       = min(refFrameCount, candFrameCount)
 *   samples = min(maxSamples, n)      (maxSamples == 0: samples = n)
 *   stride  = max(1, n / samples)
 * Emits 0, stride, 2*stride, ... while index < n and fewer than
 * `samples` indices were emitted. Empty iff n == 0.
 */
SamplePlan planSamples(std::size_t refFrameCount,
                       std::size_t candFrameCount,
                       std::size_t maxSamples = 50);

} // namespace vqeval
