#include "vqeval/sample/FrameSampler.hpp"

#include <algorithm>

namespace vqeval {

SamplePlan planSamples(std::size_t refFrameCount,
                       std::size_t candFrameCount,
                       std::size_t maxSamples)
{
    SamplePlan plan{};
    plan.n = std::min(refFrameCount, candFrameCount);
    if (plan.n == 0) return plan; // nothing to compare, caller reports EmptySource

    const std::size_t samples = (maxSamples == 0) ? plan.n : std::min(maxSamples, plan.n);
    plan.stride = std::max<std::size_t>(1, plan.n / samples);

    // floor division can leave room for more than `samples` indices
    // (n=120, samples=50 -> stride 2 -> 60 candidates); keep the cap
    plan.indices.reserve(samples);
    for (std::size_t i = 0; i < plan.n && plan.indices.size() < samples; i += plan.stride)
        plan.indices.push_back(i);

    return plan;
}

} // namespace vqeval
