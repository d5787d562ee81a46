#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace vqeval {

/* Metric backend implementation types. */
enum class BackendType : std::uint8_t {
    CPU = 0
};

/* Configuration of one quality evaluation.
   Passed by value into the Evaluator; the defaults reproduce the
   reference behaviour (50 samples, 640x360, 7x7 SSIM window). */
struct EvalConfig {
    std::size_t maxSamples {50};     // cap on compared pairs, 0 = every frame
    int targetWidth  {640};          // normalization size, 0x0 = native size
    int targetHeight {360};
    int ssimWindow {7};              // odd, >= 3

    BackendType backend {BackendType::CPU}; // metric backend
    std::size_t workerThreads {0};          // 0 = compute on the calling thread
    std::size_t queueDepth {8};             // decoded pairs waiting for workers

    /* Throws std::invalid_argument when the values cannot be used. */
    void validate() const {
        if (ssimWindow < 3 || (ssimWindow % 2) == 0)
            throw std::invalid_argument("EvalConfig: ssimWindow must be odd and >= 3");
        if (targetWidth < 0 || targetHeight < 0)
            throw std::invalid_argument("EvalConfig: negative target size");
        if ((targetWidth == 0) != (targetHeight == 0))
            throw std::invalid_argument("EvalConfig: target size must be WxH or 0x0");
        if (workerThreads > 0 && queueDepth == 0)
            throw std::invalid_argument("EvalConfig: queueDepth must be > 0 with workers");
    }

    [[nodiscard]] bool keepNativeSize() const noexcept {
        return targetWidth == 0 && targetHeight == 0;
    }
};

} // namespace vqeval
