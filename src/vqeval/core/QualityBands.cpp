#include "vqeval/core/QualityBands.hpp"

namespace vqeval {

PsnrBand psnrBand(double psnrDb) noexcept {
    if (psnrDb > 40.0) return PsnrBand::Excellent;
    if (psnrDb > 30.0) return PsnrBand::Good;
    return PsnrBand::Low; // NaN lands here as well
}

SsimBand ssimBand(double ssim) noexcept {
    if (ssim > 0.95) return SsimBand::VeryHigh;
    if (ssim > 0.85) return SsimBand::Good;
    return SsimBand::Degraded;
}

const char* label(PsnrBand b) noexcept {
    switch (b) {
        case PsnrBand::Excellent: return "excellent";
        case PsnrBand::Good:      return "good";
        case PsnrBand::Low:       return "low";
        default:                  return "?";
    }
}

const char* label(SsimBand b) noexcept {
    switch (b) {
        case SsimBand::VeryHigh: return "very high similarity";
        case SsimBand::Good:     return "good structural preservation";
        case SsimBand::Degraded: return "degraded structure";
        default:                 return "?";
    }
}

} // namespace vqeval
