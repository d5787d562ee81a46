#pragma once

#include <cstdint>

namespace vqeval {

/* User-facing quality bands for the mean scores. */
enum class PsnrBand : std::uint8_t { Excellent, Good, Low };
enum class SsimBand : std::uint8_t { VeryHigh, Good, Degraded };

/* > 40 dB excellent, (30, 40] good, <= 30 low. +inf is excellent. */
PsnrBand psnrBand(double psnrDb) noexcept;

/* > 0.95 very high, (0.85, 0.95] good, <= 0.85 degraded. */
SsimBand ssimBand(double ssim) noexcept;

const char* label(PsnrBand b) noexcept;
const char* label(SsimBand b) noexcept;

} // namespace vqeval
