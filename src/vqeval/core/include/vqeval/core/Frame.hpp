//====================================================================
// File: core/include/vqeval/core/Frame.hpp
//====================================================================
#pragma once


#include <span>
#include <cstddef>
#include <cstdint>


namespace vqeval {


/// Pixel storage layouts that the sources can hand out.
enum class PixelFormat : std::uint8_t {
Gray8 = 0, ///< 8-bit grayscale, 1 byte per pixel
RGB24, ///< 24-bit RGB, 3 bytes per pixel, interleaved
BGR24, ///< 24-bit BGR, 3 bytes per pixel (OpenCV native order)
RGBA32 ///< 32-bit RGBA, 4 bytes per pixel
};


/// Bytes per pixel for a format, 0 for an unknown value.
[[nodiscard]] constexpr std::size_t bytesPerPixel(PixelFormat f) noexcept {
switch (f) {
case PixelFormat::Gray8: return 1;
case PixelFormat::RGB24: return 3;
case PixelFormat::BGR24: return 3;
case PixelFormat::RGBA32: return 4;
default: return 0;
}
}


/// Lightweight view of one decoded video frame.
/// The buffer belongs to the source and stays valid until its next read().
struct Frame {
std::span<const std::uint8_t> data{}; ///< read-only pixel buffer, row-major
std::uint32_t width{0};
std::uint32_t height{0};
PixelFormat format{PixelFormat::BGR24};
std::size_t index{0}; ///< zero-based frame index inside the source


/// Expected byte size of the buffer for width/height/format.
[[nodiscard]] std::size_t bytes() const noexcept {
return static_cast<std::size_t>(width) * height * bytesPerPixel(format);
}


[[nodiscard]] bool valid() const noexcept {
return width > 0 && height > 0 && bytesPerPixel(format) > 0 && data.size() >= bytes();
}
};


} // namespace vqeval
