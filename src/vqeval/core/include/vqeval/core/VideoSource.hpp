#pragma once

#include "vqeval/core/Frame.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace vqeval {

/* Container metadata as reported by a source. */
struct SourceInfo {
    std::string   path;
    std::string   container;       // "mp4", "avi", "vqr", "images", ...
    std::size_t   frameCount{0};
    double        fps{0.0};
    int           width{0};
    int           height{0};
    double        durationSec{0.0};
    std::uintmax_t fileBytes{0};
};

/*
  A frame-indexed, decodable video source (the "video handle").

  Implementations should provide:
    - frameCount(): the count the container claims (never negative);
      it may overstate what can actually be decoded.
    - read(i): seek to frame i and decode it. std::nullopt on any
      decode failure or end of stream. The returned view is valid
      until the next read() on the same source.

  A source is owned by the caller and must not be read from two
  threads at the same time.
*/
class IVideoSource {
public:
    virtual ~IVideoSource() = default;

    [[nodiscard]] virtual bool isOpen() const = 0;

    [[nodiscard]] virtual std::size_t frameCount() const = 0;

    [[nodiscard]] virtual std::optional<Frame> read(std::size_t index) = 0;

    [[nodiscard]] virtual SourceInfo info() const = 0;
};

} // namespace vqeval
