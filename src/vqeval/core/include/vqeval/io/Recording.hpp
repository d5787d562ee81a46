#pragma once

#include "vqeval/core/Frame.hpp"
#include "vqeval/core/VideoSource.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace vqeval {

// Lossless raw-frame container VQR1 (.vqr):
//
// Header:
//   char     magic[4] = 'V','Q','R','1'
//   uint32_t version  = 1
//   uint64_t frame_count   (declared; patched by FrameRecorder::close())
//
// Per frame, Record:
//   uint32_t width
//   uint32_t height
//   uint8_t  format (PixelFormat)
//   uint8_t  _pad[3] = {0,0,0}
//   uint64_t index
//   uint32_t crc32        (zlib, over data)
//   uint32_t data_size
//   uint8_t  data[data_size]
//
// All little-endian (as on x86/amd64).

class FrameRecorder {
public:
    explicit FrameRecorder(const std::string& path);
    ~FrameRecorder();

    FrameRecorder(const FrameRecorder&)            = delete;
    FrameRecorder& operator=(const FrameRecorder&) = delete;

    bool isOpen() const { return ok_; }

    // Appends one frame; its index is the number of frames written before.
    bool write(const Frame& f);

    // Writes the declared frame count into the header and closes the file.
    // Called by the destructor if not called explicitly.
    bool close();

    std::uint64_t written() const { return written_; }

private:
    std::ofstream ofs_;
    bool ok_{false};
    std::uint64_t written_{0};
};

/*
  IVideoSource over a .vqr file.

  - frameCount() is the declared count from the header, which may be
    larger than what the file still holds (truncated recordings).
  - Records are indexed on open; indexing stops at the first record
    that does not fit in the file.
  - read(i) returns std::nullopt past the indexed records and for a
    record whose CRC does not match.
*/
class RecordingSource final : public IVideoSource {
public:
    explicit RecordingSource(const std::string& path);

    bool isOpen() const override { return ok_; }
    std::size_t frameCount() const override;
    std::optional<Frame> read(std::size_t index) override;
    SourceInfo info() const override;

    // number of records that are physically present
    std::size_t indexedFrames() const { return entries_.size(); }

private:
    struct Entry {
        std::uint64_t offset{0};    // position of the payload
        std::uint32_t width{0}, height{0};
        PixelFormat   format{PixelFormat::BGR24};
        std::uint32_t crc32{0};
        std::uint32_t size{0};
    };

    std::string path_;
    std::ifstream ifs_;
    bool ok_{false};
    std::uint64_t declared_{0};
    std::uintmax_t fileBytes_{0};
    std::vector<Entry> entries_;
    std::vector<std::uint8_t> scratch_; // payload of the last read frame

    void buildIndex();
};

} // namespace vqeval
