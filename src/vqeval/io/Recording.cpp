#include "vqeval/io/Recording.hpp"

#include <zlib.h>

#include <cstddef>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vqeval {

namespace {
#pragma pack(push, 1)
struct FileHeader {
    char     magic[4];      // 'V','Q','R','1'
    uint32_t version;       // 1
    uint64_t frame_count;   // declared frame count
};
struct RecordHeader {
    uint32_t width;         // 4
    uint32_t height;        // 4
    uint8_t  format;        // 1
    uint8_t  pad[3];        // 3
    uint64_t index;         // 8
    uint32_t crc32;         // 4
    uint32_t data_size;     // 4
}; // 28 bytes with pack(1)
#pragma pack(pop)

static_assert(sizeof(FileHeader)   == 16, "FileHeader size unexpected");
static_assert(sizeof(RecordHeader) == 28, "RecordHeader size unexpected");

/* CRC32 over a byte buffer using zlib. */
std::uint32_t crc32_bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}
} // namespace

//---------------- FrameRecorder ----------------

FrameRecorder::FrameRecorder(const std::string& path)
    : ofs_(path, std::ios::binary | std::ios::trunc)
{
    if (!ofs_) {
        std::cerr << "[recording] cannot create " << path << "\n";
        return;
    }

    FileHeader h{};
    std::memcpy(h.magic, "VQR1", 4);
    h.version     = 1u;
    h.frame_count = 0u;
    ofs_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    ok_ = static_cast<bool>(ofs_);
}

FrameRecorder::~FrameRecorder() {
    if (ok_ && !close())
        std::cerr << "[recording] failed to finalize header\n";
}

bool FrameRecorder::write(const Frame& f)
{
    if (!ok_) return false;
    if (!f.valid()) return false;

    RecordHeader rh{};
    rh.width     = f.width;
    rh.height    = f.height;
    rh.format    = static_cast<std::uint8_t>(f.format);
    rh.pad[0] = rh.pad[1] = rh.pad[2] = 0;
    rh.index     = written_;
    rh.data_size = static_cast<std::uint32_t>(f.bytes());
    rh.crc32     = crc32_bytes(f.data.data(), rh.data_size);

    ofs_.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
    if (!ofs_) return false;
    ofs_.write(reinterpret_cast<const char*>(f.data.data()), rh.data_size);
    if (!ofs_) return false;

    ++written_;
    return true;
}

bool FrameRecorder::close()
{
    if (!ok_) return false;
    ok_ = false;

    const std::uint64_t count = written_;
    ofs_.seekp(offsetof(FileHeader, frame_count), std::ios::beg);
    ofs_.write(reinterpret_cast<const char*>(&count), sizeof(count));
    const bool good = static_cast<bool>(ofs_);
    ofs_.close();
    return good && !ofs_.fail();
}

//---------------- RecordingSource ----------------

RecordingSource::RecordingSource(const std::string& path)
    : path_(path), ifs_(path, std::ios::binary)
{
    if (!ifs_) return;

    std::error_code ec;
    fileBytes_ = std::filesystem::file_size(path, ec);
    if (ec) return;

    FileHeader h{};
    ifs_.read(reinterpret_cast<char*>(&h), sizeof(h));
    if (!ifs_) return;
    if (std::memcmp(h.magic, "VQR1", 4) != 0 || h.version != 1u) {
        std::cerr << "[recording] " << path << ": not a VQR1 file\n";
        return;
    }
    declared_ = h.frame_count;
    buildIndex();
    ok_ = true;
}

void RecordingSource::buildIndex()
{
    std::uint64_t pos = sizeof(FileHeader);
    while (pos + sizeof(RecordHeader) <= fileBytes_) {
        RecordHeader rh{};
        ifs_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
        ifs_.read(reinterpret_cast<char*>(&rh), sizeof(rh));
        if (!ifs_) break;

        const std::uint64_t payload = pos + sizeof(RecordHeader);
        if (payload + rh.data_size > fileBytes_) break; // truncated record

        Entry e{};
        e.offset = payload;
        e.width  = rh.width;
        e.height = rh.height;
        e.format = static_cast<PixelFormat>(rh.format);
        e.crc32  = rh.crc32;
        e.size   = rh.data_size;
        entries_.push_back(e);

        pos = payload + rh.data_size;
    }
    ifs_.clear();

    if (declared_ > entries_.size()) {
        std::cerr << "[recording] " << path_ << ": header declares " << declared_
                  << " frames, file holds " << entries_.size() << "\n";
    }
}

std::size_t RecordingSource::frameCount() const
{
    // an unfinished recording (count never patched) still has its records
    return declared_ > 0 ? static_cast<std::size_t>(declared_) : entries_.size();
}

std::optional<Frame> RecordingSource::read(std::size_t index)
{
    if (!ok_ || index >= entries_.size()) return std::nullopt;
    const Entry& e = entries_[index];

    // the CRC only covers the payload; a damaged record header shows up here
    const std::size_t expected = static_cast<std::size_t>(e.width) * e.height * bytesPerPixel(e.format);
    if (expected == 0 || e.size != expected) {
        std::cerr << "[recording] bad record header at frame " << index
                  << " (" << e.width << "x" << e.height << " format="
                  << static_cast<int>(e.format) << " size=" << e.size << ") -> skip\n";
        return std::nullopt;
    }

    scratch_.resize(e.size);
    ifs_.clear();
    ifs_.seekg(static_cast<std::streamoff>(e.offset), std::ios::beg);
    ifs_.read(reinterpret_cast<char*>(scratch_.data()), e.size);
    if (!ifs_) return std::nullopt;

    const auto calc = crc32_bytes(scratch_.data(), scratch_.size());
    if (calc != e.crc32) {
        std::cerr << "[recording] CRC mismatch at frame " << index
                  << " got=" << e.crc32 << " calc=" << calc << " -> skip\n";
        return std::nullopt;
    }

    Frame f{
        std::span<const std::uint8_t>(scratch_.data(), scratch_.size()),
        e.width, e.height,
        e.format,
        index
    };
    if (!f.valid()) return std::nullopt;
    return f;
}

SourceInfo RecordingSource::info() const
{
    SourceInfo si{};
    si.path       = path_;
    si.container  = "vqr";
    si.frameCount = frameCount();
    si.fileBytes  = fileBytes_;
    if (!entries_.empty()) {
        si.width  = static_cast<int>(entries_.front().width);
        si.height = static_cast<int>(entries_.front().height);
    }
    return si;
}

} // namespace vqeval
