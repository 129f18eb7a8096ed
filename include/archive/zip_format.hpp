#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filepipe {

constexpr std::uint32_t kZipFileHeaderSignature = 0x04034b50;
constexpr std::uint32_t kZipDirectoryHeaderSignature = 0x02014b50;
constexpr std::uint32_t kZipDirectoryEndSignature = 0x06054b50;
constexpr std::uint32_t kZipDirectory64LocSignature = 0x07064b50;
constexpr std::uint32_t kZipDirectory64EndSignature = 0x06064b50;
constexpr std::uint32_t kZipDataDescriptorSignature = 0x08074b50;

constexpr size_t kZipFileHeaderLen = 30;
constexpr size_t kZipDirectoryHeaderLen = 46;
constexpr size_t kZipDirectoryEndLen = 22;
constexpr size_t kZipDataDescriptorLen = 16;
constexpr size_t kZipDataDescriptor64Len = 24;
constexpr size_t kZipDirectory64LocLen = 20;
constexpr size_t kZipDirectory64EndLen = 56;

constexpr std::uint16_t kZipStore = 0;
constexpr std::uint16_t kZipDeflate = 8;

constexpr std::uint16_t kZipCreatorFat = 0;
constexpr std::uint16_t kZipCreatorUnix = 3;
constexpr std::uint16_t kZipCreatorNtfs = 11;
constexpr std::uint16_t kZipCreatorMacOsX = 19;

constexpr std::uint16_t kZipVersion20 = 20;  // 2.0
constexpr std::uint16_t kZipVersion45 = 45;  // 4.5, reads and writes zip64 archives

constexpr std::uint16_t kZipFlagDataDescriptor = 0x0008;
constexpr std::uint16_t kZipFlagUtf8 = 0x0800;

constexpr std::uint16_t kZip64ExtraId = 0x0001;
constexpr std::uint16_t kZipExtTimeExtraId = 0x5455;

constexpr std::uint16_t kUint16Max = 0xffff;
constexpr std::uint32_t kUint32Max = 0xffffffff;

constexpr size_t kZipMaxCommentLen = kUint16Max;

// Metadata of one archive entry, as stored in the central directory.
struct ZipFileHeader {
    // Slash-separated; directories end in '/'.
    std::string name;
    std::string comment;
    // Name and comment are not UTF-8 even if they look like it.
    bool non_utf8 = false;

    std::uint16_t creator_version = 0;
    std::uint16_t reader_version = 0;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;

    // Unix seconds; when non-zero it takes precedence over the MS-DOS fields
    // on write and is stored in an extended timestamp extra field.
    std::int64_t modified = 0;
    std::uint16_t modified_time = 0;
    std::uint16_t modified_date = 0;

    std::uint32_t crc32 = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::vector<std::uint8_t> extra;
    std::uint32_t external_attrs = 0;

    bool IsDir() const { return !name.empty() && name.back() == '/'; }
    bool IsZip64() const {
        return compressed_size >= kUint32Max || uncompressed_size >= kUint32Max;
    }
    bool HasDataDescriptor() const { return (flags & kZipFlagDataDescriptor) != 0; }

    // POSIX mode with S_IF* type bits.
    std::uint32_t Mode() const;
    void SetMode(std::uint32_t mode);
    FileInfo ToFileInfo() const;

    // Header for info under its base name; directories get a trailing '/'.
    static ZipFileHeader FromFileInfo(const FileInfo& info);
};

class ZipReader;

// An entry of an opened archive.
struct ZipFile : ZipFileHeader {
    const ZipReader* zip = nullptr;
    // Offset of the local file header, relative to the reader's source.
    std::int64_t header_offset = 0;
    bool zip64 = false;
};

// MS-DOS date/time (UTC) conversions. Dates before 1980 clamp to 1980-01-01.
void UnixToMsDos(std::int64_t t, std::uint16_t& date, std::uint16_t& time);
std::int64_t MsDosToUnix(std::uint16_t date, std::uint16_t time);

// Little-endian record builder.
class LeBuffer {
public:
    void U8(std::uint8_t v) { buf_.push_back(v); }
    void U16(std::uint16_t v) {
        U8(static_cast<std::uint8_t>(v));
        U8(static_cast<std::uint8_t>(v >> 8));
    }
    void U32(std::uint32_t v) {
        U16(static_cast<std::uint16_t>(v));
        U16(static_cast<std::uint16_t>(v >> 16));
    }
    void U64(std::uint64_t v) {
        U32(static_cast<std::uint32_t>(v));
        U32(static_cast<std::uint32_t>(v >> 32));
    }
    void Bytes(std::span<const std::uint8_t> b) { buf_.insert(buf_.end(), b.begin(), b.end()); }
    void Str(std::string_view s) { buf_.insert(buf_.end(), s.begin(), s.end()); }

    std::span<const std::uint8_t> Data() const { return buf_; }
    size_t Size() const { return buf_.size(); }

private:
    std::vector<std::uint8_t> buf_;
};

// Little-endian record parser; reads past the end yield zeros and clear Ok().
class LeCursor {
public:
    explicit LeCursor(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t U8() {
        if (pos_ >= data_.size()) {
            ok_ = false;
            return 0;
        }
        return data_[pos_++];
    }
    std::uint16_t U16() {
        const std::uint16_t lo = U8();
        return static_cast<std::uint16_t>(lo | (static_cast<std::uint16_t>(U8()) << 8));
    }
    std::uint32_t U32() {
        const std::uint32_t lo = U16();
        return lo | (static_cast<std::uint32_t>(U16()) << 16);
    }
    std::uint64_t U64() {
        const std::uint64_t lo = U32();
        return lo | (static_cast<std::uint64_t>(U32()) << 32);
    }
    std::span<const std::uint8_t> Bytes(size_t n) {
        if (n > Remaining()) {
            ok_ = false;
            pos_ = data_.size();
            return {};
        }
        auto out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }
    void Skip(size_t n) { (void)Bytes(n); }

    size_t Remaining() const { return data_.size() - pos_; }
    bool Ok() const { return ok_; }

private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
    bool ok_ = true;
};

} // namespace filepipe
