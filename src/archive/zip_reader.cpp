#include "archive/zip_reader.hpp"

#include "io/limit_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <zlib.h>

namespace filepipe {

namespace {

constexpr size_t kSearchBlockSmall = 1024;
constexpr size_t kSearchBlockLarge = 65 * 1024;

Result ErrZipFormat() { return Result::Fail(kErrFormat, "zip: not a valid zip file"); }

// Returns the position of the end-of-directory record in b, or -1.
std::int64_t FindSignatureInBlock(std::span<const std::uint8_t> b) {
    if (b.size() < kZipDirectoryEndLen) return -1;
    for (std::int64_t i = static_cast<std::int64_t>(b.size() - kZipDirectoryEndLen); i >= 0; --i) {
        const size_t p = static_cast<size_t>(i);
        if (b[p] == 'P' && b[p + 1] == 'K' && b[p + 2] == 0x05 && b[p + 3] == 0x06) {
            const size_t n = b[p + 20] | (static_cast<size_t>(b[p + 21]) << 8);
            if (n + kZipDirectoryEndLen + p <= b.size()) return i;
        }
    }
    return -1;
}

bool HasNonAscii(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
}

// Handle for a directory inside the archive.
class ZipDirFile final : public IFile {
public:
    explicit ZipDirFile(FileInfo info) : info_(std::move(info)) {}

    ssize_t Read(std::span<std::uint8_t>) override { return -1; }
    Result LastError() const override { return ErrIsDir().Wrap("read " + info_.name); }
    Result Stat(FileInfo& out) const override {
        out = info_;
        return Result::Ok();
    }
    Result Close() override { return Result::Ok(); }

private:
    FileInfo info_;
};

// Decompressed entry. Size and CRC-32 are checked once the decompressor
// reports end of data.
class ZipEntryFile final : public IFile {
public:
    ZipEntryFile(const ZipFile& f, std::unique_ptr<SectionReader> section)
        : file_(f), section_(std::move(section)) {}

    Result Init(const ZipDecompressorFactory& factory) { return factory(section_.get(), dec_); }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (closed_) {
            err_ = ErrnoFail(EBADF, "zip: read " + file_.name);
            return -1;
        }
        if (!err_.ok) return -1;
        if (done_ || out.empty()) return 0;
        const ssize_t n = dec_->Read(out);
        if (n < 0) {
            err_ = dec_->LastError().Wrap("zip: " + file_.name);
            return -1;
        }
        if (n > 0) {
            crc_ = static_cast<std::uint32_t>(::crc32(crc_, out.data(), static_cast<uInt>(n)));
            count_ += static_cast<std::uint64_t>(n);
            if (count_ > file_.uncompressed_size) {
                err_ = ErrZipFormat();
                return -1;
            }
            return n;
        }
        done_ = true;
        if (count_ != file_.uncompressed_size) {
            err_ = Result::Fail(kErrUnexpectedEof, "zip: " + file_.name + ": unexpected EOF");
            return -1;
        }
        if (file_.crc32 != 0 && crc_ != file_.crc32) {
            err_ = Result::Fail(kErrChecksum, "zip: checksum error");
            return -1;
        }
        return 0;
    }

    std::optional<std::uint64_t> TotalSize() const override { return file_.uncompressed_size; }
    Result LastError() const override { return err_; }

    Result Stat(FileInfo& out) const override {
        out = file_.ToFileInfo();
        return Result::Ok();
    }

    Result Close() override {
        if (closed_) return ErrnoFail(EBADF, "zip: close " + file_.name);
        closed_ = true;
        return dec_->Close();
    }

private:
    ZipFile file_;
    std::unique_ptr<SectionReader> section_;
    std::unique_ptr<IZipDecompressor> dec_;
    std::uint32_t crc_ = 0;
    std::uint64_t count_ = 0;
    bool done_ = false;
    bool closed_ = false;
    Result err_;
};

// Stored bytes of an entry; owns its section.
class ZipRawReader final : public IReader {
public:
    explicit ZipRawReader(std::unique_ptr<SectionReader> section) : section_(std::move(section)) {}

    ssize_t Read(std::span<std::uint8_t> out) override { return section_->Read(out); }
    std::optional<std::uint64_t> TotalSize() const override { return section_->Size(); }
    Result LastError() const override { return section_->LastError(); }

private:
    std::unique_ptr<SectionReader> section_;
};

} // namespace

Result ZipReader::Open(IReaderAt* r, std::uint64_t size, std::unique_ptr<ZipReader>& out) {
    if (!r) return Result::Fail(EINVAL, "zip: null source");
    std::unique_ptr<ZipReader> zr(new ZipReader(r, size));
    auto res = zr->Init();
    if (!res.ok) return res;
    LogDebug("zip: %zu entries, base offset %lld", zr->files_.size(),
             static_cast<long long>(zr->base_offset_));
    out = std::move(zr);
    return Result::Ok();
}

void ZipReader::RegisterDecompressor(std::uint16_t method, ZipDecompressorFactory factory) {
    if (!factory) return;
    decompressors_[method] = std::move(factory);
}

ZipDecompressorFactory ZipReader::Decompressor(std::uint16_t method) const {
    auto it = decompressors_.find(method);
    if (it != decompressors_.end()) return it->second;
    if (method == kZipStore) return StoreDecompressor();
    if (method == kZipDeflate) return DeflateDecompressor();
    return {};
}

Result ZipReader::FindDirectoryEnd(std::uint64_t& eocd_off, std::vector<std::uint8_t>& tail,
                                   size_t& pos_in_tail) const {
    for (size_t block : {kSearchBlockSmall, kSearchBlockLarge}) {
        const size_t len = static_cast<size_t>(std::min<std::uint64_t>(block, size_));
        tail.assign(len, 0);
        size_t n = 0;
        auto r = r_->ReadAt(tail, size_ - len, n);
        if (!r.ok && !IsEof(r)) return r.Wrap("zip: read directory end");
        tail.resize(n);
        const std::int64_t p = FindSignatureInBlock(tail);
        if (p >= 0) {
            pos_in_tail = static_cast<size_t>(p);
            eocd_off = size_ - len + pos_in_tail;
            return Result::Ok();
        }
        if (len == size_) break;
    }
    return ErrZipFormat();
}

Result ZipReader::ReadDirectory64End(std::uint64_t eocd_off, std::uint64_t& end_off,
                                     std::uint64_t& records, std::uint64_t& dir_size,
                                     std::uint64_t& dir_offset) const {
    // Without a locator the 32-bit values stand, even when they hold the
    // zip64 marker values.
    if (eocd_off < kZipDirectory64LocLen) return Result::Ok();
    std::vector<std::uint8_t> loc(kZipDirectory64LocLen);
    size_t n = 0;
    auto r = r_->ReadAt(loc, eocd_off - kZipDirectory64LocLen, n);
    if (!r.ok) return r;

    LeCursor lc(loc);
    if (lc.U32() != kZipDirectory64LocSignature) return Result::Ok();
    if (lc.U32() != 0) return Result::Ok();
    const std::uint64_t recorded = lc.U64();

    // The recorded offset is wrong when data was prepended to the archive;
    // the record then sits right before the locator.
    std::vector<std::uint64_t> candidates{recorded};
    if (eocd_off >= kZipDirectory64LocLen + kZipDirectory64EndLen) {
        candidates.push_back(eocd_off - kZipDirectory64LocLen - kZipDirectory64EndLen);
    }
    std::vector<std::uint8_t> rec(kZipDirectory64EndLen);
    for (std::uint64_t off : candidates) {
        if (off + kZipDirectory64EndLen > size_) continue;
        r = r_->ReadAt(rec, off, n);
        if (!r.ok) {
            if (IsEof(r)) continue;
            return r;
        }
        LeCursor c(rec);
        if (c.U32() != kZipDirectory64EndSignature) continue;
        c.Skip(8);  // size of record
        c.Skip(4);  // versions
        c.Skip(8);  // disk numbers
        c.Skip(8);  // records on this disk
        records = c.U64();
        dir_size = c.U64();
        dir_offset = c.U64();
        end_off = off;
        return Result::Ok();
    }
    return ErrZipFormat();
}

Result ZipReader::Init() {
    if (size_ < kZipDirectoryEndLen) return ErrNotZip();

    std::uint64_t eocd_off = 0;
    std::vector<std::uint8_t> tail;
    size_t pos = 0;
    auto r = FindDirectoryEnd(eocd_off, tail, pos);
    if (!r.ok) return r;

    LeCursor c(std::span<const std::uint8_t>(tail).subspan(pos));
    c.Skip(4);
    const std::uint16_t disk = c.U16();
    const std::uint16_t dir_disk = c.U16();
    c.Skip(2);
    std::uint64_t records = c.U16();
    std::uint64_t dir_size = c.U32();
    std::uint64_t dir_offset = c.U32();
    const std::uint16_t comment_len = c.U16();
    auto comment = c.Bytes(comment_len);
    if (!c.Ok()) return Result::Fail(kErrFormat, "zip: invalid comment length");
    comment_.assign(comment.begin(), comment.end());
    if (disk != 0 || dir_disk != 0) {
        return Result::Fail(kErrFormat, "zip: multi-disk archives are not supported");
    }

    std::uint64_t dir_end = eocd_off;
    if (records == kUint16Max || dir_size == kUint16Max || dir_offset == kUint32Max) {
        r = ReadDirectory64End(eocd_off, dir_end, records, dir_size, dir_offset);
        if (!r.ok) return r;
    }

    if (dir_size > dir_end) return ErrZipFormat();
    base_offset_ = static_cast<std::int64_t>(dir_end - dir_size) - static_cast<std::int64_t>(dir_offset);
    const std::int64_t dir_start = base_offset_ + static_cast<std::int64_t>(dir_offset);
    if (dir_start < 0 || static_cast<std::uint64_t>(dir_start) >= size_) {
        // An empty archive has its directory at the end record.
        if (!(records == 0 && dir_size == 0)) return ErrZipFormat();
    }

    std::vector<std::uint8_t> dir(static_cast<size_t>(dir_size));
    if (!dir.empty()) {
        size_t n = 0;
        r = r_->ReadAt(dir, static_cast<std::uint64_t>(dir_start), n);
        if (!r.ok) return IsEof(r) ? ErrZipFormat() : r.Wrap("zip: read directory");
    }
    return ReadCentralDirectory(dir, records);
}

Result ZipReader::ReadCentralDirectory(std::span<const std::uint8_t> dir, std::uint64_t records) {
    LeCursor c(dir);
    files_.clear();
    while (c.Remaining() >= kZipDirectoryHeaderLen) {
        if (c.U32() != kZipDirectoryHeaderSignature) break;

        ZipFile f;
        f.zip = this;
        f.creator_version = c.U16();
        f.reader_version = c.U16();
        f.flags = c.U16();
        f.method = c.U16();
        f.modified_time = c.U16();
        f.modified_date = c.U16();
        f.crc32 = c.U32();
        std::uint64_t csize = c.U32();
        std::uint64_t usize = c.U32();
        const std::uint16_t name_len = c.U16();
        const std::uint16_t extra_len = c.U16();
        const std::uint16_t comment_len = c.U16();
        c.Skip(4);  // disk number start, internal attributes
        f.external_attrs = c.U32();
        std::uint64_t offset = c.U32();

        auto name = c.Bytes(name_len);
        auto extra = c.Bytes(extra_len);
        auto comment = c.Bytes(comment_len);
        if (!c.Ok()) return ErrZipFormat();
        f.name.assign(name.begin(), name.end());
        f.extra.assign(extra.begin(), extra.end());
        f.comment.assign(comment.begin(), comment.end());
        f.non_utf8 = (f.flags & kZipFlagUtf8) == 0 && (HasNonAscii(f.name) || HasNonAscii(f.comment));

        bool need_usize = usize == kUint32Max;
        bool need_csize = csize == kUint32Max;
        bool need_offset = offset == kUint32Max;

        LeCursor ex(extra);
        while (ex.Remaining() >= 4) {
            const std::uint16_t id = ex.U16();
            const std::uint16_t len = ex.U16();
            if (len > ex.Remaining()) break;
            LeCursor field(ex.Bytes(len));
            switch (id) {
                case kZip64ExtraId:
                    f.zip64 = true;
                    if (need_usize) {
                        need_usize = false;
                        if (field.Remaining() < 8) return ErrZipFormat();
                        usize = field.U64();
                    }
                    if (need_csize) {
                        need_csize = false;
                        if (field.Remaining() < 8) return ErrZipFormat();
                        csize = field.U64();
                    }
                    if (need_offset) {
                        need_offset = false;
                        if (field.Remaining() < 8) return ErrZipFormat();
                        offset = field.U64();
                    }
                    break;
                case kZipExtTimeExtraId: {
                    if (field.Remaining() < 5) break;
                    if ((field.U8() & 1) == 0) break;
                    f.modified = static_cast<std::int32_t>(field.U32());
                    break;
                }
                default:
                    // NTFS and Info-ZIP Unix timestamps are not decoded.
                    break;
            }
        }
        if (need_csize || need_offset) return ErrZipFormat();

        f.compressed_size = csize;
        f.uncompressed_size = usize;
        f.header_offset = base_offset_ + static_cast<std::int64_t>(offset);
        if (f.modified == 0) f.modified = MsDosToUnix(f.modified_date, f.modified_time);
        files_.push_back(std::move(f));
    }
    if (static_cast<std::uint16_t>(files_.size()) != static_cast<std::uint16_t>(records)) {
        return ErrZipFormat();
    }
    return Result::Ok();
}

Result ZipReader::DataOffset(const ZipFile& f, std::uint64_t& off) const {
    if (f.header_offset < 0) return ErrZipFormat();
    std::vector<std::uint8_t> hdr(kZipFileHeaderLen);
    size_t n = 0;
    auto r = r_->ReadAt(hdr, static_cast<std::uint64_t>(f.header_offset), n);
    if (!r.ok) return IsEof(r) ? ErrZipFormat() : r;
    LeCursor c(hdr);
    if (c.U32() != kZipFileHeaderSignature) return ErrZipFormat();
    c.Skip(22);
    const std::uint16_t name_len = c.U16();
    const std::uint16_t extra_len = c.U16();
    off = static_cast<std::uint64_t>(f.header_offset) + kZipFileHeaderLen + name_len + extra_len;
    return Result::Ok();
}

Result ZipReader::OpenRaw(const ZipFile& f, std::unique_ptr<IReader>& out) const {
    std::uint64_t off = 0;
    auto r = DataOffset(f, off);
    if (!r.ok) return r;
    out = std::make_unique<ZipRawReader>(std::make_unique<SectionReader>(r_, off, f.compressed_size));
    return Result::Ok();
}

Result ZipReader::OpenFile(const ZipFile& f, std::unique_ptr<IFile>& out) const {
    if (f.IsDir()) {
        out = std::make_unique<ZipDirFile>(f.ToFileInfo());
        return Result::Ok();
    }
    auto factory = Decompressor(f.method);
    if (!factory) {
        return Result::Fail(kErrUnsupportedMethod,
                            "zip: unsupported compression algorithm " + std::to_string(f.method));
    }
    std::uint64_t off = 0;
    auto r = DataOffset(f, off);
    if (!r.ok) return r;
    auto file = std::make_unique<ZipEntryFile>(f, std::make_unique<SectionReader>(r_, off, f.compressed_size));
    r = file->Init(factory);
    if (!r.ok) return r.Wrap("zip: " + f.name);
    out = std::move(file);
    return Result::Ok();
}

Result ZipReader::OpenPath(const std::string& name, std::unique_ptr<IFile>& out) const {
    if (name == "." || name.empty()) {
        out = std::make_unique<ZipDirFile>(FileInfo{.name = ".", .size = 0, .mode = S_IFDIR | 0555, .mtime = 0});
        return Result::Ok();
    }
    for (const auto& f : files_) {
        if (f.name == name) return OpenFile(f, out);
    }

    std::string dir = name;
    if (dir.back() != '/') dir.push_back('/');
    for (const auto& f : files_) {
        if (f.name == dir) return OpenFile(f, out);
    }
    for (const auto& f : files_) {
        if (f.name.size() > dir.size() && f.name.compare(0, dir.size(), dir) == 0) {
            std::string base(BaseName(std::string_view(dir).substr(0, dir.size() - 1)));
            out = std::make_unique<ZipDirFile>(FileInfo{.name = base, .size = 0, .mode = S_IFDIR | 0555, .mtime = 0});
            return Result::Ok();
        }
    }
    return Result::Fail(kErrNotExist, "zip: open " + name + ": file does not exist");
}

} // namespace filepipe
