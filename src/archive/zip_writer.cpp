#include "archive/zip_writer.hpp"

#include "archive/zip_reader.hpp"
#include "io/copy.hpp"
#include "io/deflate_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <stdexcept>
#include <zlib.h>

namespace filepipe {

class ZipWriter::CountWriter final : public IWriter {
public:
    explicit CountWriter(IWriter* dst) : dst_(dst) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = dst_->WriteAll(in);
        if (r.ok) count_ += static_cast<std::int64_t>(in.size());
        return r;
    }

    std::int64_t Count() const { return count_; }
    void SetCount(std::int64_t n) { count_ = n; }

private:
    IWriter* dst_;
    std::int64_t count_ = 0;
};

class ZipWriter::EntryWriter : public IWriter {
public:
    // Completes the entry, updating h with what was written.
    virtual Result Finish(ZipFileHeader& h) = 0;

    bool Finished() const { return finished_; }

protected:
    Result ErrFinished() const { return Result::Fail(kErrGeneric, "zip: write to closed file"); }

    bool finished_ = false;
};

namespace {

std::uint32_t Min32(std::uint64_t v) {
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(v, kUint32Max));
}

Result WriteDataDescriptor(IWriter& w, const ZipFileHeader& h) {
    LeBuffer b;
    // The signature is optional but commonly expected.
    b.U32(kZipDataDescriptorSignature);
    b.U32(h.crc32);
    if (h.IsZip64()) {
        b.U64(h.compressed_size);
        b.U64(h.uncompressed_size);
    } else {
        b.U32(static_cast<std::uint32_t>(h.compressed_size));
        b.U32(static_cast<std::uint32_t>(h.uncompressed_size));
    }
    return w.WriteAll(b.Data());
}

// Reports whether s is valid UTF-8 and whether it needs the UTF-8 flag to
// be read correctly (not all CP-437 compatible).
void DetectUtf8(std::string_view s, bool& valid, bool& require) {
    valid = true;
    require = false;
    auto p = AsBytes(s);
    while (!p.empty()) {
        size_t size = 0;
        const char32_t r = utf8::DecodeRune(p, size);
        p = p.subspan(size);
        if (r < 0x20 || r > 0x7d || r == 0x5c) {
            if (r == utf8::kRuneError && size == 1) {
                valid = false;
                require = false;
                return;
            }
            require = true;
        }
    }
}

std::vector<std::uint8_t> StripExtra(const std::vector<std::uint8_t>& extra, std::uint16_t drop_id) {
    std::vector<std::uint8_t> out;
    LeCursor c(extra);
    while (c.Remaining() >= 4) {
        const std::uint16_t id = c.U16();
        const std::uint16_t len = c.U16();
        auto field = c.Bytes(len);
        if (!c.Ok()) break;
        if (id == drop_id) continue;
        LeBuffer b;
        b.U16(id);
        b.U16(len);
        b.Bytes(field);
        out.insert(out.end(), b.Data().begin(), b.Data().end());
    }
    return out;
}

class DirEntryWriter final : public ZipWriter::EntryWriter {
public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        if (finished_) return ErrFinished();
        if (!in.empty()) return ErrIsDir();
        return Result::Ok();
    }

    Result Finish(ZipFileHeader&) override {
        finished_ = true;
        return Result::Ok();
    }
};

// Counts compressed bytes on their way to the archive.
class CompressedCounter final : public IWriter {
public:
    explicit CompressedCounter(IWriter* dst) : dst_(dst) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = dst_->WriteAll(in);
        if (r.ok) count_ += in.size();
        return r;
    }

    std::uint64_t Count() const { return count_; }

private:
    IWriter* dst_;
    std::uint64_t count_ = 0;
};

class FileEntryWriter final : public ZipWriter::EntryWriter {
public:
    explicit FileEntryWriter(IWriter* archive) : archive_(archive), counter_(archive) {}

    Result Init(const ZipCompressorFactory& factory) { return factory(&counter_, comp_); }

    Result WriteAll(std::span<const std::uint8_t> in) override {
        if (finished_) return ErrFinished();
        if (in.empty()) return Result::Ok();
        crc_ = static_cast<std::uint32_t>(::crc32(crc_, in.data(), static_cast<uInt>(in.size())));
        raw_count_ += in.size();
        return comp_->WriteAll(in);
    }

    Result Finish(ZipFileHeader& h) override {
        if (finished_) return Result::Ok();
        finished_ = true;
        auto r = comp_->Close();
        comp_.reset();
        if (!r.ok) return r;

        h.crc32 = crc_;
        h.compressed_size = counter_.Count();
        h.uncompressed_size = raw_count_;
        if (h.IsZip64()) h.reader_version = kZipVersion45;
        if (h.HasDataDescriptor()) return WriteDataDescriptor(*archive_, h);
        return Result::Ok();
    }

private:
    IWriter* archive_;
    CompressedCounter counter_;
    std::unique_ptr<IZipCompressor> comp_;
    std::uint32_t crc_ = 0;
    std::uint64_t raw_count_ = 0;
};

class RawEntryWriter final : public ZipWriter::EntryWriter {
public:
    explicit RawEntryWriter(IWriter* archive) : archive_(archive) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        if (finished_) return ErrFinished();
        return archive_->WriteAll(in);
    }

    Result Finish(ZipFileHeader& h) override {
        if (finished_) return Result::Ok();
        finished_ = true;
        if (h.HasDataDescriptor()) return WriteDataDescriptor(*archive_, h);
        return Result::Ok();
    }

private:
    IWriter* archive_;
};

} // namespace

ZipWriter::ZipWriter(IWriter* dst) {
    if (!dst) throw std::invalid_argument("zip: null destination");
    cw_ = std::make_unique<CountWriter>(dst);
}

ZipWriter::~ZipWriter() = default;

std::int64_t ZipWriter::Count() const { return cw_->Count(); }

Result ZipWriter::SetOffset(std::int64_t n) {
    if (cw_->Count() != 0) return Result::Fail(kErrGeneric, "zip: SetOffset called after data was written");
    cw_->SetCount(n);
    return Result::Ok();
}

Result ZipWriter::SetComment(const std::string& comment) {
    if (comment.size() > kZipMaxCommentLen) return Result::Fail(EINVAL, "zip: Writer.Comment too long");
    comment_ = comment;
    return Result::Ok();
}

void ZipWriter::RegisterCompressor(std::uint16_t method, ZipCompressorFactory factory) {
    if (!factory) return;
    compressors_[method] = std::move(factory);
}

ZipCompressorFactory ZipWriter::Compressor(std::uint16_t method) const {
    auto it = compressors_.find(method);
    if (it != compressors_.end()) return it->second;
    if (method == kZipStore) return StoreCompressor();
    if (method == kZipDeflate) return DeflateCompressor(kDefaultCompression);
    return {};
}

Result ZipWriter::FinishEntry() {
    if (!last_) return Result::Ok();
    EntryWriter* last = last_;
    last_ = nullptr;
    return last->Finish(dir_.back().header);
}

Result ZipWriter::PrepareHeader(ZipFileHeader& h) const {
    bool valid_name = false, require_name = false;
    bool valid_comment = false, require_comment = false;
    DetectUtf8(h.name, valid_name, require_name);
    DetectUtf8(h.comment, valid_comment, require_comment);
    if (h.non_utf8) {
        h.flags &= static_cast<std::uint16_t>(~kZipFlagUtf8);
    } else if (valid_name && valid_comment && (require_name || require_comment)) {
        h.flags |= kZipFlagUtf8;
    }

    h.creator_version = static_cast<std::uint16_t>((h.creator_version & 0xff00) | kZipVersion20);
    h.reader_version = kZipVersion20;

    if (h.modified != 0) {
        UnixToMsDos(h.modified, h.modified_date, h.modified_time);
        LeBuffer b;
        b.U16(kZipExtTimeExtraId);
        b.U16(5);
        b.U8(1);  // modification time present
        b.U32(static_cast<std::uint32_t>(h.modified));
        h.extra.insert(h.extra.end(), b.Data().begin(), b.Data().end());
    }
    return Result::Ok();
}

Result ZipWriter::WriteLocalHeader(const ZipFileHeader& h, bool raw) {
    if (h.name.size() > kUint16Max) return Result::Fail(EINVAL, "zip: FileHeader.Name too long");
    if (h.extra.size() > kUint16Max) return Result::Fail(EINVAL, "zip: FileHeader.Extra too long");

    LeBuffer b;
    b.U32(kZipFileHeaderSignature);
    b.U16(h.reader_version);
    b.U16(h.flags);
    b.U16(h.method);
    b.U16(h.modified_time);
    b.U16(h.modified_date);
    if (raw && !h.HasDataDescriptor()) {
        b.U32(h.crc32);
        b.U32(Min32(h.compressed_size));
        b.U32(Min32(h.uncompressed_size));
    } else {
        // Sizes and CRC follow in the data descriptor or the directory.
        b.U32(0);
        b.U32(0);
        b.U32(0);
    }
    b.U16(static_cast<std::uint16_t>(h.name.size()));
    b.U16(static_cast<std::uint16_t>(h.extra.size()));
    b.Str(h.name);
    b.Bytes(h.extra);
    return cw_->WriteAll(b.Data());
}

Result ZipWriter::Create(const std::string& name, IWriter*& out) {
    ZipFileHeader fh;
    fh.name = name;
    fh.method = kZipDeflate;
    fh.modified = static_cast<std::int64_t>(std::time(nullptr));
    return CreateHeader(fh, out);
}

Result ZipWriter::CreateHeader(const ZipFileHeader& fh, IWriter*& out) {
    if (closed_) return Result::Fail(kErrGeneric, "zip: writer closed");
    auto r = FinishEntry();
    if (!r.ok) return r;

    ZipFileHeader h = fh;
    r = PrepareHeader(h);
    if (!r.ok) return r;

    std::unique_ptr<EntryWriter> ew;
    ZipCompressorFactory factory;
    if (h.IsDir()) {
        h.method = kZipStore;
        h.flags &= static_cast<std::uint16_t>(~kZipFlagDataDescriptor);
        h.crc32 = 0;
        h.compressed_size = 0;
        h.uncompressed_size = 0;
        ew = std::make_unique<DirEntryWriter>();
    } else {
        h.flags |= kZipFlagDataDescriptor;
        factory = Compressor(h.method);
        if (!factory) {
            return Result::Fail(kErrUnsupportedMethod,
                                "zip: unsupported compression algorithm " + std::to_string(h.method));
        }
    }

    const std::uint64_t offset = static_cast<std::uint64_t>(cw_->Count());
    r = WriteLocalHeader(h, false);
    if (!r.ok) return r;

    if (!ew) {
        auto fw = std::make_unique<FileEntryWriter>(cw_.get());
        r = fw->Init(factory);
        if (!r.ok) return r;
        ew = std::move(fw);
    }
    LogDebug("zip: create %s (method %u)", h.name.c_str(), static_cast<unsigned>(h.method));
    dir_.push_back(DirEntry{.header = std::move(h), .offset = offset});
    last_ = ew.get();
    entries_.push_back(std::move(ew));
    out = last_;
    return Result::Ok();
}

Result ZipWriter::CreateRaw(const ZipFileHeader& fh, IWriter*& out) {
    if (closed_) return Result::Fail(kErrGeneric, "zip: writer closed");
    auto r = FinishEntry();
    if (!r.ok) return r;

    ZipFileHeader h = fh;
    if (h.IsZip64()) h.reader_version = std::max(h.reader_version, kZipVersion45);

    const std::uint64_t offset = static_cast<std::uint64_t>(cw_->Count());
    r = WriteLocalHeader(h, true);
    if (!r.ok) return r;

    LogDebug("zip: create raw %s", h.name.c_str());
    dir_.push_back(DirEntry{.header = std::move(h), .offset = offset});
    entries_.push_back(std::make_unique<RawEntryWriter>(cw_.get()));
    last_ = entries_.back().get();
    out = last_;
    return Result::Ok();
}

Result ZipWriter::Copy(const ZipFile& f) {
    if (!f.zip) return Result::Fail(EINVAL, "zip: copy of an entry without an archive");
    std::unique_ptr<IReader> raw;
    auto r = f.zip->OpenRaw(f, raw);
    if (!r.ok) return r;

    ZipFileHeader fh = f;
    // Sizes are re-encoded when the directory is written.
    fh.extra = StripExtra(fh.extra, kZip64ExtraId);
    IWriter* w = nullptr;
    r = CreateRaw(fh, w);
    if (!r.ok) return r;
    return filepipe::Copy(*w, *raw);
}

Result ZipWriter::AddFsDir(IFileSystem& fsys, const std::string& dir) {
    std::vector<FileInfo> entries;
    auto r = fsys.ReadDir(dir, entries);
    if (!r.ok) return r;

    for (const auto& info : entries) {
        const std::string name = JoinPath(dir, info.name);
        if (!info.IsDir() && !info.IsRegular()) {
            return Result::Fail(kErrNotRegular, "zip: cannot add non-regular file " + name);
        }
        ZipFileHeader fh = ZipFileHeader::FromFileInfo(info);
        fh.name = info.IsDir() ? name + "/" : name;
        fh.method = kZipDeflate;

        IWriter* w = nullptr;
        r = CreateHeader(fh, w);
        if (!r.ok) return r;
        if (info.IsDir()) {
            r = AddFsDir(fsys, name);
            if (!r.ok) return r;
            continue;
        }

        std::unique_ptr<IFile> f;
        r = fsys.Open(name, f);
        if (!r.ok) return r;
        r = filepipe::Copy(*w, *f);
        auto cr = f->Close();
        if (!r.ok) return r;
        if (!cr.ok) return cr;
    }
    return Result::Ok();
}

Result ZipWriter::AddFs(IFileSystem& fsys) { return AddFsDir(fsys, "."); }

Result ZipWriter::Close() {
    if (closed_) return Result::Fail(kErrGeneric, "zip: writer closed twice");
    auto r = FinishEntry();
    closed_ = true;
    if (!r.ok) return r;

    const std::uint64_t start = static_cast<std::uint64_t>(cw_->Count());
    for (auto& [h, offset] : dir_) {
        LeBuffer b;
        b.U32(kZipDirectoryHeaderSignature);
        b.U16(h.creator_version);
        b.U16(h.reader_version);
        b.U16(h.flags);
        b.U16(h.method);
        b.U16(h.modified_time);
        b.U16(h.modified_date);
        b.U32(h.crc32);
        std::vector<std::uint8_t> extra = h.extra;
        if (h.IsZip64() || offset >= kUint32Max) {
            b.U32(kUint32Max);
            b.U32(kUint32Max);
            LeBuffer eb;
            eb.U16(kZip64ExtraId);
            eb.U16(24);
            eb.U64(h.uncompressed_size);
            eb.U64(h.compressed_size);
            eb.U64(offset);
            extra.insert(extra.end(), eb.Data().begin(), eb.Data().end());
        } else {
            b.U32(static_cast<std::uint32_t>(h.compressed_size));
            b.U32(static_cast<std::uint32_t>(h.uncompressed_size));
        }
        if (extra.size() > kUint16Max) return Result::Fail(EINVAL, "zip: FileHeader.Extra too long");
        b.U16(static_cast<std::uint16_t>(h.name.size()));
        b.U16(static_cast<std::uint16_t>(extra.size()));
        b.U16(static_cast<std::uint16_t>(std::min<size_t>(h.comment.size(), kUint16Max)));
        b.U16(0);  // disk number start
        b.U16(0);  // internal file attributes
        b.U32(h.external_attrs);
        b.U32(Min32(offset));
        b.Str(h.name);
        b.Bytes(extra);
        b.Str(std::string_view(h.comment).substr(0, kUint16Max));
        r = cw_->WriteAll(b.Data());
        if (!r.ok) return r;
    }
    const std::uint64_t end = static_cast<std::uint64_t>(cw_->Count());

    std::uint64_t records = dir_.size();
    std::uint64_t size = end - start;
    std::uint64_t offset = start;

    LeBuffer b;
    if (records >= kUint16Max || size >= kUint32Max || offset >= kUint32Max) {
        b.U32(kZipDirectory64EndSignature);
        b.U64(kZipDirectory64EndLen - 12);  // record size excluding the leading 12 bytes
        b.U16(kZipVersion45);
        b.U16(kZipVersion45);
        b.U32(0);  // disk number
        b.U32(0);  // disk with the directory
        b.U64(records);
        b.U64(records);
        b.U64(size);
        b.U64(offset);

        b.U32(kZipDirectory64LocSignature);
        b.U32(0);
        b.U64(end);
        b.U32(1);  // total disks

        records = std::min<std::uint64_t>(records, kUint16Max);
        size = std::min<std::uint64_t>(size, kUint32Max);
        offset = std::min<std::uint64_t>(offset, kUint32Max);
    }
    b.U32(kZipDirectoryEndSignature);
    b.U16(0);
    b.U16(0);
    b.U16(static_cast<std::uint16_t>(records));
    b.U16(static_cast<std::uint16_t>(records));
    b.U32(static_cast<std::uint32_t>(size));
    b.U32(static_cast<std::uint32_t>(offset));
    b.U16(static_cast<std::uint16_t>(comment_.size()));
    b.Str(comment_);
    r = cw_->WriteAll(b.Data());
    if (!r.ok) return r;
    LogDebug("zip: wrote %zu entries", dir_.size());
    return Result::Ok();
}

} // namespace filepipe
