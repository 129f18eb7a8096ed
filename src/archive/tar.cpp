#include "archive/tar.hpp"

#include "io/copy.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

namespace filepipe {

namespace {

char TypeflagOf(struct archive_entry* e) {
    if (archive_entry_hardlink(e)) return kTarTypeLink;
    switch (archive_entry_filetype(e)) {
        case AE_IFDIR:  return kTarTypeDir;
        case AE_IFLNK:  return kTarTypeSymlink;
        case AE_IFCHR:  return kTarTypeChar;
        case AE_IFBLK:  return kTarTypeBlock;
        case AE_IFIFO:  return kTarTypeFifo;
        default:        return kTarTypeReg;
    }
}

unsigned int FiletypeOf(char typeflag) {
    switch (typeflag) {
        case kTarTypeDir:     return AE_IFDIR;
        case kTarTypeSymlink: return AE_IFLNK;
        case kTarTypeChar:    return AE_IFCHR;
        case kTarTypeBlock:   return AE_IFBLK;
        case kTarTypeFifo:    return AE_IFIFO;
        default:              return AE_IFREG;
    }
}

std::string OrEmpty(const char* s) { return s ? std::string(s) : std::string(); }

} // namespace

bool TarHeader::IsDir() const {
    if (typeflag == kTarTypeDir) return true;
    return (typeflag == '\0' || typeflag == kTarTypeReg) && !name.empty() && name.back() == '/';
}

FileInfo TarHeader::ToFileInfo() const {
    FileInfo info;
    info.name = BaseName(name);
    info.size = size;
    info.mtime = mtime;
    std::uint32_t type = S_IFREG;
    if (IsDir()) {
        type = S_IFDIR;
    } else {
        switch (typeflag) {
            case kTarTypeSymlink: type = S_IFLNK; break;
            case kTarTypeChar:    type = S_IFCHR; break;
            case kTarTypeBlock:   type = S_IFBLK; break;
            case kTarTypeFifo:    type = S_IFIFO; break;
            default: break;
        }
    }
    info.mode = type | (mode & 07777);
    return info;
}

TarHeader TarHeader::FromFileInfo(const FileInfo& info, const std::string& name) {
    TarHeader hdr;
    hdr.name = name;
    hdr.mode = info.mode & 07777;
    hdr.mtime = info.mtime;
    if (info.IsDir()) {
        hdr.typeflag = kTarTypeDir;
        if (hdr.name.empty() || hdr.name.back() != '/') hdr.name.push_back('/');
    } else {
        hdr.typeflag = kTarTypeReg;
        hdr.size = info.size;
    }
    return hdr;
}

// ---- TarReader ----

Result TarReader::Open(IReader* src, std::unique_ptr<TarReader>& out) {
    std::unique_ptr<TarReader> tr(new TarReader());

    tr->ar_ = archive_read_new();
    if (!tr->ar_) return Result::Fail(kErrGeneric, "archive_read_new failed");

    archive_read_support_format_tar(tr->ar_);
    // An empty stream is an empty archive.
    archive_read_support_format_empty(tr->ar_);

    if (OpenArchiveFromReader(tr->ar_, *src) != ARCHIVE_OK) {
        return Result::Fail(kErrNotTar, "archive_read_open2 failed: " + ArchiveErr(tr->ar_));
    }
    out = std::move(tr);
    return Result::Ok();
}

TarReader::~TarReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result TarReader::Next(TarHeader& out) {
    if (done_) return ErrEof();
    if (!err_.ok && !err_.Is(kErrEof)) return err_;

    const int r = archive_read_next_header(ar_, &cur_);
    if (r == ARCHIVE_EOF) {
        done_ = true;
        cur_ = nullptr;
        return ErrEof();
    }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        cur_ = nullptr;
        err_ = Result::Fail(kErrFormat, "archive_read_next_header: " + ArchiveErr(ar_));
        return err_;
    }

    out = TarHeader{};
    out.name = OrEmpty(archive_entry_pathname(cur_));
    out.typeflag = TypeflagOf(cur_);
    out.linkname = out.typeflag == kTarTypeLink ? OrEmpty(archive_entry_hardlink(cur_))
                                                : OrEmpty(archive_entry_symlink(cur_));
    out.size = archive_entry_size_is_set(cur_) ? static_cast<std::uint64_t>(archive_entry_size(cur_)) : 0;
    out.mode = static_cast<std::uint32_t>(archive_entry_perm(cur_));
    out.uid = archive_entry_uid(cur_);
    out.gid = archive_entry_gid(cur_);
    out.uname = OrEmpty(archive_entry_uname(cur_));
    out.gname = OrEmpty(archive_entry_gname(cur_));
    out.mtime = static_cast<std::int64_t>(archive_entry_mtime(cur_));
    LogDebug("tar: entry %s (%llu bytes)", out.name.c_str(), static_cast<unsigned long long>(out.size));
    return Result::Ok();
}

ssize_t TarReader::Read(std::span<std::uint8_t> out) {
    if (!cur_ || done_ || out.empty()) return 0;
    const la_ssize_t n = archive_read_data(ar_, out.data(), out.size());
    if (n < 0) {
        err_ = Result::Fail(kErrFormat, "archive_read_data: " + ArchiveErr(ar_));
        return -1;
    }
    return static_cast<ssize_t>(n);
}

// ---- TarWriter ----

Result TarWriter::Create(IWriter* dst, std::unique_ptr<TarWriter>& out) {
    std::unique_ptr<TarWriter> tw(new TarWriter());
    tw->sink_.writer = dst;

    tw->ar_ = archive_write_new();
    if (!tw->ar_) return Result::Fail(kErrGeneric, "archive_write_new failed");
    if (archive_write_set_format_pax_restricted(tw->ar_) != ARCHIVE_OK) {
        return Result::Fail(kErrGeneric, "archive_write_set_format_pax_restricted: " + ArchiveErr(tw->ar_));
    }
    // No padding of the final block beyond the end-of-archive marker.
    archive_write_set_bytes_in_last_block(tw->ar_, 1);
    if (OpenArchiveToWriter(tw->ar_, tw->sink_) != ARCHIVE_OK) {
        return Result::Fail(kErrGeneric, "archive_write_open: " + ArchiveErr(tw->ar_));
    }
    out = std::move(tw);
    return Result::Ok();
}

TarWriter::~TarWriter() {
    if (ar_) {
        archive_write_free(ar_);
        ar_ = nullptr;
    }
}

Result TarWriter::CheckEntryComplete() const {
    if (remaining_ == 0) return Result::Ok();
    return Result::Fail(kErrGeneric,
                        "tar: missed writing " + std::to_string(remaining_) + " bytes of the previous entry");
}

Result TarWriter::WriteHeader(const TarHeader& hdr) {
    if (closed_) return Result::Fail(kErrGeneric, "tar: write header after close");
    if (!sink_.err.ok) return sink_.err;
    auto r = CheckEntryComplete();
    if (!r.ok) return r;

    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> e(archive_entry_new(), &archive_entry_free);
    if (!e) return Result::Fail(kErrGeneric, "archive_entry_new failed");

    const bool is_dir = hdr.IsDir();
    archive_entry_set_pathname(e.get(), hdr.name.c_str());
    archive_entry_set_filetype(e.get(), is_dir ? AE_IFDIR : FiletypeOf(hdr.typeflag));
    archive_entry_set_perm(e.get(), static_cast<mode_t>(hdr.mode & 07777));
    const bool has_data = !is_dir && (hdr.typeflag == kTarTypeReg || hdr.typeflag == '\0');
    archive_entry_set_size(e.get(), has_data ? static_cast<la_int64_t>(hdr.size) : 0);
    archive_entry_set_mtime(e.get(), static_cast<time_t>(hdr.mtime), 0);
    archive_entry_set_uid(e.get(), hdr.uid);
    archive_entry_set_gid(e.get(), hdr.gid);
    if (!hdr.uname.empty()) archive_entry_set_uname(e.get(), hdr.uname.c_str());
    if (!hdr.gname.empty()) archive_entry_set_gname(e.get(), hdr.gname.c_str());
    if (hdr.typeflag == kTarTypeSymlink) archive_entry_set_symlink(e.get(), hdr.linkname.c_str());
    if (hdr.typeflag == kTarTypeLink) archive_entry_set_hardlink(e.get(), hdr.linkname.c_str());

    if (archive_write_header(ar_, e.get()) != ARCHIVE_OK) {
        if (!sink_.err.ok) return sink_.err;
        return Result::Fail(kErrFormat, "archive_write_header: " + ArchiveErr(ar_));
    }
    remaining_ = has_data ? hdr.size : 0;
    in_dir_ = is_dir;
    return Result::Ok();
}

Result TarWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (closed_) return Result::Fail(kErrGeneric, "tar: write after close");
    if (!sink_.err.ok) return sink_.err;
    if (in.empty()) return Result::Ok();
    if (in_dir_) return ErrIsDir();

    bool too_long = false;
    if (in.size() > remaining_) {
        in = in.first(static_cast<size_t>(remaining_));
        too_long = true;
    }
    while (!in.empty()) {
        const la_ssize_t n = archive_write_data(ar_, in.data(), in.size());
        if (n <= 0) {
            if (!sink_.err.ok) return sink_.err;
            return Result::Fail(kErrFormat, "archive_write_data: " + ArchiveErr(ar_));
        }
        remaining_ -= static_cast<std::uint64_t>(n);
        in = in.subspan(static_cast<size_t>(n));
    }
    if (too_long) return Result::Fail(kErrWriteTooLong, "tar: write too long");
    return Result::Ok();
}

Result TarWriter::AddFsDir(IFileSystem& fsys, const std::string& dir) {
    std::vector<FileInfo> entries;
    auto r = fsys.ReadDir(dir, entries);
    if (!r.ok) return r;

    for (const auto& info : entries) {
        const std::string name = JoinPath(dir, info.name);
        if (info.IsDir()) {
            r = WriteHeader(TarHeader::FromFileInfo(info, name));
            if (!r.ok) return r;
            r = AddFsDir(fsys, name);
            if (!r.ok) return r;
            continue;
        }
        if (!info.IsRegular()) {
            return Result::Fail(kErrNotRegular, "tar: cannot add non-regular file " + name);
        }

        r = WriteHeader(TarHeader::FromFileInfo(info, name));
        if (!r.ok) return r;
        std::unique_ptr<IFile> f;
        r = fsys.Open(name, f);
        if (!r.ok) return r;
        r = Copy(*this, *f);
        auto cr = f->Close();
        if (!r.ok) return r;
        if (!cr.ok) return cr;
    }
    return Result::Ok();
}

Result TarWriter::AddFs(IFileSystem& fsys) { return AddFsDir(fsys, "."); }

Result TarWriter::Close() {
    if (closed_) return Result::Ok();
    auto r = CheckEntryComplete();
    closed_ = true;
    if (!r.ok) {
        // Freeing a failed archive writes no trailer.
        archive_write_fail(ar_);
        return r;
    }
    if (archive_write_close(ar_) != ARCHIVE_OK) {
        if (!sink_.err.ok) return sink_.err;
        return Result::Fail(kErrFormat, "archive_write_close: " + ArchiveErr(ar_));
    }
    return sink_.err;
}

} // namespace filepipe
