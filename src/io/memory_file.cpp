#include "io/memory_file.hpp"

#include "util/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <sys/stat.h>

namespace filepipe {

MemoryFile::MemoryFile(std::string name, std::vector<std::uint8_t> data, std::int64_t mtime)
    : name_(std::move(name)), data_(std::move(data)), mtime_(mtime) {}

MemoryFile::MemoryFile(std::string name, std::string_view data, std::int64_t mtime)
    : name_(std::move(name)), data_(data.begin(), data.end()), mtime_(mtime) {}

ssize_t MemoryFile::Read(std::span<std::uint8_t> out) {
    if (closed_) {
        last_err_ = ErrnoFail(EBADF, "read " + name_);
        return -1;
    }
    if (pos_ >= data_.size()) return 0;
    const size_t n = std::min<std::uint64_t>(out.size(), data_.size() - pos_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
    pos_ += n;
    return static_cast<ssize_t>(n);
}

Result MemoryFile::ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) {
    n = 0;
    if (closed_) return ErrnoFail(EBADF, "read " + name_);
    if (off >= data_.size()) return out.empty() ? Result::Ok() : ErrEof();
    n = std::min<std::uint64_t>(out.size(), data_.size() - off);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(off), n, out.begin());
    return n < out.size() ? ErrEof() : Result::Ok();
}

Result MemoryFile::Seek(std::int64_t off, Whence whence, std::uint64_t* pos) {
    std::int64_t base = 0;
    if (whence == Whence::kCurrent) base = static_cast<std::int64_t>(pos_);
    if (whence == Whence::kEnd) base = static_cast<std::int64_t>(data_.size());
    if (base + off < 0) return ErrnoFail(EINVAL, "seek " + name_);
    pos_ = static_cast<std::uint64_t>(base + off);
    if (pos) *pos = pos_;
    return Result::Ok();
}

Result MemoryFile::Stat(FileInfo& out) const {
    out.name = name_;
    out.size = data_.size();
    out.mode = S_IFREG | 0644;
    out.mtime = mtime_;
    return Result::Ok();
}

Result MemoryFile::Close() {
    if (closed_) return ErrnoFail(EBADF, "close " + name_);
    closed_ = true;
    return Result::Ok();
}

Result MemoryWritableFile::WriteAll(std::span<const std::uint8_t> in) {
    if (closed_) return ErrnoFail(EBADF, "write " + name_);
    data_.insert(data_.end(), in.begin(), in.end());
    return Result::Ok();
}

Result MemoryWritableFile::Stat(FileInfo& out) const {
    out.name = name_;
    out.size = data_.size();
    out.mode = S_IFREG | 0644;
    out.mtime = 0;
    return Result::Ok();
}

Result MemoryWritableFile::Close() {
    if (closed_) return ErrnoFail(EBADF, "close " + name_);
    closed_ = true;
    return Result::Ok();
}

} // namespace filepipe
