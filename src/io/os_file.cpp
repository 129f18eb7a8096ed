#include "io/os_file.hpp"

#include "util/errors.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace filepipe {

namespace {

void FillInfo(const std::string& path, const struct stat& st, FileInfo& out) {
    out.name = path == "-" ? "-" : BaseName(path);
    out.size = S_ISREG(st.st_mode) ? static_cast<std::uint64_t>(st.st_size) : 0;
    out.mode = static_cast<std::uint32_t>(st.st_mode);
    out.mtime = static_cast<std::int64_t>(st.st_mtime);
}

Result FstatInfo(int fd, const std::string& path, FileInfo& out) {
    struct stat st{};
    if (fd < 0) return ErrnoFail(EBADF, "stat " + path);
    if (::fstat(fd, &st) != 0) return ErrnoFail(errno, "stat " + path);
    FillInfo(path, st, out);
    return Result::Ok();
}

ssize_t ReadFd(int fd, std::span<std::uint8_t> out, Result& err) {
    if (fd < 0) {
        err = ErrnoFail(EBADF, "read");
        return -1;
    }
    while (true) {
        const ssize_t n = ::read(fd, out.data(), out.size());
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        err = ErrnoFail(errno, "read");
        return -1;
    }
}

} // namespace

Result OsFile::Open(const std::string& path, std::unique_ptr<OsFile>& out) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return ErrnoFail(errno, "Failed to open input: " + path);
    }
    out.reset(new OsFile(path, Fd(fd)));
    return Result::Ok();
}

ssize_t OsFile::Read(std::span<std::uint8_t> out) { return ReadFd(fd_.Get(), out, last_err_); }

std::optional<std::uint64_t> OsFile::TotalSize() const {
    FileInfo info;
    if (!Stat(info).ok) return std::nullopt;
    return info.size;
}

Result OsFile::ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) {
    n = 0;
    if (!fd_.Valid()) return ErrnoFail(EBADF, "pread " + path_);
    while (n < out.size()) {
        const ssize_t got = ::pread(fd_.Get(), out.data() + n, out.size() - n,
                                    static_cast<off_t>(off + n));
        if (got < 0) {
            if (errno == EINTR) continue;
            return ErrnoFail(errno, "pread " + path_);
        }
        if (got == 0) return ErrEof();
        n += static_cast<size_t>(got);
    }
    return Result::Ok();
}

Result OsFile::Seek(std::int64_t off, Whence whence, std::uint64_t* pos) {
    int w = SEEK_SET;
    if (whence == Whence::kCurrent) w = SEEK_CUR;
    if (whence == Whence::kEnd) w = SEEK_END;
    const off_t r = ::lseek(fd_.Get(), static_cast<off_t>(off), w);
    if (r < 0) return ErrnoFail(errno, "seek " + path_);
    if (pos) *pos = static_cast<std::uint64_t>(r);
    return Result::Ok();
}

Result OsFile::Stat(FileInfo& out) const { return FstatInfo(fd_.Get(), path_, out); }

Result OsFile::Close() {
    if (!fd_.Valid()) return ErrnoFail(EBADF, "close " + path_);
    return fd_.Close().Wrap("close " + path_);
}

ssize_t OsStream::Read(std::span<std::uint8_t> out) { return ReadFd(fd_.Get(), out, last_err_); }

Result OsStream::Stat(FileInfo& out) const { return FstatInfo(fd_.Get(), path_, out); }

Result OsStream::Close() {
    if (!fd_.Valid()) return ErrnoFail(EBADF, "close " + path_);
    return fd_.Close().Wrap("close " + path_);
}

Result OpenOsFile(const std::string& path, std::unique_ptr<IFile>& out) {
    if (path == "-") {
        out = std::make_unique<OsStream>(path, Fd(STDIN_FILENO));
        return Result::Ok();
    }
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return ErrnoFail(errno, "Failed to open input: " + path);
    }
    Fd owned(fd);
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return ErrnoFail(errno, "stat " + path);
    }
    if (S_ISREG(st.st_mode)) {
        out.reset(new OsFile(path, std::move(owned)));
        return Result::Ok();
    }
    out = std::make_unique<OsStream>(path, std::move(owned));
    return Result::Ok();
}

Result OsWritableFile::Open(const std::string& path, int flags, mode_t perm,
                            std::unique_ptr<OsWritableFile>& out) {
    const int fd = ::open(path.c_str(), flags | O_WRONLY | O_CLOEXEC, perm);
    if (fd < 0) {
        return ErrnoFail(errno, "Failed to open output: " + path);
    }
    out.reset(new OsWritableFile(path, Fd(fd)));
    return Result::Ok();
}

std::unique_ptr<OsWritableFile> OsWritableFile::Stdout() {
    return std::unique_ptr<OsWritableFile>(new OsWritableFile("-", Fd(STDOUT_FILENO)));
}

Result OsWritableFile::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return ErrnoFail(errno, "write " + path_);
    }

    return Result::Ok();
}

Result OsWritableFile::Stat(FileInfo& out) const { return FstatInfo(fd_.Get(), path_, out); }

Result OsWritableFile::Close() {
    if (!fd_.Valid()) return ErrnoFail(EBADF, "close " + path_);
    return fd_.Close().Wrap("close " + path_);
}

Result OsWritableFile::Sync() {
    if (::fsync(fd_.Get()) == -1) {
        return ErrnoFail(errno, "fsync " + path_);
    }
    return Result::Ok();
}

Result StatPath(const std::string& path, FileInfo& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return ErrnoFail(errno, "stat " + path);
    FillInfo(path, st, out);
    return Result::Ok();
}

} // namespace filepipe
