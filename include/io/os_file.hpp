#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace filepipe {

// Opens path for reading: OsFile for regular files, OsStream otherwise.
// "-" is standard input.
Result OpenOsFile(const std::string& path, std::unique_ptr<IFile>& out);

// A regular file opened read-only. Supports positional reads and seeking.
class OsFile final : public IFile, public IReaderAt, public ISeeker {
public:
    static Result Open(const std::string& path, std::unique_ptr<OsFile>& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override;
    Result LastError() const override { return last_err_; }

    Result ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) override;
    Result Seek(std::int64_t off, Whence whence, std::uint64_t* pos) override;

    Result Stat(FileInfo& out) const override;
    Result Close() override;

    const std::string& Path() const { return path_; }

private:
    friend Result OpenOsFile(const std::string& path, std::unique_ptr<IFile>& out);
    OsFile(std::string path, Fd fd) : path_(std::move(path)), fd_(std::move(fd)) {}

    std::string path_;
    Fd fd_;
    Result last_err_;
};

// A pipe, character device, directory or standard input. Sequential only.
class OsStream final : public IFile {
public:
    OsStream(std::string path, Fd fd) : path_(std::move(path)), fd_(std::move(fd)) {}

    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return last_err_; }

    Result Stat(FileInfo& out) const override;
    Result Close() override;

private:
    std::string path_;
    Fd fd_;
    Result last_err_;
};


class OsWritableFile final : public IWritableFile {
public:
    // flags are open(2) flags; O_WRONLY is implied.
    static Result Open(const std::string& path, int flags, mode_t perm,
                       std::unique_ptr<OsWritableFile>& out);
    static std::unique_ptr<OsWritableFile> Stdout();

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Stat(FileInfo& out) const override;
    Result Close() override;

    Result Sync();
    const std::string& Path() const { return path_; }

private:
    OsWritableFile(std::string path, Fd fd) : path_(std::move(path)), fd_(std::move(fd)) {}

    std::string path_;
    Fd fd_;
};

// Stat for a path (following symlinks), named after its base name.
Result StatPath(const std::string& path, FileInfo& out);

} // namespace filepipe
