#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filepipe {

// Read-only file over an owned byte buffer.
class MemoryFile final : public IFile, public IReaderAt, public ISeeker {
public:
    MemoryFile(std::string name, std::vector<std::uint8_t> data, std::int64_t mtime = 0);
    MemoryFile(std::string name, std::string_view data, std::int64_t mtime = 0);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return data_.size(); }
    Result LastError() const override { return last_err_; }

    Result ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) override;
    Result Seek(std::int64_t off, Whence whence, std::uint64_t* pos) override;

    Result Stat(FileInfo& out) const override;
    Result Close() override;

    bool Closed() const { return closed_; }

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
    std::int64_t mtime_ = 0;
    std::uint64_t pos_ = 0;
    bool closed_ = false;
    Result last_err_;
};

// Writable file collecting everything written into memory.
class MemoryWritableFile final : public IWritableFile {
public:
    explicit MemoryWritableFile(std::string name) : name_(std::move(name)) {}

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Stat(FileInfo& out) const override;
    Result Close() override;

    const std::vector<std::uint8_t>& Data() const { return data_; }
    std::string Str() const { return std::string(data_.begin(), data_.end()); }
    bool Closed() const { return closed_; }

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
    bool closed_ = false;
};

} // namespace filepipe
