#pragma once

#include "util/errors.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <vector>

namespace filepipe {

// Read returns the number of bytes read (> 0), 0 at end of stream, or -1 on
// failure. LastError() explains the most recent -1.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
    virtual Result LastError() const { return Result::Fail(kErrGeneric, "read failed"); }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
};

class ICloser {
public:
    virtual ~ICloser() = default;
    virtual Result Close() = 0;
};

// Positional read. Fills out completely unless the end of data is reached,
// in which case n < out.size() and the result is kErrEof.
class IReaderAt {
public:
    virtual ~IReaderAt() = default;
    virtual Result ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) = 0;
};

enum class Whence { kStart, kCurrent, kEnd };

class ISeeker {
public:
    virtual ~ISeeker() = default;
    virtual Result Seek(std::int64_t off, Whence whence, std::uint64_t* pos) = 0;
};

struct FileInfo {
    std::string name;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;  // S_IF* type bits and permissions
    std::int64_t mtime = 0;  // Unix seconds

    bool IsDir() const { return S_ISDIR(mode); }
    bool IsRegular() const { return S_ISREG(mode); }
};

class IFile : public IReader, public ICloser {
public:
    virtual Result Stat(FileInfo& out) const = 0;
};

class IWritableFile : public IWriter, public ICloser {
public:
    virtual Result Stat(FileInfo& out) const = 0;
};

// Names are slash-separated and relative to the root of the file system;
// "." names the root itself.
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual Result Open(const std::string& name, std::unique_ptr<IFile>& out) = 0;
    // Entries are sorted by name; FileInfo::name is the base name.
    virtual Result ReadDir(const std::string& name, std::vector<FileInfo>& out) = 0;
};

} // namespace filepipe
