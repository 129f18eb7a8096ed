#pragma once

#include "archive/libarchive_adapter.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <string>

struct archive_entry;

namespace filepipe {

constexpr char kTarTypeReg = '0';
constexpr char kTarTypeLink = '1';
constexpr char kTarTypeSymlink = '2';
constexpr char kTarTypeChar = '3';
constexpr char kTarTypeBlock = '4';
constexpr char kTarTypeDir = '5';
constexpr char kTarTypeFifo = '6';

struct TarHeader {
    std::string name;
    std::string linkname;
    char typeflag = kTarTypeReg;
    std::uint64_t size = 0;
    std::uint32_t mode = 0644;  // permission bits
    std::int64_t uid = 0;
    std::int64_t gid = 0;
    std::string uname;
    std::string gname;
    std::int64_t mtime = 0;

    // A directory by type, or an old-style regular entry whose name ends in '/'.
    bool IsDir() const;
    FileInfo ToFileInfo() const;

    static TarHeader FromFileInfo(const FileInfo& info, const std::string& name);
};

// Sequential tar reader over src (not owned), backed by libarchive.
class TarReader final : public IReader {
  public:
    static Result Open(IReader* src, std::unique_ptr<TarReader>& out);
    ~TarReader() override;

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advances to the next entry, skipping what is left of the current one.
    // Fails with kErrEof at the end of the archive.
    Result Next(TarHeader& out);

    // Payload of the current entry.
    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return err_; }

  private:
    TarReader() = default;

    struct archive* ar_ = nullptr;
    struct archive_entry* cur_ = nullptr;
    bool done_ = false;
    Result err_;
};

// Tar writer (PAX) into dst (not owned), backed by libarchive.
class TarWriter final : public IWriter, public ICloser {
  public:
    static Result Create(IWriter* dst, std::unique_ptr<TarWriter>& out);
    ~TarWriter() override;

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    // Starts a new entry. The previous entry must be complete.
    Result WriteHeader(const TarHeader& hdr);

    // Payload of the current entry; fails with kErrWriteTooLong past
    // hdr.size and with kErrIsDir for directories.
    Result WriteAll(std::span<const std::uint8_t> in) override;

    // Adds every directory and regular file of fsys, walking from its root.
    // Other file types fail with kErrNotRegular.
    Result AddFs(IFileSystem& fsys);

    // Writes the archive trailer. Does not close dst.
    Result Close() override;

  private:
    TarWriter() = default;

    Result AddFsDir(IFileSystem& fsys, const std::string& dir);
    Result CheckEntryComplete() const;

    struct archive* ar_ = nullptr;
    ArchiveSink sink_;
    std::uint64_t remaining_ = 0;
    bool in_dir_ = false;
    bool closed_ = false;
};

} // namespace filepipe
