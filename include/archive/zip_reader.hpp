#pragma once

#include "archive/zip_compressors.hpp"
#include "archive/zip_format.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace filepipe {

// ZIP archive reader over a positional source (not owned) of the given size.
// The central directory is read eagerly by Open.
class ZipReader {
public:
    static Result Open(IReaderAt* r, std::uint64_t size, std::unique_ptr<ZipReader>& out);

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // Entries in central-directory order.
    const std::vector<ZipFile>& Files() const { return files_; }
    const std::string& Comment() const { return comment_; }

    // Where offset 0 of the archive lies relative to the source. Negative
    // when the source starts after the beginning of the archive data.
    std::int64_t BaseOffset() const { return base_offset_; }

    // Overrides or adds the decompressor for method. Store and Deflate are
    // built in; an empty factory is ignored.
    void RegisterDecompressor(std::uint16_t method, ZipDecompressorFactory factory);

    // Opens an entry by name. Directories (stored or implied by entry
    // names, and "." for the root) open as handles whose reads fail with
    // kErrIsDir. Unknown names fail with kErrNotExist.
    Result OpenPath(const std::string& name, std::unique_ptr<IFile>& out) const;

    // Opens f for decompressed reading. The size and CRC-32 are checked at
    // the end of the entry.
    Result OpenFile(const ZipFile& f, std::unique_ptr<IFile>& out) const;

    // The stored (compressed) bytes of f.
    Result OpenRaw(const ZipFile& f, std::unique_ptr<IReader>& out) const;

    // Offset of the entry data relative to the source.
    Result DataOffset(const ZipFile& f, std::uint64_t& off) const;

private:
    ZipReader(IReaderAt* r, std::uint64_t size) : r_(r), size_(size) {}

    Result Init();
    Result FindDirectoryEnd(std::uint64_t& eocd_off, std::vector<std::uint8_t>& tail,
                            size_t& pos_in_tail) const;
    Result ReadDirectory64End(std::uint64_t eocd_off, std::uint64_t& end_off,
                              std::uint64_t& records, std::uint64_t& dir_size,
                              std::uint64_t& dir_offset) const;
    Result ReadCentralDirectory(std::span<const std::uint8_t> dir, std::uint64_t records);
    ZipDecompressorFactory Decompressor(std::uint16_t method) const;

    IReaderAt* r_;
    std::uint64_t size_;
    std::int64_t base_offset_ = 0;
    std::vector<ZipFile> files_;
    std::string comment_;
    ZipDecompressorMap decompressors_;
};

} // namespace filepipe
