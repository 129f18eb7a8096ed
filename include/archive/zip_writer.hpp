#pragma once

#include "archive/zip_compressors.hpp"
#include "archive/zip_format.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace filepipe {

// ZIP archive writer into dst (not owned). Entry writers returned by the
// Create* calls are owned by the ZipWriter and stay valid until it is
// destroyed; an entry is finished by the next Create*/Copy/Close call, and
// later writes to its writer fail.
class ZipWriter final : public ICloser {
public:
    explicit ZipWriter(IWriter* dst);
    ~ZipWriter() override;

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Offset of the first byte written within the enclosing stream, for
    // archives appended to other data. Must precede any write.
    Result SetOffset(std::int64_t n);
    Result SetComment(const std::string& comment);

    // Overrides or adds the compressor for method; an empty factory is ignored.
    void RegisterCompressor(std::uint16_t method, ZipCompressorFactory factory);

    // Deflated entry named name, modified now.
    Result Create(const std::string& name, IWriter*& out);

    // Entry described by fh. Names ending in '/' are directories, whose
    // writers reject payload bytes with kErrIsDir.
    Result CreateHeader(const ZipFileHeader& fh, IWriter*& out);

    // Entry whose bytes are written already compressed. fh must carry the
    // CRC-32 and both sizes.
    Result CreateRaw(const ZipFileHeader& fh, IWriter*& out);

    // Copies f without recompressing it.
    Result Copy(const ZipFile& f);

    // Adds every directory and regular file of fsys, walking from its root.
    Result AddFs(IFileSystem& fsys);

    // Finishes the last entry and writes the central directory. Does not
    // close dst.
    Result Close() override;

    // Bytes written so far, including the offset.
    std::int64_t Count() const;

    class EntryWriter;

private:
    struct DirEntry {
        ZipFileHeader header;
        std::uint64_t offset = 0;
    };

    class CountWriter;

    Result FinishEntry();
    Result WriteLocalHeader(const ZipFileHeader& h, bool raw);
    Result PrepareHeader(ZipFileHeader& h) const;
    Result AddFsDir(IFileSystem& fsys, const std::string& dir);
    ZipCompressorFactory Compressor(std::uint16_t method) const;

    std::unique_ptr<CountWriter> cw_;
    std::vector<DirEntry> dir_;
    std::vector<std::unique_ptr<EntryWriter>> entries_;
    EntryWriter* last_ = nullptr;
    ZipCompressorMap compressors_;
    std::string comment_;
    bool closed_ = false;
};

} // namespace filepipe
