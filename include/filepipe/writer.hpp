#pragma once

#include "archive/tar.hpp"
#include "archive/zip_writer.hpp"
#include "filepipe/options.hpp"
#include "io/buffered_writer.hpp"
#include "io/closer.hpp"
#include "io/io.hpp"

#include <cstdarg>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace filepipe {

// Writes a file through the pipeline selected by its name: a buffer on
// top, then archive framing (.tar, .zip) and compression (.gz).
//
// Close flushes the buffer and then closes every transform, and the file
// if requested, in reverse order of creation. After a successful Close the
// write methods fail with kErrFileWriterClosed.
class Writer final : public IWriter, public Closer {
public:
    // Throws std::invalid_argument if file is null or opts are out of
    // range (see ValidateWriteOptions). With close_file the writer closes
    // file on Close, and also when Open fails; the object itself stays
    // owned by the caller and must outlive the writer.
    static Result Open(IWritableFile* file, const WriteOptions& opts, bool close_file,
                       std::unique_ptr<Writer>& out);
    // Takes ownership of file.
    static Result Open(std::unique_ptr<IWritableFile> file, const WriteOptions& opts,
                       std::unique_ptr<Writer>& out);

    ~Writer() override;

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    Result Close() override;
    bool Closed() const override;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Write(std::span<const std::uint8_t> p, size_t& n);
    Result WriteByte(std::uint8_t c);
    Result WriteRune(char32_t r, size_t& size);
    Result WriteString(std::string_view s, size_t& n);
    Result ReadFrom(IReader& src, std::uint64_t& n);
    Result Printf(size_t& n, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    template <typename... Args>
    Result Print(size_t& n, const Args&... args) {
        n = 0;
        auto r = WriteGate();
        if (!r.ok) return r;
        return bw_->Print(n, args...);
    }

    template <typename... Args>
    Result Println(size_t& n, const Args&... args) {
        n = 0;
        auto r = WriteGate();
        if (!r.ok) return r;
        return bw_->Println(n, args...);
    }

    // Like the methods above, but throw WritePanic on failure.
    size_t MustWrite(std::span<const std::uint8_t> p);
    void MustWriteByte(std::uint8_t c);
    size_t MustWriteRune(char32_t r);
    size_t MustWriteString(std::string_view s);
    size_t MustPrintf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    template <typename... Args>
    size_t MustPrint(const Args&... args) {
        size_t n = 0;
        auto r = Print(n, args...);
        if (!r.ok) throw WritePanic(r);
        return n;
    }

    template <typename... Args>
    size_t MustPrintln(const Args&... args) {
        size_t n = 0;
        auto r = Println(n, args...);
        if (!r.ok) throw WritePanic(r);
        return n;
    }

    // Succeeds without doing anything when nothing is buffered, even after
    // Close.
    Result Flush();

    size_t Size() const { return bw_->Size(); }
    size_t Buffered() const { return bw_->Buffered(); }
    size_t Available() const { return bw_->Available(); }

    bool TarEnabled() const { return tar_ != nullptr; }
    // Flushes the current entry and starts a new one.
    Result TarWriteHeader(const TarHeader& hdr);
    Result TarAddFs(IFileSystem& fsys);

    bool ZipEnabled() const { return zip_ != nullptr; }
    // Each call flushes the current entry first. Until the first create,
    // after ZipCopy/ZipAddFs, and while a directory entry is current,
    // writes fail immediately (kErrZipWriteBeforeCreate or kErrIsDir).
    Result ZipCreate(const std::string& name);
    Result ZipCreateHeader(const ZipFileHeader& fh);
    Result ZipCreateRaw(const ZipFileHeader& fh);
    Result ZipCopy(const ZipFile& f);
    Result ZipAddFs(IFileSystem& fsys);

    const WriteOptions& Options() const { return opts_; }
    Result FileStat(FileInfo& out) const { return file_->Stat(out); }

private:
    enum class ZipState {
        kBetweenEntries,
        kRegularEntry,
        kDirectoryEntry,
    };

    Writer(IWritableFile* file, const WriteOptions& opts);

    Result Init(const FileInfo& info, std::vector<ICloser*>& closers);
    Result InitZip(std::vector<ICloser*>& closers);
    Result WriteGate() const;
    Result ArchiveCheck(bool enabled, Result (*mode_err)()) const;
    void SetZipState(ZipState state, IWriter* entry);

    IWritableFile* file_;
    std::unique_ptr<IWritableFile> owned_file_;
    WriteOptions opts_;
    std::vector<std::unique_ptr<ICloser>> stages_;
    IWriter* uw_;
    std::unique_ptr<Closer> closer_;
    std::unique_ptr<BufferedWriter> bw_;
    TarWriter* tar_ = nullptr;
    ZipWriter* zip_ = nullptr;
    ZipState zip_state_ = ZipState::kBetweenEntries;
    std::unique_ptr<IWriter> between_writer_;
    std::unique_ptr<IWriter> dir_writer_;
};

} // namespace filepipe
