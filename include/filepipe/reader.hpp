#pragma once

#include "archive/tar.hpp"
#include "archive/zip_reader.hpp"
#include "filepipe/options.hpp"
#include "io/buffered_reader.hpp"
#include "io/closer.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace filepipe {

class Reader;

// Single-use sequence of the headers of a tar reader. Iterating again
// yields nothing and leaves the error slot as it is.
class TarHeaderSeq {
public:
    // Calls fn for each header until fn returns false or the archive ends.
    // A non-local name (unless allowed) is still passed to fn, and then
    // ends the iteration with kErrInsecurePath in the error slot.
    void ForEach(const std::function<bool(const TarHeader&)>& fn);

private:
    friend class Reader;
    TarHeaderSeq(Reader* r, Result* err, bool allow_non_local)
        : r_(r), err_(err), allow_non_local_(allow_non_local) {}

    Reader* r_;
    Result* err_;
    bool allow_non_local_;
    bool used_ = false;
};

// Sequence of zip entries in directory order. Iteration resumes where the
// previous one stopped; Rewind starts over.
class ZipFileSeq {
public:
    ZipFileSeq() = default;

    void ForEach(const std::function<bool(const ZipFile&)>& fn);
    void ForEachIndexed(const std::function<bool(size_t, const ZipFile&)>& fn);
    void Rewind() { pos_ = 0; }

private:
    friend class Reader;
    explicit ZipFileSeq(std::vector<ZipFile> files) : files_(std::move(files)) {}

    std::vector<ZipFile> files_;
    size_t pos_ = 0;
};

// Reads a file through the pipeline selected by its name: decompression
// (.gz, .bz2), archive framing (.tar, .zip) and a buffer on top, after
// the offset and limit options have been applied to the stored bytes.
//
// Closing the reader closes every transform it created and, if requested,
// the file. After a successful Close every read method fails with
// kErrFileReaderClosed and Close does nothing.
class Reader final : public IReader, public Closer {
public:
    // Throws std::invalid_argument if file is null. With close_file the
    // reader closes file on Close, and also when Open fails; the object
    // itself stays owned by the caller and must outlive the reader.
    static Result Open(IFile* file, const ReadOptions& opts, bool close_file,
                       std::unique_ptr<Reader>& out);
    // Takes ownership of file.
    static Result Open(std::unique_ptr<IFile> file, const ReadOptions& opts,
                       std::unique_ptr<Reader>& out);
    // Opens name from fsys (not owned); throws std::invalid_argument if
    // fsys is null.
    static Result OpenFromFs(IFileSystem* fsys, const std::string& name, const ReadOptions& opts,
                             std::unique_ptr<Reader>& out);

    ~Reader() override;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    Result Close() override;
    bool Closed() const override;

    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return last_err_; }

    Result ReadByte(std::uint8_t& c);
    Result UnreadByte();
    Result ReadRune(char32_t& r, size_t& size);
    Result UnreadRune();
    Result WriteTo(IWriter& w, std::uint64_t& n);
    Result ReadLine(std::span<const std::uint8_t>& line, bool& more);
    Result ReadEntireLine(std::string& line);
    Result WriteLineTo(IWriter& w, std::uint64_t& n);
    Result Peek(int n, std::span<const std::uint8_t>& data);
    Result Discard(int n, int& discarded);

    size_t Size() const { return br_->Size(); }
    size_t Buffered() const { return br_->Buffered(); }

    bool TarEnabled() const { return tar_ != nullptr; }

    // Advances to the next tar entry, dropping what is left of the current
    // one. Fails with kErrEof at the end of the archive. Reads of a
    // directory entry fail with kErrIsDir.
    Result TarNext(TarHeader& out);

    // err (may be null) receives the terminal error; the normal end of the
    // archive leaves it ok.
    TarHeaderSeq IterTarHeaders(Result* err, bool allow_non_local = false);

    bool ZipEnabled() const { return zip_ != nullptr; }

    // Entry handles read from this reader's stream and must be closed
    // before it.
    Result ZipOpen(const std::string& name, std::unique_ptr<IFile>& out);
    Result ZipFiles(std::vector<ZipFile>& out) const;
    Result ZipComment(std::string& out) const;
    Result IterZipFiles(ZipFileSeq& out) const;

    const ReadOptions& Options() const { return opts_; }
    Result FileStat(FileInfo& out) const { return file_->Stat(out); }

private:
    Reader(IFile* file, const ReadOptions& opts);

    Result Init(const FileInfo& info, std::vector<ICloser*>& closers);
    Result InitOffsetAndLimit(std::uint64_t size, std::uint64_t& n);
    Result InitStages(const FileInfo& info, std::uint64_t n, std::vector<ICloser*>& closers);
    Result InitZip(std::uint64_t n);
    Result ModeCheck(bool enabled, Result (*mode_err)()) const;
    void SetState(Result err, IReader* ur);
    Result Record(Result r);

    IFile* file_;
    std::unique_ptr<IFile> owned_file_;
    ReadOptions opts_;
    std::vector<std::unique_ptr<IReader>> stages_;
    IReader* ur_;
    std::unique_ptr<IReader> state_reader_;
    std::unique_ptr<Closer> closer_;
    std::unique_ptr<BufferedReader> br_;
    TarReader* tar_ = nullptr;
    std::unique_ptr<ZipReader> zip_;
    // State error (kErrIsDir, kErrReadZip, closed) or the sticky read error.
    Result err_;
    Result last_err_;
};

} // namespace filepipe
