#include "filepipe/writer.hpp"

#include "filepipe/pipeline.hpp"
#include "io/deflate_writer.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace filepipe {

namespace {

// Fails every write with a fixed error.
class ErrorWriter final : public IWriter {
public:
    explicit ErrorWriter(Result err) : err_(std::move(err)) {}

    Result WriteAll(std::span<const std::uint8_t>) override { return err_; }

private:
    Result err_;
};

Result CloseAll(Result err, const std::vector<ICloser*>& closers) {
    std::vector<Result> errs{std::move(err)};
    for (auto it = closers.rbegin(); it != closers.rend(); ++it) {
        errs.push_back((*it)->Close());
    }
    return Result::Combine(errs);
}

} // namespace

Writer::Writer(IWritableFile* file, const WriteOptions& opts) : file_(file), opts_(opts), uw_(file) {
    for (auto it = opts_.zip_compressors.begin(); it != opts_.zip_compressors.end();) {
        if (!it->second) {
            it = opts_.zip_compressors.erase(it);
        } else {
            ++it;
        }
    }
}

Writer::~Writer() {
    if (closer_ && !closer_->Closed()) {
        auto r = Close();
        if (!r.ok) LogWarn("filepipe: closing writer on destruction: %s", r.msg.c_str());
    }
    // Outer stages write into inner ones while tearing down.
    bw_.reset();
    while (!stages_.empty()) stages_.pop_back();
}

Result Writer::Open(IWritableFile* file, const WriteOptions& opts, bool close_file,
                    std::unique_ptr<Writer>& out) {
    if (!file) throw std::invalid_argument("filepipe: file is null");
    auto valid = ValidateWriteOptions(opts);
    if (!valid.ok) throw std::invalid_argument("filepipe: " + valid.msg);

    std::vector<ICloser*> closers;
    if (close_file) closers.push_back(file);

    FileInfo info;
    auto r = file->Stat(info);
    if (!r.ok) return CloseAll(r.Wrap("filepipe: stat"), closers);
    if (info.IsDir()) return CloseAll(ErrIsDir().Wrap("filepipe: " + info.name), closers);

    std::unique_ptr<Writer> fw(new Writer(file, opts));
    r = fw->Init(info, closers);
    if (!r.ok) return CloseAll(r.Wrap("filepipe: open " + info.name), closers);
    out = std::move(fw);
    return Result::Ok();
}

Result Writer::Open(std::unique_ptr<IWritableFile> file, const WriteOptions& opts,
                    std::unique_ptr<Writer>& out) {
    if (!file) throw std::invalid_argument("filepipe: file is null");
    std::unique_ptr<Writer> fw;
    auto r = Open(file.get(), opts, true, fw);
    if (!r.ok) return r;
    fw->owned_file_ = std::move(file);
    out = std::move(fw);
    return Result::Ok();
}

Result Writer::Init(const FileInfo& info, std::vector<ICloser*>& closers) {
    std::vector<Stage> chain;
    if (!opts_.raw) chain = ParseExtensionChain(info.name, true);
    LogDebug("filepipe: write %s through %s", info.name.c_str(), DescribeChain(chain).c_str());

    for (Stage stage : chain) {
        switch (stage) {
            case Stage::kGzip: {
                std::unique_ptr<DeflateWriter> gw;
                auto r = DeflateWriter::Create(uw_, ZlibFraming::kGzip, opts_.deflate_level, gw);
                if (!r.ok) return r;
                closers.push_back(gw.get());
                uw_ = gw.get();
                stages_.push_back(std::move(gw));
                break;
            }
            case Stage::kTar: {
                std::unique_ptr<TarWriter> tw;
                auto r = TarWriter::Create(uw_, tw);
                if (!r.ok) return r;
                closers.push_back(tw.get());
                tar_ = tw.get();
                uw_ = tw.get();
                stages_.push_back(std::move(tw));
                break;
            }
            case Stage::kZip: {
                auto r = InitZip(closers);
                if (!r.ok) return r;
                break;
            }
            case Stage::kBzip2:
                // Not produced for writing.
                break;
        }
    }

    switch (closers.size()) {
        case 0:
            closer_ = std::make_unique<NoOpCloser>();
            break;
        case 1:
            closer_ = std::make_unique<NoErrorCloser>(closers[0]);
            break;
        default:
            closer_ = std::make_unique<MultiCloser>(true, true, closers);
            break;
    }
    const size_t size = opts_.buf_size > 0 ? static_cast<size_t>(opts_.buf_size) : BufferedWriter::kDefaultSize;
    bw_ = std::make_unique<BufferedWriter>(uw_, size);
    if (zip_) SetZipState(ZipState::kBetweenEntries, nullptr);
    return Result::Ok();
}

Result Writer::InitZip(std::vector<ICloser*>& closers) {
    auto zw = std::make_unique<ZipWriter>(uw_);
    auto r = zw->SetOffset(opts_.zip_offset);
    if (!r.ok) return r;
    r = zw->SetComment(opts_.zip_comment);
    if (!r.ok) return r;

    bool has_deflate = false;
    for (const auto& [method, factory] : opts_.zip_compressors) {
        zw->RegisterCompressor(method, factory);
        if (method == kZipDeflate) has_deflate = true;
    }
    if (!has_deflate) zw->RegisterCompressor(kZipDeflate, DeflateCompressor(opts_.deflate_level));

    closers.push_back(zw.get());
    zip_ = zw.get();
    between_writer_ = std::make_unique<ErrorWriter>(ErrZipWriteBeforeCreate());
    dir_writer_ = std::make_unique<ErrorWriter>(ErrIsDir());
    uw_ = between_writer_.get();
    stages_.push_back(std::move(zw));
    return Result::Ok();
}

Result Writer::Close() {
    if (closer_->Closed()) return Result::Ok();
    auto flush = bw_->Flush();
    auto closed = closer_->Close();
    return Result::Combine({flush, closed});
}

bool Writer::Closed() const { return closer_->Closed(); }

Result Writer::WriteGate() const {
    if (closer_->Closed()) return ErrFileWriterClosed();
    if (!zip_) return Result::Ok();
    switch (zip_state_) {
        case ZipState::kBetweenEntries:
            return ErrZipWriteBeforeCreate();
        case ZipState::kDirectoryEntry:
            return ErrIsDir();
        case ZipState::kRegularEntry:
            break;
    }
    return Result::Ok();
}

void Writer::SetZipState(ZipState state, IWriter* entry) {
    zip_state_ = state;
    switch (state) {
        case ZipState::kBetweenEntries:
            uw_ = between_writer_.get();
            break;
        case ZipState::kDirectoryEntry:
            uw_ = dir_writer_.get();
            break;
        case ZipState::kRegularEntry:
            uw_ = entry;
            break;
    }
    bw_->Reset(uw_);
}

Result Writer::WriteAll(std::span<const std::uint8_t> in) {
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->WriteAll(in);
}

Result Writer::Write(std::span<const std::uint8_t> p, size_t& n) {
    n = 0;
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->Write(p, n);
}

Result Writer::WriteByte(std::uint8_t c) {
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->WriteByte(c);
}

Result Writer::WriteRune(char32_t rn, size_t& size) {
    size = 0;
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->WriteRune(rn, size);
}

Result Writer::WriteString(std::string_view s, size_t& n) {
    n = 0;
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->WriteString(s, n);
}

Result Writer::ReadFrom(IReader& src, std::uint64_t& n) {
    n = 0;
    auto r = WriteGate();
    if (!r.ok) return r;
    return bw_->ReadFrom(src, n);
}

Result Writer::Printf(size_t& n, const char* fmt, ...) {
    n = 0;
    auto r = WriteGate();
    if (!r.ok) return r;
    va_list ap;
    va_start(ap, fmt);
    r = bw_->VPrintf(n, fmt, ap);
    va_end(ap);
    return r;
}

size_t Writer::MustWrite(std::span<const std::uint8_t> p) {
    size_t n = 0;
    auto r = Write(p, n);
    if (!r.ok) throw WritePanic(r);
    return n;
}

void Writer::MustWriteByte(std::uint8_t c) {
    auto r = WriteByte(c);
    if (!r.ok) throw WritePanic(r);
}

size_t Writer::MustWriteRune(char32_t rn) {
    size_t size = 0;
    auto r = WriteRune(rn, size);
    if (!r.ok) throw WritePanic(r);
    return size;
}

size_t Writer::MustWriteString(std::string_view s) {
    size_t n = 0;
    auto r = WriteString(s, n);
    if (!r.ok) throw WritePanic(r);
    return n;
}

size_t Writer::MustPrintf(const char* fmt, ...) {
    size_t n = 0;
    auto r = WriteGate();
    if (r.ok) {
        va_list ap;
        va_start(ap, fmt);
        r = bw_->VPrintf(n, fmt, ap);
        va_end(ap);
    }
    if (!r.ok) throw WritePanic(r);
    return n;
}

Result Writer::Flush() {
    if (closer_->Closed()) {
        if (bw_->Buffered() > 0) return ErrFileWriterClosed();
        return Result::Ok();
    }
    return bw_->Flush();
}

Result Writer::ArchiveCheck(bool enabled, Result (*mode_err)()) const {
    if (!enabled) return mode_err();
    if (closer_->Closed()) return ErrFileWriterClosed();
    return Result::Ok();
}

Result Writer::TarWriteHeader(const TarHeader& hdr) {
    auto r = ArchiveCheck(TarEnabled(), &ErrNotTar);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;
    r = tar_->WriteHeader(hdr);
    if (r.ok) bw_->Reset(uw_);
    return r;
}

Result Writer::TarAddFs(IFileSystem& fsys) {
    auto r = ArchiveCheck(TarEnabled(), &ErrNotTar);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;
    r = tar_->AddFs(fsys);
    if (r.ok) bw_->Reset(uw_);
    return r;
}

Result Writer::ZipCreate(const std::string& name) {
    auto r = ArchiveCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;

    IWriter* w = nullptr;
    r = zip_->Create(name, w);
    if (!r.ok) {
        SetZipState(ZipState::kBetweenEntries, nullptr);
        return r;
    }
    const bool dir = !name.empty() && name.back() == '/';
    SetZipState(dir ? ZipState::kDirectoryEntry : ZipState::kRegularEntry, w);
    return Result::Ok();
}

Result Writer::ZipCreateHeader(const ZipFileHeader& fh) {
    auto r = ArchiveCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;

    IWriter* w = nullptr;
    r = zip_->CreateHeader(fh, w);
    if (!r.ok) {
        SetZipState(ZipState::kBetweenEntries, nullptr);
        return r;
    }
    SetZipState(fh.IsDir() ? ZipState::kDirectoryEntry : ZipState::kRegularEntry, w);
    return Result::Ok();
}

Result Writer::ZipCreateRaw(const ZipFileHeader& fh) {
    auto r = ArchiveCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;

    IWriter* w = nullptr;
    r = zip_->CreateRaw(fh, w);
    if (!r.ok) {
        SetZipState(ZipState::kBetweenEntries, nullptr);
        return r;
    }
    SetZipState(ZipState::kRegularEntry, w);
    return Result::Ok();
}

Result Writer::ZipCopy(const ZipFile& f) {
    auto r = ArchiveCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;
    r = zip_->Copy(f);
    SetZipState(ZipState::kBetweenEntries, nullptr);
    return r;
}

Result Writer::ZipAddFs(IFileSystem& fsys) {
    auto r = ArchiveCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    r = bw_->Flush();
    if (!r.ok) return r;
    r = zip_->AddFs(fsys);
    SetZipState(ZipState::kBetweenEntries, nullptr);
    return r;
}

} // namespace filepipe
