#include "filepipe/reader.hpp"

#include "archive/archive_path_policy.hpp"
#include "filepipe/pipeline.hpp"
#include "io/bzip2_reader.hpp"
#include "io/copy.hpp"
#include "io/inflate_reader.hpp"
#include "io/limit_reader.hpp"
#include "io/memory_file.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace filepipe {

namespace {

// Fails every read with a fixed error.
class ErrorReader final : public IReader {
public:
    explicit ErrorReader(Result err) : err_(std::move(err)) {}

    ssize_t Read(std::span<std::uint8_t>) override { return -1; }
    Result LastError() const override { return err_; }

private:
    Result err_;
};

bool IsSticky(const Result& r) {
    if (r.ok) return false;
    return !(r.Is(kErrEof) || r.Is(kErrBufferFull) || r.Is(kErrInvalidUnread) || r.Is(kErrNegativeCount));
}

Result CloseAll(Result err, const std::vector<ICloser*>& closers) {
    std::vector<Result> errs{std::move(err)};
    for (auto it = closers.rbegin(); it != closers.rend(); ++it) {
        errs.push_back((*it)->Close());
    }
    return Result::Combine(errs);
}

} // namespace

// ---- TarHeaderSeq ----

void TarHeaderSeq::ForEach(const std::function<bool(const TarHeader&)>& fn) {
    if (used_) return;
    used_ = true;
    if (err_) *err_ = Result::Ok();

    const ArchivePathPolicy policy(allow_non_local_);
    while (true) {
        TarHeader hdr;
        auto r = r_->TarNext(hdr);
        if (!r.ok) {
            if (err_ && !IsEof(r)) *err_ = r;
            return;
        }
        const bool more = fn(hdr);
        auto check = policy.CheckName(hdr.name);
        if (!check.ok) {
            if (err_) *err_ = check;
            return;
        }
        if (!more) return;
    }
}

// ---- ZipFileSeq ----

void ZipFileSeq::ForEach(const std::function<bool(const ZipFile&)>& fn) {
    while (pos_ < files_.size()) {
        if (!fn(files_[pos_++])) return;
    }
}

void ZipFileSeq::ForEachIndexed(const std::function<bool(size_t, const ZipFile&)>& fn) {
    while (pos_ < files_.size()) {
        const size_t i = pos_++;
        if (!fn(i, files_[i])) return;
    }
}

// ---- Reader ----

Reader::Reader(IFile* file, const ReadOptions& opts) : file_(file), opts_(opts), ur_(file) {
    for (auto it = opts_.zip_decompressors.begin(); it != opts_.zip_decompressors.end();) {
        if (!it->second) {
            it = opts_.zip_decompressors.erase(it);
        } else {
            ++it;
        }
    }
}

Reader::~Reader() {
    if (closer_ && !closer_->Closed()) {
        auto r = Close();
        if (!r.ok) LogWarn("filepipe: closing reader on destruction: %s", r.msg.c_str());
    }
    br_.reset();
    while (!stages_.empty()) stages_.pop_back();
}

Result Reader::Open(IFile* file, const ReadOptions& opts, bool close_file, std::unique_ptr<Reader>& out) {
    if (!file) throw std::invalid_argument("filepipe: file is null");

    std::vector<ICloser*> closers;
    if (close_file) closers.push_back(file);

    FileInfo info;
    auto r = file->Stat(info);
    if (!r.ok) return CloseAll(r.Wrap("filepipe: stat"), closers);
    if (info.IsDir()) return CloseAll(ErrIsDir().Wrap("filepipe: " + info.name), closers);

    std::unique_ptr<Reader> fr(new Reader(file, opts));
    r = fr->Init(info, closers);
    if (!r.ok) return CloseAll(r.Wrap("filepipe: open " + info.name), closers);
    out = std::move(fr);
    return Result::Ok();
}

Result Reader::Open(std::unique_ptr<IFile> file, const ReadOptions& opts, std::unique_ptr<Reader>& out) {
    if (!file) throw std::invalid_argument("filepipe: file is null");
    std::unique_ptr<Reader> fr;
    auto r = Open(file.get(), opts, true, fr);
    if (!r.ok) return r;
    fr->owned_file_ = std::move(file);
    out = std::move(fr);
    return Result::Ok();
}

Result Reader::OpenFromFs(IFileSystem* fsys, const std::string& name, const ReadOptions& opts,
                          std::unique_ptr<Reader>& out) {
    if (!fsys) throw std::invalid_argument("filepipe: file system is null");
    std::unique_ptr<IFile> f;
    auto r = fsys->Open(name, f);
    if (!r.ok) return r;
    return Open(std::move(f), opts, out);
}

Result Reader::Init(const FileInfo& info, std::vector<ICloser*>& closers) {
    std::uint64_t n = 0;
    auto r = InitOffsetAndLimit(info.size, n);
    if (!r.ok) return r;
    r = InitStages(info, n, closers);
    if (!r.ok) return r;

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
    const size_t size = opts_.buf_size > 0 ? static_cast<size_t>(opts_.buf_size) : BufferedReader::kDefaultSize;
    br_ = std::make_unique<BufferedReader>(ur_, size);
    return Result::Ok();
}

Result Reader::InitOffsetAndLimit(std::uint64_t size, std::uint64_t& n) {
    n = size;
    const std::int64_t offset = opts_.offset;
    const std::int64_t ssize = static_cast<std::int64_t>(size);
    // offset < 0 is tested first so that size + offset cannot overflow.
    if (offset != 0 && (offset > ssize || (offset < 0 && ssize + offset < 0))) {
        return Result::Fail(kErrOutOfRange, "option offset (" + std::to_string(offset) +
                                                ") is out of range; file size: " + std::to_string(size));
    }
    if (offset == 0 && opts_.limit <= 0) return Result::Ok();

    const std::uint64_t start = static_cast<std::uint64_t>(offset < 0 ? ssize + offset : offset);
    n = size - start;
    const bool limited = opts_.limit > 0 && static_cast<std::uint64_t>(opts_.limit) < n;
    if (limited) n = static_cast<std::uint64_t>(opts_.limit);

    if (auto* ra = dynamic_cast<IReaderAt*>(ur_)) {
        // Keep the stream positional.
        stages_.push_back(std::make_unique<SectionReader>(ra, start, n));
        ur_ = stages_.back().get();
        return Result::Ok();
    }

    Result r;
    if (offset != 0) {
        if (auto* seeker = dynamic_cast<ISeeker*>(ur_)) {
            r = seeker->Seek(offset, offset > 0 ? Whence::kStart : Whence::kEnd, nullptr);
        } else {
            r = Skip(*ur_, start);
        }
        if (!r.ok) return r.Wrap("apply offset");
    }
    if (limited) {
        stages_.push_back(std::make_unique<LimitReader>(ur_, n));
        ur_ = stages_.back().get();
    }
    return Result::Ok();
}

Result Reader::InitStages(const FileInfo& info, std::uint64_t n, std::vector<ICloser*>& closers) {
    if (opts_.raw) return Result::Ok();
    const auto chain = ParseExtensionChain(info.name, false);
    LogDebug("filepipe: read %s through %s", info.name.c_str(), DescribeChain(chain).c_str());

    for (Stage stage : chain) {
        switch (stage) {
            case Stage::kGzip: {
                std::unique_ptr<InflateReader> gr;
                auto r = InflateReader::Create(ur_, ZlibFraming::kGzip, gr);
                if (!r.ok) return r;
                closers.push_back(gr.get());
                ur_ = gr.get();
                stages_.push_back(std::move(gr));
                break;
            }
            case Stage::kBzip2: {
                auto br = std::make_unique<Bzip2Reader>(ur_);
                closers.push_back(br.get());
                ur_ = br.get();
                stages_.push_back(std::move(br));
                break;
            }
            case Stage::kTar: {
                std::unique_ptr<TarReader> tr;
                auto r = TarReader::Open(ur_, tr);
                if (!r.ok) return r;
                tar_ = tr.get();
                ur_ = tr.get();
                stages_.push_back(std::move(tr));
                break;
            }
            case Stage::kZip: {
                auto r = InitZip(n);
                if (!r.ok) return r;
                break;
            }
        }
    }
    return Result::Ok();
}

Result Reader::InitZip(std::uint64_t n) {
    auto* ra = dynamic_cast<IReaderAt*>(ur_);
    if (!ra) {
        std::vector<std::uint8_t> data;
        auto r = ReadToEnd(*ur_, data);
        if (!r.ok) return r.Wrap("zip: spool");
        LogDebug("zip: spooled %zu bytes of a sequential stream into memory", data.size());
        n = data.size();
        auto mf = std::make_unique<MemoryFile>("zip-spool", std::move(data));
        ra = mf.get();
        stages_.push_back(std::move(mf));
    }

    std::unique_ptr<ZipReader> zr;
    auto r = ZipReader::Open(ra, n, zr);
    if (!r.ok) return r;
    for (const auto& [method, factory] : opts_.zip_decompressors) {
        zr->RegisterDecompressor(method, factory);
    }
    zip_ = std::move(zr);
    state_reader_ = std::make_unique<ErrorReader>(ErrReadZip());
    ur_ = state_reader_.get();
    err_ = ErrReadZip();
    return Result::Ok();
}

Result Reader::Close() {
    if (closer_->Closed()) return Result::Ok();
    auto r = closer_->Close();
    if (closer_->Closed()) {
        SetState(ErrFileReaderClosed(), nullptr);
    }
    return r;
}

bool Reader::Closed() const { return closer_->Closed(); }

void Reader::SetState(Result err, IReader* ur) {
    if (!ur) {
        state_reader_ = std::make_unique<ErrorReader>(err);
        ur = state_reader_.get();
    }
    err_ = std::move(err);
    ur_ = ur;
    br_->Reset(ur_);
}

Result Reader::Record(Result r) {
    if (IsSticky(r)) err_ = r;
    return r;
}

ssize_t Reader::Read(std::span<std::uint8_t> out) {
    if (!err_.ok) {
        last_err_ = err_;
        return -1;
    }
    const ssize_t n = br_->Read(out);
    if (n < 0) last_err_ = Record(br_->LastError());
    return n;
}

Result Reader::ReadByte(std::uint8_t& c) {
    if (!err_.ok) return err_;
    return Record(br_->ReadByte(c));
}

Result Reader::UnreadByte() {
    if (!err_.ok) return err_;
    return Record(br_->UnreadByte());
}

Result Reader::ReadRune(char32_t& r, size_t& size) {
    if (!err_.ok) return err_;
    return Record(br_->ReadRune(r, size));
}

Result Reader::UnreadRune() {
    if (!err_.ok) return err_;
    return Record(br_->UnreadRune());
}

Result Reader::WriteTo(IWriter& w, std::uint64_t& n) {
    n = 0;
    if (!err_.ok) return err_;
    return Record(br_->WriteTo(w, n));
}

Result Reader::ReadLine(std::span<const std::uint8_t>& line, bool& more) {
    line = {};
    more = false;
    if (!err_.ok) return err_;
    return Record(br_->ReadLine(line, more));
}

Result Reader::ReadEntireLine(std::string& line) {
    line.clear();
    if (!err_.ok) return err_;
    return Record(br_->ReadEntireLine(line));
}

Result Reader::WriteLineTo(IWriter& w, std::uint64_t& n) {
    n = 0;
    if (!err_.ok) return err_;
    return Record(br_->WriteLineTo(w, n));
}

Result Reader::Peek(int n, std::span<const std::uint8_t>& data) {
    data = {};
    if (!err_.ok) return err_;
    return Record(br_->Peek(n, data));
}

Result Reader::Discard(int n, int& discarded) {
    discarded = 0;
    if (!err_.ok) return err_;
    return Record(br_->Discard(n, discarded));
}

Result Reader::ModeCheck(bool enabled, Result (*mode_err)()) const {
    if (!enabled) return mode_err();
    if (closer_->Closed()) return ErrFileReaderClosed();
    return Result::Ok();
}

Result Reader::TarNext(TarHeader& out) {
    auto r = ModeCheck(TarEnabled(), &ErrNotTar);
    if (!r.ok) return r;

    r = tar_->Next(out);
    if (!r.ok && !IsEof(r)) {
        SetState(r, nullptr);
        return r;
    }
    if (r.ok && out.IsDir()) {
        SetState(ErrIsDir().Wrap("tar: " + out.name), nullptr);
    } else {
        SetState(Result::Ok(), tar_);
    }
    return r;
}

TarHeaderSeq Reader::IterTarHeaders(Result* err, bool allow_non_local) {
    return TarHeaderSeq(this, err, allow_non_local);
}

Result Reader::ZipOpen(const std::string& name, std::unique_ptr<IFile>& out) {
    auto r = ModeCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    return zip_->OpenPath(name, out);
}

Result Reader::ZipFiles(std::vector<ZipFile>& out) const {
    auto r = ModeCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    out = zip_->Files();
    return Result::Ok();
}

Result Reader::ZipComment(std::string& out) const {
    auto r = ModeCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    out = zip_->Comment();
    return Result::Ok();
}

Result Reader::IterZipFiles(ZipFileSeq& out) const {
    auto r = ModeCheck(ZipEnabled(), &ErrNotZip);
    if (!r.ok) return r;
    out = ZipFileSeq(zip_->Files());
    return Result::Ok();
}

} // namespace filepipe
