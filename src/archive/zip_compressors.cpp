#include "archive/zip_compressors.hpp"

#include "io/deflate_writer.hpp"
#include "io/inflate_reader.hpp"

namespace filepipe {

namespace {

class StoreWriter final : public IZipCompressor {
public:
    explicit StoreWriter(IWriter* dst) : dst_(dst) {}

    Result WriteAll(std::span<const std::uint8_t> in) override { return dst_->WriteAll(in); }
    Result Close() override { return Result::Ok(); }

private:
    IWriter* dst_;
};

class DeflateEntryWriter final : public IZipCompressor {
public:
    explicit DeflateEntryWriter(std::unique_ptr<DeflateWriter> w) : w_(std::move(w)) {}

    Result WriteAll(std::span<const std::uint8_t> in) override { return w_->WriteAll(in); }
    Result Close() override { return w_->Close(); }

private:
    std::unique_ptr<DeflateWriter> w_;
};

class StoreReader final : public IZipDecompressor {
public:
    explicit StoreReader(IReader* src) : src_(src) {}

    ssize_t Read(std::span<std::uint8_t> out) override { return src_->Read(out); }
    Result LastError() const override { return src_->LastError(); }
    Result Close() override { return Result::Ok(); }

private:
    IReader* src_;
};

class InflateEntryReader final : public IZipDecompressor {
public:
    explicit InflateEntryReader(std::unique_ptr<InflateReader> r) : r_(std::move(r)) {}

    ssize_t Read(std::span<std::uint8_t> out) override { return r_->Read(out); }
    Result LastError() const override { return r_->LastError(); }
    Result Close() override { return r_->Close(); }

private:
    std::unique_ptr<InflateReader> r_;
};

} // namespace

ZipCompressorFactory StoreCompressor() {
    return [](IWriter* dst, std::unique_ptr<IZipCompressor>& out) {
        out = std::make_unique<StoreWriter>(dst);
        return Result::Ok();
    };
}

ZipCompressorFactory DeflateCompressor(int level) {
    return [level](IWriter* dst, std::unique_ptr<IZipCompressor>& out) {
        std::unique_ptr<DeflateWriter> w;
        auto r = DeflateWriter::Create(dst, ZlibFraming::kRawDeflate, level, w);
        if (!r.ok) return r;
        out = std::make_unique<DeflateEntryWriter>(std::move(w));
        return Result::Ok();
    };
}

ZipDecompressorFactory StoreDecompressor() {
    return [](IReader* src, std::unique_ptr<IZipDecompressor>& out) {
        out = std::make_unique<StoreReader>(src);
        return Result::Ok();
    };
}

ZipDecompressorFactory DeflateDecompressor() {
    return [](IReader* src, std::unique_ptr<IZipDecompressor>& out) {
        std::unique_ptr<InflateReader> r;
        auto res = InflateReader::Create(src, ZlibFraming::kRawDeflate, r);
        if (!res.ok) return res;
        out = std::make_unique<InflateEntryReader>(std::move(r));
        return Result::Ok();
    };
}

} // namespace filepipe
