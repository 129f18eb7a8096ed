#include "io/deflate_writer.hpp"

#include "util/errors.hpp"

#include <climits>
#include <string>

namespace filepipe {

namespace {
constexpr size_t kOutBufferSize = 32 * 1024;
constexpr size_t kMaxInChunk = size_t{1} << 30;
} // namespace

bool ValidDeflateLevel(int level) { return level >= kHuffmanOnly && level <= kBestCompression; }

DeflateWriter::DeflateWriter(IWriter* dst, ZlibFraming framing)
    : dst_(dst), framing_(framing), out_buffer_(kOutBufferSize) {}

Result DeflateWriter::Create(IWriter* dst, ZlibFraming framing, int level,
                            std::unique_ptr<DeflateWriter>& out) {
    if (!ValidDeflateLevel(level)) {
        return Result::Fail(kErrGeneric, "invalid deflate level " + std::to_string(level));
    }
    std::unique_ptr<DeflateWriter> w(new DeflateWriter(dst, framing));

    w->strm_.zalloc = Z_NULL;
    w->strm_.zfree = Z_NULL;
    w->strm_.opaque = Z_NULL;

    int strategy = Z_DEFAULT_STRATEGY;
    if (level == kHuffmanOnly) {
        strategy = Z_HUFFMAN_ONLY;
        level = Z_DEFAULT_COMPRESSION;
    }
    const int bits = framing == ZlibFraming::kGzip ? 16 + MAX_WBITS : -MAX_WBITS;
    if (deflateInit2(&w->strm_, level, Z_DEFLATED, bits, 8, strategy) != Z_OK) {
        return Result::Fail(kErrGeneric, "Failed to initialize zlib deflate");
    }
    w->initialized_ = true;
    out = std::move(w);
    return Result::Ok();
}

DeflateWriter::~DeflateWriter() {
    if (initialized_) deflateEnd(&strm_);
}

Result DeflateWriter::Pump(int flush) {
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());
        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return Result::Fail(kErrGeneric, "deflate: stream error");
        }
        const size_t have = out_buffer_.size() - strm_.avail_out;
        if (have > 0) {
            auto r = dst_->WriteAll(std::span<const std::uint8_t>(out_buffer_.data(), have));
            if (!r.ok) return r;
        }
        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) return Result::Ok();
            continue;
        }
        // All input consumed and zlib had room to spare.
        if (strm_.avail_in == 0 && strm_.avail_out != 0) return Result::Ok();
    }
}

Result DeflateWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (closed_) return Result::Fail(kErrGeneric, "deflate: write after close");
    if (!err_.ok) return err_;

    while (!in.empty()) {
        const size_t chunk = in.size() < kMaxInChunk ? in.size() : kMaxInChunk;
        strm_.next_in = const_cast<Bytef*>(in.data());
        strm_.avail_in = static_cast<uInt>(chunk);
        auto r = Pump(Z_NO_FLUSH);
        if (!r.ok) {
            err_ = r;
            return r;
        }
        in = in.subspan(chunk);
    }
    return Result::Ok();
}

Result DeflateWriter::Close() {
    if (closed_) return err_;
    closed_ = true;
    if (err_.ok) {
        strm_.next_in = Z_NULL;
        strm_.avail_in = 0;
        err_ = Pump(Z_FINISH);
    }
    deflateEnd(&strm_);
    initialized_ = false;
    return err_;
}

} // namespace filepipe
