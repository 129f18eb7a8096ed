#include "io/inflate_reader.hpp"

#include "util/errors.hpp"

#include <cstring>

namespace filepipe {

namespace {

constexpr size_t kInBufferSize = 16384;
constexpr size_t kMaxOutChunk = size_t{1} << 30;
constexpr std::uint8_t kGzipId1 = 0x1f;
constexpr std::uint8_t kGzipId2 = 0x8b;

std::string ZlibMessage(const z_stream& strm, int ret) {
    if (strm.msg) return strm.msg;
    return "zlib error " + std::to_string(ret);
}

} // namespace

InflateReader::InflateReader(IReader* src, ZlibFraming framing)
    : src_(src), framing_(framing), in_buffer_(kInBufferSize) {}

Result InflateReader::Create(IReader* src, ZlibFraming framing, std::unique_ptr<InflateReader>& out) {
    std::unique_ptr<InflateReader> r(new InflateReader(src, framing));

    r->strm_.zalloc = Z_NULL;
    r->strm_.zfree = Z_NULL;
    r->strm_.opaque = Z_NULL;
    r->strm_.avail_in = 0;
    r->strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header; negative bits mean raw.
    const int bits = framing == ZlibFraming::kGzip ? 16 + MAX_WBITS : -MAX_WBITS;
    if (inflateInit2(&r->strm_, bits) != Z_OK) {
        return Result::Fail(kErrGeneric, "Failed to initialize zlib inflate");
    }
    r->initialized_ = true;

    if (framing == ZlibFraming::kGzip) {
        auto res = r->CheckGzipMagic();
        if (!res.ok) return res;
    }
    out = std::move(r);
    return Result::Ok();
}

InflateReader::~InflateReader() {
    if (initialized_) inflateEnd(&strm_);
}

Result InflateReader::EnsureInput(size_t n) {
    if (strm_.avail_in >= n || src_eof_) return Result::Ok();

    if (strm_.avail_in > 0 && strm_.next_in != in_buffer_.data()) {
        std::memmove(in_buffer_.data(), strm_.next_in, strm_.avail_in);
    }
    strm_.next_in = in_buffer_.data();

    while (strm_.avail_in < n && !src_eof_) {
        const ssize_t got = src_->Read(std::span<std::uint8_t>(in_buffer_.data() + strm_.avail_in,
                                                               in_buffer_.size() - strm_.avail_in));
        if (got < 0) return src_->LastError();
        if (got == 0) {
            src_eof_ = true;
            break;
        }
        strm_.avail_in += static_cast<uInt>(got);
    }
    return Result::Ok();
}

Result InflateReader::CheckGzipMagic() {
    auto r = EnsureInput(2);
    if (!r.ok) return r;
    if (strm_.avail_in == 0) return ErrUnexpectedEof().Wrap("gzip: missing header");
    if (strm_.avail_in < 2 || strm_.next_in[0] != kGzipId1 || strm_.next_in[1] != kGzipId2) {
        return Result::Fail(kErrFormat, "gzip: invalid header");
    }
    return Result::Ok();
}

ssize_t InflateReader::Read(std::span<std::uint8_t> out) {
    if (closed_) {
        err_ = Result::Fail(kErrGeneric, "inflate: read after close");
        return -1;
    }
    if (!err_.ok) return -1;
    if (done_ || out.empty()) return 0;
    if (out.size() > kMaxOutChunk) out = out.first(kMaxOutChunk);

    size_t produced = 0;
    while (produced == 0) {
        if (stream_end_) {
            if (framing_ != ZlibFraming::kGzip || !multistream_) {
                done_ = true;
                return 0;
            }
            auto r = EnsureInput(1);
            if (!r.ok) {
                err_ = r;
                return -1;
            }
            if (strm_.avail_in == 0) {
                done_ = true;
                return 0;
            }
            r = CheckGzipMagic();
            if (!r.ok) {
                err_ = r;
                return -1;
            }
            inflateReset(&strm_);
            stream_end_ = false;
        }

        if (strm_.avail_in == 0) {
            auto r = EnsureInput(1);
            if (!r.ok) {
                err_ = r;
                return -1;
            }
            if (strm_.avail_in == 0) {
                // Source exhausted before the end of the compressed stream.
                err_ = ErrUnexpectedEof().Wrap("inflate");
                return -1;
            }
        }

        strm_.next_out = out.data();
        strm_.avail_out = static_cast<uInt>(out.size());
        const int ret = inflate(&strm_, Z_NO_FLUSH);
        produced = out.size() - strm_.avail_out;

        if (ret == Z_STREAM_END) {
            stream_end_ = true;
            continue;
        }
        // Z_BUF_ERROR is not fatal; it just means we need more input.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            err_ = Result::Fail(kErrFormat, "inflate: " + ZlibMessage(strm_, ret));
            if (produced == 0) return -1;
            break;
        }
    }
    return static_cast<ssize_t>(produced);
}

Result InflateReader::Close() {
    if (closed_) return Result::Ok();
    closed_ = true;
    if (initialized_) {
        inflateEnd(&strm_);
        initialized_ = false;
    }
    return Result::Ok();
}

} // namespace filepipe
