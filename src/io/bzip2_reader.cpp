#include "io/bzip2_reader.hpp"

#include "util/errors.hpp"

#include <cstring>
#include <string>

namespace filepipe {

namespace {
constexpr size_t kInBufferSize = 16384;
constexpr size_t kMaxOutChunk = size_t{1} << 30;
} // namespace

Bzip2Reader::Bzip2Reader(IReader* src) : src_(src), in_buffer_(kInBufferSize) {}

Bzip2Reader::~Bzip2Reader() {
    if (initialized_) BZ2_bzDecompressEnd(&strm_);
}

Result Bzip2Reader::EnsureInput(size_t n) {
    if (strm_.avail_in >= n || src_eof_) return Result::Ok();

    if (strm_.avail_in > 0 && strm_.next_in != in_buffer_.data()) {
        std::memmove(in_buffer_.data(), strm_.next_in, strm_.avail_in);
    }
    strm_.next_in = in_buffer_.data();

    while (strm_.avail_in < n && !src_eof_) {
        const ssize_t got = src_->Read(std::span<std::uint8_t>(
            reinterpret_cast<std::uint8_t*>(in_buffer_.data()) + strm_.avail_in,
            in_buffer_.size() - strm_.avail_in));
        if (got < 0) return src_->LastError();
        if (got == 0) {
            src_eof_ = true;
            break;
        }
        strm_.avail_in += static_cast<unsigned int>(got);
    }
    return Result::Ok();
}

// Checks the "BZh" signature of the next stream and resets the decoder.
Result Bzip2Reader::StartStream() {
    auto r = EnsureInput(3);
    if (!r.ok) return r;
    if (strm_.avail_in < 3 || std::memcmp(strm_.next_in, "BZh", 3) != 0) {
        return Result::Fail(kErrFormat, "bzip2: invalid header");
    }
    if (initialized_) {
        BZ2_bzDecompressEnd(&strm_);
        initialized_ = false;
    }
    char* next_in = strm_.next_in;
    const unsigned int avail_in = strm_.avail_in;
    strm_.bzalloc = nullptr;
    strm_.bzfree = nullptr;
    strm_.opaque = nullptr;
    if (BZ2_bzDecompressInit(&strm_, 0, 0) != BZ_OK) {
        return Result::Fail(kErrGeneric, "Failed to initialize bzip2 decompressor");
    }
    strm_.next_in = next_in;
    strm_.avail_in = avail_in;
    initialized_ = true;
    return Result::Ok();
}

ssize_t Bzip2Reader::Read(std::span<std::uint8_t> out) {
    if (closed_) {
        err_ = Result::Fail(kErrGeneric, "bzip2: read after close");
        return -1;
    }
    if (!err_.ok) return -1;
    if (done_ || out.empty()) return 0;
    if (out.size() > kMaxOutChunk) out = out.first(kMaxOutChunk);

    size_t produced = 0;
    while (produced == 0) {
        if (!initialized_) {
            // Between streams: anything left must be another stream.
            auto r = EnsureInput(1);
            if (r.ok && strm_.avail_in == 0) {
                if (started_any_) {
                    done_ = true;
                    return 0;
                }
                r = ErrUnexpectedEof().Wrap("bzip2");
            }
            if (r.ok) r = StartStream();
            if (!r.ok) {
                err_ = r;
                return -1;
            }
        }

        if (strm_.avail_in == 0) {
            auto r = EnsureInput(1);
            if (!r.ok) {
                err_ = r;
                return -1;
            }
            if (strm_.avail_in == 0) {
                err_ = ErrUnexpectedEof().Wrap("bzip2");
                return -1;
            }
        }

        strm_.next_out = reinterpret_cast<char*>(out.data());
        strm_.avail_out = static_cast<unsigned int>(out.size());
        const int ret = BZ2_bzDecompress(&strm_);
        produced = out.size() - strm_.avail_out;

        if (ret == BZ_STREAM_END) {
            BZ2_bzDecompressEnd(&strm_);
            initialized_ = false;
            started_any_ = true;
            continue;
        }
        if (ret != BZ_OK) {
            err_ = Result::Fail(kErrFormat, "bzip2: data error " + std::to_string(ret));
            if (produced == 0) return -1;
            break;
        }
    }
    return static_cast<ssize_t>(produced);
}

Result Bzip2Reader::Close() {
    if (closed_) return Result::Ok();
    closed_ = true;
    if (initialized_) {
        BZ2_bzDecompressEnd(&strm_);
        initialized_ = false;
    }
    return Result::Ok();
}

} // namespace filepipe
