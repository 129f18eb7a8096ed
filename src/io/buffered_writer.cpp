#include "io/buffered_writer.hpp"

#include "util/errors.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace filepipe {

std::string FormatV(const char* fmt, va_list ap) {
    va_list ap2;
    va_copy(ap2, ap);
    const int len = std::vsnprintf(nullptr, 0, fmt, ap2);
    va_end(ap2);
    if (len <= 0) return {};
    std::string out(static_cast<size_t>(len) + 1, '\0');
    std::vsnprintf(out.data(), out.size(), fmt, ap);
    out.resize(static_cast<size_t>(len));
    return out;
}

BufferedWriter::BufferedWriter(IWriter* wr, size_t size)
    : buf_(size == 0 ? kDefaultSize : size), wr_(wr) {}

void BufferedWriter::Reset(IWriter* wr) {
    wr_ = wr;
    n_ = 0;
    err_ = Result::Ok();
}

Result BufferedWriter::Flush() {
    if (!err_.ok) return err_;
    if (n_ == 0) return Result::Ok();
    auto r = wr_->WriteAll(std::span<const std::uint8_t>(buf_.data(), n_));
    if (!r.ok) {
        err_ = r;
        return r;
    }
    n_ = 0;
    return Result::Ok();
}

Result BufferedWriter::Write(std::span<const std::uint8_t> p, size_t& nn) {
    nn = 0;
    while (p.size() > Available() && err_.ok) {
        size_t n = 0;
        if (Buffered() == 0) {
            // Large write, empty buffer: write directly to avoid a copy.
            auto r = wr_->WriteAll(p);
            if (!r.ok) {
                err_ = r;
                break;
            }
            n = p.size();
        } else {
            n = Available();
            std::memcpy(buf_.data() + n_, p.data(), n);
            n_ += n;
            nn += n;
            p = p.subspan(n);
            if (!Flush().ok) break;
            continue;
        }
        nn += n;
        p = p.subspan(n);
    }
    if (!err_.ok) return err_;
    if (p.empty()) return Result::Ok();
    std::memcpy(buf_.data() + n_, p.data(), p.size());
    n_ += p.size();
    nn += p.size();
    return Result::Ok();
}

Result BufferedWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t n = 0;
    return Write(in, n);
}

Result BufferedWriter::WriteByte(std::uint8_t c) {
    if (!err_.ok) return err_;
    if (Available() == 0) {
        auto r = Flush();
        if (!r.ok) return r;
    }
    buf_[n_++] = c;
    return Result::Ok();
}

Result BufferedWriter::WriteRune(char32_t r, size_t& size) {
    size = 0;
    if (r < 0x80) {
        auto res = WriteByte(static_cast<std::uint8_t>(r));
        if (res.ok) size = 1;
        return res;
    }
    if (!err_.ok) return err_;
    if (Available() < utf8::kUtfMax) {
        auto res = Flush();
        if (!res.ok) return res;
        if (Available() < utf8::kUtfMax) {
            // Only happens with a tiny buffer.
            std::uint8_t tmp[utf8::kUtfMax];
            const size_t len = utf8::EncodeRune(r, tmp);
            return Write(std::span<const std::uint8_t>(tmp, len), size);
        }
    }
    size = utf8::EncodeRune(r, buf_.data() + n_);
    n_ += size;
    return Result::Ok();
}

Result BufferedWriter::WriteString(std::string_view s, size_t& n) {
    return Write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()), n);
}

Result BufferedWriter::ReadFrom(IReader& src, std::uint64_t& n) {
    n = 0;
    if (!err_.ok) return err_;
    while (true) {
        if (Available() == 0) {
            auto r = Flush();
            if (!r.ok) return r;
        }
        const ssize_t m = src.Read(std::span<std::uint8_t>(buf_.data() + n_, Available()));
        if (m < 0) return src.LastError();
        if (m == 0) break;
        n_ += static_cast<size_t>(m);
        n += static_cast<std::uint64_t>(m);
    }
    if (Available() == 0) return Flush();
    return Result::Ok();
}

Result BufferedWriter::VPrintf(size_t& n, const char* fmt, va_list ap) {
    return WriteString(FormatV(fmt, ap), n);
}

Result BufferedWriter::Printf(size_t& n, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    auto r = VPrintf(n, fmt, ap);
    va_end(ap);
    return r;
}

size_t BufferedWriter::MustWrite(std::span<const std::uint8_t> p) {
    size_t n = 0;
    auto r = Write(p, n);
    if (!r.ok) throw WritePanic(r);
    return n;
}

void BufferedWriter::MustWriteByte(std::uint8_t c) {
    auto r = WriteByte(c);
    if (!r.ok) throw WritePanic(r);
}

size_t BufferedWriter::MustWriteRune(char32_t rn) {
    size_t size = 0;
    auto r = WriteRune(rn, size);
    if (!r.ok) throw WritePanic(r);
    return size;
}

size_t BufferedWriter::MustWriteString(std::string_view s) {
    size_t n = 0;
    auto r = WriteString(s, n);
    if (!r.ok) throw WritePanic(r);
    return n;
}

size_t BufferedWriter::MustPrintf(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    size_t n = 0;
    auto r = VPrintf(n, fmt, ap);
    va_end(ap);
    if (!r.ok) throw WritePanic(r);
    return n;
}

} // namespace filepipe
