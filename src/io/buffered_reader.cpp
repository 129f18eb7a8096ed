#include "io/buffered_reader.hpp"

#include "util/errors.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <cstring>

namespace filepipe {

namespace {
constexpr std::uint8_t kRuneSelf = 0x80;
} // namespace

BufferedReader::BufferedReader(IReader* rd, size_t size)
    : buf_(std::max(size, kMinSize)), rd_(rd) {}

void BufferedReader::Reset(IReader* rd) {
    rd_ = rd;
    r_ = w_ = 0;
    err_ = Result::Ok();
    last_err_ = Result::Ok();
    last_byte_ = -1;
    last_rune_size_ = -1;
}

// Reads a new chunk into the buffer after sliding existing data to the front.
void BufferedReader::Fill() {
    if (r_ > 0) {
        std::memmove(buf_.data(), buf_.data() + r_, w_ - r_);
        w_ -= r_;
        r_ = 0;
    }
    if (w_ >= buf_.size()) return;

    const ssize_t n = rd_->Read(std::span<std::uint8_t>(buf_.data() + w_, buf_.size() - w_));
    if (n < 0) {
        err_ = rd_->LastError();
        if (err_.ok) err_ = Result::Fail(kErrGeneric, "read failed");
        return;
    }
    if (n == 0) {
        err_ = ErrEof();
        return;
    }
    w_ += static_cast<size_t>(n);
}

Result BufferedReader::TakeErr() {
    Result e = std::move(err_);
    err_ = Result::Ok();
    return e;
}

ssize_t BufferedReader::Read(std::span<std::uint8_t> out) {
    const auto fail = [this](Result e) -> ssize_t {
        if (IsEof(e)) return 0;
        last_err_ = std::move(e);
        return -1;
    };

    if (out.empty()) {
        if (Buffered() > 0) return 0;
        auto e = TakeErr();
        return e.ok ? 0 : fail(std::move(e));
    }
    if (r_ == w_) {
        if (!err_.ok) return fail(TakeErr());
        if (out.size() >= buf_.size()) {
            // Large read, empty buffer: read directly into out.
            const ssize_t n = rd_->Read(out);
            if (n < 0) return fail(rd_->LastError());
            if (n > 0) {
                last_byte_ = out[static_cast<size_t>(n) - 1];
                last_rune_size_ = -1;
            }
            return n;
        }
        r_ = w_ = 0;
        Fill();
        if (r_ == w_) return fail(TakeErr());
    }

    const size_t n = std::min(out.size(), w_ - r_);
    std::memcpy(out.data(), buf_.data() + r_, n);
    r_ += n;
    last_byte_ = buf_[r_ - 1];
    last_rune_size_ = -1;
    return static_cast<ssize_t>(n);
}

Result BufferedReader::ReadByte(std::uint8_t& c) {
    last_rune_size_ = -1;
    while (r_ == w_) {
        if (!err_.ok) return TakeErr();
        Fill();
    }
    c = buf_[r_++];
    last_byte_ = c;
    return Result::Ok();
}

Result BufferedReader::UnreadByte() {
    if (last_byte_ < 0 || (r_ == 0 && w_ > 0)) {
        return Result::Fail(kErrInvalidUnread, "invalid use of UnreadByte");
    }
    if (r_ > 0) {
        --r_;
    } else {
        w_ = 1;
    }
    buf_[r_] = static_cast<std::uint8_t>(last_byte_);
    last_byte_ = -1;
    last_rune_size_ = -1;
    return Result::Ok();
}

Result BufferedReader::ReadRune(char32_t& r, size_t& size) {
    while (r_ + utf8::kUtfMax > w_ &&
           !utf8::FullRune(std::span<const std::uint8_t>(buf_.data() + r_, w_ - r_)) &&
           err_.ok && w_ - r_ < buf_.size()) {
        Fill();
    }
    last_rune_size_ = -1;
    if (r_ == w_) {
        r = 0;
        size = 0;
        return TakeErr();
    }
    r = buf_[r_];
    size = 1;
    if (r >= kRuneSelf) {
        r = utf8::DecodeRune(std::span<const std::uint8_t>(buf_.data() + r_, w_ - r_), size);
    }
    r_ += size;
    last_byte_ = buf_[r_ - 1];
    last_rune_size_ = static_cast<int>(size);
    return Result::Ok();
}

Result BufferedReader::UnreadRune() {
    if (last_rune_size_ < 0 || r_ < static_cast<size_t>(last_rune_size_)) {
        return Result::Fail(kErrInvalidUnread, "invalid use of UnreadRune");
    }
    r_ -= static_cast<size_t>(last_rune_size_);
    last_byte_ = -1;
    last_rune_size_ = -1;
    return Result::Ok();
}

Result BufferedReader::WriteBuf(IWriter& w, std::uint64_t& n) {
    const size_t len = w_ - r_;
    if (len == 0) return Result::Ok();
    auto res = w.WriteAll(std::span<const std::uint8_t>(buf_.data() + r_, len));
    if (!res.ok) return res;
    r_ += len;
    n += len;
    return Result::Ok();
}

Result BufferedReader::WriteTo(IWriter& w, std::uint64_t& n) {
    n = 0;
    last_byte_ = -1;
    last_rune_size_ = -1;

    auto res = WriteBuf(w, n);
    if (!res.ok) return res;

    if (w_ - r_ < buf_.size()) Fill();
    while (r_ < w_) {
        res = WriteBuf(w, n);
        if (!res.ok) return res;
        Fill();
    }
    auto e = TakeErr();
    if (IsEof(e)) return Result::Ok();
    return e;
}

Result BufferedReader::ReadSlice(std::uint8_t delim, std::span<const std::uint8_t>& line) {
    Result res;
    size_t s = 0;  // search start index
    while (true) {
        const auto* begin = buf_.data() + r_ + s;
        const auto* end = buf_.data() + w_;
        const auto* hit = std::find(begin, end, delim);
        if (hit != end) {
            const size_t i = static_cast<size_t>(hit - (buf_.data() + r_));
            line = std::span<const std::uint8_t>(buf_.data() + r_, i + 1);
            r_ += i + 1;
            break;
        }
        if (!err_.ok) {
            line = std::span<const std::uint8_t>(buf_.data() + r_, w_ - r_);
            r_ = w_;
            res = TakeErr();
            break;
        }
        if (Buffered() >= buf_.size()) {
            r_ = w_;
            line = std::span<const std::uint8_t>(buf_.data(), buf_.size());
            res = ErrBufferFull();
            break;
        }
        s = w_ - r_;
        Fill();
    }
    if (!line.empty()) {
        last_byte_ = line.back();
        last_rune_size_ = -1;
    }
    return res;
}

Result BufferedReader::ReadLine(std::span<const std::uint8_t>& line, bool& more) {
    more = false;
    auto res = ReadSlice('\n', line);
    if (res.Is(kErrBufferFull)) {
        // Keep a trailing '\r' in the buffer in case a '\n' follows it.
        if (!line.empty() && line.back() == '\r') {
            --r_;
            line = line.first(line.size() - 1);
        }
        more = true;
        return Result::Ok();
    }
    if (line.empty()) return res;
    // Content first; the error, if any, comes with the next call.
    if (!res.ok) err_ = std::move(res);

    if (line.back() == '\n') {
        size_t drop = 1;
        if (line.size() > 1 && line[line.size() - 2] == '\r') drop = 2;
        line = line.first(line.size() - drop);
    }
    return Result::Ok();
}

Result BufferedReader::ReadEntireLine(std::string& line) {
    line.clear();
    bool more = true;
    bool got_any = false;
    while (more) {
        std::span<const std::uint8_t> frag;
        auto res = ReadLine(frag, more);
        if (!res.ok) {
            if (got_any && IsEof(res)) return Result::Ok();
            return res;
        }
        got_any = true;
        line.append(reinterpret_cast<const char*>(frag.data()), frag.size());
    }
    return Result::Ok();
}

Result BufferedReader::WriteLineTo(IWriter& w, std::uint64_t& n) {
    n = 0;
    bool more = true;
    while (more) {
        std::span<const std::uint8_t> frag;
        auto res = ReadLine(frag, more);
        if (!res.ok) return res;
        if (!frag.empty()) {
            res = w.WriteAll(frag);
            if (!res.ok) return res;
            n += frag.size();
        }
    }
    return Result::Ok();
}

Result BufferedReader::Peek(int n, std::span<const std::uint8_t>& data) {
    data = {};
    if (n < 0) return Result::Fail(kErrNegativeCount, "negative count");

    last_byte_ = -1;
    last_rune_size_ = -1;

    const size_t want = static_cast<size_t>(n);
    while (w_ - r_ < want && w_ - r_ < buf_.size() && err_.ok) {
        Fill();
    }

    if (want > buf_.size()) {
        data = std::span<const std::uint8_t>(buf_.data() + r_, w_ - r_);
        return ErrBufferFull();
    }

    const size_t avail = w_ - r_;
    if (avail < want) {
        data = std::span<const std::uint8_t>(buf_.data() + r_, avail);
        auto e = TakeErr();
        return e.ok ? ErrBufferFull() : e;
    }
    data = std::span<const std::uint8_t>(buf_.data() + r_, want);
    return Result::Ok();
}

Result BufferedReader::Discard(int n, int& discarded) {
    discarded = 0;
    if (n < 0) return Result::Fail(kErrNegativeCount, "negative count");
    if (n == 0) return Result::Ok();

    last_byte_ = -1;
    last_rune_size_ = -1;

    size_t remain = static_cast<size_t>(n);
    while (true) {
        size_t skip = Buffered();
        if (skip == 0) {
            Fill();
            skip = Buffered();
        }
        skip = std::min(skip, remain);
        r_ += skip;
        remain -= skip;
        if (remain == 0) {
            discarded = n;
            return Result::Ok();
        }
        if (!err_.ok) {
            discarded = n - static_cast<int>(remain);
            return TakeErr();
        }
    }
}

} // namespace filepipe
