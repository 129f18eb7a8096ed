#pragma once

#include "io/io.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <cstdint>

namespace filepipe {

// Reports end of stream after n bytes of the inner reader.
class LimitReader final : public IReader {
public:
    LimitReader(IReader* inner, std::uint64_t n) : inner_(inner), remaining_(n) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (remaining_ == 0 || out.empty()) return 0;
        if (out.size() > remaining_) out = out.first(static_cast<size_t>(remaining_));
        const ssize_t n = inner_->Read(out);
        if (n > 0) remaining_ -= static_cast<std::uint64_t>(n);
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override {
        const auto inner = inner_->TotalSize();
        if (!inner) return remaining_;
        return std::min(*inner, remaining_);
    }

    Result LastError() const override { return inner_->LastError(); }

    std::uint64_t Remaining() const { return remaining_; }

private:
    IReader* inner_;
    std::uint64_t remaining_;
};

// Reads n bytes of a positional source starting at off. The section is
// itself positional and seekable.
class SectionReader final : public IReader, public IReaderAt, public ISeeker {
public:
    SectionReader(IReaderAt* inner, std::uint64_t off, std::uint64_t n)
        : inner_(inner), base_(off), size_(n) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= size_ || out.empty()) return 0;
        size_t got = 0;
        auto r = ReadAt(out, pos_, got);
        pos_ += got;
        if (got > 0) return static_cast<ssize_t>(got);
        if (r.ok || IsEof(r)) return 0;
        last_err_ = r;
        return -1;
    }

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    Result LastError() const override { return last_err_; }

    Result ReadAt(std::span<std::uint8_t> out, std::uint64_t off, size_t& n) override {
        n = 0;
        if (off >= size_) return out.empty() ? Result::Ok() : ErrEof();
        const std::uint64_t max = size_ - off;
        if (out.size() > max) {
            auto r = inner_->ReadAt(out.first(static_cast<size_t>(max)), base_ + off, n);
            return r.ok ? ErrEof() : r;
        }
        return inner_->ReadAt(out, base_ + off, n);
    }

    Result Seek(std::int64_t off, Whence whence, std::uint64_t* pos) override {
        std::int64_t base = 0;
        if (whence == Whence::kCurrent) base = static_cast<std::int64_t>(pos_);
        if (whence == Whence::kEnd) base = static_cast<std::int64_t>(size_);
        if (base + off < 0) return Result::Fail(kErrOutOfRange, "seek before start of section");
        pos_ = static_cast<std::uint64_t>(base + off);
        if (pos) *pos = pos_;
        return Result::Ok();
    }

    std::uint64_t Size() const { return size_; }

private:
    IReaderAt* inner_;
    std::uint64_t base_;
    std::uint64_t size_;
    std::uint64_t pos_ = 0;
    Result last_err_;
};

} // namespace filepipe
