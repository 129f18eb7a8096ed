#include "io/copy.hpp"

#include "util/errors.hpp"

#include <algorithm>

namespace filepipe {

namespace {
constexpr size_t kCopyBufSize = 32 * 1024;
} // namespace

Result Copy(IWriter& dst, IReader& src, std::uint64_t* written) {
    std::vector<std::uint8_t> buf(kCopyBufSize);
    std::uint64_t total = 0;
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            if (written) *written = total;
            return src.LastError();
        }
        auto r = dst.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.ok) {
            if (written) *written = total;
            return r;
        }
        total += static_cast<std::uint64_t>(n);
    }
    if (written) *written = total;
    return Result::Ok();
}

Result Skip(IReader& src, std::uint64_t n, std::uint64_t* skipped) {
    std::vector<std::uint8_t> buf(static_cast<size_t>(std::min<std::uint64_t>(n, kCopyBufSize)));
    std::uint64_t done = 0;
    Result res;
    while (done < n) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(n - done, buf.size()));
        const ssize_t got = src.Read(std::span<std::uint8_t>(buf.data(), want));
        if (got == 0) {
            res = ErrUnexpectedEof();
            break;
        }
        if (got < 0) {
            res = src.LastError();
            break;
        }
        done += static_cast<std::uint64_t>(got);
    }
    if (skipped) *skipped = done;
    return res;
}

Result ReadFull(IReader& src, std::span<std::uint8_t> out, size_t& n) {
    n = 0;
    while (n < out.size()) {
        const ssize_t got = src.Read(out.subspan(n));
        if (got == 0) return n == 0 ? ErrEof() : ErrUnexpectedEof();
        if (got < 0) return src.LastError();
        n += static_cast<size_t>(got);
    }
    return Result::Ok();
}

Result ReadToEnd(IReader& src, std::vector<std::uint8_t>& out) {
    std::vector<std::uint8_t> buf(kCopyBufSize);
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) return Result::Ok();
        if (n < 0) return src.LastError();
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
}

} // namespace filepipe
