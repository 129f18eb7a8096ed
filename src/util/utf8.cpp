#include "util/utf8.hpp"

namespace filepipe::utf8 {

namespace {

// Expected sequence length from the leading byte, 0 for an invalid lead.
size_t SeqLen(std::uint8_t b) {
    if (b < 0x80) return 1;
    if (b < 0xC2) return 0;
    if (b < 0xE0) return 2;
    if (b < 0xF0) return 3;
    if (b < 0xF5) return 4;
    return 0;
}

bool IsCont(std::uint8_t b) { return (b & 0xC0) == 0x80; }

} // namespace

bool FullRune(std::span<const std::uint8_t> p) {
    if (p.empty()) return false;
    const size_t n = SeqLen(p[0]);
    if (n == 0 || p.size() >= n) return true;
    // A short prefix that already contains an invalid byte decodes to an error.
    for (size_t i = 1; i < p.size(); ++i) {
        if (!IsCont(p[i])) return true;
    }
    if (p.size() >= 2) {
        const std::uint8_t b0 = p[0], b1 = p[1];
        if ((b0 == 0xE0 && b1 < 0xA0) || (b0 == 0xED && b1 > 0x9F) ||
            (b0 == 0xF0 && b1 < 0x90) || (b0 == 0xF4 && b1 > 0x8F)) {
            return true;
        }
    }
    return false;
}

char32_t DecodeRune(std::span<const std::uint8_t> p, size_t& size) {
    if (p.empty()) {
        size = 0;
        return kRuneError;
    }
    const std::uint8_t b0 = p[0];
    const size_t n = SeqLen(b0);
    size = 1;
    if (n == 1) return b0;
    if (n == 0 || p.size() < n) return kRuneError;

    for (size_t i = 1; i < n; ++i) {
        if (!IsCont(p[i])) return kRuneError;
    }
    const std::uint8_t b1 = p[1];
    char32_t r = 0;
    switch (n) {
        case 2:
            r = (char32_t(b0 & 0x1F) << 6) | (b1 & 0x3F);
            break;
        case 3:
            if ((b0 == 0xE0 && b1 < 0xA0) || (b0 == 0xED && b1 > 0x9F)) return kRuneError;
            r = (char32_t(b0 & 0x0F) << 12) | (char32_t(b1 & 0x3F) << 6) | (p[2] & 0x3F);
            break;
        default:
            if ((b0 == 0xF0 && b1 < 0x90) || (b0 == 0xF4 && b1 > 0x8F)) return kRuneError;
            r = (char32_t(b0 & 0x07) << 18) | (char32_t(b1 & 0x3F) << 12) |
                (char32_t(p[2] & 0x3F) << 6) | (p[3] & 0x3F);
            break;
    }
    size = n;
    return r;
}

size_t EncodeRune(char32_t r, std::uint8_t* out) {
    if (r > kMaxRune || (r >= 0xD800 && r <= 0xDFFF)) r = kRuneError;
    if (r < 0x80) {
        out[0] = static_cast<std::uint8_t>(r);
        return 1;
    }
    if (r < 0x800) {
        out[0] = static_cast<std::uint8_t>(0xC0 | (r >> 6));
        out[1] = static_cast<std::uint8_t>(0x80 | (r & 0x3F));
        return 2;
    }
    if (r < 0x10000) {
        out[0] = static_cast<std::uint8_t>(0xE0 | (r >> 12));
        out[1] = static_cast<std::uint8_t>(0x80 | ((r >> 6) & 0x3F));
        out[2] = static_cast<std::uint8_t>(0x80 | (r & 0x3F));
        return 3;
    }
    out[0] = static_cast<std::uint8_t>(0xF0 | (r >> 18));
    out[1] = static_cast<std::uint8_t>(0x80 | ((r >> 12) & 0x3F));
    out[2] = static_cast<std::uint8_t>(0x80 | ((r >> 6) & 0x3F));
    out[3] = static_cast<std::uint8_t>(0x80 | (r & 0x3F));
    return 4;
}

} // namespace filepipe::utf8
