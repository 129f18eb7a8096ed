#include "util/hex.hpp"

#include <cctype>

namespace filepipe {

namespace {
constexpr char kHex[] = "0123456789abcdef";
} // namespace

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

bool CanEncodeToHex(std::span<const std::uint8_t> digest, std::string_view want, bool prefix) {
    if (want.empty()) return false;
    const size_t full = digest.size() * 2;
    if (want.size() > full) return false;
    if (!prefix && want.size() != full) return false;

    for (size_t i = 0; i < want.size(); ++i) {
        const std::uint8_t b = digest[i / 2];
        const char c = kHex[(i % 2 == 0) ? (b >> 4) & 0xF : b & 0xF];
        if (std::tolower(static_cast<unsigned char>(want[i])) != c) return false;
    }
    return true;
}

} // namespace filepipe
