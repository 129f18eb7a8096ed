#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace filepipe {

// Lowercase hexadecimal encoding.
std::string HexEncode(std::span<const std::uint8_t> bytes);

// Reports whether the lowercase hex encoding of digest equals want,
// ignoring the case of want. If prefix is true, want may be a prefix
// of the encoding instead. An empty want never matches.
bool CanEncodeToHex(std::span<const std::uint8_t> digest, std::string_view want, bool prefix = false);

} // namespace filepipe
