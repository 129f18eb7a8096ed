#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace filepipe::utf8 {

constexpr char32_t kRuneError = 0xFFFD;
constexpr size_t kUtfMax = 4;
constexpr char32_t kMaxRune = 0x10FFFF;

// Reports whether p begins with a full (possibly invalid) UTF-8 encoding.
bool FullRune(std::span<const std::uint8_t> p);

// Decodes the first rune in p. Invalid or short input decodes to
// kRuneError with size 1; empty input gives size 0.
char32_t DecodeRune(std::span<const std::uint8_t> p, size_t& size);

// Writes the encoding of r into out (at least kUtfMax bytes) and returns
// its length. Invalid runes are encoded as kRuneError.
size_t EncodeRune(char32_t r, std::uint8_t* out);

} // namespace filepipe::utf8
