#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filepipe {

// Copies src into dst until end of stream.
Result Copy(IWriter& dst, IReader& src, std::uint64_t* written = nullptr);

// Reads and drops exactly n bytes; fails with kErrUnexpectedEof if the
// stream ends first.
Result Skip(IReader& src, std::uint64_t n, std::uint64_t* skipped = nullptr);

// Fills out completely; n is the count read before the end of stream.
Result ReadFull(IReader& src, std::span<std::uint8_t> out, size_t& n);

// Reads src to the end and appends to out.
Result ReadToEnd(IReader& src, std::vector<std::uint8_t>& out);

// Writer that collects bytes into a string.
class StringWriter final : public IWriter {
public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        str_.append(reinterpret_cast<const char*>(in.data()), in.size());
        return Result::Ok();
    }

    const std::string& Str() const { return str_; }
    void Clear() { str_.clear(); }

private:
    std::string str_;
};

inline std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace filepipe
