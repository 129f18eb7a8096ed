#pragma once

#include "io/io.hpp"

#include <cstdarg>
#include <cstdint>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace filepipe {

// Thrown by the Must* writer methods; carries the failed Result.
class WritePanic : public std::runtime_error {
public:
    explicit WritePanic(Result r)
        : std::runtime_error("write panic: " + r.msg), result_(std::move(r)) {}

    const Result& result() const { return result_; }

private:
    Result result_;
};

namespace detail {

template <typename T>
constexpr bool kIsStringLike =
    std::is_convertible_v<const T&, std::string_view> || std::is_same_v<std::decay_t<T>, char*>;

template <typename T>
void PrintOperand(std::ostringstream& os, const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        os << (v ? "true" : "false");
    } else if constexpr (std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char>) {
        os << static_cast<int>(v);
    } else {
        os << v;
    }
}

template <typename T>
void AppendPrintOperand(std::ostringstream& os, const T& v, bool& first, bool& prev_string) {
    constexpr bool is_string = kIsStringLike<T>;
    if (!first && !is_string && !prev_string) os << ' ';
    PrintOperand(os, v);
    first = false;
    prev_string = is_string;
}

template <typename T>
void AppendPrintlnOperand(std::ostringstream& os, const T& v, bool& first) {
    if (!first) os << ' ';
    PrintOperand(os, v);
    first = false;
}

// Operands are separated by a space when neither side is a string.
template <typename... Args>
std::string FormatPrint(const Args&... args) {
    std::ostringstream os;
    bool first = true;
    bool prev_string = false;
    (AppendPrintOperand(os, args, first, prev_string), ...);
    return os.str();
}

// Operands are always separated by a space, and a newline is appended.
template <typename... Args>
std::string FormatPrintln(const Args&... args) {
    std::ostringstream os;
    bool first = true;
    (AppendPrintlnOperand(os, args, first), ...);
    os << '\n';
    return os.str();
}

} // namespace detail

std::string FormatV(const char* fmt, va_list ap);

// Buffered writer over a byte sink (not owned). The first write error is
// sticky: later writes and Flush return it until Reset.
class BufferedWriter final : public IWriter {
public:
    static constexpr size_t kDefaultSize = 4096;

    explicit BufferedWriter(IWriter* wr, size_t size = kDefaultSize);

    Result WriteAll(std::span<const std::uint8_t> in) override;

    Result Write(std::span<const std::uint8_t> p, size_t& n);
    Result WriteByte(std::uint8_t c);
    Result WriteRune(char32_t r, size_t& size);
    Result WriteString(std::string_view s, size_t& n);
    // Copies src until its end; the end of src is not an error.
    Result ReadFrom(IReader& src, std::uint64_t& n);

    Result Printf(size_t& n, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    Result VPrintf(size_t& n, const char* fmt, va_list ap);

    template <typename... Args>
    Result Print(size_t& n, const Args&... args) {
        return WriteString(detail::FormatPrint(args...), n);
    }

    template <typename... Args>
    Result Println(size_t& n, const Args&... args) {
        return WriteString(detail::FormatPrintln(args...), n);
    }

    size_t MustWrite(std::span<const std::uint8_t> p);
    void MustWriteByte(std::uint8_t c);
    size_t MustWriteRune(char32_t r);
    size_t MustWriteString(std::string_view s);
    size_t MustPrintf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    template <typename... Args>
    size_t MustPrint(const Args&... args) {
        size_t n = 0;
        auto r = Print(n, args...);
        if (!r.ok) throw WritePanic(r);
        return n;
    }

    template <typename... Args>
    size_t MustPrintln(const Args&... args) {
        size_t n = 0;
        auto r = Println(n, args...);
        if (!r.ok) throw WritePanic(r);
        return n;
    }

    Result Flush();

    size_t Size() const { return buf_.size(); }
    size_t Buffered() const { return n_; }
    size_t Available() const { return buf_.size() - n_; }

    // Discards unflushed data and any error, and writes to wr from now on.
    void Reset(IWriter* wr);

private:
    std::vector<std::uint8_t> buf_;
    size_t n_ = 0;
    IWriter* wr_;
    Result err_;
};

} // namespace filepipe
