#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace filepipe {

// Buffered reader over a byte stream (not owned).
//
// Errors from the underlying reader are reported once, by the call that
// runs into them; the end of the stream is kErrEof for the Result-returning
// methods and 0 for Read.
class BufferedReader final : public IReader {
public:
    static constexpr size_t kDefaultSize = 4096;
    static constexpr size_t kMinSize = 16;

    explicit BufferedReader(IReader* rd, size_t size = kDefaultSize);

    // Reads into out; an empty out returns 0.
    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return last_err_; }

    Result ReadByte(std::uint8_t& c);
    Result UnreadByte();
    // Invalid encodings yield utf8::kRuneError with size 1.
    Result ReadRune(char32_t& r, size_t& size);
    Result UnreadRune();

    // Writes everything up to the end of the stream into w.
    Result WriteTo(IWriter& w, std::uint64_t& n);

    // Returns a line without its "\n" or "\r\n" ending. If the line does not
    // fit in the buffer, its beginning is returned with more set, and the
    // rest follows in later calls. line is valid until the next read.
    // Content and an error are never returned together.
    Result ReadLine(std::span<const std::uint8_t>& line, bool& more);
    // Like ReadLine, but collects the fragments into one line.
    Result ReadEntireLine(std::string& line);
    // Streams the next line, without its ending, into w.
    Result WriteLineTo(IWriter& w, std::uint64_t& n);

    // Returns the next n bytes without advancing. Fails with kErrBufferFull
    // when n is larger than the buffer, returning what is buffered.
    Result Peek(int n, std::span<const std::uint8_t>& data);
    Result Discard(int n, int& discarded);

    size_t Size() const { return buf_.size(); }
    size_t Buffered() const { return w_ - r_; }

    // Drops buffered data and state and reads from rd from now on.
    void Reset(IReader* rd);

private:
    void Fill();
    Result TakeErr();
    Result ReadSlice(std::uint8_t delim, std::span<const std::uint8_t>& line);
    Result WriteBuf(IWriter& w, std::uint64_t& n);

    std::vector<std::uint8_t> buf_;
    IReader* rd_;
    size_t r_ = 0;
    size_t w_ = 0;
    Result err_;
    Result last_err_;
    int last_byte_ = -1;
    int last_rune_size_ = -1;
};

} // namespace filepipe
