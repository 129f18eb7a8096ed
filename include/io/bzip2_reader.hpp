#pragma once

#include "io/io.hpp"

#include <bzlib.h>

#include <memory>
#include <vector>

namespace filepipe {

// Decompresses bzip2 data read from src (not owned). Concatenated streams
// decode as one. There is no bzip2 writer.
class Bzip2Reader final : public IReader, public ICloser {
  public:
    explicit Bzip2Reader(IReader* src);
    ~Bzip2Reader() override;

    Bzip2Reader(const Bzip2Reader&) = delete;
    Bzip2Reader& operator=(const Bzip2Reader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return err_; }
    Result Close() override;

  private:
    Result StartStream();
    Result EnsureInput(size_t n);

    IReader* src_;
    bz_stream strm_{};
    bool initialized_ = false;
    std::vector<char> in_buffer_;
    bool src_eof_ = false;
    bool started_any_ = false;
    bool done_ = false;
    bool closed_ = false;
    Result err_;
};

} // namespace filepipe
