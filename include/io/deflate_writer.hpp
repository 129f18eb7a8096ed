#pragma once

#include "io/inflate_reader.hpp"
#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace filepipe {

constexpr int kHuffmanOnly = -2;
constexpr int kDefaultCompression = Z_DEFAULT_COMPRESSION;
constexpr int kNoCompression = Z_NO_COMPRESSION;
constexpr int kBestCompression = Z_BEST_COMPRESSION;

// Compresses everything written into dst (not owned). Close finishes the
// stream but does not close dst.
class DeflateWriter final : public IWriter, public ICloser {
  public:
    // level is kHuffmanOnly, kDefaultCompression or 0-9.
    static Result Create(IWriter* dst, ZlibFraming framing, int level,
                         std::unique_ptr<DeflateWriter>& out);
    ~DeflateWriter() override;

    DeflateWriter(const DeflateWriter&) = delete;
    DeflateWriter& operator=(const DeflateWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Close() override;

  private:
    DeflateWriter(IWriter* dst, ZlibFraming framing);

    Result Pump(int flush);

    IWriter* dst_;
    ZlibFraming framing_;
    z_stream strm_{};
    bool initialized_ = false;
    bool closed_ = false;
    std::vector<std::uint8_t> out_buffer_;
    Result err_;
};

bool ValidDeflateLevel(int level);

} // namespace filepipe
