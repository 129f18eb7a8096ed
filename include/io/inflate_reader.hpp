#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace filepipe {

enum class ZlibFraming {
    kGzip,        // RFC 1952 members
    kRawDeflate,  // bare RFC 1951 stream, as stored in ZIP entries
};

// Decompresses a gzip or raw DEFLATE stream read from src (not owned).
// Concatenated gzip members decode as one stream unless multistream is off.
class InflateReader final : public IReader, public ICloser {
  public:
    // For gzip, the member header magic is checked before returning.
    static Result Create(IReader* src, ZlibFraming framing, std::unique_ptr<InflateReader>& out);
    ~InflateReader() override;

    InflateReader(const InflateReader&) = delete;
    InflateReader& operator=(const InflateReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    Result LastError() const override { return err_; }
    Result Close() override;

    void SetMultistream(bool on) { multistream_ = on; }

  private:
    InflateReader(IReader* src, ZlibFraming framing);

    Result EnsureInput(size_t n);
    Result CheckGzipMagic();

    IReader* src_;
    ZlibFraming framing_;
    z_stream strm_{};
    bool initialized_ = false;
    std::vector<std::uint8_t> in_buffer_;
    bool src_eof_ = false;
    bool stream_end_ = false;
    bool done_ = false;
    bool closed_ = false;
    bool multistream_ = true;
    Result err_;
};

} // namespace filepipe
