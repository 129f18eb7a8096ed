#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace filepipe {

// Compresses one ZIP entry into dst. Close ends the compressed stream and
// does not close dst.
class IZipCompressor : public IWriter, public ICloser {};

// Decompresses one ZIP entry read from src.
class IZipDecompressor : public IReader, public ICloser {};

using ZipCompressorFactory =
    std::function<Result(IWriter* dst, std::unique_ptr<IZipCompressor>& out)>;
using ZipDecompressorFactory =
    std::function<Result(IReader* src, std::unique_ptr<IZipDecompressor>& out)>;

using ZipCompressorMap = std::map<std::uint16_t, ZipCompressorFactory>;
using ZipDecompressorMap = std::map<std::uint16_t, ZipDecompressorFactory>;

ZipCompressorFactory StoreCompressor();
// level follows DeflateWriter (kHuffmanOnly, kDefaultCompression or 0-9).
ZipCompressorFactory DeflateCompressor(int level);

ZipDecompressorFactory StoreDecompressor();
ZipDecompressorFactory DeflateDecompressor();

} // namespace filepipe
