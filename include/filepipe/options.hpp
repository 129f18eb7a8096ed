#pragma once

#include "archive/zip_compressors.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace filepipe {

struct ReadOptions {
    // Minimum buffer size; non-positive selects the default.
    int buf_size = 0;
    // Positive counts from the start of the file, negative from its end.
    std::int64_t offset = 0;
    // Bytes to read after offset; non-positive means no limit.
    std::int64_t limit = 0;
    // Read the bytes as stored, ignoring the extension chain.
    bool raw = false;
    // Added to the built-in Store and Deflate methods; empty entries are ignored.
    ZipDecompressorMap zip_decompressors;
};

struct WriteOptions {
    // Minimum buffer size; non-positive selects the default.
    int buf_size = 0;
    // Write the bytes as given, ignoring the extension chain.
    bool raw = false;
    // DEFLATE level for gzip and zip: -2 Huffman-only, -1 default, 0-9.
    int deflate_level = -1;
    // Offset of the archive within the file, for zips appended to other data.
    std::int64_t zip_offset = 0;
    std::string zip_comment;
    // Added to the built-in Store and Deflate methods; empty entries are ignored.
    ZipCompressorMap zip_compressors;
};

// Range checks shared by Writer (which throws std::invalid_argument) and
// the JSON loader (which returns the Result).
Result ValidateWriteOptions(const WriteOptions& opts);

} // namespace filepipe
