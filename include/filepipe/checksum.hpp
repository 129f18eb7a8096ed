#pragma once

#include "crypto/hash.hpp"
#include "io/io.hpp"

#include <string>
#include <vector>

namespace filepipe {

struct HashChecksum {
    crypto::HashFactory new_hash;
    // Expected digest in hex, either case.
    std::string want_hex;
    // Match want_hex against the beginning of the digest only.
    bool is_prefix = false;
};

// Reads file to its end once, feeding every hash, and reports whether the
// read succeeded and every digest matches. An empty cs only requires the
// read to succeed. With close_file, file is closed before returning.
//
// Throws std::invalid_argument if file is null, or if an entry of cs has
// an empty factory or an empty want_hex.
bool VerifyChecksum(IFile* file, bool close_file, const std::vector<HashChecksum>& cs);

// Opens name from fsys and verifies it. Returns false if the open fails.
// Throws std::invalid_argument if fsys is null or cs is malformed.
bool VerifyChecksumFromFs(IFileSystem* fsys, const std::string& name, const std::vector<HashChecksum>& cs);

} // namespace filepipe
