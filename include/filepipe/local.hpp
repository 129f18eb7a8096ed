#pragma once

#include "filepipe/checksum.hpp"
#include "filepipe/reader.hpp"
#include "filepipe/writer.hpp"

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace filepipe {

// Opens a local file for reading after resolving symlinks in path. The
// reader owns the file.
Result ReadLocal(const std::string& path, const ReadOptions& opts, std::unique_ptr<Reader>& out);

// Open a local file for writing; the writer owns the file. perm applies to
// a newly created file (before umask). With make_dirs the missing parent
// directories are created first, with default permissions.
//
// WriteTrunc truncates an existing file, WriteAppend appends to it and
// WriteExcl fails with EEXIST.
Result WriteTrunc(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                  std::unique_ptr<Writer>& out);
Result WriteAppend(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                   std::unique_ptr<Writer>& out);
Result WriteExcl(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                 std::unique_ptr<Writer>& out);

// VerifyChecksum on a local file. Returns false if it cannot be opened.
bool VerifyLocalChecksum(const std::string& path, const std::vector<HashChecksum>& cs);

} // namespace filepipe
