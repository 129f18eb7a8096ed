#include "filepipe/local.hpp"

#include "io/os_file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <system_error>

namespace filepipe {

namespace fs = std::filesystem;

namespace {

Result WriteOpenFile(const std::string& path, int flags, mode_t perm, bool make_dirs,
                     const WriteOptions& opts, std::unique_ptr<Writer>& out) {
    if (path.empty()) return Result::Fail(EINVAL, "filepipe: path is empty");
    const fs::path clean = fs::path(path).lexically_normal();

    if (make_dirs && clean.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(clean.parent_path(), ec);
        if (ec) {
            return Result::Fail(ec.value(),
                                "create_directories failed: " + clean.parent_path().string() + ": " + ec.message());
        }
    }

    std::unique_ptr<OsWritableFile> f;
    auto r = OsWritableFile::Open(clean.string(), flags, perm, f);
    if (!r.ok) return r;
    return Writer::Open(std::unique_ptr<IWritableFile>(std::move(f)), opts, out);
}

} // namespace

Result ReadLocal(const std::string& path, const ReadOptions& opts, std::unique_ptr<Reader>& out) {
    std::error_code ec;
    const fs::path resolved = fs::canonical(path, ec);
    if (ec) return Result::Fail(ec.value(), "resolve " + path + ": " + ec.message());

    std::unique_ptr<IFile> f;
    auto r = OpenOsFile(resolved.string(), f);
    if (!r.ok) return r;
    return Reader::Open(std::move(f), opts, out);
}

Result WriteTrunc(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                  std::unique_ptr<Writer>& out) {
    return WriteOpenFile(path, O_CREAT | O_TRUNC, perm, make_dirs, opts, out);
}

Result WriteAppend(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                   std::unique_ptr<Writer>& out) {
    return WriteOpenFile(path, O_CREAT | O_APPEND, perm, make_dirs, opts, out);
}

Result WriteExcl(const std::string& path, mode_t perm, bool make_dirs, const WriteOptions& opts,
                 std::unique_ptr<Writer>& out) {
    return WriteOpenFile(path, O_CREAT | O_EXCL, perm, make_dirs, opts, out);
}

bool VerifyLocalChecksum(const std::string& path, const std::vector<HashChecksum>& cs) {
    std::unique_ptr<IFile> f;
    auto r = OpenOsFile(path, f);
    if (!r.ok) return false;
    return VerifyChecksum(f.get(), true, cs);
}

} // namespace filepipe
