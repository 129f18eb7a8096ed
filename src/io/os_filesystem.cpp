#include "io/os_filesystem.hpp"

#include "io/os_file.hpp"
#include "util/errors.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

namespace filepipe {

namespace fs = std::filesystem;

Result OsFileSystem::Resolve(const std::string& name, std::string& path) const {
    if (!ValidFsPath(name)) {
        return Result::Fail(kErrInsecurePath, "invalid path: " + name);
    }
    path = name == "." ? root_ : JoinPath(root_, name);
    return Result::Ok();
}

Result OsFileSystem::Open(const std::string& name, std::unique_ptr<IFile>& out) {
    std::string path;
    auto r = Resolve(name, path);
    if (!r.ok) return r.Wrap("open");
    r = OpenOsFile(path, out);
    if (!r.ok && r.err == ENOENT) return Result::Fail(kErrNotExist, r.msg);
    return r;
}

Result OsFileSystem::ReadDir(const std::string& name, std::vector<FileInfo>& out) {
    out.clear();
    std::string path;
    auto r = Resolve(name, path);
    if (!r.ok) return r.Wrap("readdir");

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) return Result::Fail(ec.value(), "readdir " + path + ": " + ec.message());

    for (const auto& entry : it) {
        FileInfo info;
        r = StatPath(entry.path().string(), info);
        if (!r.ok) return r;
        out.push_back(std::move(info));
    }
    std::sort(out.begin(), out.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return Result::Ok();
}

} // namespace filepipe
