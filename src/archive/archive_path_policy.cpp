#include "archive/archive_path_policy.hpp"

#include "util/errors.hpp"

namespace filepipe {

bool ArchivePathPolicy::IsLocal(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;

    int depth = 0;
    std::string_view sv(p);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") {
            if (--depth < 0) return false;
        } else if (!seg.empty() && seg != ".") {
            ++depth;
        }
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return true;
}

Result ArchivePathPolicy::CheckName(const std::string& name) const {
    if (allow_non_local_ || IsLocal(name)) return Result::Ok();
    return Result::Fail(kErrInsecurePath, "insecure file path in archive: " + name);
}

} // namespace filepipe
