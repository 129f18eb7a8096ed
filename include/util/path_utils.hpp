#pragma once

#include <string>
#include <string_view>

namespace filepipe {

// Extension of the last path element, including the dot ("" if none),
// like "a/b.tar.gz" -> ".gz".
inline std::string_view PathExt(std::string_view s) {
    for (size_t i = s.size(); i > 0; --i) {
        const char c = s[i - 1];
        if (c == '/') break;
        if (c == '.') return s.substr(i - 1);
    }
    return {};
}

// Last element of a slash-separated path, ignoring trailing slashes.
inline std::string BaseName(std::string_view s) {
    while (s.size() > 1 && s.back() == '/') s.remove_suffix(1);
    const auto pos = s.rfind('/');
    if (pos != std::string_view::npos && s.size() > 1) s.remove_prefix(pos + 1);
    return std::string(s);
}

// Joins two slash-separated path elements, treating "." as empty.
inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty() || dir == ".") return std::string(name);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

// Reports whether name is usable with IFileSystem: "." or a relative
// slash-separated path without empty, "." or ".." elements.
inline bool ValidFsPath(std::string_view name) {
    if (name == ".") return true;
    while (true) {
        const auto pos = name.find('/');
        const auto elem = name.substr(0, pos);
        if (elem.empty() || elem == "." || elem == "..") return false;
        if (pos == std::string_view::npos) return true;
        name.remove_prefix(pos + 1);
    }
}

} // namespace filepipe
