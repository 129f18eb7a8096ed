#include "filepipe/pipeline.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace filepipe {

const char* StageName(Stage stage) {
    switch (stage) {
        case Stage::kGzip:
            return "gzip";
        case Stage::kBzip2:
            return "bzip2";
        case Stage::kTar:
            return "tar";
        case Stage::kZip:
            return "zip";
    }
    return "unknown";
}

std::vector<Stage> ParseExtensionChain(std::string_view name, bool for_write) {
    std::string lower(BaseName(name));
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<Stage> chain;
    std::string_view rest = lower;
    while (true) {
        const std::string_view ext = PathExt(rest);
        if (ext == ".gz" || ext == ".tgz") {
            chain.push_back(Stage::kGzip);
            if (ext == ".tgz") {
                chain.push_back(Stage::kTar);
                break;
            }
        } else if (!for_write && (ext == ".bz2" || ext == ".tbz")) {
            chain.push_back(Stage::kBzip2);
            if (ext == ".tbz") {
                chain.push_back(Stage::kTar);
                break;
            }
        } else if (ext == ".tar") {
            chain.push_back(Stage::kTar);
            break;
        } else if (ext == ".zip") {
            chain.push_back(Stage::kZip);
            break;
        } else {
            break;
        }
        rest.remove_suffix(ext.size());
    }
    return chain;
}

std::string DescribeChain(const std::vector<Stage>& chain) {
    if (chain.empty()) return "none";
    std::string out;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) out += " -> ";
        out += StageName(chain[i]);
    }
    return out;
}

} // namespace filepipe
