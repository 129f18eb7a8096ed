#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace filepipe {

enum class Stage {
    kGzip,
    kBzip2,
    kTar,
    kZip,
};

const char* StageName(Stage stage);

// Transforms implied by the extensions of name, from the file outwards:
// "a.tar.gz" gives {kGzip, kTar}. Extensions are matched case-insensitively
// from the last one until an unknown one, ".tar" or ".zip" is reached.
// ".tgz" stands for ".tar.gz" and ".tbz" for ".tar.bz2". bzip2 is only
// recognized when reading.
std::vector<Stage> ParseExtensionChain(std::string_view name, bool for_write);

// "gzip -> tar", or "none".
std::string DescribeChain(const std::vector<Stage>& chain);

} // namespace filepipe
