#include "util/result.hpp"

namespace filepipe {

Result Result::Combine(const std::vector<Result>& results) {
    Result out;
    for (const auto& r : results) {
        if (r.ok) continue;
        if (out.ok) {
            out = r;
            continue;
        }
        out.joined.push_back(r.err);
        out.joined.insert(out.joined.end(), r.joined.begin(), r.joined.end());
        out.msg += "; " + r.msg;
    }
    return out;
}

} // namespace filepipe
