#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace filepipe {

// Decides which archive entry names may be handed to callers.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool allow_non_local) : allow_non_local_(allow_non_local) {}

    // Reports whether path stays inside the directory it is relative to:
    // it is non-empty, not absolute, and never climbs above its root
    // with "..". "a/../b" is local, "a/../../b" is not.
    static bool IsLocal(std::string_view path);

    // Fails with kErrInsecurePath for a non-local name unless allowed.
    Result CheckName(const std::string& name) const;

    bool AllowNonLocal() const { return allow_non_local_; }

  private:
    bool allow_non_local_ = false;
};

} // namespace filepipe
