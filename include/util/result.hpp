#pragma once
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace filepipe {

// err > 0 is an errno value, err < 0 is an ErrorKind (see util/errors.hpp).
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    // Kinds of the other failures folded in by Combine().
    std::vector<int> joined;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    bool Is(int kind) const {
        if (ok) return false;
        if (err == kind) return true;
        for (int k : joined) {
            if (k == kind) return true;
        }
        return false;
    }

    // Prepends "context: " to the message; the kind is kept.
    Result Wrap(std::string_view context) const {
        if (ok) return *this;
        Result r = *this;
        r.msg = std::string(context) + ": " + msg;
        return r;
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .joined = {}};
    }

    static Result Combine(const std::vector<Result>& results);
    static Result Combine(std::initializer_list<Result> results) {
        return Combine(std::vector<Result>(results));
    }
};

} // namespace filepipe
