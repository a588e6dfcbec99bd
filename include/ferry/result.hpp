#pragma once

#include <string>
#include <utility>

namespace ferry {

// Outcome of a single low-level operation (process, filesystem, copy).
// code carries the exit status or errno; -1 when neither applies.
struct Result {
    bool ok{true};
    int code{0};
    std::string msg;

    static Result Ok() { return Result{}; }

    static Result Fail(int code, std::string msg) {
        Result r;
        r.ok = false;
        r.code = code;
        r.msg = std::move(msg);
        return r;
    }

    bool is_ok() const { return ok; }
};

} // namespace ferry
