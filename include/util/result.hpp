#pragma once
#include <string>
#include <utility>

namespace takeout {

enum class ErrorKind : int {
    None = 0,
    Io,
    Config,
    MissingDependency,
    NoInputFound,
    ExtractionFailure,
    PackagingFailure,
    Cancelled,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;
    ErrorKind kind{ErrorKind::None};

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m), .kind = ErrorKind::Io};
    }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .err = -1, .msg = std::move(m), .kind = k};
    }

    // Re-tags a lower level failure (usually Io) with the stage that hit it.
    Result As(ErrorKind k) const {
        Result r = *this;
        if (!r.ok) r.kind = k;
        return r;
    }
};

} // namespace takeout
