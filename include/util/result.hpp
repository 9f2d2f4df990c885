#pragma once
#include <string>
#include <utility>

namespace peel {

enum class ErrorKind : int {
    None = 0,
    Usage,
    Io,
    UnrecognizedFormat,
    MissingTool,
    UnsupportedMode,
    ExtractionTool,
    PasswordProtected,
    UnsupportedCompression,
    DestinationCollision,
    Interrupted,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;
    // Captured tool stderr for ExtractionTool and its subtypes.
    std::string detail;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .kind = ErrorKind::Io, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m, std::string d = {}) {
        return {.ok = false, .kind = k, .err = -1, .msg = std::move(m), .detail = std::move(d)};
    }
};

} // namespace peel
