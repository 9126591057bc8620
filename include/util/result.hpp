#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace apg {

enum class ErrorKind : int {
    None = 0,
    Io,
    ArchiveFormat,
    PathSecurity,
    SizeLimit,
    Structural,
    Schema,
    Usage,
};

constexpr std::string_view ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "OK";
        case ErrorKind::Io:            return "IOError";
        case ErrorKind::ArchiveFormat: return "ArchiveFormatError";
        case ErrorKind::PathSecurity:  return "PathSecurityViolation";
        case ErrorKind::SizeLimit:     return "SizeLimitExceeded";
        case ErrorKind::Structural:    return "StructuralValidationError";
        case ErrorKind::Schema:        return "SchemaValidationError";
        case ErrorKind::Usage:         return "UsageError";
    }
    return "Error";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = -1) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace apg
