#pragma once
#include <string>
#include <utility>

namespace kiosk {

enum class ErrorCode : int {
    None = 0,
    MediaNotFound,
    PackageNotFound,
    SchemaInvalid,
    AssetMissing,
    IoFailure,
    CommitFailure,
    RollbackFailure,
};

inline const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:            return "None";
        case ErrorCode::MediaNotFound:   return "MediaNotFound";
        case ErrorCode::PackageNotFound: return "PackageNotFound";
        case ErrorCode::SchemaInvalid:   return "SchemaInvalid";
        case ErrorCode::AssetMissing:    return "AssetMissing";
        case ErrorCode::IoFailure:       return "IOFailure";
        case ErrorCode::CommitFailure:   return "CommitFailure";
        case ErrorCode::RollbackFailure: return "RollbackFailure";
    }
    return "Unknown";
}

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, int e, std::string m) {
        return {.ok = false, .code = c, .err = e, .msg = std::move(m)};
    }
    // Plain failures from the I/O layer.
    static Result Fail(int e, std::string m) {
        return Fail(ErrorCode::IoFailure, e, std::move(m));
    }
    // Keeps errno and text, reclassifies.
    static Result Wrap(ErrorCode c, const Result& inner, const std::string& context) {
        return Fail(c, inner.err, context + ": " + inner.msg);
    }
};

} // namespace kiosk
