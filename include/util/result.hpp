#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace pkgrepo {

enum class ErrorCode : int {
    None = 0,
    MalformedPackage,
    DescriptorMismatch,
    NoMatchingRepository,
    RepositoryBusy,
    MetadataBuildFailed,
    SigningFailed,
    VerificationFailed,
    StorageError,
    PreconditionFailed,
    NotFound,
    Timeout,
    Cancelled,
    InvalidConfig,
    PackageNotFound,
};

std::string_view ToString(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode err{ErrorCode::None};
    std::string msg;

    bool is_ok() const { return ok; }
    ErrorCode code() const { return err; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    // Same code, message prefixed with context.
    static Result Wrap(const Result& inner, std::string_view context) {
        return Fail(inner.err, std::string(context) + ": " + inner.msg);
    }
};

} // namespace pkgrepo
