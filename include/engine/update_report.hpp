#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pkgrepo {

enum class Outcome {
    Added,
    Removed,
    Unchanged,
    Initialized,
    Planned,
    Failed,
    Aborted,
};

std::string_view ToString(Outcome outcome);

// One input package (or hash, or prefix) and what happened to it.
struct ReportEntry {
    std::string package;
    std::string content_hash;
    std::string repository;
    Outcome outcome = Outcome::Unchanged;
    ErrorCode error = ErrorCode::None;
    std::string message;
    std::vector<std::string> warnings;

    bool IsFailure() const { return outcome == Outcome::Failed || outcome == Outcome::Aborted; }
};

struct UpdateReport {
    std::string operation;
    std::vector<ReportEntry> entries;

    bool AnyFailed() const;
    // First failing entry as a Result; Ok when nothing failed.
    Result FirstFailure() const;
    std::string ToJson() const;
};

} // namespace pkgrepo
