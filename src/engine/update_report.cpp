#include "engine/update_report.hpp"

#include <nlohmann/json.hpp>

namespace pkgrepo {

std::string_view ToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Added: return "added";
        case Outcome::Removed: return "removed";
        case Outcome::Unchanged: return "unchanged";
        case Outcome::Initialized: return "initialized";
        case Outcome::Planned: return "planned";
        case Outcome::Failed: return "failed";
        case Outcome::Aborted: return "aborted";
    }
    return "unknown";
}

bool UpdateReport::AnyFailed() const {
    for (const auto& e : entries) {
        if (e.IsFailure()) return true;
    }
    return false;
}

Result UpdateReport::FirstFailure() const {
    for (const auto& e : entries) {
        if (e.IsFailure()) return Result::Fail(e.error, e.package + ": " + e.message);
    }
    return Result::Ok();
}

std::string UpdateReport::ToJson() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        nlohmann::json j{
            {"package", e.package},
            {"repository", e.repository},
            {"outcome", std::string(ToString(e.outcome))},
        };
        if (!e.content_hash.empty()) j["content_hash"] = e.content_hash;
        if (e.error != ErrorCode::None) j["error"] = std::string(ToString(e.error));
        if (!e.message.empty()) j["message"] = e.message;
        if (!e.warnings.empty()) j["warnings"] = e.warnings;
        arr.push_back(std::move(j));
    }
    nlohmann::json root{
        {"operation", operation},
        {"failed", AnyFailed()},
        {"entries", std::move(arr)},
    };
    return root.dump(2);
}

} // namespace pkgrepo
