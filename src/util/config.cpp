#include "util/config.hpp"

#include "util/config_json_utils.hpp"

namespace pkgrepo::config {

Result LoadEngineConfig(const std::string& path, EngineConfig& out) {
    out = EngineConfig{};

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err))
        return Result::Fail(ErrorCode::InvalidConfig, "config: " + err);

    if (!detail::FillConfigFromJson(json, out, err))
        return Result::Fail(ErrorCode::InvalidConfig, "config: " + err + " in " + path);

    return Result::Ok();
}

Result ParseEngineConfig(std::string_view json_text, EngineConfig& out) {
    out = EngineConfig{};

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorCode::InvalidConfig, std::string("config: invalid JSON: ") + e.what());
    }
    if (!json.is_object()) return Result::Fail(ErrorCode::InvalidConfig, "config: root must be JSON object");

    std::string err;
    if (!detail::FillConfigFromJson(json, out, err)) return Result::Fail(ErrorCode::InvalidConfig, "config: " + err);
    return Result::Ok();
}

} // namespace pkgrepo::config
