#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace pkgrepo::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, EngineConfig& cfg, std::string& err);

} // namespace pkgrepo::config::detail
