#include "util/config_json_utils.hpp"

#include <fstream>

namespace pkgrepo::config::detail {

namespace {

using nlohmann::json;

// Each getter: absent key leaves out untouched and succeeds; a present key of
// the wrong type fails with err naming the key.
bool GetString(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetBool(const json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetU64(const json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(it->get<long long>());
    return true;
}

template <typename Duration>
bool GetDuration(const json& j, const char* key, Duration& out, std::string& err) {
    std::uint64_t v = static_cast<std::uint64_t>(out.count());
    if (!GetU64(j, key, v, err)) return false;
    out = Duration(static_cast<typename Duration::rep>(v));
    return true;
}

bool GetStringArray(const json& j, const char* key, std::vector<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_array()) {
        err = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool GetSection(const json& j, const char* key, const json*& out, std::string& err) {
    out = nullptr;
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_object()) {
        err = std::string("'") + key + "' must be an object";
        return false;
    }
    out = &*it;
    return true;
}

bool FillRouting(const json& j, std::vector<RoutingRule>& rules, std::string& err) {
    auto it = j.find("routing");
    if (it == j.end() || !it->is_array() || it->empty()) {
        err = "'routing' must be a non-empty array";
        return false;
    }
    for (const auto& item : *it) {
        if (!item.is_object()) {
            err = "routing rules must be objects";
            return false;
        }
        RoutingRule rule;
        if (!GetString(item, "target_prefix", rule.target_prefix, err)) return false;
        if (rule.target_prefix.empty()) {
            err = "routing rule without target_prefix";
            return false;
        }
        const json* match = nullptr;
        if (!GetSection(item, "match", match, err)) return false;
        if (match) {
            if (!GetString(*match, "arch", rule.match.arch, err)) return false;
            if (!GetString(*match, "os_tag", rule.match.os_tag, err)) return false;
            if (!GetString(*match, "format", rule.match.format, err)) return false;
        }
        rules.push_back(std::move(rule));
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, EngineConfig& cfg, std::string& err) {
    const json* sec = nullptr;

    if (!GetSection(j, "storage", sec, err)) return false;
    if (sec) {
        if (!GetString(*sec, "type", cfg.storage.type, err)) return false;
        if (!GetString(*sec, "root", cfg.storage.root, err)) return false;
    }
    if (cfg.storage.type != "filesystem" && cfg.storage.type != "memory") {
        err = "unknown storage type '" + cfg.storage.type + "'";
        return false;
    }
    if (cfg.storage.type == "filesystem" && cfg.storage.root.empty()) {
        err = "storage.root is required for filesystem storage";
        return false;
    }

    if (!GetSection(j, "storage_retry", sec, err)) return false;
    if (sec) {
        std::uint64_t attempts = static_cast<std::uint64_t>(cfg.storage_retry.max_attempts);
        if (!GetU64(*sec, "max_attempts", attempts, err)) return false;
        cfg.storage_retry.max_attempts = static_cast<int>(attempts);
        if (!GetDuration(*sec, "backoff_ms", cfg.storage_retry.initial_backoff, err)) return false;
    }

    if (!FillRouting(j, cfg.routing, err)) return false;

    if (!GetSection(j, "lock", sec, err)) return false;
    if (sec) {
        std::uint64_t attempts = static_cast<std::uint64_t>(cfg.lock.max_attempts);
        if (!GetDuration(*sec, "lease_seconds", cfg.lock.lease_duration, err)) return false;
        if (!GetU64(*sec, "max_attempts", attempts, err)) return false;
        cfg.lock.max_attempts = static_cast<int>(attempts);
        if (!GetDuration(*sec, "backoff_initial_ms", cfg.lock.backoff_initial, err)) return false;
        if (!GetDuration(*sec, "backoff_max_ms", cfg.lock.backoff_max, err)) return false;
    }
    if (cfg.lock.lease_duration.count() == 0 || cfg.lock.max_attempts == 0) {
        err = "lock.lease_seconds and lock.max_attempts must be positive";
        return false;
    }

    if (!GetSection(j, "signing", sec, err)) return false;
    if (sec) {
        auto& s = cfg.signing;
        if (!GetBool(*sec, "enabled", s.enabled, err)) return false;
        if (!GetString(*sec, "key_path", s.key_path, err)) return false;
        if (!GetString(*sec, "passphrase_env", s.passphrase_env, err)) return false;
        if (!GetBool(*sec, "sign_packages", s.sign_packages, err)) return false;
        if (!GetBool(*sec, "verify", s.verify, err)) return false;
        if (!GetBool(*sec, "verify_uses_system_keyring", s.verify_uses_system_keyring, err)) return false;
        if (!GetStringArray(*sec, "privileged_command", s.privileged_command, err)) return false;
        if (!GetString(*sec, "gpg_executable", s.gpg_executable, err)) return false;
        if (!GetString(*sec, "rpm_executable", s.rpm_executable, err)) return false;
        if (!GetDuration(*sec, "timeout_seconds", s.timeout, err)) return false;
    }
    if (cfg.signing.enabled && cfg.signing.key_path.empty()) {
        err = "signing.key_path is required when signing is enabled";
        return false;
    }
    if (cfg.signing.enabled && cfg.signing.verify && cfg.signing.sign_packages &&
        !cfg.signing.verify_uses_system_keyring) {
        err = "verifying signed packages needs the system rpm keyring; set signing.verify_uses_system_keyring";
        return false;
    }

    if (!GetSection(j, "metadata", sec, err)) return false;
    if (sec) {
        if (!GetString(*sec, "generator", cfg.metadata.generator, err)) return false;
        if (!GetStringArray(*sec, "command", cfg.metadata.command, err)) return false;
        if (!GetDuration(*sec, "timeout_seconds", cfg.metadata.timeout, err)) return false;
    }
    if (cfg.metadata.generator != "native" && cfg.metadata.generator != "external") {
        err = "unknown metadata generator '" + cfg.metadata.generator + "'";
        return false;
    }
    if (cfg.metadata.generator == "external" && cfg.metadata.command.empty()) {
        err = "metadata.command is required for the external generator";
        return false;
    }

    if (!GetSection(j, "cdn", sec, err)) return false;
    if (sec && !GetStringArray(*sec, "invalidate_command", cfg.cdn_invalidate_command, err)) return false;

    if (!GetBool(j, "strict_headers", cfg.strict_headers, err)) return false;
    if (!GetDuration(j, "deadline_seconds", cfg.deadline, err)) return false;

    std::string level;
    if (!GetString(j, "log_level", level, err)) return false;
    if (!level.empty()) {
        cfg.log_level = ParseLogLevel(level);
        if (!cfg.log_level) {
            err = "unknown log_level '" + level + "'";
            return false;
        }
    }
    return true;
}

} // namespace pkgrepo::config::detail
