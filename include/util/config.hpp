#pragma once

#include "lock/lock_manager.hpp"
#include "routing/repository_locator.hpp"
#include "storage/retrying_object_store.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgrepo::config {

struct StorageConfig {
    // "filesystem" or "memory"
    std::string type = "filesystem";
    std::string root;
};

struct SigningConfig {
    bool enabled = false;
    std::string key_path;
    // Environment variable holding the key passphrase.
    std::string passphrase_env = "PKGREPO_GPG_PASSPHRASE";
    bool sign_packages = true;
    bool verify = false;
    bool verify_uses_system_keyring = false;
    std::vector<std::string> privileged_command;
    std::string gpg_executable = "gpg";
    std::string rpm_executable = "rpm";
    std::chrono::seconds timeout{120};
};

struct MetadataConfig {
    // "native" or "external"
    std::string generator = "native";
    std::vector<std::string> command;
    std::chrono::seconds timeout{600};
};

struct EngineConfig {
    StorageConfig storage;
    RetryPolicy storage_retry;
    std::vector<RoutingRule> routing;
    LockOptions lock;
    SigningConfig signing;
    MetadataConfig metadata;
    std::vector<std::string> cdn_invalidate_command;
    bool strict_headers = false;
    std::optional<LogLevel> log_level;
    // 0 disables the deadline.
    std::chrono::seconds deadline{0};
};

Result LoadEngineConfig(const std::string& path, EngineConfig& out);
Result ParseEngineConfig(std::string_view json_text, EngineConfig& out);

} // namespace pkgrepo::config
