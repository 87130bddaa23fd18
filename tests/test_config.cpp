#include "util/config.hpp"
#include "io/file_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace pkgrepo::config {
namespace {

constexpr const char* kMinimal = R"({
  "storage": {"type": "memory"},
  "routing": [{"target_prefix": "/default"}]
})";

TEST(ConfigTest, MinimalConfigKeepsDefaults) {
    EngineConfig cfg;
    ASSERT_TRUE(ParseEngineConfig(kMinimal, cfg).ok);
    EXPECT_EQ(cfg.storage.type, "memory");
    ASSERT_EQ(cfg.routing.size(), 1u);
    EXPECT_EQ(cfg.routing[0].target_prefix, "/default");
    EXPECT_EQ(cfg.routing[0].match.arch, "*");
    EXPECT_EQ(cfg.lock.lease_duration, std::chrono::seconds(300));
    EXPECT_EQ(cfg.storage_retry.max_attempts, 3);
    EXPECT_FALSE(cfg.signing.enabled);
    EXPECT_EQ(cfg.metadata.generator, "native");
    EXPECT_FALSE(cfg.strict_headers);
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_EQ(cfg.deadline.count(), 0);
}

TEST(ConfigTest, FullConfig) {
    constexpr const char* text = R"({
      "storage": {"type": "filesystem", "root": "/srv/repo"},
      "storage_retry": {"max_attempts": 5, "backoff_ms": 50},
      "routing": [
        {"match": {"arch": "aarch64", "format": "rpm"}, "target_prefix": "/el9/$basearch"},
        {"target_prefix": "/el9/$arch"}
      ],
      "lock": {"lease_seconds": 60, "max_attempts": 4, "backoff_initial_ms": 10, "backoff_max_ms": 80},
      "signing": {"enabled": true, "key_path": "/etc/keys/repo.asc", "verify": true,
                  "verify_uses_system_keyring": true, "privileged_command": ["sudo", "-n"],
                  "timeout_seconds": 30},
      "metadata": {"generator": "external", "command": ["createrepo_c", "{input}"], "timeout_seconds": 90},
      "cdn": {"invalidate_command": ["purge", "{prefix}"]},
      "strict_headers": true,
      "deadline_seconds": 900,
      "log_level": "warning"
    })";

    EngineConfig cfg;
    auto r = ParseEngineConfig(text, cfg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.storage.root, "/srv/repo");
    EXPECT_EQ(cfg.storage_retry.max_attempts, 5);
    EXPECT_EQ(cfg.storage_retry.initial_backoff, std::chrono::milliseconds(50));
    ASSERT_EQ(cfg.routing.size(), 2u);
    EXPECT_EQ(cfg.routing[0].match.arch, "aarch64");
    EXPECT_EQ(cfg.routing[0].match.format, "rpm");
    EXPECT_EQ(cfg.routing[0].match.os_tag, "*");
    EXPECT_EQ(cfg.lock.lease_duration, std::chrono::seconds(60));
    EXPECT_EQ(cfg.lock.max_attempts, 4);
    EXPECT_EQ(cfg.lock.backoff_max, std::chrono::milliseconds(80));
    EXPECT_TRUE(cfg.signing.enabled);
    EXPECT_EQ(cfg.signing.privileged_command, (std::vector<std::string>{"sudo", "-n"}));
    EXPECT_EQ(cfg.signing.timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.metadata.command.size(), 2u);
    EXPECT_EQ(cfg.cdn_invalidate_command.front(), "purge");
    EXPECT_TRUE(cfg.strict_headers);
    EXPECT_EQ(cfg.deadline, std::chrono::seconds(900));
    EXPECT_EQ(cfg.log_level, LogLevel::Warn);
}

struct BadConfig {
    const char* name;
    const char* text;
    const char* message;
};

class ConfigRejectTest : public ::testing::TestWithParam<BadConfig> {};

TEST_P(ConfigRejectTest, RejectsWithInvalidConfig) {
    EngineConfig cfg;
    auto r = ParseEngineConfig(GetParam().text, cfg);
    EXPECT_EQ(r.err, ErrorCode::InvalidConfig);
    EXPECT_NE(r.msg.find(GetParam().message), std::string::npos) << r.msg;
}

INSTANTIATE_TEST_SUITE_P(
    Config,
    ConfigRejectTest,
    ::testing::Values(
        BadConfig{"NotJson", "{", "invalid JSON"},
        BadConfig{"NotObject", "[]", "root must be JSON object"},
        BadConfig{"NoRouting", R"({"storage": {"type": "memory"}})", "'routing' must be a non-empty array"},
        BadConfig{"EmptyTarget", R"({"storage": {"type": "memory"}, "routing": [{"match": {}}]})",
                  "without target_prefix"},
        BadConfig{"FilesystemWithoutRoot", R"({"routing": [{"target_prefix": "a"}]})", "storage.root is required"},
        BadConfig{"UnknownStorage", R"({"storage": {"type": "s4"}, "routing": [{"target_prefix": "a"}]})",
                  "unknown storage type"},
        BadConfig{"WrongType", R"({"storage": {"type": 7}, "routing": [{"target_prefix": "a"}]})",
                  "'type' must be a string"},
        BadConfig{"ZeroLease",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}], "lock": {"lease_seconds": 0}})",
                  "must be positive"},
        BadConfig{"NegativeAttempts",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}], "lock": {"max_attempts": -1}})",
                  "non-negative integer"},
        BadConfig{"SigningWithoutKey",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}], "signing": {"enabled": true}})",
                  "key_path is required"},
        BadConfig{"VerifyWithoutKeyringOptIn",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}],
                      "signing": {"enabled": true, "key_path": "k", "verify": true}})",
                  "verify_uses_system_keyring"},
        BadConfig{"ExternalWithoutCommand",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}],
                      "metadata": {"generator": "external"}})",
                  "metadata.command is required"},
        BadConfig{"UnknownLogLevel",
                  R"({"storage": {"type": "memory"}, "routing": [{"target_prefix": "a"}], "log_level": "loud"})",
                  "unknown log_level"}),
    [](const ::testing::TestParamInfo<BadConfig>& info) { return std::string(info.param.name); });

TEST(ConfigTest, LoadFromFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/engine.json";
    ASSERT_TRUE(WriteFileBytes(path, ToBytes(kMinimal)).ok);

    EngineConfig cfg;
    ASSERT_TRUE(LoadEngineConfig(path, cfg).ok);
    EXPECT_EQ(cfg.routing.size(), 1u);

    auto r = LoadEngineConfig(tmp.Path() + "/missing.json", cfg);
    EXPECT_EQ(r.err, ErrorCode::InvalidConfig);
    EXPECT_NE(r.msg.find("cannot open"), std::string::npos);
}

} // namespace
} // namespace pkgrepo::config
