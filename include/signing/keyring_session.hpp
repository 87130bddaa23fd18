#pragma once

#include "io/temp_file.hpp"
#include "util/process.hpp"
#include "util/result.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pkgrepo {

struct GpgOptions {
    std::string gpg_executable = "gpg";
    std::string gpgconf_executable = "gpgconf";
    std::string rpm_executable = "rpm";
    // Armored or binary secret key to import.
    std::string key_path;
    std::string passphrase;
    // Prepended to rpm commands that modify the system keyring (e.g. {"sudo", "-n"}).
    std::vector<std::string> privileged_command;
    bool verify_uses_system_keyring = false;
    std::chrono::seconds timeout{120};
};

struct GpgKeyInfo {
    std::string fingerprint;
    std::string user_id;
};

// Extracts the first fpr and uid records from `gpg --with-colons` output.
bool ParseGpgColonListing(std::string_view text, GpgKeyInfo& out);

// Ephemeral GNUPGHOME holding the imported signing key. Only one session
// exists per process at a time; the home directory and its agent are torn
// down on destruction.
class KeyringSession {
public:
    static Result Open(const GpgOptions& opt, KeyringSession& out);

    KeyringSession() = default;
    KeyringSession(const KeyringSession&) = delete;
    KeyringSession& operator=(const KeyringSession&) = delete;
    KeyringSession(KeyringSession&&) noexcept = default;
    KeyringSession& operator=(KeyringSession&&) noexcept = default;
    ~KeyringSession();

    const std::string& Home() const { return home_.Path(); }
    const GpgKeyInfo& Key() const { return key_; }
    const std::string& PublicKeyPath() const { return public_key_path_; }

    // gpg --homedir <home> args...; non-zero exit fails with SigningFailed.
    Result RunGpg(const std::vector<std::string>& args, ProcessOutput& out) const;
    ProcessSpec GpgSpec(const std::vector<std::string>& args) const;

private:
    std::unique_lock<std::mutex> lock_;
    TempDirectory home_;
    GpgOptions opt_;
    GpgKeyInfo key_;
    std::string public_key_path_;
};

} // namespace pkgrepo
