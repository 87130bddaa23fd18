#include "signing/keyring_session.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <sys/stat.h>

namespace pkgrepo {

namespace {

std::mutex& KeyringMutex() {
    static std::mutex m;
    return m;
}

std::vector<std::string_view> SplitColons(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const auto pos = line.find(':', start);
        fields.push_back(line.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return fields;
}

} // namespace

bool ParseGpgColonListing(std::string_view text, GpgKeyInfo& out) {
    out = GpgKeyInfo{};
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        start = end + 1;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        const auto f = SplitColons(line);
        if (f.size() < 10) continue;
        if (f[0] == "fpr" && out.fingerprint.empty()) out.fingerprint = std::string(f[9]);
        if (f[0] == "uid" && out.user_id.empty()) out.user_id = std::string(f[9]);
        if (!out.fingerprint.empty() && !out.user_id.empty()) return true;
    }
    return !out.fingerprint.empty();
}

Result KeyringSession::Open(const GpgOptions& opt, KeyringSession& out) {
    if (opt.key_path.empty())
        return Result::Fail(ErrorCode::InvalidConfig, "signing key path is not set");

    KeyringSession s;
    s.lock_ = std::unique_lock<std::mutex>(KeyringMutex());
    s.opt_ = opt;

    auto r = TempDirectory::Create("pkgrepo-gnupg-", s.home_);
    if (!r.is_ok()) return r;
    if (::chmod(s.home_.Path().c_str(), 0700) != 0)
        return Result::Fail(ErrorCode::SigningFailed, "cannot restrict permissions of " + s.home_.Path());

    std::string gpg_conf = "batch\nno-tty\npinentry-mode loopback\n";
    if (!opt.passphrase.empty()) {
        const std::string pass_path = s.home_.Path() + "/passphrase";
        r = WriteFileBytes(pass_path, ToBytes(opt.passphrase));
        if (!r.is_ok()) return r;
        gpg_conf += "passphrase-file " + pass_path + "\n";
    }
    r = WriteFileBytes(s.home_.Path() + "/gpg.conf", ToBytes(gpg_conf));
    if (!r.is_ok()) return r;
    r = WriteFileBytes(s.home_.Path() + "/gpg-agent.conf", ToBytes("allow-loopback-pinentry\n"));
    if (!r.is_ok()) return r;

    ProcessOutput po;
    r = s.RunGpg({"--import", opt.key_path}, po);
    if (!r.is_ok()) return Result::Wrap(r, "import signing key");

    r = s.RunGpg({"--with-colons", "--list-secret-keys"}, po);
    if (!r.is_ok()) return Result::Wrap(r, "list signing key");
    if (!ParseGpgColonListing(po.out, s.key_))
        return Result::Fail(ErrorCode::SigningFailed, opt.key_path + " does not contain a secret key");

    r = s.RunGpg({"--armor", "--export", s.key_.fingerprint}, po);
    if (!r.is_ok()) return Result::Wrap(r, "export public key");
    s.public_key_path_ = s.home_.Path() + "/public.asc";
    r = WriteFileBytes(s.public_key_path_, ToBytes(po.out));
    if (!r.is_ok()) return r;

    LogDebug("keyring session %s: key %s (%s)", s.home_.Path().c_str(),
             s.key_.fingerprint.c_str(), s.key_.user_id.c_str());
    out = std::move(s);
    return Result::Ok();
}

KeyringSession::~KeyringSession() {
    if (home_.Path().empty()) return;
    ProcessSpec spec;
    spec.argv = {opt_.gpgconf_executable, "--homedir", home_.Path(), "--kill", "gpg-agent"};
    spec.timeout = std::chrono::seconds(10);
    ProcessOutput po;
    auto r = RunProcess(spec, po);
    if (!r.is_ok() || po.exit_code != 0)
        LogDebug("gpg-agent shutdown for %s: %s", home_.Path().c_str(), r.is_ok() ? po.err.c_str() : r.msg.c_str());
}

ProcessSpec KeyringSession::GpgSpec(const std::vector<std::string>& args) const {
    ProcessSpec spec;
    spec.argv = {opt_.gpg_executable, "--homedir", home_.Path()};
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.env = {{"GNUPGHOME", home_.Path()}};
    spec.timeout = opt_.timeout;
    return spec;
}

Result KeyringSession::RunGpg(const std::vector<std::string>& args, ProcessOutput& out) const {
    auto r = RunProcessChecked(GpgSpec(args), out, ErrorCode::SigningFailed);
    if (r.err == ErrorCode::Timeout) return Result::Fail(ErrorCode::SigningFailed, r.msg);
    return r;
}

} // namespace pkgrepo
