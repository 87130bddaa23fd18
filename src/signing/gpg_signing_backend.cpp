#include "signing/gpg_signing_backend.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>

namespace pkgrepo {

namespace {

// rpm names imported keys gpg-pubkey-<last 8 hex digits of the fingerprint>.
std::string RpmPubkeyPackage(const std::string& fingerprint) {
    std::string id = fingerprint.size() > 8 ? fingerprint.substr(fingerprint.size() - 8) : fingerprint;
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) { return std::tolower(c); });
    return "gpg-pubkey-" + id;
}

} // namespace

GpgSigningBackend::GpgSigningBackend(GpgOptions opt) : opt_(std::move(opt)) {}

std::string GpgSigningBackend::Describe() const {
    return "gpg (" + opt_.gpg_executable + ", key " + opt_.key_path + ")";
}

bool GpgSigningBackend::SupportsPackageSigning(PackageFormat format) const {
    return format == PackageFormat::Rpm;
}

ProcessSpec GpgSigningBackend::RpmSpec(std::vector<std::string> args, bool privileged) const {
    ProcessSpec spec;
    if (privileged) spec.argv = opt_.privileged_command;
    spec.argv.push_back(opt_.rpm_executable);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = opt_.timeout;
    return spec;
}

Result GpgSigningBackend::SignPackageFile(const std::string& path, PackageFormat format) {
    if (!SupportsPackageSigning(format))
        return Result::Fail(ErrorCode::SigningFailed,
                            std::string(ToString(format)) + " packages are not signed individually");

    KeyringSession session;
    auto r = KeyringSession::Open(opt_, session);
    if (!r.is_ok()) return r;

    ProcessSpec spec = RpmSpec({"--addsign",
                                "--define", "_gpg_path " + session.Home(),
                                "--define", "_gpg_name " + session.Key().fingerprint,
                                "--define", "__gpg " + opt_.gpg_executable,
                                path},
                               false);
    spec.env = {{"GNUPGHOME", session.Home()}};
    ProcessOutput po;
    r = RunProcessChecked(spec, po, ErrorCode::SigningFailed);
    if (r.err == ErrorCode::Timeout) return Result::Fail(ErrorCode::SigningFailed, r.msg);
    return r;
}

Result GpgSigningBackend::VerifyPackageFile(const std::string& path, PackageFormat format, bool& valid) {
    valid = false;
    if (!SupportsPackageSigning(format)) {
        valid = true;
        return Result::Ok();
    }
    if (!opt_.verify_uses_system_keyring)
        return Result::Fail(ErrorCode::InvalidConfig,
                            "RPM signature verification imports the key into the system rpm keyring; "
                            "enable signing.verify_uses_system_keyring to allow it");

    KeyringSession session;
    auto r = KeyringSession::Open(opt_, session);
    if (!r.is_ok()) return r;

    ProcessOutput po;
    r = RunProcessChecked(RpmSpec({"--import", session.PublicKeyPath()}, true), po, ErrorCode::VerificationFailed);
    if (!r.is_ok()) return Result::Wrap(r, "import key into rpm keyring");

    ProcessOutput check;
    auto cr = RunProcess(RpmSpec({"--checksig", path}, false), check);

    // The key is removed from the system keyring whatever the check said.
    ProcessOutput erase;
    auto er = RunProcessChecked(RpmSpec({"-e", "--allmatches", RpmPubkeyPackage(session.Key().fingerprint)}, true),
                                erase, ErrorCode::VerificationFailed);
    if (!er.is_ok()) LogWarn("cannot remove signing key from rpm keyring: %s", er.msg.c_str());

    if (!cr.is_ok()) return Result::Fail(ErrorCode::VerificationFailed, "rpm --checksig: " + cr.msg);
    valid = check.exit_code == 0 && check.out.find("NOT OK") == std::string::npos &&
            check.out.find("signatures") != std::string::npos;
    return Result::Ok();
}

Result GpgSigningBackend::SignDetached(std::string_view data, ManifestSignature& out) {
    KeyringSession session;
    auto r = KeyringSession::Open(opt_, session);
    if (!r.is_ok()) return r;

    const std::string data_path = session.Home() + "/payload";
    const std::string sig_path = data_path + ".asc";
    r = WriteFileBytes(data_path, ToBytes(data));
    if (!r.is_ok()) return r;

    ProcessOutput po;
    r = session.RunGpg({"--local-user", session.Key().fingerprint, "--armor", "--detach-sign",
                        "--output", sig_path, data_path},
                       po);
    if (!r.is_ok()) return r;

    Bytes sig;
    r = ReadFileBytes(sig_path, sig);
    if (!r.is_ok()) return Result::Fail(ErrorCode::SigningFailed, "gpg produced no signature: " + r.msg);

    out.key_id = session.Key().fingerprint;
    out.data.assign(sig.begin(), sig.end());
    return Result::Ok();
}

Result GpgSigningBackend::VerifyDetached(std::string_view data, const ManifestSignature& sig, bool& valid) {
    valid = false;
    KeyringSession session;
    auto r = KeyringSession::Open(opt_, session);
    if (!r.is_ok()) return r;

    const std::string data_path = session.Home() + "/payload";
    const std::string sig_path = data_path + ".asc";
    r = WriteFileBytes(data_path, ToBytes(data));
    if (r.is_ok()) r = WriteFileBytes(sig_path, ToBytes(sig.data));
    if (!r.is_ok()) return r;

    ProcessOutput po;
    r = RunProcess(session.GpgSpec({"--verify", sig_path, data_path}), po);
    if (!r.is_ok()) return Result::Fail(ErrorCode::VerificationFailed, "gpg --verify: " + r.msg);
    // gpg exits 1 for a bad signature, 2 for everything else.
    if (po.exit_code != 0 && po.exit_code != 1)
        return Result::Fail(ErrorCode::VerificationFailed, "gpg --verify exited " + std::to_string(po.exit_code) +
                                                              ": " + po.err);
    valid = po.exit_code == 0;
    return Result::Ok();
}

} // namespace pkgrepo
