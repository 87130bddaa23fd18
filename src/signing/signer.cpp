#include "signing/signer.hpp"

#include "io/file_reader.hpp"
#include "io/temp_file.hpp"
#include "util/logger.hpp"

namespace pkgrepo {

Signer::Signer(std::shared_ptr<ISigningBackend> backend, SignerOptions opt)
    : backend_(std::move(backend)), opt_(opt) {}

Result Signer::SignPackage(PackageFormat format, const std::string& filename, Bytes& bytes, bool& out_signed) const {
    out_signed = false;
    if (!backend_ || !opt_.sign_packages || !backend_->SupportsPackageSigning(format)) return Result::Ok();

    TempFile tmp;
    auto r = TempFile::Create(tmp, std::string(FileExtension(format)));
    if (!r.is_ok()) return r;
    tmp.Close();
    r = WriteFileBytes(tmp.Path(), bytes);
    if (!r.is_ok()) return r;

    r = backend_->SignPackageFile(tmp.Path(), format);
    if (!r.is_ok()) {
        if (r.err == ErrorCode::SigningFailed) return Result::Wrap(r, "sign " + filename);
        return Result::Fail(ErrorCode::SigningFailed, "sign " + filename + ": " + r.msg);
    }

    if (opt_.verify) {
        bool valid = false;
        r = backend_->VerifyPackageFile(tmp.Path(), format, valid);
        if (!r.is_ok()) return Result::Wrap(r, "verify " + filename);
        if (!valid) return Result::Fail(ErrorCode::VerificationFailed, "signature of " + filename + " does not verify");
    }

    Bytes signed_bytes;
    r = ReadFileBytes(tmp.Path(), signed_bytes);
    if (!r.is_ok()) return r;
    bytes = std::move(signed_bytes);
    out_signed = true;
    LogDebug("signed %s (%zu bytes)", filename.c_str(), bytes.size());
    return Result::Ok();
}

Result Signer::SignManifest(RepositoryManifest& manifest) const {
    manifest.signature.reset();
    if (!backend_) return Result::Ok();

    const std::string payload = EncodeManifestPayload(manifest);
    ManifestSignature sig;
    auto r = backend_->SignDetached(payload, sig);
    if (!r.is_ok()) {
        if (r.err == ErrorCode::SigningFailed) return Result::Wrap(r, "sign manifest");
        return Result::Fail(ErrorCode::SigningFailed, "sign manifest: " + r.msg);
    }
    manifest.signature = std::move(sig);

    if (opt_.verify) {
        r = VerifyManifest(manifest);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result Signer::VerifyManifest(const RepositoryManifest& manifest) const {
    if (!backend_) return Result::Fail(ErrorCode::InvalidConfig, "no signing backend configured");
    if (!manifest.signature) return Result::Fail(ErrorCode::VerificationFailed, "manifest is not signed");

    bool valid = false;
    auto r = backend_->VerifyDetached(EncodeManifestPayload(manifest), *manifest.signature, valid);
    if (!r.is_ok()) return Result::Wrap(r, "verify manifest");
    if (!valid) return Result::Fail(ErrorCode::VerificationFailed, "manifest signature does not verify");
    return Result::Ok();
}

} // namespace pkgrepo
