#pragma once

#include "io/io.hpp"
#include "metadata/repository_index.hpp"
#include "signing/signing_backend.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace pkgrepo {

struct SignerOptions {
    bool sign_packages = true;
    // Verify every signature right after producing it.
    bool verify = false;
};

// Adapter between the orchestrator and a signing backend. Without a backend
// nothing is signed and manifests are published with a null signature.
class Signer {
public:
    Signer() = default;
    Signer(std::shared_ptr<ISigningBackend> backend, SignerOptions opt);

    bool Enabled() const { return backend_ != nullptr; }

    // Signs package bytes in place. out_signed is false when the format has
    // no per-package signature or package signing is off.
    Result SignPackage(PackageFormat format, const std::string& filename, Bytes& bytes, bool& out_signed) const;

    // Sets manifest.signature over EncodeManifestPayload(manifest).
    Result SignManifest(RepositoryManifest& manifest) const;
    // VerificationFailed when the manifest is unsigned or the signature is bad.
    Result VerifyManifest(const RepositoryManifest& manifest) const;

private:
    std::shared_ptr<ISigningBackend> backend_;
    SignerOptions opt_;
};

} // namespace pkgrepo
