#pragma once

#include "signing/keyring_session.hpp"
#include "signing/signing_backend.hpp"

namespace pkgrepo {

// gpg for detached signatures, rpm --addsign for RPM packages. Every call
// runs inside its own KeyringSession.
class GpgSigningBackend final : public ISigningBackend {
public:
    explicit GpgSigningBackend(GpgOptions opt);

    bool SupportsPackageSigning(PackageFormat format) const override;
    Result SignPackageFile(const std::string& path, PackageFormat format) override;
    Result VerifyPackageFile(const std::string& path, PackageFormat format, bool& valid) override;

    Result SignDetached(std::string_view data, ManifestSignature& out) override;
    Result VerifyDetached(std::string_view data, const ManifestSignature& sig, bool& valid) override;

    std::string Describe() const override;

private:
    ProcessSpec RpmSpec(std::vector<std::string> args, bool privileged) const;

    GpgOptions opt_;
};

} // namespace pkgrepo
