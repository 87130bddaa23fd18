#pragma once

#include "metadata/repository_index.hpp"
#include "package/package_descriptor.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace pkgrepo {

// External signing capability. Verification methods fail only when the
// check could not run; a bad signature is reported through valid=false.
class ISigningBackend {
public:
    virtual ~ISigningBackend() = default;

    virtual bool SupportsPackageSigning(PackageFormat format) const = 0;
    // Rewrites the file at path with the embedded signature.
    virtual Result SignPackageFile(const std::string& path, PackageFormat format) = 0;
    virtual Result VerifyPackageFile(const std::string& path, PackageFormat format, bool& valid) = 0;

    virtual Result SignDetached(std::string_view data, ManifestSignature& out) = 0;
    virtual Result VerifyDetached(std::string_view data, const ManifestSignature& sig, bool& valid) = 0;

    virtual std::string Describe() const = 0;
};

} // namespace pkgrepo
