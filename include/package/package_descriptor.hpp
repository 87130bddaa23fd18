#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pkgrepo {

enum class PackageFormat {
    Unknown,
    Rpm,
    Deb,
};

std::string_view ToString(PackageFormat format);
std::optional<PackageFormat> ParsePackageFormat(std::string_view name);
// ".rpm", ".deb"
std::string_view FileExtension(PackageFormat format);

// Identity of one package artifact. content_hash is the SHA-256 of the
// submitted bytes and is what makes re-adding identical content a no-op.
struct PackageDescriptor {
    std::string name;
    std::string epoch;
    std::string version;
    std::string release;
    std::string architecture;
    std::string os_tag;
    PackageFormat format = PackageFormat::Unknown;
    std::string content_hash;

    // name-[epoch:]version-release.arch
    std::string Nevra() const;
    // Routing variable derived from os_tag ("el8" -> "8", "fc39" -> "39").
    std::string ReleaseVersion() const;

    bool operator==(const PackageDescriptor&) const = default;
};

// Same logical package (name/epoch/version/release/arch), possibly different bytes.
bool SamePackageIdentity(const PackageDescriptor& a, const PackageDescriptor& b);

} // namespace pkgrepo
