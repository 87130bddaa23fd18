#include "package/package_descriptor.hpp"

#include <cctype>

namespace pkgrepo {

std::string_view ToString(PackageFormat format) {
    switch (format) {
        case PackageFormat::Rpm: return "rpm";
        case PackageFormat::Deb: return "deb";
        default:                 return "unknown";
    }
}

std::optional<PackageFormat> ParsePackageFormat(std::string_view name) {
    if (name == "rpm") return PackageFormat::Rpm;
    if (name == "deb") return PackageFormat::Deb;
    return std::nullopt;
}

std::string_view FileExtension(PackageFormat format) {
    switch (format) {
        case PackageFormat::Rpm: return ".rpm";
        case PackageFormat::Deb: return ".deb";
        default:                 return ".bin";
    }
}

std::string PackageDescriptor::Nevra() const {
    std::string out = name + "-";
    if (!epoch.empty() && epoch != "0") out += epoch + ":";
    out += version;
    if (!release.empty()) out += "-" + release;
    out += "." + architecture;
    return out;
}

std::string PackageDescriptor::ReleaseVersion() const {
    size_t i = 0;
    while (i < os_tag.size() && std::isalpha(static_cast<unsigned char>(os_tag[i]))) ++i;
    return os_tag.substr(i);
}

bool SamePackageIdentity(const PackageDescriptor& a, const PackageDescriptor& b) {
    return a.format == b.format && a.name == b.name && a.epoch == b.epoch &&
           a.version == b.version && a.release == b.release &&
           a.architecture == b.architecture;
}

} // namespace pkgrepo
