#include "package/descriptor_extractor.hpp"

#include "crypto/sha256.hpp"
#include "package/deb_control.hpp"
#include "package/rpm_header.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pkgrepo {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool AllDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// "1.el8" -> "el8"
std::string RpmDistTag(std::string_view release) {
    const auto dot = release.find('.');
    return dot == std::string_view::npos ? std::string{} : std::string(release.substr(dot + 1));
}

// "1.0-1~bullseye" -> "bullseye", "11.1+deb11u3" -> "deb11"
std::string DebOsTag(std::string_view version) {
    if (const auto tilde = version.rfind('~'); tilde != std::string_view::npos)
        return std::string(version.substr(tilde + 1));
    if (const auto deb = version.find("+deb"); deb != std::string_view::npos) {
        size_t end = deb + 4;
        while (end < version.size() && std::isdigit(static_cast<unsigned char>(version[end]))) ++end;
        return std::string(version.substr(deb + 1, end - deb - 1));
    }
    return {};
}

void SplitDebEpoch(std::string_view full, std::string& epoch, std::string& version) {
    const auto colon = full.find(':');
    if (colon != std::string_view::npos && AllDigits(full.substr(0, colon))) {
        epoch = std::string(full.substr(0, colon));
        version = std::string(full.substr(colon + 1));
    } else {
        epoch.clear();
        version = std::string(full);
    }
}

class RpmFormatStrategy final : public DescriptorExtractor::IFormatStrategy {
public:
    PackageFormat Format() const override { return PackageFormat::Rpm; }

    bool HasMagic(std::span<const std::uint8_t> bytes) const override {
        return HasRpmLeadMagic(bytes);
    }

    // name-[epoch:]version-release.arch.rpm
    Result ParseFilename(std::string_view filename, PackageDescriptor& out) const override {
        std::string base(KeyBaseName(filename));
        if (!EndsWith(ToLower(base), ".rpm"))
            return Fail(filename);
        base.resize(base.size() - 4);

        const auto arch_dot = base.rfind('.');
        if (arch_dot == std::string::npos) return Fail(filename);
        std::string arch = base.substr(arch_dot + 1);
        base.resize(arch_dot);

        const auto rel_dash = base.rfind('-');
        if (rel_dash == std::string::npos) return Fail(filename);
        std::string release = base.substr(rel_dash + 1);
        base.resize(rel_dash);

        const auto ver_dash = base.rfind('-');
        if (ver_dash == std::string::npos) return Fail(filename);
        std::string version = base.substr(ver_dash + 1);
        std::string name = base.substr(0, ver_dash);

        std::string epoch;
        if (const auto colon = version.find(':'); colon != std::string::npos) {
            if (!AllDigits(std::string_view(version).substr(0, colon))) return Fail(filename);
            epoch = version.substr(0, colon);
            version.erase(0, colon + 1);
        }

        if (name.empty() || version.empty() || release.empty() || arch.empty())
            return Fail(filename);

        out = PackageDescriptor{};
        out.format = PackageFormat::Rpm;
        out.name = std::move(name);
        out.epoch = std::move(epoch);
        out.version = std::move(version);
        out.os_tag = RpmDistTag(release);
        out.release = std::move(release);
        out.architecture = std::move(arch);
        return Result::Ok();
    }

    Result ReadHeader(std::span<const std::uint8_t> bytes, PackageDescriptor& out) const override {
        RpmHeaderInfo info;
        auto r = ReadRpmHeader(bytes, info);
        if (!r.is_ok()) return r;

        out = PackageDescriptor{};
        out.format = PackageFormat::Rpm;
        out.name = info.name;
        out.epoch = info.epoch;
        out.version = info.version;
        out.release = info.release;
        out.architecture = info.source_package ? "src" : info.arch;
        out.os_tag = RpmDistTag(info.release);
        return Result::Ok();
    }

private:
    static Result Fail(std::string_view filename) {
        return Result::Fail(ErrorCode::MalformedPackage,
                            "Unable to parse the \"" + std::string(filename) +
                                "\" package name; expected <name>-<version>-<release>.<arch>.rpm");
    }
};

class DebFormatStrategy final : public DescriptorExtractor::IFormatStrategy {
public:
    PackageFormat Format() const override { return PackageFormat::Deb; }

    bool HasMagic(std::span<const std::uint8_t> bytes) const override {
        return HasDebMagic(bytes);
    }

    // name_version_arch.deb
    Result ParseFilename(std::string_view filename, PackageDescriptor& out) const override {
        std::string base(KeyBaseName(filename));
        if (!EndsWith(ToLower(base), ".deb"))
            return Fail(filename);
        base.resize(base.size() - 4);

        const auto first = base.find('_');
        const auto last = base.rfind('_');
        if (first == std::string::npos || first == last) return Fail(filename);

        std::string name = base.substr(0, first);
        std::string full_version = base.substr(first + 1, last - first - 1);
        std::string arch = base.substr(last + 1);
        // dpkg-name encodes the epoch colon as "%3a"
        if (const auto enc = full_version.find("%3a"); enc != std::string::npos)
            full_version.replace(enc, 3, ":");

        if (name.empty() || full_version.empty() || arch.empty())
            return Fail(filename);

        out = PackageDescriptor{};
        out.format = PackageFormat::Deb;
        out.name = std::move(name);
        SplitDebEpoch(full_version, out.epoch, out.version);
        out.architecture = std::move(arch);
        out.os_tag = DebOsTag(out.version);
        return Result::Ok();
    }

    Result ReadHeader(std::span<const std::uint8_t> bytes, PackageDescriptor& out) const override {
        DebControl control;
        auto r = ReadDebControl(bytes, control);
        if (!r.is_ok()) return r;

        out = PackageDescriptor{};
        out.format = PackageFormat::Deb;
        out.name = control.Get("Package");
        SplitDebEpoch(control.Get("Version"), out.epoch, out.version);
        out.architecture = control.Get("Architecture");
        out.os_tag = DebOsTag(out.version);
        return Result::Ok();
    }

private:
    static Result Fail(std::string_view filename) {
        return Result::Fail(ErrorCode::MalformedPackage,
                            "Unable to parse the \"" + std::string(filename) +
                                "\" package name; expected <name>_<version>_<arch>.deb");
    }
};

void CompareField(const char* field,
                  const std::string& from_name,
                  const std::string& from_header,
                  std::vector<std::string>& warnings) {
    if (from_name.empty() || from_header.empty() || from_name == from_header) return;
    warnings.push_back(std::string(ToString(ErrorCode::DescriptorMismatch)) + ": " + field +
                       " filename=" + from_name + " header=" + from_header);
}

} // namespace

std::vector<std::shared_ptr<const DescriptorExtractor::IFormatStrategy>> CreateDefaultFormatStrategies() {
    std::vector<std::shared_ptr<const DescriptorExtractor::IFormatStrategy>> out;
    out.push_back(std::make_shared<RpmFormatStrategy>());
    out.push_back(std::make_shared<DebFormatStrategy>());
    return out;
}

DescriptorExtractor::DescriptorExtractor() : DescriptorExtractor(Options{}) {}

DescriptorExtractor::DescriptorExtractor(Options opt)
    : opt_(opt), strategies_(CreateDefaultFormatStrategies()) {}

DescriptorExtractor::DescriptorExtractor(Options opt,
                                         std::vector<std::shared_ptr<const IFormatStrategy>> strategies)
    : opt_(opt), strategies_(std::move(strategies)) {}

const DescriptorExtractor::IFormatStrategy* DescriptorExtractor::SelectStrategy(
    std::string_view filename, std::span<const std::uint8_t> bytes) const {
    const std::string lower = ToLower(KeyBaseName(filename));
    for (const auto& s : strategies_) {
        if (EndsWith(lower, FileExtension(s->Format()))) return s.get();
    }
    for (const auto& s : strategies_) {
        if (s->HasMagic(bytes)) return s.get();
    }
    return nullptr;
}

Result DescriptorExtractor::ParseFilename(std::string_view filename, PackageDescriptor& out) const {
    const IFormatStrategy* strategy = SelectStrategy(filename, {});
    if (!strategy)
        return Result::Fail(ErrorCode::MalformedPackage,
                            "unrecognized package format: " + std::string(filename));
    return strategy->ParseFilename(filename, out);
}

Result DescriptorExtractor::Extract(std::string_view filename,
                                    std::span<const std::uint8_t> bytes,
                                    ExtractedPackage& out) const {
    out = ExtractedPackage{};
    out.filename = std::string(KeyBaseName(filename));

    const IFormatStrategy* strategy = SelectStrategy(filename, bytes);
    if (!strategy)
        return Result::Fail(ErrorCode::MalformedPackage,
                            "unrecognized package format: " + out.filename);

    PackageDescriptor from_name;
    const Result name_result = strategy->ParseFilename(out.filename, from_name);

    PackageDescriptor from_header;
    const Result header_result = bytes.empty()
        ? Result::Fail(ErrorCode::MalformedPackage, "empty package")
        : strategy->ReadHeader(bytes, from_header);

    if (header_result.is_ok()) {
        out.descriptor = from_header;
        if (name_result.is_ok()) {
            CompareField("name", from_name.name, from_header.name, out.warnings);
            CompareField("epoch", from_name.epoch, from_header.epoch, out.warnings);
            CompareField("version", from_name.version, from_header.version, out.warnings);
            CompareField("release", from_name.release, from_header.release, out.warnings);
            CompareField("architecture", from_name.architecture, from_header.architecture, out.warnings);
        }
    } else if (opt_.strict_headers) {
        return Result::Wrap(header_result, out.filename);
    } else if (name_result.is_ok()) {
        out.descriptor = from_name;
        out.warnings.push_back("package header unreadable (" + header_result.msg +
                               "), identity taken from filename");
    } else {
        return Result::Fail(ErrorCode::MalformedPackage,
                            name_result.msg + "; header: " + header_result.msg);
    }

    out.descriptor.content_hash = Sha256Hex(bytes);
    if (out.descriptor.content_hash.empty())
        return Result::Fail(ErrorCode::MalformedPackage, "sha256 failed: " + out.filename);
    return Result::Ok();
}

} // namespace pkgrepo
