#include "metadata/metadata_builder.hpp"

#include "crypto/sha256.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cctype>
#include <set>

namespace pkgrepo {

namespace {

bool IsSafeComponentPart(std::string_view s, bool allow_empty) {
    if (s.empty()) return allow_empty;
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '_' || c == '-' || c == '.')) return false;
    }
    return s.front() != '.';
}

Result BuildFailed(const std::string& prefix, const std::string& msg) {
    return Result::Fail(ErrorCode::MetadataBuildFailed, prefix + ": " + msg);
}

} // namespace

MetadataBuilder::MetadataBuilder(std::shared_ptr<IMetadataGenerator> generator, std::shared_ptr<const IClock> clock)
    : generator_(std::move(generator)), clock_(clock ? std::move(clock) : SystemClock()) {}

RepositoryIndex MetadataBuilder::ApplyDelta(const RepositoryIndex& current,
                                            const std::vector<IndexEntry>& added,
                                            const std::vector<std::string>& removed) {
    RepositoryIndex next = current;
    for (const auto& e : added) next.packages[e.descriptor.content_hash] = e;
    for (const auto& h : removed) next.packages.erase(h);
    next.metadata_version = current.metadata_version + 1;
    return next;
}

Result MetadataBuilder::Build(const RepositoryIndex& current,
                              const std::vector<IndexEntry>& added,
                              const std::vector<std::string>& removed,
                              MetadataBuildOutput& out) const {
    if (current.format == PackageFormat::Unknown)
        return BuildFailed(current.prefix, "repository format is unknown");
    for (const auto& e : added) {
        if (e.descriptor.format != current.format)
            return BuildFailed(current.prefix, "package " + e.filename + " is " +
                                                   std::string(ToString(e.descriptor.format)) +
                                                   ", repository is " + std::string(ToString(current.format)));
    }

    out = MetadataBuildOutput{};
    out.index = ApplyDelta(current, added, removed);

    std::vector<GeneratedComponent> generated;
    auto r = generator_->Generate(out.index, generated);
    if (!r.is_ok()) {
        if (r.err == ErrorCode::MetadataBuildFailed) return r;
        return Result::Fail(ErrorCode::MetadataBuildFailed, current.prefix + ": " + r.msg);
    }

    const std::string dir = MetadataDirKey(current.prefix);
    std::set<std::string> seen_types;
    for (auto& g : generated) {
        if (!IsSafeComponentPart(g.type, false) || !IsSafeComponentPart(g.extension, true))
            return BuildFailed(current.prefix, "invalid component name '" + g.type + "." + g.extension + "'");
        if (g.type == "manifest" || !seen_types.insert(g.type).second)
            return BuildFailed(current.prefix, "duplicate or reserved component type '" + g.type + "'");

        StagedComponent sc;
        sc.component.type = g.type;
        sc.component.sha256 = Sha256Hex(g.data);
        sc.component.size = g.data.size();
        std::string name = g.type + "-" + sc.component.sha256;
        if (!g.extension.empty()) name += "." + g.extension;
        sc.component.key = JoinKey(dir, name);
        sc.data = std::move(g.data);
        out.components.push_back(std::move(sc));
    }

    out.manifest.format = out.index.format;
    out.manifest.metadata_version = out.index.metadata_version;
    out.manifest.package_count = out.index.packages.size();
    out.manifest.updated_at = FormatIso8601(clock_->Now());
    for (const auto& sc : out.components) out.manifest.components.push_back(sc.component);

    r = Validate(out.index, out);
    if (!r.is_ok()) return r;

    LogInfo("built metadata v%llu for %s: %zu packages, %zu components (%s)",
            static_cast<unsigned long long>(out.manifest.metadata_version), current.prefix.c_str(),
            out.index.packages.size(), out.components.size(), generator_->Describe().c_str());
    return Result::Ok();
}

Result MetadataBuilder::Validate(const RepositoryIndex& expected, const MetadataBuildOutput& out) const {
    const std::string dir = MetadataDirKey(expected.prefix) + "/";
    const StagedComponent* primary = nullptr;
    for (const auto& sc : out.components) {
        if (!StartsWith(sc.component.key, dir))
            return BuildFailed(expected.prefix, "component outside metadata path: " + sc.component.key);
        if (Sha256Hex(sc.data) != sc.component.sha256)
            return BuildFailed(expected.prefix, "digest mismatch for " + sc.component.key);
        if (sc.component.type == kPrimaryComponent) primary = &sc;
    }
    if (!primary) return BuildFailed(expected.prefix, "generator produced no primary index");

    Bytes raw;
    auto r = GzipDecompress(primary->data, raw);
    if (!r.is_ok()) return BuildFailed(expected.prefix, "primary index unreadable: " + r.msg);
    auto decoded = DecodeIndexJson(AsStringView(raw));
    if (!decoded) return BuildFailed(expected.prefix, "primary index invalid: " + decoded.error());

    if (decoded->packages.size() != expected.packages.size())
        return BuildFailed(expected.prefix, "primary index lists " + std::to_string(decoded->packages.size()) +
                                                " packages, expected " + std::to_string(expected.packages.size()));
    for (const auto& [hash, entry] : expected.packages) {
        if (!decoded->Find(hash)) return BuildFailed(expected.prefix, "primary index is missing " + hash);
    }
    return Result::Ok();
}

} // namespace pkgrepo
