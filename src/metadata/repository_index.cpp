#include "metadata/repository_index.hpp"

#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

namespace pkgrepo {

using json = nlohmann::json;

namespace {

json EntryToJson(const IndexEntry& e) {
    const auto& d = e.descriptor;
    return json{
        {"name", d.name},
        {"epoch", d.epoch},
        {"version", d.version},
        {"release", d.release},
        {"arch", d.architecture},
        {"os_tag", d.os_tag},
        {"format", std::string(ToString(d.format))},
        {"content_hash", d.content_hash},
        {"filename", e.filename},
        {"object_key", e.object_key},
        {"size", e.size},
        {"object_sha256", e.object_sha256},
        {"signed", e.is_signed},
    };
}

std::expected<IndexEntry, std::string> EntryFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("package entry must be an object");

    IndexEntry e;
    auto& d = e.descriptor;
    d.name = j.value("name", "");
    d.epoch = j.value("epoch", "");
    d.version = j.value("version", "");
    d.release = j.value("release", "");
    d.architecture = j.value("arch", "");
    d.os_tag = j.value("os_tag", "");
    d.content_hash = j.value("content_hash", "");
    auto fmt = ParsePackageFormat(j.value("format", ""));
    if (!fmt) return std::unexpected("package entry has unknown format");
    d.format = *fmt;
    e.filename = j.value("filename", "");
    e.object_key = j.value("object_key", "");
    e.size = j.value("size", std::uint64_t{0});
    e.object_sha256 = j.value("object_sha256", "");
    e.is_signed = j.value("signed", false);

    if (d.name.empty() || d.content_hash.empty() || e.object_key.empty())
        return std::unexpected("package entry missing name, content_hash or object_key");
    return e;
}

json PayloadToJson(const RepositoryManifest& m) {
    json comps = json::array();
    for (const auto& c : m.components) {
        comps.push_back(json{{"type", c.type}, {"key", c.key}, {"sha256", c.sha256}, {"size", c.size}});
    }
    return json{
        {"format", std::string(ToString(m.format))},
        {"metadata_version", m.metadata_version},
        {"package_count", m.package_count},
        {"updated_at", m.updated_at},
        {"components", std::move(comps)},
    };
}

} // namespace

const IndexEntry* RepositoryIndex::Find(const std::string& content_hash) const {
    auto it = packages.find(content_hash);
    return it == packages.end() ? nullptr : &it->second;
}

const IndexEntry* RepositoryIndex::FindSameIdentity(const PackageDescriptor& d) const {
    for (const auto& [hash, entry] : packages) {
        if (SamePackageIdentity(entry.descriptor, d)) return &entry;
    }
    return nullptr;
}

const ManifestComponent* RepositoryManifest::FindComponent(std::string_view type) const {
    for (const auto& c : components) {
        if (c.type == type) return &c;
    }
    return nullptr;
}

std::string ManifestKey(const std::string& prefix) {
    return JoinKey(prefix, "metadata/manifest");
}

std::string MetadataDirKey(const std::string& prefix) {
    return JoinKey(prefix, "metadata");
}

std::string PackageObjectKey(const std::string& prefix, const PackageDescriptor& d) {
    return JoinKey(prefix, "packages/" + d.content_hash + std::string(FileExtension(d.format)));
}

std::string EncodeManifestPayload(const RepositoryManifest& manifest) {
    return PayloadToJson(manifest).dump();
}

std::string EncodeManifest(const RepositoryManifest& manifest) {
    json j;
    j["schema"] = manifest.schema;
    j["payload"] = PayloadToJson(manifest);
    if (manifest.signature) {
        j["signature"] = json{{"key_id", manifest.signature->key_id}, {"data", manifest.signature->data}};
    } else {
        j["signature"] = nullptr;
    }
    return j.dump(2);
}

std::expected<RepositoryManifest, std::string> DecodeManifest(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("manifest root must be an object");

        RepositoryManifest m;
        m.schema = j.value("schema", 0);
        if (m.schema != kManifestSchema)
            return std::unexpected("unsupported manifest schema " + std::to_string(m.schema));

        auto payload = j.find("payload");
        if (payload == j.end() || !payload->is_object()) return std::unexpected("manifest has no payload");

        auto fmt = ParsePackageFormat(payload->value("format", ""));
        if (!fmt) return std::unexpected("manifest has unknown format");
        m.format = *fmt;
        m.metadata_version = payload->value("metadata_version", std::uint64_t{0});
        m.package_count = payload->value("package_count", std::uint64_t{0});
        m.updated_at = payload->value("updated_at", "");

        auto comps = payload->find("components");
        if (comps == payload->end() || !comps->is_array())
            return std::unexpected("'components' must be an array");
        for (const auto& c : *comps) {
            ManifestComponent mc;
            mc.type = c.value("type", "");
            mc.key = c.value("key", "");
            mc.sha256 = c.value("sha256", "");
            mc.size = c.value("size", std::uint64_t{0});
            if (mc.type.empty() || mc.key.empty() || mc.sha256.empty())
                return std::unexpected("manifest component missing type, key or sha256");
            m.components.push_back(std::move(mc));
        }

        auto sig = j.find("signature");
        if (sig != j.end() && sig->is_object()) {
            m.signature = ManifestSignature{sig->value("key_id", ""), sig->value("data", "")};
        }
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid manifest JSON: ") + e.what());
    }
}

std::string EncodeIndexJson(const RepositoryIndex& index) {
    json pkgs = json::array();
    for (const auto& [hash, entry] : index.packages) pkgs.push_back(EntryToJson(entry));
    json j{
        {"prefix", index.prefix},
        {"format", std::string(ToString(index.format))},
        {"metadata_version", index.metadata_version},
        {"packages", std::move(pkgs)},
    };
    return j.dump();
}

std::expected<RepositoryIndex, std::string> DecodeIndexJson(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("index root must be an object");

        RepositoryIndex index;
        index.prefix = j.value("prefix", "");
        auto fmt = ParsePackageFormat(j.value("format", ""));
        if (!fmt) return std::unexpected("index has unknown format");
        index.format = *fmt;
        index.metadata_version = j.value("metadata_version", std::uint64_t{0});

        auto pkgs = j.find("packages");
        if (pkgs == j.end() || !pkgs->is_array()) return std::unexpected("'packages' must be an array");
        for (const auto& item : *pkgs) {
            auto entry = EntryFromJson(item);
            if (!entry) return std::unexpected(entry.error());
            const std::string hash = entry->descriptor.content_hash;
            if (!index.packages.emplace(hash, std::move(*entry)).second)
                return std::unexpected("duplicate package " + hash);
        }
        return index;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid index JSON: ") + e.what());
    }
}

} // namespace pkgrepo
