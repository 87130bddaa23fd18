#pragma once

#include "package/package_descriptor.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgrepo {

inline constexpr int kManifestSchema = 1;
inline constexpr std::string_view kPrimaryComponent = "primary";
inline constexpr std::string_view kChecksumsComponent = "checksums";
// Type prefix of components produced by an external metadata tool.
inline constexpr std::string_view kExternalComponentPrefix = "ext-";

// One package as recorded in the repository index.
struct IndexEntry {
    PackageDescriptor descriptor;
    std::string filename;
    std::string object_key;
    std::uint64_t size = 0;
    // Digest of the stored bytes; differs from content_hash once signed.
    std::string object_sha256;
    bool is_signed = false;

    bool operator==(const IndexEntry&) const = default;
};

struct RepositoryIndex {
    std::string prefix;
    PackageFormat format = PackageFormat::Unknown;
    std::uint64_t metadata_version = 0;
    // Keyed by content_hash.
    std::map<std::string, IndexEntry> packages;

    const IndexEntry* Find(const std::string& content_hash) const;
    // Entry with the same name/epoch/version/release/arch, if any.
    const IndexEntry* FindSameIdentity(const PackageDescriptor& d) const;
};

struct ManifestComponent {
    std::string type;
    std::string key;
    std::string sha256;
    std::uint64_t size = 0;

    bool operator==(const ManifestComponent&) const = default;
};

struct ManifestSignature {
    std::string key_id;
    std::string data;
};

struct RepositoryManifest {
    int schema = kManifestSchema;
    PackageFormat format = PackageFormat::Unknown;
    std::uint64_t metadata_version = 0;
    std::uint64_t package_count = 0;
    std::string updated_at;
    std::vector<ManifestComponent> components;
    std::optional<ManifestSignature> signature;

    const ManifestComponent* FindComponent(std::string_view type) const;
};

// Storage layout under one repository prefix.
std::string ManifestKey(const std::string& prefix);
std::string MetadataDirKey(const std::string& prefix);
std::string PackageObjectKey(const std::string& prefix, const PackageDescriptor& d);

// Canonical bytes covered by the manifest signature.
std::string EncodeManifestPayload(const RepositoryManifest& manifest);
std::string EncodeManifest(const RepositoryManifest& manifest);
std::expected<RepositoryManifest, std::string> DecodeManifest(std::string_view text);

// The primary component: the complete package index as JSON.
std::string EncodeIndexJson(const RepositoryIndex& index);
std::expected<RepositoryIndex, std::string> DecodeIndexJson(std::string_view text);

} // namespace pkgrepo
