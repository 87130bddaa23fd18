#include "metadata/index_store.hpp"

#include "crypto/sha256.hpp"
#include "io/gzip_reader.hpp"
#include "util/path_utils.hpp"

namespace pkgrepo {

namespace {

constexpr std::string_view kManifestSuffix = "metadata/manifest";

} // namespace

Result IndexStore::ReadCurrent(const std::string& prefix, CurrentState& out) const {
    out = CurrentState{};
    out.index.prefix = NormalizeKey(prefix);

    const std::string key = ManifestKey(prefix);
    StoredObject obj;
    auto r = store_.Get(key, obj);
    if (r.err == ErrorCode::NotFound) return Result::Ok();
    if (!r.is_ok()) return Result::Wrap(r, "read " + key);

    auto manifest = DecodeManifest(AsStringView(obj.data));
    if (!manifest) return Result::Fail(ErrorCode::StorageError, key + ": " + manifest.error());

    const ManifestComponent* primary = manifest->FindComponent(kPrimaryComponent);
    if (!primary) return Result::Fail(ErrorCode::StorageError, key + ": manifest has no primary component");

    StoredObject comp;
    r = store_.Get(primary->key, comp);
    if (!r.is_ok()) return Result::Wrap(r, "read " + primary->key);
    if (Sha256Hex(comp.data) != primary->sha256)
        return Result::Fail(ErrorCode::StorageError, primary->key + ": digest does not match manifest");

    Bytes raw;
    r = GzipDecompress(comp.data, raw);
    if (!r.is_ok()) return Result::Wrap(r, "decompress " + primary->key);
    auto index = DecodeIndexJson(AsStringView(raw));
    if (!index) return Result::Fail(ErrorCode::StorageError, primary->key + ": " + index.error());
    if (index->format != manifest->format)
        return Result::Fail(ErrorCode::StorageError, primary->key + ": format does not match manifest");

    out.exists = true;
    out.manifest_token = std::move(obj.token);
    out.manifest = std::move(*manifest);
    out.index = std::move(*index);
    out.index.prefix = NormalizeKey(prefix);
    out.index.metadata_version = out.manifest.metadata_version;
    return Result::Ok();
}

Result IndexStore::DiscoverRepositories(std::vector<std::string>& out_prefixes) const {
    out_prefixes.clear();
    std::vector<std::string> keys;
    auto r = store_.List("", keys);
    if (!r.is_ok()) return Result::Wrap(r, "discover repositories");
    for (const auto& key : keys) {
        if (key == kManifestSuffix) {
            out_prefixes.emplace_back();
        } else if (EndsWith(key, "/" + std::string(kManifestSuffix))) {
            out_prefixes.push_back(key.substr(0, key.size() - kManifestSuffix.size() - 1));
        }
    }
    return Result::Ok();
}

} // namespace pkgrepo
