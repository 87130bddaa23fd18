#pragma once

#include "storage/object_store.hpp"

#include <string>

namespace pkgrepo {

// Objects are files under root. Writes go through tmp+rename; conditional
// operations are serialised across processes with flock() on a store lock
// file. The version token is the SHA-256 of the object bytes.
class FilesystemObjectStore final : public IObjectStore {
public:
    static Result Open(const std::string& root, FilesystemObjectStore& out);

    FilesystemObjectStore() = default;

    Result Get(const std::string& key, StoredObject& out) override;
    Result Put(const std::string& key,
               std::span<const std::uint8_t> data,
               const Precondition& pre,
               VersionToken* out_token) override;
    Result Delete(const std::string& key, const Precondition& pre) override;
    Result List(const std::string& prefix, std::vector<std::string>& out_keys) override;
    std::string Describe() const override { return "file://" + root_; }

    const std::string& Root() const { return root_; }

private:
    Result PathFor(const std::string& key, std::string& out_path) const;
    Result CurrentToken(const std::string& path, bool& exists, VersionToken& token) const;
    Result CheckPrecondition(const std::string& key, const std::string& path, const Precondition& pre) const;

    std::string root_;
};

} // namespace pkgrepo
