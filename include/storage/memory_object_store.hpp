#pragma once

#include "storage/object_store.hpp"

#include <cstdint>
#include <map>
#include <mutex>

namespace pkgrepo {

// In-process store with generation-number tokens. Thread-safe.
class MemoryObjectStore final : public IObjectStore {
public:
    Result Get(const std::string& key, StoredObject& out) override;
    Result Put(const std::string& key,
               std::span<const std::uint8_t> data,
               const Precondition& pre,
               VersionToken* out_token) override;
    Result Delete(const std::string& key, const Precondition& pre) override;
    Result List(const std::string& prefix, std::vector<std::string>& out_keys) override;
    std::string Describe() const override { return "memory://"; }

    std::vector<std::string> Keys() const;
    size_t Size() const;

private:
    struct Entry {
        Bytes data;
        VersionToken token;
    };

    static Result CheckPrecondition(const std::string& key,
                                    const Entry* current,
                                    const Precondition& pre);

    mutable std::mutex mu_;
    std::map<std::string, Entry> objects_;
    std::uint64_t generation_ = 0;
};

} // namespace pkgrepo
