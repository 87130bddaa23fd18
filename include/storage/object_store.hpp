#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <vector>

namespace pkgrepo {

// Opaque per-object version (ETag, generation number, content digest).
using VersionToken = std::string;

struct Precondition {
    enum class Kind {
        None,
        IfAbsent,
        IfMatch,
    };

    Kind kind = Kind::None;
    VersionToken token;

    static Precondition Unconditional() { return {}; }
    static Precondition IfAbsent() { return {.kind = Kind::IfAbsent, .token = {}}; }
    static Precondition IfMatch(VersionToken t) { return {.kind = Kind::IfMatch, .token = std::move(t)}; }
};

struct StoredObject {
    Bytes data;
    VersionToken token;
};

// Capability surface over the object store. Only per-object conditional
// writes are required; nothing here spans more than one key.
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    // ErrorCode::NotFound when the key does not exist.
    virtual Result Get(const std::string& key, StoredObject& out) = 0;

    // ErrorCode::PreconditionFailed when pre does not hold. out_token may be null.
    virtual Result Put(const std::string& key,
                       std::span<const std::uint8_t> data,
                       const Precondition& pre,
                       VersionToken* out_token) = 0;

    // Deleting a missing key succeeds unless a precondition is given.
    virtual Result Delete(const std::string& key, const Precondition& pre) = 0;

    // Keys starting with prefix, sorted.
    virtual Result List(const std::string& prefix, std::vector<std::string>& out_keys) = 0;

    virtual std::string Describe() const = 0;
};

inline Result PutObject(IObjectStore& store, const std::string& key, std::span<const std::uint8_t> data) {
    return store.Put(key, data, Precondition::Unconditional(), nullptr);
}

inline Result DeleteObject(IObjectStore& store, const std::string& key) {
    return store.Delete(key, Precondition::Unconditional());
}

} // namespace pkgrepo
