#include "storage/memory_object_store.hpp"

#include "util/path_utils.hpp"

namespace pkgrepo {

Result MemoryObjectStore::CheckPrecondition(const std::string& key,
                                            const Entry* current,
                                            const Precondition& pre) {
    switch (pre.kind) {
        case Precondition::Kind::None:
            return Result::Ok();
        case Precondition::Kind::IfAbsent:
            if (current)
                return Result::Fail(ErrorCode::PreconditionFailed, "object exists: " + key);
            return Result::Ok();
        case Precondition::Kind::IfMatch:
            if (!current || current->token != pre.token)
                return Result::Fail(ErrorCode::PreconditionFailed, "version mismatch: " + key);
            return Result::Ok();
    }
    return Result::Ok();
}

Result MemoryObjectStore::Get(const std::string& key, StoredObject& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(key);
    if (it == objects_.end())
        return Result::Fail(ErrorCode::NotFound, "no such key: " + key);
    out.data = it->second.data;
    out.token = it->second.token;
    return Result::Ok();
}

Result MemoryObjectStore::Put(const std::string& key,
                              std::span<const std::uint8_t> data,
                              const Precondition& pre,
                              VersionToken* out_token) {
    if (key.empty())
        return Result::Fail(ErrorCode::StorageError, "empty key");
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(key);
    auto pr = CheckPrecondition(key, it == objects_.end() ? nullptr : &it->second, pre);
    if (!pr.is_ok()) return pr;

    Entry& e = objects_[key];
    e.data.assign(data.begin(), data.end());
    e.token = "g" + std::to_string(++generation_);
    if (out_token) *out_token = e.token;
    return Result::Ok();
}

Result MemoryObjectStore::Delete(const std::string& key, const Precondition& pre) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = objects_.find(key);
    auto pr = CheckPrecondition(key, it == objects_.end() ? nullptr : &it->second, pre);
    if (!pr.is_ok()) return pr;
    if (it != objects_.end()) objects_.erase(it);
    return Result::Ok();
}

Result MemoryObjectStore::List(const std::string& prefix, std::vector<std::string>& out_keys) {
    std::lock_guard<std::mutex> lk(mu_);
    out_keys.clear();
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (!StartsWith(it->first, prefix)) break;
        out_keys.push_back(it->first);
    }
    return Result::Ok();
}

std::vector<std::string> MemoryObjectStore::Keys() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(objects_.size());
    for (const auto& [k, v] : objects_) out.push_back(k);
    return out;
}

size_t MemoryObjectStore::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return objects_.size();
}

} // namespace pkgrepo
