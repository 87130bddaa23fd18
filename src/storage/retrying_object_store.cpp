#include "storage/retrying_object_store.hpp"

#include "util/logger.hpp"

#include <algorithm>

namespace pkgrepo {

RetryingObjectStore::RetryingObjectStore(std::shared_ptr<IObjectStore> inner,
                                         RetryPolicy policy,
                                         std::shared_ptr<const IClock> clock)
    : inner_(std::move(inner)), policy_(policy), clock_(clock ? std::move(clock) : SystemClock()) {}

Result RetryingObjectStore::WithRetry(const char* op,
                                      const std::string& key,
                                      const std::function<Result()>& fn) const {
    auto backoff = policy_.initial_backoff;
    const int attempts = std::max(1, policy_.max_attempts);
    Result last;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = fn();
        if (last.is_ok() || last.err != ErrorCode::StorageError) return last;
        if (attempt == attempts) break;
        LogWarn("storage %s %s failed (attempt %d/%d): %s; retrying in %lldms",
                op, key.c_str(), attempt, attempts, last.msg.c_str(),
                static_cast<long long>(backoff.count()));
        clock_->SleepFor(backoff);
        backoff = std::min(backoff * 2, policy_.max_backoff);
    }
    return Result::Fail(ErrorCode::StorageError,
                        std::string(op) + " " + key + " failed after " + std::to_string(attempts) +
                            " attempts: " + last.msg);
}

Result RetryingObjectStore::Get(const std::string& key, StoredObject& out) {
    return WithRetry("get", key, [&] { return inner_->Get(key, out); });
}

Result RetryingObjectStore::Put(const std::string& key,
                                std::span<const std::uint8_t> data,
                                const Precondition& pre,
                                VersionToken* out_token) {
    return WithRetry("put", key, [&] { return inner_->Put(key, data, pre, out_token); });
}

Result RetryingObjectStore::Delete(const std::string& key, const Precondition& pre) {
    return WithRetry("delete", key, [&] { return inner_->Delete(key, pre); });
}

Result RetryingObjectStore::List(const std::string& prefix, std::vector<std::string>& out_keys) {
    return WithRetry("list", prefix, [&] { return inner_->List(prefix, out_keys); });
}

} // namespace pkgrepo
