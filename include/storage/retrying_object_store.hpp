#pragma once

#include "storage/object_store.hpp"
#include "util/clock.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace pkgrepo {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
};

// Retries transient ErrorCode::StorageError failures with exponential backoff.
// PreconditionFailed and NotFound are answers, not faults, and pass through.
class RetryingObjectStore final : public IObjectStore {
public:
    RetryingObjectStore(std::shared_ptr<IObjectStore> inner, RetryPolicy policy, std::shared_ptr<const IClock> clock);

    Result Get(const std::string& key, StoredObject& out) override;
    Result Put(const std::string& key,
               std::span<const std::uint8_t> data,
               const Precondition& pre,
               VersionToken* out_token) override;
    Result Delete(const std::string& key, const Precondition& pre) override;
    Result List(const std::string& prefix, std::vector<std::string>& out_keys) override;
    std::string Describe() const override { return inner_->Describe(); }

private:
    Result WithRetry(const char* op, const std::string& key, const std::function<Result()>& fn) const;

    std::shared_ptr<IObjectStore> inner_;
    RetryPolicy policy_;
    std::shared_ptr<const IClock> clock_;
};

} // namespace pkgrepo
