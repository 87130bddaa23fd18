#pragma once

#include "lock/lease.hpp"
#include "storage/object_store.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pkgrepo {

enum class LockState {
    Unlocked,
    Acquiring,
    Held,
    Renewing,
    Releasing,
};

std::string_view ToString(LockState state);

struct LockOptions {
    std::chrono::seconds lease_duration{300};
    int max_attempts = 20;
    std::chrono::milliseconds backoff_initial{250};
    std::chrono::milliseconds backoff_max{5000};
};

struct HeldLease {
    std::string lock_key;
    Lease lease;
    VersionToken token;
};

// "<hostname>-<pid>-<32 hex>"
std::string MakeHolderId();

// Mutual exclusion per repository prefix built only on conditional puts of
// the lease object. Not linearizable under large clock skew between holders.
class LockManager {
public:
    LockManager(IObjectStore& store, LockOptions opt, std::shared_ptr<const IClock> clock);

    static std::string LockKeyFor(const std::string& prefix);

    // RepositoryBusy after max_attempts, Timeout past deadline, Cancelled when
    // *cancel becomes true. Storage is never mutated on failure.
    Result Acquire(const std::string& prefix,
                   const std::string& holder_id,
                   std::optional<WallTime> deadline,
                   const std::atomic_bool* cancel,
                   HeldLease& out);

    // Extends expires_at. RepositoryBusy when the lease was lost.
    Result Renew(HeldLease& held);

    // Deletes the lease only while it still carries our version token.
    Result Release(const HeldLease& held);

    const LockOptions& Options() const { return opt_; }
    const IClock& Clock() const { return *clock_; }

private:
    Result TryPut(const Lease& lease, const Precondition& pre, HeldLease& out);
    std::chrono::milliseconds Jitter(std::chrono::milliseconds backoff) const;

    IObjectStore& store_;
    LockOptions opt_;
    std::shared_ptr<const IClock> clock_;
};

// Owns one held lease; releases it on scope exit.
class LeaseGuard {
public:
    LeaseGuard() = default;
    LeaseGuard(LockManager& manager, HeldLease held);
    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;
    LeaseGuard(LeaseGuard&& other) noexcept;
    LeaseGuard& operator=(LeaseGuard&& other) noexcept;
    ~LeaseGuard();

    bool Held() const { return state_ == LockState::Held; }
    LockState State() const { return state_; }
    const HeldLease& Current() const { return held_; }

    Result Renew();
    // Renews when less than half of the lease duration remains.
    Result RenewIfDue();
    Result Release();

private:
    LockManager* manager_ = nullptr;
    HeldLease held_;
    LockState state_ = LockState::Unlocked;
};

} // namespace pkgrepo
