#include "lock/lock_manager.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <openssl/rand.h>
#include <random>
#include <vector>
#include <unistd.h>

namespace pkgrepo {

namespace {

std::string RandomHex(size_t nbytes) {
    std::vector<unsigned char> buf(nbytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        std::random_device rd;
        for (auto& b : buf) b = static_cast<unsigned char>(rd());
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(nbytes * 2);
    for (unsigned char b : buf) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

bool CancelRequested(const std::atomic_bool* cancel) {
    return cancel && cancel->load(std::memory_order_relaxed);
}

} // namespace

std::string_view ToString(LockState state) {
    switch (state) {
        case LockState::Unlocked: return "UNLOCKED";
        case LockState::Acquiring: return "ACQUIRING";
        case LockState::Held: return "HELD";
        case LockState::Renewing: return "RENEWING";
        case LockState::Releasing: return "RELEASING";
    }
    return "UNKNOWN";
}

std::string MakeHolderId() {
    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0')
        std::snprintf(host, sizeof(host), "localhost");
    return std::string(host) + "-" + std::to_string(::getpid()) + "-" + RandomHex(16);
}

LockManager::LockManager(IObjectStore& store, LockOptions opt, std::shared_ptr<const IClock> clock)
    : store_(store), opt_(opt), clock_(clock ? std::move(clock) : SystemClock()) {}

std::string LockManager::LockKeyFor(const std::string& prefix) {
    return JoinKey(prefix, "lock");
}

std::chrono::milliseconds LockManager::Jitter(std::chrono::milliseconds backoff) const {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto half = std::max<std::int64_t>(1, backoff.count() / 2);
    std::uniform_int_distribution<std::int64_t> dist(half, std::max(half, static_cast<std::int64_t>(backoff.count())));
    return std::chrono::milliseconds(dist(rng));
}

Result LockManager::TryPut(const Lease& lease, const Precondition& pre, HeldLease& out) {
    const std::string key = LockKeyFor(lease.repository_prefix);
    const std::string body = EncodeLease(lease);
    VersionToken token;
    auto r = store_.Put(key, ToBytes(body), pre, &token);
    if (!r.is_ok()) return r;
    out.lock_key = key;
    out.lease = lease;
    out.token = std::move(token);
    return Result::Ok();
}

Result LockManager::Acquire(const std::string& prefix,
                            const std::string& holder_id,
                            std::optional<WallTime> deadline,
                            const std::atomic_bool* cancel,
                            HeldLease& out) {
    const std::string key = LockKeyFor(prefix);
    auto backoff = opt_.backoff_initial;
    const int attempts = std::max(1, opt_.max_attempts);
    std::string last_holder;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (CancelRequested(cancel))
            return Result::Fail(ErrorCode::Cancelled, "cancelled while waiting for " + key);
        const WallTime now = clock_->Now();
        if (deadline && now >= *deadline)
            return Result::Fail(ErrorCode::Timeout, "deadline passed while waiting for " + key);

        Lease lease{
            .repository_prefix = prefix,
            .holder_id = holder_id,
            .acquired_at = now,
            .expires_at = now + opt_.lease_duration,
        };

        auto r = TryPut(lease, Precondition::IfAbsent(), out);
        if (r.is_ok()) {
            LogInfo("lock %s acquired by %s (attempt %d)", key.c_str(), holder_id.c_str(), attempt);
            return r;
        }
        if (r.err != ErrorCode::PreconditionFailed) return Result::Wrap(r, "acquire " + key);

        StoredObject existing;
        auto g = store_.Get(key, existing);
        if (g.err == ErrorCode::NotFound) {
            // Released between our put and get.
            continue;
        }
        if (!g.is_ok()) return Result::Wrap(g, "read lease " + key);

        auto current = DecodeLease(AsStringView(existing.data));
        const bool reclaimable = !current || current->ExpiredAt(now);
        if (reclaimable) {
            if (!current)
                LogWarn("lock %s holds a corrupt lease (%s); reclaiming", key.c_str(), current.error().c_str());
            else
                LogWarn("lock %s held by %s expired at %s; reclaiming",
                        key.c_str(), current->holder_id.c_str(), FormatIso8601(current->expires_at).c_str());

            auto rr = TryPut(lease, Precondition::IfMatch(existing.token), out);
            if (rr.is_ok()) {
                LogInfo("lock %s reclaimed by %s", key.c_str(), holder_id.c_str());
                return rr;
            }
            if (rr.err != ErrorCode::PreconditionFailed) return Result::Wrap(rr, "reclaim " + key);
            LogDebug("lock %s: lost reclaim race", key.c_str());
        } else {
            last_holder = current->holder_id;
            LogDebug("lock %s busy, held by %s until %s", key.c_str(), current->holder_id.c_str(),
                     FormatIso8601(current->expires_at).c_str());
        }

        if (attempt == attempts) break;

        auto sleep = Jitter(backoff);
        if (deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock_->Now());
            if (remaining <= std::chrono::milliseconds::zero())
                return Result::Fail(ErrorCode::Timeout, "deadline passed while waiting for " + key);
            sleep = std::min(sleep, remaining);
        }
        clock_->SleepFor(sleep);
        backoff = std::min(backoff * 2, opt_.backoff_max);
    }

    std::string msg = "repository " + prefix + " is busy after " + std::to_string(attempts) + " attempts";
    if (!last_holder.empty()) msg += " (held by " + last_holder + ")";
    return Result::Fail(ErrorCode::RepositoryBusy, msg);
}

Result LockManager::Renew(HeldLease& held) {
    Lease renewed = held.lease;
    renewed.expires_at = clock_->Now() + opt_.lease_duration;

    HeldLease next;
    auto r = TryPut(renewed, Precondition::IfMatch(held.token), next);
    if (r.err == ErrorCode::PreconditionFailed)
        return Result::Fail(ErrorCode::RepositoryBusy, "lease on " + held.lock_key + " was lost");
    if (!r.is_ok()) return Result::Wrap(r, "renew " + held.lock_key);

    held = std::move(next);
    LogDebug("lock %s renewed until %s", held.lock_key.c_str(), FormatIso8601(held.lease.expires_at).c_str());
    return Result::Ok();
}

Result LockManager::Release(const HeldLease& held) {
    StoredObject current;
    auto g = store_.Get(held.lock_key, current);
    if (g.err == ErrorCode::NotFound) {
        LogWarn("lock %s already gone at release", held.lock_key.c_str());
        return Result::Ok();
    }
    if (!g.is_ok()) return Result::Wrap(g, "release " + held.lock_key);

    if (current.token != held.token) {
        LogWarn("lock %s is now owned by another holder; leaving it", held.lock_key.c_str());
        return Result::Ok();
    }

    auto d = store_.Delete(held.lock_key, Precondition::IfMatch(held.token));
    if (d.err == ErrorCode::PreconditionFailed) {
        LogWarn("lock %s changed during release; leaving it", held.lock_key.c_str());
        return Result::Ok();
    }
    if (!d.is_ok()) return Result::Wrap(d, "release " + held.lock_key);

    LogInfo("lock %s released by %s", held.lock_key.c_str(), held.lease.holder_id.c_str());
    return Result::Ok();
}

LeaseGuard::LeaseGuard(LockManager& manager, HeldLease held)
    : manager_(&manager), held_(std::move(held)), state_(LockState::Held) {}

LeaseGuard::LeaseGuard(LeaseGuard&& other) noexcept
    : manager_(other.manager_), held_(std::move(other.held_)), state_(other.state_) {
    other.manager_ = nullptr;
    other.state_ = LockState::Unlocked;
}

LeaseGuard& LeaseGuard::operator=(LeaseGuard&& other) noexcept {
    if (this != &other) {
        (void)Release();
        manager_ = other.manager_;
        held_ = std::move(other.held_);
        state_ = other.state_;
        other.manager_ = nullptr;
        other.state_ = LockState::Unlocked;
    }
    return *this;
}

LeaseGuard::~LeaseGuard() {
    auto r = Release();
    if (!r.is_ok()) LogError("lock release failed: %s", r.msg.c_str());
}

Result LeaseGuard::Renew() {
    if (!manager_ || state_ != LockState::Held)
        return Result::Fail(ErrorCode::RepositoryBusy, "lease is not held");
    state_ = LockState::Renewing;
    auto r = manager_->Renew(held_);
    state_ = r.is_ok() ? LockState::Held : LockState::Unlocked;
    return r;
}

Result LeaseGuard::RenewIfDue() {
    if (!manager_ || state_ != LockState::Held)
        return Result::Fail(ErrorCode::RepositoryBusy, "lease is not held");
    const auto remaining = held_.lease.expires_at - manager_->Clock().Now();
    if (remaining * 2 >= manager_->Options().lease_duration) return Result::Ok();
    return Renew();
}

Result LeaseGuard::Release() {
    if (!manager_ || state_ != LockState::Held) return Result::Ok();
    state_ = LockState::Releasing;
    auto r = manager_->Release(held_);
    state_ = LockState::Unlocked;
    manager_ = nullptr;
    return r;
}

} // namespace pkgrepo
