#include "lock/lock_manager.hpp"
#include "storage/memory_object_store.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace pkgrepo {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

class LockManagerTest : public ::testing::Test {
  protected:
    LockOptions Options() {
        LockOptions opt;
        opt.lease_duration = seconds(300);
        opt.max_attempts = 3;
        opt.backoff_initial = milliseconds(100);
        opt.backoff_max = milliseconds(400);
        return opt;
    }

    std::string HolderOf(const std::string& prefix) {
        StoredObject obj;
        if (!store.Get(LockManager::LockKeyFor(prefix), obj).ok) return {};
        auto lease = DecodeLease(AsStringView(obj.data));
        return lease ? lease->holder_id : "<corrupt>";
    }

    MemoryObjectStore store;
    std::shared_ptr<testutil::FakeClock> clock = std::make_shared<testutil::FakeClock>();
    LockManager locks{store, Options(), clock};
};

TEST_F(LockManagerTest, AcquireAndReleaseLeaseObject) {
    HeldLease held;
    auto r = locks.Acquire("el9/x86_64", "A", std::nullopt, nullptr, held);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(held.lock_key, "el9/x86_64/lock");
    EXPECT_EQ(held.lease.holder_id, "A");
    EXPECT_EQ(held.lease.expires_at - held.lease.acquired_at, seconds(300));
    EXPECT_EQ(HolderOf("el9/x86_64"), "A");

    ASSERT_TRUE(locks.Release(held).ok);
    EXPECT_EQ(HolderOf("el9/x86_64"), "");
}

TEST_F(LockManagerTest, LiveLeaseMakesOthersBusyWithoutMutation) {
    HeldLease a;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, a).ok);
    StoredObject before;
    ASSERT_TRUE(store.Get("repo/lock", before).ok);

    HeldLease b;
    auto r = locks.Acquire("repo", "B", std::nullopt, nullptr, b);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::RepositoryBusy);
    EXPECT_NE(r.msg.find("held by A"), std::string::npos);
    EXPECT_EQ(clock->Sleeps(), 2);

    StoredObject after;
    ASSERT_TRUE(store.Get("repo/lock", after).ok);
    EXPECT_EQ(after.token, before.token);
    EXPECT_EQ(store.Size(), 1u);
}

TEST_F(LockManagerTest, ExpiredLeaseIsReclaimed) {
    HeldLease a;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, a).ok);
    clock->Advance(seconds(301));

    HeldLease b;
    ASSERT_TRUE(locks.Acquire("repo", "B", std::nullopt, nullptr, b).ok);
    EXPECT_EQ(HolderOf("repo"), "B");

    // The stale holder neither renews nor deletes the new lease.
    EXPECT_EQ(locks.Renew(a).err, ErrorCode::RepositoryBusy);
    EXPECT_TRUE(locks.Release(a).ok);
    EXPECT_EQ(HolderOf("repo"), "B");
}

TEST(LockManagerRaceTest, OnlyOneReclaimerOfAnExpiredLeaseWins) {
    auto memory = std::make_shared<MemoryObjectStore>();
    testutil::FaultInjectingStore racy(memory);
    auto clock = std::make_shared<testutil::FakeClock>();
    const LockOptions opt{.lease_duration = seconds(300),
                          .max_attempts = 3,
                          .backoff_initial = milliseconds(100),
                          .backoff_max = milliseconds(400)};

    LockManager crashed(*memory, opt, clock);
    HeldLease stale;
    ASSERT_TRUE(crashed.Acquire("repo", "crashed", std::nullopt, nullptr, stale).ok);
    clock->Advance(seconds(301));

    // B runs its whole reclaim after A has read the expired lease but before
    // A's conditional put of the replacement.
    LockManager b_locks(*memory, opt, clock);
    HeldLease b;
    Result b_result = Result::Fail(ErrorCode::NotFound, "B never ran");
    int puts = 0;
    racy.SetHook([&](const std::string& op, const std::string& key) {
        if (op == "put" && key == "repo/lock" && ++puts == 2) {
            b_result = b_locks.Acquire("repo", "B", std::nullopt, nullptr, b);
        }
        return Result::Ok();
    });

    LockManager a_locks(racy, opt, clock);
    HeldLease a;
    auto a_result = a_locks.Acquire("repo", "A", std::nullopt, nullptr, a);

    ASSERT_TRUE(b_result.ok) << b_result.msg;
    EXPECT_EQ(a_result.err, ErrorCode::RepositoryBusy);
    EXPECT_NE(a_result.msg.find("held by B"), std::string::npos);

    StoredObject obj;
    ASSERT_TRUE(memory->Get("repo/lock", obj).ok);
    EXPECT_EQ(obj.token, b.token);
    auto lease = DecodeLease(AsStringView(obj.data));
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->holder_id, "B");
}

TEST_F(LockManagerTest, CorruptLeaseIsReclaimed) {
    ASSERT_TRUE(PutObject(store, "repo/lock", ToBytes("{not json")).ok);
    HeldLease held;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, held).ok);
    EXPECT_EQ(HolderOf("repo"), "A");
}

TEST_F(LockManagerTest, RenewExtendsExpiry) {
    HeldLease held;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, held).ok);
    const auto first_expiry = held.lease.expires_at;
    const auto first_token = held.token;

    clock->Advance(seconds(60));
    ASSERT_TRUE(locks.Renew(held).ok);
    EXPECT_EQ(held.lease.expires_at, first_expiry + seconds(60));
    EXPECT_NE(held.token, first_token);
    EXPECT_TRUE(locks.Release(held).ok);
    EXPECT_EQ(HolderOf("repo"), "");
}

TEST_F(LockManagerTest, CancelAndDeadline) {
    HeldLease a;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, a).ok);

    std::atomic_bool cancel{true};
    HeldLease b;
    EXPECT_EQ(locks.Acquire("repo", "B", std::nullopt, &cancel, b).err, ErrorCode::Cancelled);
    EXPECT_EQ(locks.Acquire("repo", "B", clock->Now(), nullptr, b).err, ErrorCode::Timeout);

    LockManager patient(store, LockOptions{.lease_duration = seconds(300),
                                           .max_attempts = 50,
                                           .backoff_initial = milliseconds(100),
                                           .backoff_max = milliseconds(1000)},
                        clock);
    const auto deadline = clock->Now() + seconds(2);
    EXPECT_EQ(patient.Acquire("repo", "B", deadline, nullptr, b).err, ErrorCode::Timeout);
    EXPECT_GE(clock->Now(), deadline);
    EXPECT_EQ(HolderOf("repo"), "A");
}

TEST_F(LockManagerTest, DistinctPrefixesDoNotContend) {
    HeldLease a, b;
    ASSERT_TRUE(locks.Acquire("arm", "A", std::nullopt, nullptr, a).ok);
    ASSERT_TRUE(locks.Acquire("default", "B", std::nullopt, nullptr, b).ok);
    EXPECT_EQ(clock->Sleeps(), 0);
}

TEST_F(LockManagerTest, GuardReleasesOnScopeExitAndRenewsWhenDue) {
    {
        HeldLease held;
        ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, held).ok);
        LeaseGuard guard(locks, held);
        EXPECT_TRUE(guard.Held());
        EXPECT_EQ(guard.State(), LockState::Held);

        const auto token = guard.Current().token;
        clock->Advance(seconds(100));
        ASSERT_TRUE(guard.RenewIfDue().ok);
        EXPECT_EQ(guard.Current().token, token);

        clock->Advance(seconds(60));
        ASSERT_TRUE(guard.RenewIfDue().ok);
        EXPECT_NE(guard.Current().token, token);
        EXPECT_EQ(guard.Current().lease.expires_at, clock->Now() + seconds(300));
        EXPECT_EQ(HolderOf("repo"), "A");
    }
    EXPECT_EQ(HolderOf("repo"), "");
}

TEST_F(LockManagerTest, GuardMoveTransfersOwnership) {
    HeldLease held;
    ASSERT_TRUE(locks.Acquire("repo", "A", std::nullopt, nullptr, held).ok);
    LeaseGuard outer;
    {
        LeaseGuard inner(locks, held);
        outer = std::move(inner);
    }
    EXPECT_TRUE(outer.Held());
    EXPECT_EQ(HolderOf("repo"), "A");
    ASSERT_TRUE(outer.Release().ok);
    EXPECT_EQ(outer.State(), LockState::Unlocked);
    EXPECT_EQ(HolderOf("repo"), "");
    EXPECT_EQ(outer.Renew().err, ErrorCode::RepositoryBusy);
}

TEST(LeaseCodecTest, EncodeDecode) {
    Lease lease{.repository_prefix = "r",
                .holder_id = "host-1-abc",
                .acquired_at = FromUnixMillis(1000),
                .expires_at = FromUnixMillis(301000)};
    auto back = DecodeLease(EncodeLease(lease));
    ASSERT_TRUE(back.has_value()) << back.error();
    EXPECT_EQ(back->repository_prefix, "r");
    EXPECT_EQ(back->holder_id, "host-1-abc");
    EXPECT_EQ(ToUnixMillis(back->expires_at), 301000);
    EXPECT_TRUE(back->ExpiredAt(FromUnixMillis(301000)));
    EXPECT_FALSE(back->ExpiredAt(FromUnixMillis(300999)));
}

TEST(LeaseCodecTest, RejectsIncompleteLeases) {
    EXPECT_FALSE(DecodeLease("[]").has_value());
    EXPECT_FALSE(DecodeLease(R"({"expires_at": 5})").has_value());
    EXPECT_FALSE(DecodeLease(R"({"holder_id": "x", "expires_at": "soon"})").has_value());
    EXPECT_FALSE(DecodeLease("garbage").has_value());
}

TEST(LockManagerHolderIdTest, HostPidAndRandomSuffix) {
    const std::string a = MakeHolderId();
    const std::string b = MakeHolderId();
    EXPECT_NE(a, b);
    const auto dash = a.rfind('-');
    ASSERT_NE(dash, std::string::npos);
    EXPECT_EQ(a.size() - dash - 1, 32u);
    EXPECT_NE(a.find("-" + std::to_string(::getpid()) + "-"), std::string::npos);
}

} // namespace
} // namespace pkgrepo
