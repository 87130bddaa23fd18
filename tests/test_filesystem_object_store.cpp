#include "storage/filesystem_object_store.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <thread>

namespace pkgrepo {
namespace {

class FilesystemObjectStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto r = FilesystemObjectStore::Open(tmp.Path() + "/store", store);
        ASSERT_TRUE(r.ok) << r.msg;
    }

    testutil::TemporaryDirectory tmp;
    FilesystemObjectStore store;
};

TEST_F(FilesystemObjectStoreTest, PutCreatesNestedFileAndTokenIsDigest) {
    VersionToken token;
    ASSERT_TRUE(store.Put("el9/x86_64/packages/a.rpm", ToBytes("data"), Precondition::Unconditional(), &token).ok);
    EXPECT_EQ(token, Sha256Hex(std::string_view("data")));

    struct stat st{};
    EXPECT_EQ(::stat((store.Root() + "/el9/x86_64/packages/a.rpm").c_str(), &st), 0);

    StoredObject obj;
    ASSERT_TRUE(store.Get("el9/x86_64/packages/a.rpm", obj).ok);
    EXPECT_EQ(AsStringView(obj.data), "data");
    EXPECT_EQ(obj.token, token);
    EXPECT_EQ(store.Describe(), "file://" + store.Root());
}

TEST_F(FilesystemObjectStoreTest, MissingKeyIsNotFound) {
    StoredObject obj;
    EXPECT_EQ(store.Get("nothing/here", obj).err, ErrorCode::NotFound);
    EXPECT_TRUE(DeleteObject(store, "nothing/here").ok);
}

TEST_F(FilesystemObjectStoreTest, ConditionalWrites) {
    VersionToken t;
    ASSERT_TRUE(store.Put("repo/lock", ToBytes("a"), Precondition::IfAbsent(), &t).ok);
    EXPECT_EQ(store.Put("repo/lock", ToBytes("b"), Precondition::IfAbsent(), nullptr).err,
              ErrorCode::PreconditionFailed);
    EXPECT_EQ(store.Delete("repo/lock", Precondition::IfMatch("deadbeef")).err,
              ErrorCode::PreconditionFailed);
    ASSERT_TRUE(store.Delete("repo/lock", Precondition::IfMatch(t)).ok);

    StoredObject obj;
    EXPECT_EQ(store.Get("repo/lock", obj).err, ErrorCode::NotFound);
}

TEST_F(FilesystemObjectStoreTest, RejectsUnsafeKeys) {
    for (const char* key : {"", "/abs", "a/../b", "..", "a//b", "a/.pkgrepo-store.lock", "a/x.tmp-123"}) {
        auto r = PutObject(store, key, ToBytes("x"));
        EXPECT_FALSE(r.ok) << key;
        EXPECT_EQ(r.err, ErrorCode::StorageError) << key;
    }
}

TEST_F(FilesystemObjectStoreTest, ListSkipsLockFileAndSorts) {
    ASSERT_TRUE(PutObject(store, "r/packages/b.rpm", ToBytes("b")).ok);
    ASSERT_TRUE(PutObject(store, "r/packages/a.rpm", ToBytes("a")).ok);
    ASSERT_TRUE(PutObject(store, "r/metadata/manifest", ToBytes("m")).ok);
    ASSERT_TRUE(PutObject(store, "other/x", ToBytes("x")).ok);

    std::vector<std::string> keys;
    ASSERT_TRUE(store.List("r/", keys).ok);
    EXPECT_EQ(keys, (std::vector<std::string>{"r/metadata/manifest", "r/packages/a.rpm", "r/packages/b.rpm"}));

    ASSERT_TRUE(store.List("", keys).ok);
    EXPECT_EQ(keys.size(), 4u);

    ASSERT_TRUE(store.List("missing/", keys).ok);
    EXPECT_TRUE(keys.empty());
}

TEST_F(FilesystemObjectStoreTest, ConcurrentIfAbsentHasSingleWinner) {
    ASSERT_TRUE(PutObject(store, "repo/marker", ToBytes("m")).ok);
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i] {
            auto data = ToBytes("holder-" + std::to_string(i));
            if (store.Put("repo/lock", data, Precondition::IfAbsent(), nullptr).ok) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST(FilesystemObjectStoreOpenTest, EmptyRootIsInvalid) {
    FilesystemObjectStore store;
    EXPECT_EQ(FilesystemObjectStore::Open("", store).err, ErrorCode::InvalidConfig);
}

} // namespace
} // namespace pkgrepo
