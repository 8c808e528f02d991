#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "dropguard/memory_session_store.hpp"

namespace {
struct ManualClock {
  std::shared_ptr<std::atomic<std::int64_t>> now = std::make_shared<std::atomic<std::int64_t>>(1700000000);

  dropguard::Clock AsClock() const {
    auto state = now;
    return [state]() { return dropguard::FromUnixSeconds(state->load()); };
  }
  void Advance(std::int64_t seconds) { *now += seconds; }
};

dropguard::SessionRecord MakeRecord(const std::string& owner, std::int64_t created) {
  dropguard::SessionRecord record;
  record.owner_id = owner;
  record.created_at = dropguard::FromUnixSeconds(created);
  record.last_activity_at = record.created_at;
  return record;
}

constexpr std::chrono::seconds kTtl{3600};
}  // namespace

class MemorySessionStoreTest : public ::testing::Test {
 protected:
  ManualClock clock_;
  dropguard::MemorySessionStore store_{clock_.AsClock()};
};

TEST_F(MemorySessionStoreTest, CreateThenReadRoundTrip) {
  auto record = MakeRecord("alice", 1700000000);
  record.application_data = {{"k", 1}};
  store_.Create("s1", "alice", record, kTtl);

  auto read = store_.Read("s1");
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read->session_id, "s1");
  EXPECT_EQ(read->owner_id, "alice");
  EXPECT_EQ(read->application_data["k"], 1);
  EXPECT_EQ(store_.CountForOwner("alice"), 1u);
}

TEST_F(MemorySessionStoreTest, ExpiredRecordIsAbsent) {
  store_.Create("s1", "alice", MakeRecord("alice", 1700000000), kTtl);
  clock_.Advance(3599);
  EXPECT_TRUE(store_.Read("s1").has_value());
  clock_.Advance(1);
  EXPECT_FALSE(store_.Read("s1").has_value());
  EXPECT_EQ(store_.CountForOwner("alice"), 0u);
}

TEST_F(MemorySessionStoreTest, RefreshExtendsExpiryAndActivity) {
  store_.Create("s1", "alice", MakeRecord("alice", 1700000000), kTtl);
  clock_.Advance(3000);
  store_.RefreshTtl("s1", kTtl);
  clock_.Advance(3000);
  auto read = store_.Read("s1");
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(dropguard::ToUnixSeconds(read->last_activity_at), 1700003000);
}

TEST_F(MemorySessionStoreTest, RefreshOfMissingSessionIsNoOp) {
  store_.RefreshTtl("missing", kTtl);
  EXPECT_FALSE(store_.Read("missing").has_value());
}

TEST_F(MemorySessionStoreTest, RotatePreservesCreatedAtAndRemovesOld) {
  store_.Create("old", "alice", MakeRecord("alice", 1700000000), kTtl);
  clock_.Advance(400);
  auto payload = *store_.Read("old");
  ASSERT_TRUE(store_.RotateAtomic("old", "new", "alice", payload, kTtl));

  EXPECT_FALSE(store_.Read("old").has_value());
  auto rotated = store_.Read("new");
  ASSERT_TRUE(rotated.has_value());
  EXPECT_EQ(dropguard::ToUnixSeconds(rotated->created_at), 1700000000);
  EXPECT_EQ(dropguard::ToUnixSeconds(rotated->last_activity_at), 1700000400);
  EXPECT_EQ(store_.CountForOwner("alice"), 1u);
}

TEST_F(MemorySessionStoreTest, RotateRejectsOwnerMismatchWithoutChanges) {
  store_.Create("old", "alice", MakeRecord("alice", 1700000000), kTtl);
  auto payload = *store_.Read("old");
  EXPECT_FALSE(store_.RotateAtomic("old", "new", "mallory", payload, kTtl));
  EXPECT_TRUE(store_.Read("old").has_value());
  EXPECT_FALSE(store_.Read("new").has_value());
}

TEST_F(MemorySessionStoreTest, RotateOfMissingOrExpiredFails) {
  auto payload = MakeRecord("alice", 1700000000);
  EXPECT_FALSE(store_.RotateAtomic("ghost", "new", "alice", payload, kTtl));
  store_.Create("old", "alice", payload, std::chrono::seconds(60));
  clock_.Advance(60);
  EXPECT_FALSE(store_.RotateAtomic("old", "new", "alice", payload, kTtl));
  EXPECT_FALSE(store_.Read("new").has_value());
}

TEST_F(MemorySessionStoreTest, RepeatedRotationWithSameNewIdIsIdempotent) {
  store_.Create("old", "alice", MakeRecord("alice", 1700000000), kTtl);
  auto payload = *store_.Read("old");
  ASSERT_TRUE(store_.RotateAtomic("old", "new", "alice", payload, kTtl));

  EXPECT_TRUE(store_.RotateAtomic("old", "new", "alice", payload, kTtl));
  EXPECT_FALSE(store_.RotateAtomic("old", "new", "mallory", payload, kTtl));
  EXPECT_FALSE(store_.RotateAtomic("old", "other", "alice", payload, kTtl));
  EXPECT_EQ(store_.CountForOwner("alice"), 1u);
}

TEST_F(MemorySessionStoreTest, ConcurrentRotationsHaveOneWinner) {
  store_.Create("old", "alice", MakeRecord("alice", 1700000000), kTtl);
  auto payload = *store_.Read("old");

  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      if (store_.RotateAtomic("old", "new-" + std::to_string(i), "alice", payload, kTtl)) {
        ++winners;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_FALSE(store_.Read("old").has_value());
  EXPECT_EQ(store_.CountForOwner("alice"), 1u);
}

TEST_F(MemorySessionStoreTest, DeleteAllForOwnerLeavesOthers) {
  store_.Create("a1", "alice", MakeRecord("alice", 1700000000), kTtl);
  store_.Create("a2", "alice", MakeRecord("alice", 1700000000), kTtl);
  store_.Create("b1", "bob", MakeRecord("bob", 1700000000), kTtl);

  store_.DeleteAllForOwner("alice");
  EXPECT_FALSE(store_.Read("a1").has_value());
  EXPECT_FALSE(store_.Read("a2").has_value());
  EXPECT_TRUE(store_.Read("b1").has_value());
  EXPECT_EQ(store_.CountForOwner("alice"), 0u);
  EXPECT_EQ(store_.CountForOwner("bob"), 1u);
}

TEST_F(MemorySessionStoreTest, CreateWithNewOwnerMovesIndexEntry) {
  store_.Create("s1", "alice", MakeRecord("alice", 1700000000), kTtl);
  store_.Create("s1", "bob", MakeRecord("bob", 1700000000), kTtl);
  EXPECT_EQ(store_.CountForOwner("alice"), 0u);
  EXPECT_EQ(store_.CountForOwner("bob"), 1u);
}

TEST_F(MemorySessionStoreTest, UpdateApplicationDataOnlyTouchesData) {
  store_.Create("s1", "alice", MakeRecord("alice", 1700000000), kTtl);
  clock_.Advance(10);
  EXPECT_TRUE(store_.UpdateApplicationData("s1", {{"cart", 3}}));
  auto read = store_.Read("s1");
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read->application_data["cart"], 3);
  EXPECT_EQ(dropguard::ToUnixSeconds(read->last_activity_at), 1700000000);
  EXPECT_FALSE(store_.UpdateApplicationData("missing", {{"cart", 1}}));
}

TEST_F(MemorySessionStoreTest, PurgeExpiredCountsRemovedRecords) {
  store_.Create("short", "alice", MakeRecord("alice", 1700000000), std::chrono::seconds(60));
  store_.Create("long", "alice", MakeRecord("alice", 1700000000), kTtl);
  clock_.Advance(120);
  EXPECT_EQ(store_.PurgeExpired(), 1u);
  EXPECT_EQ(store_.PurgeExpired(), 0u);
  EXPECT_EQ(store_.CountForOwner("alice"), 1u);
}
