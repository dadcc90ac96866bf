#include <lark/store.hpp>

#include <gtest/gtest.h>

namespace {

TEST(MemoryStore, MissingValue) {
  lark::MemoryStore store;
  EXPECT_EQ(store.get("alice", "tz"), std::nullopt);
}

TEST(MemoryStore, SetAndGet) {
  lark::MemoryStore store;
  store.set("alice", "tz", "Europe/Berlin");
  EXPECT_EQ(store.get("alice", "tz"), "Europe/Berlin");
  store.set("alice", "tz", "UTC");
  EXPECT_EQ(store.get("alice", "tz"), "UTC");
}

TEST(MemoryStore, OwnersAreCaseFolded) {
  lark::MemoryStore store;
  store.set("#Chan{1}", "topic", "welcome");
  EXPECT_EQ(store.get("#chan[1]", "topic"), "welcome");
}

TEST(MemoryStore, KeysAreExact) {
  lark::MemoryStore store;
  store.set("alice", "tz", "UTC");
  EXPECT_EQ(store.get("alice", "TZ"), std::nullopt);
}

TEST(MemoryStore, Erase) {
  lark::MemoryStore store;
  store.set("alice", "tz", "UTC");
  EXPECT_TRUE(store.erase("ALICE", "tz"));
  EXPECT_FALSE(store.erase("alice", "tz"));
  EXPECT_EQ(store.get("alice", "tz"), std::nullopt);
}

TEST(MemoryStore, UsableThroughInterface) {
  lark::MemoryStore memory;
  lark::KeyValueStore& store = memory;
  store.set("bob", "seen", "yesterday");
  EXPECT_EQ(memory.get("Bob", "seen"), "yesterday");
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
