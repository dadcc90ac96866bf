#include <lark/privileges.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace {

using ::testing::ElementsAre;
using ::testing::Pair;
using lark::PrivilegeTracker;

auto add_names(PrivilegeTracker& tracker) -> void
{
  tracker.join("#chan", "Bot", true);
  tracker.names("#chan", "@alice +bob carol");
}

TEST(Privileges, NamesReply) {
  PrivilegeTracker tracker;
  add_names(tracker);
  EXPECT_EQ(tracker.privileges("#chan", "alice"), lark::OP);
  EXPECT_EQ(tracker.privileges("#chan", "bob"), lark::VOICE);
  EXPECT_EQ(tracker.privileges("#chan", "carol"), 0);
  EXPECT_TRUE(tracker.has_member("#chan", "carol"));
}

TEST(Privileges, ModeChange) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.mode("#chan", {"+o-v", "alice", "bob"});
  EXPECT_EQ(tracker.privileges("#chan", "alice"), lark::OP);
  EXPECT_EQ(tracker.privileges("#chan", "bob"), 0);
}

TEST(Privileges, MultiPrefixNames) {
  PrivilegeTracker tracker;
  tracker.names("#chan", "~@+alice %bob");
  EXPECT_EQ(tracker.privileges("#chan", "alice"), lark::OWNER | lark::OP | lark::VOICE);
  EXPECT_EQ(tracker.privileges("#chan", "bob"), lark::HALFOP);
  EXPECT_TRUE(tracker.has_channel("#chan"));
}

TEST(Privileges, UserhostInNames) {
  PrivilegeTracker tracker;
  tracker.names("#chan", "@alice!al@example.org bob!b@host");
  EXPECT_THAT(tracker.members("#chan"), ElementsAre(Pair("alice", lark::OP), Pair("bob", 0)));
}

TEST(Privileges, ModeSkipsParameterModes) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.mode("#chan", {"+bkov", "*!*@spam", "key", "carol", "carol"});
  EXPECT_EQ(tracker.privileges("#chan", "carol"), lark::OP | lark::VOICE);
}

TEST(Privileges, LimitTakesParameterOnlyWhenSet) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.mode("#chan", {"+lv", "10", "carol"});
  EXPECT_EQ(tracker.privileges("#chan", "carol"), lark::VOICE);
  tracker.mode("#chan", {"-lv", "carol"});
  EXPECT_EQ(tracker.privileges("#chan", "carol"), 0);
}

TEST(Privileges, UserModesIgnored) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.mode("Bot", {"+o", "alice"});
  EXPECT_EQ(tracker.privileges("#chan", "alice"), lark::OP);
}

TEST(Privileges, IsupportPrefix) {
  PrivilegeTracker tracker;
  tracker.isupport({"CHANTYPES=#", "PREFIX=(qov)*@+", "NETWORK=Test"});
  tracker.names("#chan", "*alice @bob");
  EXPECT_EQ(tracker.privileges("#chan", "alice"), lark::OWNER);
  EXPECT_EQ(tracker.privileges("#chan", "bob"), lark::OP);
  tracker.mode("#chan", {"-q", "alice"});
  EXPECT_EQ(tracker.privileges("#chan", "alice"), 0);
}

TEST(Privileges, IsupportChanmodes) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.isupport({"CHANMODES=beIq,kX,lj,imnpst"});
  tracker.mode("#chan", {"+Xv", "param", "carol"});
  EXPECT_EQ(tracker.privileges("#chan", "carol"), lark::VOICE);
  EXPECT_EQ(tracker.privileges("#chan", "param"), 0);
}

TEST(Privileges, NickChangeKeepsBits) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.join("#other", "Bot", true);
  tracker.names("#other", "+alice");
  tracker.rename("Alice", "alice_");
  EXPECT_EQ(tracker.privileges("#chan", "alice_"), lark::OP);
  EXPECT_EQ(tracker.privileges("#other", "alice_"), lark::VOICE);
  EXPECT_FALSE(tracker.has_member("#chan", "alice"));
}

TEST(Privileges, LookupsFoldCase) {
  PrivilegeTracker tracker;
  tracker.join("#Chan{1}", "Bot", true);
  tracker.names("#CHAN[1]", "@Alice|Away +bob");
  EXPECT_EQ(tracker.privileges("#chan[1]", "alice\\away"), lark::OP);

  tracker.rename("BOB", "Bob");
  EXPECT_THAT(tracker.members("#chan{1}"), ElementsAre(Pair("Alice|Away", lark::OP), Pair("Bob", lark::VOICE), Pair("Bot", 0)));

  tracker.part("#CHAN{1}", "ALICE|AWAY", false);
  EXPECT_FALSE(tracker.has_member("#chan{1}", "alice|away"));
  EXPECT_THAT(tracker.channels(), ElementsAre("#Chan{1}"));
}

TEST(Privileges, JoinPartQuit) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.join("#chan", "dave", false);
  EXPECT_TRUE(tracker.has_member("#chan", "dave"));
  tracker.join("#unknown", "dave", false);
  EXPECT_FALSE(tracker.has_channel("#unknown"));

  tracker.part("#chan", "dave", false);
  EXPECT_FALSE(tracker.has_member("#chan", "dave"));

  tracker.quit("alice");
  EXPECT_FALSE(tracker.has_member("#chan", "alice"));
  EXPECT_TRUE(tracker.has_member("#chan", "bob"));
}

TEST(Privileges, SelfPartDropsChannel) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.part("#CHAN", "Bot", true);
  EXPECT_FALSE(tracker.has_channel("#chan"));
  EXPECT_TRUE(tracker.channels().empty());
}

TEST(Privileges, AtLeast) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.mode("#chan", {"+v", "alice"});
  EXPECT_TRUE(tracker.at_least("#chan", "alice", lark::OP));
  EXPECT_TRUE(tracker.at_least("#chan", "alice", lark::HALFOP));
  EXPECT_FALSE(tracker.at_least("#chan", "alice", lark::ADMIN));
  EXPECT_TRUE(tracker.at_least("#chan", "bob", lark::VOICE));
  EXPECT_FALSE(tracker.at_least("#chan", "carol", lark::VOICE));
}

TEST(Privileges, Clear) {
  PrivilegeTracker tracker;
  add_names(tracker);
  tracker.clear();
  EXPECT_FALSE(tracker.has_channel("#chan"));
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
