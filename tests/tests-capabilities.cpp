#include <lark/capabilities.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

namespace {

using ::testing::ElementsAre;
using ::testing::Pair;
using lark::CapabilityManager;
using lark::CapRequest;
using lark::CapStatus;

auto advertised(std::initializer_list<std::string> names) -> std::set<std::string, std::less<>>
{
  return {names.begin(), names.end()};
}

TEST(Capabilities, NormalizeSortsAndDeduplicates) {
  EXPECT_THAT(CapabilityManager::normalize({"sasl", "account-tag", "", "sasl"}),
    ElementsAre("account-tag", "sasl"));
  EXPECT_THAT(CapabilityManager::parse("multi-prefix  away-notify"),
    ElementsAre("away-notify", "multi-prefix"));
  EXPECT_EQ(CapabilityManager::join({"a", "b"}), "a b");
}

TEST(Capabilities, RejectsOversizedRequest) {
  CapabilityManager caps;
  EXPECT_THROW(caps.register_request("big", {std::string(501, 'x')}), lark::capability_error);
  EXPECT_THROW(caps.register_request("empty", {}), lark::capability_error);
  EXPECT_NO_THROW(caps.register_request("ok", {std::string(500, 'x')}));
}

TEST(Capabilities, RequestsOnlyAdvertised) {
  CapabilityManager caps;
  caps.register_request("a", {"multi-prefix"});
  caps.register_request("b", {"away-notify", "-echo-message"});
  caps.register_request("c", {"draft/unknown"});

  auto const requests = caps.request_available(advertised({"multi-prefix", "away-notify", "echo-message"}));
  EXPECT_THAT(requests, ElementsAre(CapRequest{"-echo-message", "away-notify"}, CapRequest{"multi-prefix"}));
  EXPECT_TRUE(caps.is_requested({"multi-prefix"}));
  EXPECT_FALSE(caps.is_requested({"draft/unknown"}));
  EXPECT_TRUE(caps.is_registered({"draft/unknown"}));

  // a second pass does not repeat requests
  EXPECT_TRUE(caps.request_available(advertised({"multi-prefix"})).empty());
}

TEST(Capabilities, AcknowledgeAndDeny) {
  CapabilityManager caps;
  caps.register_request("a", {"multi-prefix"});
  caps.request_available(advertised({"multi-prefix"}));
  EXPECT_FALSE(caps.is_complete());

  auto const results = caps.acknowledge({"multi-prefix"});
  ASSERT_TRUE(results.has_value());
  EXPECT_THAT(*results, ElementsAre(Pair("a", CapStatus::DONE)));
  EXPECT_TRUE(caps.is_acknowledged({"multi-prefix"}));
  EXPECT_TRUE(caps.is_enabled("multi-prefix"));
  EXPECT_TRUE(caps.is_complete());

  caps.deny({"multi-prefix"});
  EXPECT_FALSE(caps.is_acknowledged({"multi-prefix"}));
  EXPECT_TRUE(caps.is_denied({"multi-prefix"}));
  EXPECT_FALSE(caps.is_enabled("multi-prefix"));
}

TEST(Capabilities, UnrequestedAckIgnored) {
  CapabilityManager caps;
  caps.register_request("a", {"multi-prefix"});
  EXPECT_EQ(caps.acknowledge({"multi-prefix"}), std::nullopt);
  EXPECT_EQ(caps.deny({"server-time"}), std::nullopt);
  EXPECT_FALSE(caps.is_acknowledged({"multi-prefix"}));
}

TEST(Capabilities, TwoPluginsShareRequest) {
  CapabilityManager caps;
  std::vector<std::string> calls;

  caps.register_request("first", {"sasl"}, [&calls](CapRequest const&, bool const ack) {
    calls.push_back(ack ? "first+" : "first-");
    return CapStatus::DONE;
  });
  caps.register_request("second", {"sasl"}, [&calls](CapRequest const&, bool const ack) {
    calls.push_back(ack ? "second+" : "second-");
    return CapStatus::CONTINUE;
  });

  EXPECT_EQ(caps.request_available(advertised({"sasl"})).size(), 1u);

  auto const results = caps.acknowledge({"sasl"});
  ASSERT_TRUE(results.has_value());
  EXPECT_THAT(*results, ElementsAre(Pair("first", CapStatus::DONE), Pair("second", CapStatus::CONTINUE)));
  EXPECT_THAT(calls, ElementsAre("first+", "second+"));
  EXPECT_FALSE(caps.is_complete());

  EXPECT_EQ(caps.resume({"sasl"}, "second"), std::make_pair(false, true));
  EXPECT_TRUE(caps.is_complete());
}

TEST(Capabilities, CallbackExceptionIsError) {
  CapabilityManager caps;
  caps.register_request("broken", {"sasl"}, [](CapRequest const&, bool) -> CapStatus {
    throw std::runtime_error{"boom"};
  });
  caps.request_available(advertised({"sasl"}));
  auto const results = caps.deny({"sasl"});
  ASSERT_TRUE(results.has_value());
  EXPECT_THAT(*results, ElementsAre(Pair("broken", CapStatus::ERROR)));
  EXPECT_FALSE(caps.is_complete());
}

TEST(Capabilities, ResumeUnknownChangesNothing) {
  CapabilityManager caps;
  caps.register_request("a", {"sasl"});
  caps.request_available(advertised({"sasl"}));
  EXPECT_EQ(caps.resume({"sasl"}, "nobody"), std::make_pair(false, false));
  EXPECT_EQ(caps.resume({"away-notify"}, "a"), std::make_pair(false, false));
}

TEST(Capabilities, ResetForgetsConnectionState) {
  CapabilityManager caps;
  caps.register_request("a", {"sasl"});
  caps.request_available(advertised({"sasl"}));
  caps.acknowledge({"sasl"});
  caps.reset();
  EXPECT_FALSE(caps.is_requested({"sasl"}));
  EXPECT_FALSE(caps.is_acknowledged({"sasl"}));
  EXPECT_TRUE(caps.is_registered({"sasl"}));
  EXPECT_EQ(caps.request_available(advertised({"sasl"})).size(), 1u);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
