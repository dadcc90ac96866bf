#include <lark/rate_limit.hpp>

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;
using lark::RateLimiter;
using lark::RateLimits;

auto at(std::chrono::seconds const s) -> RateLimiter::clock::time_point
{
  return RateLimiter::clock::time_point{} + s;
}

/// Attempt one invocation and record it when permitted
auto attempt(RateLimiter& limiter, RateLimits const& limits, std::string_view nick, std::string_view channel, std::chrono::seconds when) -> bool
{
  if (limiter.permit(7, limits, nick, channel, at(when))) {
    limiter.record(7, nick, channel, at(when));
    return true;
  }
  return false;
}

TEST(RateLimit, DeniedAttemptRestartsCooldown) {
  RateLimiter limiter;
  RateLimits const limits {.user = 20s};

  EXPECT_TRUE(attempt(limiter, limits, "alice", "#chan", 0s));
  EXPECT_FALSE(attempt(limiter, limits, "alice", "#chan", 5s));
  EXPECT_FALSE(attempt(limiter, limits, "alice", "#chan", 24s));
  EXPECT_TRUE(attempt(limiter, limits, "alice", "#chan", 45s));
}

TEST(RateLimit, UserScopeIsPerNick) {
  RateLimiter limiter;
  RateLimits const limits {.user = 10s};

  EXPECT_TRUE(attempt(limiter, limits, "alice", "#chan", 0s));
  EXPECT_TRUE(attempt(limiter, limits, "bob", "#chan", 1s));
  EXPECT_FALSE(attempt(limiter, limits, "ALICE", "#chan", 2s));
}

TEST(RateLimit, ChannelScope) {
  RateLimiter limiter;
  RateLimits const limits {.channel = 10s};

  EXPECT_TRUE(attempt(limiter, limits, "alice", "#chan", 0s));
  EXPECT_FALSE(attempt(limiter, limits, "bob", "#Chan", 1s));
  EXPECT_TRUE(attempt(limiter, limits, "bob", "#other", 2s));
  // private messages have no channel scope
  EXPECT_TRUE(attempt(limiter, limits, "bob", "", 3s));
}

TEST(RateLimit, GlobalScope) {
  RateLimiter limiter;
  RateLimits const limits {.global = 10s};

  EXPECT_TRUE(attempt(limiter, limits, "alice", "#a", 0s));
  EXPECT_FALSE(attempt(limiter, limits, "bob", "#b", 1s));
  EXPECT_FALSE(attempt(limiter, limits, "carol", "", 2s));
  EXPECT_TRUE(attempt(limiter, limits, "carol", "", 12s));
}

TEST(RateLimit, HandlersAreIndependent) {
  RateLimiter limiter;
  RateLimits const limits {.user = 10s};

  EXPECT_TRUE(limiter.permit(1, limits, "alice", "", at(0s)));
  limiter.record(1, "alice", "", at(0s));
  EXPECT_TRUE(limiter.permit(2, limits, "alice", "", at(1s)));
  EXPECT_FALSE(limiter.permit(1, limits, "alice", "", at(1s)));
}

TEST(RateLimit, ZeroPeriodNeverLimits) {
  RateLimiter limiter;
  RateLimits const limits {};

  for (auto const t : {0s, 0s, 1s}) {
    EXPECT_TRUE(attempt(limiter, limits, "alice", "#chan", t));
  }
}

TEST(RateLimit, UnrecordedRunDoesNotLimit) {
  RateLimiter limiter;
  RateLimits const limits {.user = 10s};

  EXPECT_TRUE(limiter.permit(3, limits, "alice", "", at(0s)));
  EXPECT_TRUE(limiter.permit(3, limits, "alice", "", at(1s)));
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
