#pragma once
/**
 * @file rate_limit.hpp
 * @brief Per-user, per-channel, and global handler cooldowns
 *
 */

#include "lark/rules.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

namespace lark {

/**
 * @brief Cooldown bookkeeping keyed by scope, identity, and handler
 *
 * A denied attempt restarts the cooldown of the scope that denied
 * it, so a user who keeps retrying stays blocked until a full
 * period passes without attempts.
 */
class RateLimiter
{
public:
    using clock = std::chrono::steady_clock;

    enum class Scope {
        USER,
        CHANNEL,
        GLOBAL,
    };

private:
    std::mutex mutex_;
    std::map<std::tuple<Scope, std::string, std::size_t>, clock::time_point> stamps_;

public:
    /**
     * @brief Decide whether a handler may run now
     *
     * @param handler handler identity
     * @param limits cooldown periods of the handler
     * @param nick triggering nickname
     * @param channel originating channel, empty for private messages
     * @param now current time
     * @return true when no scope's cooldown is active
     */
    auto permit(
        std::size_t handler,
        RateLimits const& limits,
        std::string_view nick,
        std::string_view channel,
        clock::time_point now) -> bool;

    /// @brief Record a completed invocation in every applicable scope
    auto record(
        std::size_t handler,
        std::string_view nick,
        std::string_view channel,
        clock::time_point now) -> void;
};

} // namespace lark
