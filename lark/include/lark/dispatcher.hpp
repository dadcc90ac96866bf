#pragma once
/**
 * @file dispatcher.hpp
 * @brief Routes inbound messages to matching handlers
 *
 */

#include "lark/message.hpp"
#include "lark/rate_limit.hpp"
#include "lark/rules.hpp"
#include "lark/settings.hpp"
#include "lark/worker_pool.hpp"

#include <boost/regex.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

class Dispatcher
{
public:
    /// @brief Delivers an error report to the triggering recipient
    using Report = std::function<void(std::string_view recipient, std::string_view text)>;
    using Now = std::function<RateLimiter::clock::time_point()>;

private:
    RuleRegistry const& registry_;
    RateLimiter& limiter_;
    WorkerPool& workers_;
    Report report_;
    Now now_;

    std::string owner_;
    std::set<std::string> admins_;
    std::vector<boost::regex> nick_blocks_;
    std::vector<boost::regex> host_blocks_;
    std::map<std::string, std::set<std::string>> channel_plugins_;

public:
    /**
     * @throw rule_error when a blocklist pattern is invalid
     */
    Dispatcher(
        RuleRegistry const& registry,
        RateLimiter& limiter,
        WorkerPool& workers,
        Settings const& settings,
        Report report,
        Now now = {});

    /**
     * @brief Run every handler matching the message
     *
     * Handlers are visited by priority, then registration order. Each
     * matching pattern of a handler produces one invocation.
     *
     * @return number of invocations started
     */
    auto dispatch(std::shared_ptr<Message const> const& message) -> std::size_t;

    /// @brief Queue one run of an interval job on the worker pool
    auto run_job(HandlerPtr const& job) -> bool;

    auto rank(Message const& message) const -> Rank;
    auto is_blocked(Message const& message) const -> bool;

    /// @brief True when the message's channel does not allow the handler's plugin
    auto is_restricted(HandlerDescriptor const& handler, Message const& message) const -> bool;

private:
    auto invoke(HandlerDescriptor const& handler, Trigger const& trigger) -> void;
    auto call(HandlerDescriptor const& handler, Trigger const& trigger) -> HandlerResult;
    auto report(HandlerDescriptor const& handler, Trigger const& trigger, std::string const& problem) -> void;
};

} // namespace lark
