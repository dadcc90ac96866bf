#pragma once
/**
 * @file rules.hpp
 * @brief Handler descriptors and the registry that owns them
 *
 */

#include "lark/trigger.hpp"

#include <boost/regex.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lark {

enum class Priority {
    HIGH,
    MEDIUM,
    LOW,
};

/// @brief Handler return value; NOLIMIT skips rate-limit bookkeeping
enum class HandlerResult {
    OK,
    NOLIMIT,
};

using Callback = std::function<HandlerResult(Trigger const&)>;

/// @brief Regular expressions matched at the start of the message text
struct Patterns { std::vector<std::string> expressions; };

/// @brief Command names recognized after the command prefix
struct Commands { std::vector<std::string> names; };

/// @brief Fires on every message whose command is in the event filter
struct Events {};

/// @brief Runs periodically without an inbound message
struct Interval { std::chrono::seconds period; };

using RuleKind = std::variant<Patterns, Commands, Events, Interval>;

/// @brief Cooldown periods; zero disables a scope
struct RateLimits {
    std::chrono::seconds user {0};
    std::chrono::seconds channel {0};
    std::chrono::seconds global {0};
};

/// @brief Registration request supplied by a plugin
struct RuleSpec {
    std::string plugin;
    std::string label;
    RuleKind kind;
    std::vector<std::string> events {"PRIVMSG"};
    Priority priority = Priority::MEDIUM;
    bool threaded = true;
    RateLimits rate {};
    bool unblockable = false;
    std::vector<std::string> intents {};
    Callback callback {};
};

struct rule_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Compiled, immutable handler registration
 */
class HandlerDescriptor
{
public:
    std::size_t const id;
    std::string const plugin;
    std::string const label;
    RuleKind const kind;
    std::vector<boost::regex> const patterns;
    std::vector<std::string> const events;
    Priority const priority;
    bool const threaded;
    RateLimits const rate;
    bool const unblockable;
    std::vector<std::string> const intents;
    Callback const callback;

    HandlerDescriptor(std::size_t id, RuleSpec spec, std::vector<boost::regex> patterns);

    /// @brief "plugin.label", used in logs and error reports
    auto name() const -> std::string { return plugin + "." + label; }

    auto is_job() const -> bool { return std::holds_alternative<Interval>(kind); }

    /// @brief True when the event filter admits this command
    auto handles(std::string_view command) const -> bool;

    /// @brief True when the handler has no intent filter or lists this intent
    auto accepts_intent(std::optional<std::string_view> intent) const -> bool;
};

using HandlerPtr = std::shared_ptr<HandlerDescriptor const>;

/**
 * @brief Ordered collection of registered handlers
 *
 * Handlers are kept per priority in registration order. Interval
 * jobs are kept separately as they are never matched.
 */
class RuleRegistry
{
    std::string command_prefix_;
    std::size_t next_id_ = 0;
    std::array<std::vector<HandlerPtr>, 3> rules_;
    std::vector<HandlerPtr> jobs_;

public:
    /// @param command_prefix regular expression introducing commands
    explicit RuleRegistry(std::string command_prefix = "\\.");

    /**
     * @brief Compile and register a handler
     *
     * @return The immutable descriptor
     * @throw rule_error when a pattern is invalid or the callback is missing
     */
    auto add(RuleSpec spec) -> HandlerPtr;

    auto rules(Priority priority) const -> std::vector<HandlerPtr> const&
    {
        return rules_[static_cast<std::size_t>(priority)];
    }

    auto jobs() const -> std::vector<HandlerPtr> const& { return jobs_; }

    auto command_prefix() const -> std::string const& { return command_prefix_; }

    /// @brief Total number of registered handlers and jobs
    auto size() const -> std::size_t;
};

/// @brief Escape regular expression metacharacters in a literal
auto regex_escape(std::string_view literal) -> std::string;

} // namespace lark
