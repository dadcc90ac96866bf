#pragma once
/**
 * @file bot.hpp
 * @brief Engine context owning one IRC session and its components
 *
 */

#include "lark/capabilities.hpp"
#include "lark/connection.hpp"
#include "lark/dispatcher.hpp"
#include "lark/flood.hpp"
#include "lark/privileges.hpp"
#include "lark/rate_limit.hpp"
#include "lark/rules.hpp"
#include "lark/settings.hpp"
#include "lark/store.hpp"
#include "lark/worker_pool.hpp"

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

/**
 * @brief One bot connection with its registry, trackers, and queues
 *
 * Reader-path state (capabilities, privilege mutations, timers) is
 * only touched on the io_context thread. Output methods may be
 * called from handlers on any thread.
 */
class Bot
{
public:
    using clock = std::chrono::steady_clock;

private:
    boost::asio::io_context& io_context_;
    Settings const settings_;
    KeyValueStore& store_;
    std::shared_ptr<Connection> connection_;

    RuleRegistry rules_;
    CapabilityManager capabilities_;
    PrivilegeTracker privileges_;
    RateLimiter limiter_;
    FloodControl flood_;
    Dispatcher dispatcher_;

    boost::asio::steady_timer watchdog_timer_;
    boost::asio::steady_timer ping_timer_;
    std::list<std::weak_ptr<boost::asio::steady_timer>> timers_;

    std::vector<std::function<void()>> shutdown_hooks_;

    mutable std::mutex nick_mutex_;
    std::string nick_;

    std::atomic<clock::time_point> last_read_;
    std::atomic<clock::time_point> last_write_;
    std::atomic<bool> quitting_ {false};
    bool closed_ = false;
    bool cap_ended_ = false;

    // declared last so running jobs finish before the members they use go away
    WorkerPool workers_;

public:
    /**
     * @brief Construct a new Bot object
     *
     * @param io_context event loop running the session
     * @param settings validated configuration
     * @param store key-value collaborator exposed to plugins
     * @throw rule_error when a configured blocklist pattern is invalid
     */
    Bot(boost::asio::io_context& io_context, Settings settings, KeyValueStore& store);
    ~Bot();

    Bot(Bot const&) = delete;
    Bot(Bot&&) = delete;
    auto operator=(Bot const&) -> Bot& = delete;
    auto operator=(Bot&&) -> Bot& = delete;

    /**
     * @brief Connect to the configured server and run the session
     *
     * Completes when the connection closes for any reason.
     */
    auto run() -> boost::asio::awaitable<void>;

    /**
     * @brief Register and process lines on an already connected stream
     *
     * Completes when the connection closes for any reason.
     */
    auto serve() -> boost::asio::awaitable<void>;

    /**
     * @brief Process one raw inbound line
     *
     * Decodes, parses, answers PING, enforces fatal numerics, and
     * dispatches to handlers. Undecodable or malformed lines are
     * dropped.
     */
    auto handle_line(std::string_view raw) -> void;

    /// @brief Close the connection, run shutdown hooks, and stop workers
    auto shutdown() -> void;

    // plugin registration, before run or on the io thread

    /// @throw rule_error when the rule cannot be compiled
    auto register_rule(RuleSpec spec) -> HandlerPtr;

    /// @throw capability_error when the request is too long
    auto register_capability(std::string const& plugin, std::vector<std::string> tokens, CapCallback callback = {}) -> void;

    /**
     * @brief Report that a plugin finished a request it continued
     *
     * Sends CAP END when this completes negotiation. Safe to call
     * from any thread.
     */
    auto resume_capability_negotiation(std::vector<std::string> tokens, std::string plugin) -> void;

    /// @brief Send CAP END unless it was already sent on this connection
    auto end_capability_negotiation() -> void;
    auto capability_negotiation_ended() const -> bool { return cap_ended_; }

    auto add_shutdown_hook(std::function<void()> hook) -> void;

    /**
     * @brief Run a function on the io thread after a delay
     *
     * Pending calls are canceled when the connection closes.
     */
    auto schedule(clock::duration delay, std::function<void()> action) -> void;

    // output, safe from any thread

    /// @brief Flood-controlled PRIVMSG, split into at most max_messages lines
    auto say(std::string_view text, std::string_view recipient, std::size_t max_messages = 1) -> void;
    auto notice(std::string_view text, std::string_view recipient) -> void;
    auto action(std::string_view text, std::string_view recipient) -> void;

    /// @brief Address the triggering user where the trigger came from
    auto reply(std::string_view text, Trigger const& trigger, bool as_notice = false) -> void;

    /**
     * @brief Send a command built from arguments and an optional trailing text
     *
     * @param args command and middle parameters
     * @param text trailing parameter, sent after " :"
     */
    auto write(std::vector<std::string> const& args, std::optional<std::string_view> text = std::nullopt) -> void;

    /// @brief Send a preformatted line
    auto write_line(std::string_view line) -> void;

    auto join(std::string_view channel, std::string_view key = {}) -> void;
    auto part(std::string_view channel, std::string_view reason = {}) -> void;
    auto quit(std::string_view message = {}) -> void;

    // state

    auto settings() const -> Settings const& { return settings_; }
    auto nick() const -> std::string;
    auto set_nick(std::string nick) -> void;
    auto store() -> KeyValueStore& { return store_; }
    auto privileges() const -> PrivilegeTracker const& { return privileges_; }
    auto tracker() -> PrivilegeTracker& { return privileges_; }
    auto capabilities() -> CapabilityManager& { return capabilities_; }
    auto rules() const -> RuleRegistry const& { return rules_; }
    auto connection() -> Connection& { return *connection_; }
    auto has_quit() const -> bool { return quitting_; }
    auto is_closed() const -> bool { return closed_; }

private:
    auto watchdog_thread() -> boost::asio::awaitable<void>;
    auto ping_thread() -> boost::asio::awaitable<void>;
    auto schedule_job(HandlerPtr job) -> void;
};

} // namespace lark
