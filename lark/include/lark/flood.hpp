#pragma once
/**
 * @file flood.hpp
 * @brief Outbound pacing and repeat suppression for PRIVMSG
 *
 */

#include "lark/identifier.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

struct FloodSettings
{
    /// @brief Byte budget of one message fragment
    std::size_t text_length = 400;

    /// @brief Sends closer together than this are paced
    std::chrono::milliseconds burst_window {3000};

    /// @brief Pacing delay is base_delay + max(0, len - free_length) / length_divisor seconds
    double base_delay = 0.7;
    std::size_t free_length = 50;
    double length_divisor = 70.0;

    /// @brief Sends remembered per recipient
    std::size_t history = 10;

    /// @brief Recent sends inspected for repeats
    std::size_t repeat_window = 8;
    std::size_t repeat_threshold = 5;
    std::size_t placeholder_limit = 3;
    std::chrono::seconds repeat_age {120};
};

/**
 * @brief Per-recipient flood control in front of the connection
 *
 * The pacing sleep happens on the calling thread while the history
 * lock is held, so concurrent senders are serialized. The clock and
 * sleep functions default to the steady clock and a thread sleep.
 */
class FloodControl
{
public:
    using clock = std::chrono::steady_clock;
    using Now = std::function<clock::time_point()>;
    using Sleep = std::function<void(clock::duration)>;
    using Send = std::function<void(std::string_view recipient, std::string_view text)>;

    /// @brief Replacement text for suppressed repeats
    static constexpr std::string_view placeholder = "\xE2\x80\xA6";

private:
    struct Entry {
        clock::time_point time;
        std::string text;
    };

    Send send_;
    FloodSettings settings_;
    Now now_;
    Sleep sleep_;

    std::mutex mutex_;
    IdentifierMap<std::deque<Entry>> history_;

public:
    explicit FloodControl(
        Send send,
        FloodSettings settings = {},
        Now now = {},
        Sleep sleep = {});

    /**
     * @brief Send a message, splitting it into at most max_messages fragments
     *
     * @param text message body
     * @param recipient nickname or channel
     * @param max_messages fragment limit
     */
    auto say(std::string_view text, std::string_view recipient, std::size_t max_messages = 1) -> void;

    /// @brief Texts recently sent to a recipient, oldest first
    auto recent(std::string_view recipient) -> std::vector<std::string>;

    /// @brief Forget all history
    auto clear() -> void;

private:
    auto send_one(std::string_view recipient, std::deque<Entry>& history, std::string text) -> void;
};

} // namespace lark
