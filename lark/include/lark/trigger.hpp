#pragma once
/**
 * @file trigger.hpp
 * @brief Per-invocation view of a matched message handed to handlers
 *
 */

#include "lark/message.hpp"

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

/// @brief Standing of a sender in the bot's settings
enum class Rank {
    USER,
    ADMIN,
    OWNER,
};

class Trigger
{
    std::shared_ptr<Message const> message_;
    std::vector<std::string> groups_;
    Rank rank_;
    std::stop_token stop_;

public:
    Trigger(
        std::shared_ptr<Message const> message,
        std::vector<std::string> groups,
        Rank rank,
        std::stop_token stop = {});

    /// @brief The matched message, or nullptr for interval jobs
    auto message() const -> Message const* { return message_.get(); }

    auto nick() const -> std::string_view;
    auto sender() const -> std::string_view;
    auto text() const -> std::string_view;
    auto command() const -> std::string_view;

    /**
     * @brief Capture group of the matching pattern
     *
     * Group 0 is the whole match. Unmatched and out of range groups
     * are empty.
     */
    auto group(std::size_t n) const -> std::string_view;
    auto groups() const -> std::vector<std::string> const& { return groups_; }

    /// @brief True when the sender is the owner or an admin
    auto is_admin() const -> bool { return rank_ != Rank::USER; }
    auto is_owner() const -> bool { return rank_ == Rank::OWNER; }
    auto rank() const -> Rank { return rank_; }

    auto is_private() const -> bool;

    /// @brief Cooperative cancellation for long-running threaded handlers
    auto stop_requested() const -> bool { return stop_.stop_requested(); }
    auto stop_token() const -> std::stop_token { return stop_; }

    /// @brief Copy of this trigger observing a different stop token
    auto with_stop_token(std::stop_token stop) const -> Trigger;
};

} // namespace lark
