#pragma once
/**
 * @file message.hpp
 * @brief Owned, immutable representation of one inbound IRC line
 *
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

class Message
{
public:
    using tag_map = std::map<std::string, std::optional<std::string>, std::less<>>;

private:
    std::string raw_;
    tag_map tags_;
    std::string source_;
    std::string nick_;
    std::string user_;
    std::string host_;
    std::string command_;
    std::vector<std::string> params_;
    std::string text_;
    std::string sender_;

public:
    /**
     * @brief Parse a decoded IRC line
     *
     * @param line Line without its terminator
     * @param own_nick Current nickname, used to derive the reply target
     * @return Parsed message
     * @throw irc_parse_error when the line has no command or a bad tag
     */
    static auto parse(std::string_view line, std::string_view own_nick) -> Message;

    auto raw() const -> std::string const& { return raw_; }
    auto tags() const -> tag_map const& { return tags_; }
    auto source() const -> std::string const& { return source_; }
    auto nick() const -> std::string const& { return nick_; }
    auto user() const -> std::string const& { return user_; }
    auto host() const -> std::string const& { return host_; }

    /// @brief Command token in upper case, numerics unchanged
    auto command() const -> std::string const& { return command_; }
    auto params() const -> std::vector<std::string> const& { return params_; }

    /// @brief The n-th parameter or the empty string when absent
    auto param(std::size_t n) const -> std::string_view;

    /**
     * @brief Message body used for rule matching
     *
     * This is the last parameter, with any CTCP framing removed
     * when the message carries an intent.
     */
    auto text() const -> std::string const& { return text_; }

    /// @brief Reply target: the channel, or the source nick for direct messages
    auto sender() const -> std::string const& { return sender_; }

    /// @brief True when the tag exists with or without a value
    auto has_tag(std::string_view key) const -> bool;

    /// @brief Value of a tag; nullopt when absent or valueless
    auto tag(std::string_view key) const -> std::optional<std::string_view>;

    /// @brief CTCP verb of this message, if any
    auto intent() const -> std::optional<std::string_view> { return tag("intent"); }

    /// @brief True when the reply target is not a channel
    auto is_private() const -> bool;
};

} // namespace lark
