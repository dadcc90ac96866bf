#pragma once
/**
 * @file privileges.hpp
 * @brief Channel membership and privilege tracking
 *
 */

#include "lark/identifier.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lark {

/// @brief Channel privilege bits, ordered by rank
enum Privilege : std::uint8_t {
    VOICE = 1,
    HALFOP = 2,
    OP = 4,
    ADMIN = 8,
    OWNER = 16,
    OPER = 32,
};

/**
 * @brief Membership and privilege bitmasks per channel
 *
 * Mutators are called from the reader path only. Readers may run on
 * any thread.
 */
class PrivilegeTracker
{
    struct Member {
        std::string nick;
        std::uint8_t privileges;
    };

    struct Channel {
        std::string name;
        IdentifierMap<Member> members;
    };

    mutable std::shared_mutex mutex_;
    IdentifierMap<Channel> channels_;

    std::map<char, std::uint8_t> symbol_bits_;
    std::map<char, std::uint8_t> mode_bits_;

    // CHANMODES classes: list (A), always-parameter (B), set-parameter (C)
    std::string list_modes_;
    std::string param_modes_;
    std::string set_param_modes_;

public:
    PrivilegeTracker();

    /**
     * @brief Apply a NAMES reply (353) body
     *
     * @param channel channel the names belong to
     * @param names space-separated list of prefixed nicknames
     */
    auto names(std::string_view channel, std::string_view names) -> void;

    /**
     * @brief Apply a MODE change
     *
     * @param target channel or user the change applies to
     * @param modes mode string followed by its parameters
     */
    auto mode(std::string_view target, std::vector<std::string> const& modes) -> void;

    auto join(std::string_view channel, std::string_view nick, bool self) -> void;
    auto part(std::string_view channel, std::string_view nick, bool self) -> void;
    auto quit(std::string_view nick) -> void;
    auto rename(std::string_view old_nick, std::string_view new_nick) -> void;

    /**
     * @brief Apply RPL_ISUPPORT tokens
     *
     * PREFIX and CHANMODES replace the default prefix symbol and mode
     * parameter tables. Other tokens are ignored.
     */
    auto isupport(std::vector<std::string> const& tokens) -> void;

    /// @brief Forget all channels, used when the connection ends
    auto clear() -> void;

    /// @brief Privilege bits of a member, 0 when unknown
    auto privileges(std::string_view channel, std::string_view nick) const -> std::uint8_t;

    /// @brief True when the member's highest privilege is at least the given one
    auto at_least(std::string_view channel, std::string_view nick, Privilege) const -> bool;

    auto has_channel(std::string_view channel) const -> bool;
    auto has_member(std::string_view channel, std::string_view nick) const -> bool;

    /// @brief Names of the channels currently joined
    auto channels() const -> std::vector<std::string>;

    /// @brief Snapshot of a channel's members and their bits
    auto members(std::string_view channel) const -> std::map<std::string, std::uint8_t>;

private:
    auto find_channel(std::string_view channel) -> Channel*;
    static auto erase_member(Channel& chan, std::string_view nick) -> void;
    auto find_channel(std::string_view channel) const -> Channel const*;
};

} // namespace lark
