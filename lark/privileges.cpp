#include "lark/privileges.hpp"

#include <bit>
#include <mutex>

namespace lark {

namespace {

auto default_bit(char const mode) -> std::uint8_t
{
    switch (mode) {
    case 'v': return VOICE;
    case 'h': return HALFOP;
    case 'o': return OP;
    case 'a': return ADMIN;
    case 'q': return OWNER;
    case 'y':
    case 'Y': return OPER;
    default: return 0;
    }
}

auto split_words(std::string_view text) -> std::vector<std::string_view>
{
    std::vector<std::string_view> words;
    while (not text.empty())
    {
        auto const space = text.find(' ');
        auto const word = text.substr(0, space);
        if (not word.empty()) words.push_back(word);
        if (space == text.npos) break;
        text.remove_prefix(space + 1);
    }
    return words;
}

} // namespace

PrivilegeTracker::PrivilegeTracker()
    : symbol_bits_{{'+', VOICE}, {'%', HALFOP}, {'@', OP}, {'&', ADMIN}, {'~', OWNER}, {'!', OPER}}
    , mode_bits_{{'v', VOICE}, {'h', HALFOP}, {'o', OP}, {'a', ADMIN}, {'q', OWNER}, {'y', OPER}, {'Y', OPER}}
    , list_modes_{"beI"}
    , param_modes_{"k"}
    , set_param_modes_{"l"}
{
}

auto PrivilegeTracker::find_channel(std::string_view const channel) -> Channel*
{
    auto const it = channels_.find(channel);
    return it == channels_.end() ? nullptr : &it->second;
}

auto PrivilegeTracker::find_channel(std::string_view const channel) const -> Channel const*
{
    auto const it = channels_.find(channel);
    return it == channels_.end() ? nullptr : &it->second;
}

auto PrivilegeTracker::erase_member(Channel& chan, std::string_view const nick) -> void
{
    if (auto const it = chan.members.find(nick); it != chan.members.end())
    {
        chan.members.erase(it);
    }
}

auto PrivilegeTracker::names(std::string_view const channel, std::string_view const names) -> void
{
    std::unique_lock const lock{mutex_};

    auto& chan = channels_.try_emplace(std::string{channel}).first->second;
    if (chan.name.empty()) chan.name = channel;

    for (auto name : split_words(names))
    {
        std::uint8_t bits = 0;
        while (not name.empty())
        {
            auto const it = symbol_bits_.find(name.front());
            if (it == symbol_bits_.end()) break;
            bits |= it->second;
            name.remove_prefix(1);
        }

        // userhost-in-names sends full sources
        name = name.substr(0, name.find('!'));
        if (name.empty()) continue;

        chan.members.insert_or_assign(std::string{name}, Member{std::string{name}, bits});
    }
}

auto PrivilegeTracker::mode(std::string_view const target, std::vector<std::string> const& modes) -> void
{
    if (modes.empty() || not is_channel(target)) return;

    std::unique_lock const lock{mutex_};

    auto const chan = find_channel(target);
    if (nullptr == chan) return;

    auto param = std::next(modes.begin());
    auto const next_param = [&]() -> std::string const* {
        return param == modes.end() ? nullptr : &*param++;
    };

    bool adding = true;
    for (auto const c : modes.front())
    {
        if (c == '+') { adding = true; continue; }
        if (c == '-') { adding = false; continue; }

        if (auto const it = mode_bits_.find(c); it != mode_bits_.end())
        {
            auto const nick = next_param();
            if (nullptr == nick) return;

            auto& bits = chan->members.try_emplace(*nick, Member{*nick, 0}).first->second.privileges;
            if (adding) bits |= it->second;
            else bits &= ~it->second;
        }
        else if (list_modes_.find(c) != std::string::npos
              || param_modes_.find(c) != std::string::npos
              || (adding && set_param_modes_.find(c) != std::string::npos))
        {
            next_param();
        }
    }
}

auto PrivilegeTracker::join(std::string_view const channel, std::string_view const nick, bool const self) -> void
{
    std::unique_lock const lock{mutex_};

    if (self)
    {
        auto& chan = channels_.try_emplace(std::string{channel}).first->second;
        chan.name = channel;
        chan.members.insert_or_assign(std::string{nick}, Member{std::string{nick}, 0});
    }
    else if (auto const chan = find_channel(channel))
    {
        chan->members.try_emplace(std::string{nick}, Member{std::string{nick}, 0});
    }
}

auto PrivilegeTracker::part(std::string_view const channel, std::string_view const nick, bool const self) -> void
{
    std::unique_lock const lock{mutex_};

    if (self)
    {
        if (auto const it = channels_.find(channel); it != channels_.end())
        {
            channels_.erase(it);
        }
    }
    else if (auto const chan = find_channel(channel))
    {
        erase_member(*chan, nick);
    }
}

auto PrivilegeTracker::quit(std::string_view const nick) -> void
{
    std::unique_lock const lock{mutex_};

    for (auto& [_, chan] : channels_)
    {
        erase_member(chan, nick);
    }
}

auto PrivilegeTracker::rename(std::string_view const old_nick, std::string_view const new_nick) -> void
{
    std::unique_lock const lock{mutex_};

    for (auto& [_, chan] : channels_)
    {
        auto const it = chan.members.find(old_nick);
        if (it == chan.members.end()) continue;
        auto member = std::move(it->second);
        chan.members.erase(it);
        member.nick = new_nick;
        chan.members.insert_or_assign(std::string{new_nick}, std::move(member));
    }
}

auto PrivilegeTracker::isupport(std::vector<std::string> const& tokens) -> void
{
    std::unique_lock const lock{mutex_};

    for (std::string_view const token : tokens)
    {
        if (token.starts_with("PREFIX=("))
        {
            auto const spec = token.substr(8);
            auto const close = spec.find(')');
            if (close == spec.npos) continue;

            auto const letters = spec.substr(0, close);
            auto const symbols = spec.substr(close + 1);
            if (letters.size() != symbols.size()) continue;

            symbol_bits_.clear();
            mode_bits_.clear();
            for (std::size_t i = 0; i < letters.size(); i++)
            {
                if (auto const bit = default_bit(letters[i]))
                {
                    mode_bits_[letters[i]] = bit;
                    symbol_bits_[symbols[i]] = bit;
                }
            }
        }
        else if (token.starts_with("CHANMODES="))
        {
            auto classes = token.substr(10);
            std::string* const targets[] {&list_modes_, &param_modes_, &set_param_modes_};
            for (auto const target : targets)
            {
                auto const comma = classes.find(',');
                *target = classes.substr(0, comma);
                classes = comma == classes.npos ? std::string_view{} : classes.substr(comma + 1);
            }
        }
    }
}

auto PrivilegeTracker::clear() -> void
{
    std::unique_lock const lock{mutex_};
    channels_.clear();
}

auto PrivilegeTracker::privileges(std::string_view const channel, std::string_view const nick) const -> std::uint8_t
{
    std::shared_lock const lock{mutex_};

    auto const chan = find_channel(channel);
    if (nullptr == chan) return 0;

    auto const it = chan->members.find(nick);
    return it == chan->members.end() ? 0 : it->second.privileges;
}

auto PrivilegeTracker::at_least(std::string_view const channel, std::string_view const nick, Privilege const level) const -> bool
{
    auto const bits = privileges(channel, nick);
    return bits != 0 && std::bit_floor(static_cast<unsigned>(bits)) >= level;
}

auto PrivilegeTracker::has_channel(std::string_view const channel) const -> bool
{
    std::shared_lock const lock{mutex_};
    return nullptr != find_channel(channel);
}

auto PrivilegeTracker::has_member(std::string_view const channel, std::string_view const nick) const -> bool
{
    std::shared_lock const lock{mutex_};
    auto const chan = find_channel(channel);
    return nullptr != chan && chan->members.contains(nick);
}

auto PrivilegeTracker::channels() const -> std::vector<std::string>
{
    std::shared_lock const lock{mutex_};

    std::vector<std::string> result;
    result.reserve(channels_.size());
    for (auto const& [_, chan] : channels_)
    {
        result.push_back(chan.name);
    }
    return result;
}

auto PrivilegeTracker::members(std::string_view const channel) const -> std::map<std::string, std::uint8_t>
{
    std::shared_lock const lock{mutex_};

    std::map<std::string, std::uint8_t> result;
    if (auto const chan = find_channel(channel))
    {
        for (auto const& [_, member] : chan->members)
        {
            result.emplace(member.nick, member.privileges);
        }
    }
    return result;
}

} // namespace lark
