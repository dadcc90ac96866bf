#include "lark/message.hpp"

#include "lark/identifier.hpp"

#include <ircmsg.hpp>

#include <algorithm>
#include <cctype>

namespace lark {

namespace {

/**
 * @brief Recognize a CTCP body of the form "\x01VERB rest\x01"
 *
 * The closing delimiter is optional as some clients truncate it.
 * On success verb and rest are populated.
 */
auto split_ctcp(std::string_view body, std::string& verb, std::string& rest) -> bool
{
    if (body.size() < 2 || body.front() != '\x01') return false;
    body.remove_prefix(1);
    if (body.back() == '\x01') body.remove_suffix(1);

    auto const space = body.find(' ');
    auto const word = body.substr(0, space);
    if (word.empty()) return false;

    verb = word;
    rest = space == body.npos ? std::string_view{} : body.substr(space + 1);
    return true;
}

} // namespace

auto Message::parse(std::string_view const line, std::string_view const own_nick) -> Message
{
    auto const parsed = parse_irc_message(line);

    Message msg;
    msg.raw_ = line;

    for (auto const& [key, val] : parsed.tags)
    {
        msg.tags_.insert_or_assign(std::string{key}, val);
    }

    msg.source_ = parsed.source;
    auto const source = split_irc_source(parsed.source);
    msg.nick_ = source.nick;
    msg.user_ = source.user;
    msg.host_ = source.host;

    msg.command_ = parsed.command;
    std::transform(msg.command_.begin(), msg.command_.end(), msg.command_.begin(),
        [](unsigned char const c) { return std::toupper(c); });

    msg.params_.assign(parsed.args.begin(), parsed.args.end());
    if (not msg.params_.empty())
    {
        msg.text_ = msg.params_.back();
    }

    if (msg.params_.empty())
    {
        msg.sender_ = msg.nick_;
    }
    else if (same_identifier(msg.params_.front(), own_nick))
    {
        msg.sender_ = msg.nick_;
    }
    else
    {
        msg.sender_ = msg.params_.front();
    }

    if ((msg.command_ == "PRIVMSG" || msg.command_ == "NOTICE") && not msg.has_tag("intent"))
    {
        std::string verb, rest;
        if (split_ctcp(msg.text_, verb, rest))
        {
            msg.tags_.insert_or_assign("intent", std::move(verb));
            msg.text_ = std::move(rest);
        }
    }

    return msg;
}

auto Message::param(std::size_t const n) const -> std::string_view
{
    return n < params_.size() ? std::string_view{params_[n]} : std::string_view{};
}

auto Message::has_tag(std::string_view const key) const -> bool
{
    return tags_.find(key) != tags_.end();
}

auto Message::tag(std::string_view const key) const -> std::optional<std::string_view>
{
    auto const it = tags_.find(key);
    if (it == tags_.end() || not it->second) return std::nullopt;
    return *it->second;
}

auto Message::is_private() const -> bool
{
    return not is_channel(sender_);
}

} // namespace lark
