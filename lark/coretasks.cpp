#include "lark/coretasks.hpp"

#include "lark/bot.hpp"
#include "lark/identifier.hpp"
#include "lark/logging.hpp"

#include <sasl.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>

namespace lark {

namespace {

/// @brief Capabilities the engine can make use of when offered
char const* const core_capabilities[] {
    "account-tag",
    "extended-join",
    "message-tags",
    "multi-prefix",
    "server-time",
    "userhost-in-names",
};

struct CoreState
{
    /// @brief Capability names advertised by the server
    std::set<std::string, std::less<>> advertised;

    /// @brief SASL exchange started and awaiting the server's "+"
    bool authenticating = false;

    bool registered = false;

    /// @brief Failed join attempts per folded channel name
    std::map<std::string, std::size_t> join_attempts;
};

auto upper(std::string_view const text) -> std::string
{
    std::string result {text};
    for (auto& c : result)
    {
        if ('a' <= c && c <= 'z') c = c - 'a' + 'A';
    }
    return result;
}

/// @brief Capability names from an LS, NEW, or DEL list, values removed
auto capability_names(std::string_view list) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (auto const& token : CapabilityManager::parse(list))
    {
        names.push_back(token.substr(0, token.find('=')));
    }
    return names;
}

auto add_core_rule(Bot& bot, std::string label, std::vector<std::string> events, Callback callback) -> void
{
    bot.register_rule({
        .plugin = "coretasks",
        .label = std::move(label),
        .kind = Events{},
        .events = std::move(events),
        .priority = Priority::HIGH,
        .threaded = false,
        .unblockable = true,
        .callback = std::move(callback),
    });
}

auto finish_results(Bot& bot, std::optional<CapabilityManager::Results> const& results) -> void
{
    if (not results) return;

    for (auto const& [plugin, status] : *results)
    {
        if (status == CapStatus::ERROR)
        {
            log::error("capabilities", plugin, " aborted capability negotiation");
            bot.end_capability_negotiation();
            bot.quit("Error negotiating capabilities.");
            return;
        }
    }

    if (bot.capabilities().is_complete())
    {
        bot.end_capability_negotiation();
    }
}

auto handle_cap(Bot& bot, CoreState& state, Message const& msg) -> void
{
    auto const subcommand = upper(msg.param(1));
    auto const& text = msg.text();

    if (subcommand == "LS")
    {
        for (auto& name : capability_names(text))
        {
            state.advertised.insert(std::move(name));
        }

        // "CAP * LS * :..." announces that more lines follow
        if (msg.params().size() > 3 && msg.param(2) == "*") return;
        if (bot.capability_negotiation_ended()) return;

        auto const requests = bot.capabilities().request_available(state.advertised);
        if (requests.empty())
        {
            bot.end_capability_negotiation();
            return;
        }

        for (auto const& request : requests)
        {
            bot.write({"CAP", "REQ"}, CapabilityManager::join(request));
        }

        bot.schedule(bot.settings().cap_timeout, [&bot]() {
            if (not bot.capability_negotiation_ended())
            {
                log::warning("capabilities", "negotiation timed out, ending it");
                bot.end_capability_negotiation();
            }
        });
    }
    else if (subcommand == "ACK")
    {
        finish_results(bot, bot.capabilities().acknowledge(CapabilityManager::parse(text)));
    }
    else if (subcommand == "NAK")
    {
        finish_results(bot, bot.capabilities().deny(CapabilityManager::parse(text)));
    }
    else if (subcommand == "NEW")
    {
        for (auto& name : capability_names(text))
        {
            log::info("capabilities", "server added ", name);
            state.advertised.insert(std::move(name));
        }
    }
    else if (subcommand == "DEL")
    {
        for (auto const& name : capability_names(text))
        {
            log::info("capabilities", "server removed ", name);
            state.advertised.erase(name);
        }
    }
}

auto install_sasl(Bot& bot, std::shared_ptr<CoreState> const& state) -> void
{
    auto const mechanism = upper(bot.settings().sasl_mechanism);

    bot.register_capability("coretasks", {"sasl"},
        [&bot, state, mechanism](CapRequest const&, bool const acknowledged) {
            if (not acknowledged)
            {
                log::warning("sasl", "server refused the sasl capability");
                return CapStatus::DONE;
            }
            state->authenticating = true;
            bot.write({"AUTHENTICATE", mechanism});
            return CapStatus::CONTINUE;
        });

    add_core_rule(bot, "sasl-authenticate", {"AUTHENTICATE"}, [&bot, state, mechanism](Trigger const& trigger) {
        if (not state->authenticating || trigger.message()->param(0) != "+")
        {
            return HandlerResult::OK;
        }
        state->authenticating = false;

        if (mechanism == "EXTERNAL")
        {
            bot.write({"AUTHENTICATE", "+"});
            return HandlerResult::OK;
        }

        auto const& settings = bot.settings();
        auto const account = settings.auth_username.empty() ? settings.nick : settings.auth_username;
        for (auto& chunk : sasl::authenticate_chunks(sasl::plain_message(account, account, settings.auth_password)))
        {
            bot.write({"AUTHENTICATE", std::move(chunk)});
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "sasl-success", {"903"}, [&bot](Trigger const&) {
        log::info("sasl", "authentication succeeded");
        bot.resume_capability_negotiation({"sasl"}, "coretasks");
        return HandlerResult::OK;
    });

    add_core_rule(bot, "sasl-failure", {"902", "904", "905", "906"}, [&bot, state](Trigger const& trigger) {
        state->authenticating = false;
        log::error("sasl", "authentication failed: ", trigger.text());
        bot.resume_capability_negotiation({"sasl"}, "coretasks");
        bot.quit("SASL authentication failed");
        return HandlerResult::OK;
    });

    add_core_rule(bot, "sasl-mechanisms", {"908"}, [](Trigger const& trigger) {
        log::info("sasl", "server supports ", trigger.message()->param(1));
        return HandlerResult::OK;
    });
}

auto on_registered(Bot& bot, Message const& msg) -> void
{
    auto const& settings = bot.settings();

    if (msg.command() == "001" && not msg.param(0).empty())
    {
        bot.set_nick(std::string{msg.param(0)});
    }

    if (settings.auth_method == AuthMethod::NICKSERV)
    {
        auto const account = settings.auth_username.empty() ? settings.nick : settings.auth_username;
        bot.say("IDENTIFY " + account + " " + settings.auth_password, settings.auth_target);
    }

    for (auto const& command : settings.commands_on_connect)
    {
        bot.write_line(command);
    }

    for (auto const& channel : settings.channels)
    {
        auto const space = channel.find(' ');
        if (space == std::string::npos)
        {
            bot.join(channel);
        }
        else
        {
            bot.join(std::string_view{channel}.substr(0, space), std::string_view{channel}.substr(space + 1));
        }
    }
}

} // namespace

auto install_coretasks(Bot& bot) -> void
{
    auto const state = std::make_shared<CoreState>();

    for (auto const capability : core_capabilities)
    {
        bot.register_capability("coretasks", {capability});
    }
    if (bot.settings().auth_method == AuthMethod::SASL)
    {
        install_sasl(bot, state);
    }

    bot.add_shutdown_hook([state]() {
        state->advertised.clear();
        state->authenticating = false;
        state->registered = false;
        state->join_attempts.clear();
    });

    add_core_rule(bot, "capabilities", {"CAP"}, [&bot, state](Trigger const& trigger) {
        handle_cap(bot, *state, *trigger.message());
        return HandlerResult::OK;
    });

    add_core_rule(bot, "registered", {"001", "251"}, [&bot, state](Trigger const& trigger) {
        if (not state->registered)
        {
            state->registered = true;
            on_registered(bot, *trigger.message());
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "isupport", {"005"}, [&bot](Trigger const& trigger) {
        auto const& params = trigger.message()->params();
        if (params.size() > 2)
        {
            // skip the target nick and the trailing description
            bot.tracker().isupport({params.begin() + 1, params.end() - 1});
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "names", {"353"}, [&bot](Trigger const& trigger) {
        auto const& msg = *trigger.message();
        if (msg.params().size() >= 4)
        {
            bot.tracker().names(msg.param(2), msg.text());
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "mode", {"MODE"}, [&bot](Trigger const& trigger) {
        auto const& params = trigger.message()->params();
        if (params.size() >= 2)
        {
            bot.tracker().mode(params.front(), {params.begin() + 1, params.end()});
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "nick", {"NICK"}, [&bot](Trigger const& trigger) {
        auto const& msg = *trigger.message();
        auto const new_nick = msg.param(0);
        if (same_identifier(msg.nick(), bot.nick()))
        {
            bot.set_nick(std::string{new_nick});
        }
        bot.tracker().rename(msg.nick(), new_nick);
        return HandlerResult::OK;
    });

    add_core_rule(bot, "join", {"JOIN"}, [&bot, state](Trigger const& trigger) {
        auto const& msg = *trigger.message();
        auto const self = same_identifier(msg.nick(), bot.nick());
        bot.tracker().join(msg.param(0), msg.nick(), self);
        if (self)
        {
            state->join_attempts.erase(fold(msg.param(0)));
            log::info("channels", "joined ", msg.param(0));
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "part", {"PART"}, [&bot](Trigger const& trigger) {
        auto const& msg = *trigger.message();
        bot.tracker().part(msg.param(0), msg.nick(), same_identifier(msg.nick(), bot.nick()));
        return HandlerResult::OK;
    });

    add_core_rule(bot, "kick", {"KICK"}, [&bot](Trigger const& trigger) {
        auto const& msg = *trigger.message();
        auto const target = msg.param(1);
        auto const self = same_identifier(target, bot.nick());
        bot.tracker().part(msg.param(0), target, self);
        if (self)
        {
            log::warning("channels", "kicked from ", msg.param(0), " by ", msg.nick());
        }
        return HandlerResult::OK;
    });

    add_core_rule(bot, "quit", {"QUIT"}, [&bot](Trigger const& trigger) {
        bot.tracker().quit(trigger.nick());
        return HandlerResult::OK;
    });

    add_core_rule(bot, "join-retry", {"477"}, [&bot, state](Trigger const& trigger) {
        auto const channel = std::string{trigger.message()->param(1)};
        auto const attempt = ++state->join_attempts[fold(channel)];
        if (attempt > bot.settings().join_attempts)
        {
            log::warning("channels", "giving up joining ", channel, " after ", attempt - 1, " attempts");
            return HandlerResult::OK;
        }

        auto const delay = bot.settings().join_retry_delay * attempt;
        log::info("channels", "cannot join ", channel, " yet, retrying in ", delay.count(), "s");
        bot.schedule(delay, [&bot, channel]() { bot.join(channel); });
        return HandlerResult::OK;
    });
}

} // namespace lark
