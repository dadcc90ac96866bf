#include "lark/dispatcher.hpp"

#include "lark/identifier.hpp"
#include "lark/logging.hpp"

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <typeinfo>

namespace lark {

namespace {

auto compile_blocks(std::vector<std::string> const& expressions) -> std::vector<boost::regex>
{
    std::vector<boost::regex> result;
    for (auto const& expression : expressions)
    {
        try
        {
            result.emplace_back(expression, boost::regex::perl | boost::regex::icase);
        }
        catch (boost::regex_error const& e)
        {
            throw rule_error{"bad blocklist pattern " + expression + ": " + e.what()};
        }
    }
    return result;
}

auto describe(std::exception const& e) -> std::string
{
    return boost::core::demangle(typeid(e).name()) + ": " + e.what();
}

/// @brief Search failures count as no match
auto any_search(std::vector<boost::regex> const& patterns, std::string const& subject) -> bool
{
    return not subject.empty() && std::any_of(patterns.begin(), patterns.end(),
        [&subject](boost::regex const& pattern) {
            try
            {
                return boost::regex_search(subject, pattern);
            }
            catch (std::exception const& e)
            {
                log::warning("dispatch", "blocklist ", pattern.str(), ": ", describe(e));
                return false;
            }
        });
}

} // namespace

Dispatcher::Dispatcher(
    RuleRegistry const& registry,
    RateLimiter& limiter,
    WorkerPool& workers,
    Settings const& settings,
    Report report,
    Now now)
    : registry_{registry}
    , limiter_{limiter}
    , workers_{workers}
    , report_{std::move(report)}
    , now_{now ? std::move(now) : Now{RateLimiter::clock::now}}
    , owner_{fold(settings.owner)}
    , nick_blocks_{compile_blocks(settings.nick_blocks)}
    , host_blocks_{compile_blocks(settings.host_blocks)}
{
    for (auto const& admin : settings.admins)
    {
        admins_.insert(fold(admin));
    }
    for (auto const& [channel, plugins] : settings.channel_plugins)
    {
        channel_plugins_[fold(channel)].insert(plugins.begin(), plugins.end());
    }
}

auto Dispatcher::rank(Message const& message) const -> Rank
{
    auto const nick = fold(message.nick());
    if (nick.empty()) return Rank::USER;
    if (nick == owner_) return Rank::OWNER;
    return admins_.contains(nick) ? Rank::ADMIN : Rank::USER;
}

auto Dispatcher::is_blocked(Message const& message) const -> bool
{
    return any_search(nick_blocks_, message.nick()) || any_search(host_blocks_, message.host());
}

auto Dispatcher::is_restricted(HandlerDescriptor const& handler, Message const& message) const -> bool
{
    if (message.is_private() || handler.plugin == "coretasks") return false;

    auto const it = channel_plugins_.find(fold(message.sender()));
    return it != channel_plugins_.end() && not it->second.contains(handler.plugin);
}

auto Dispatcher::dispatch(std::shared_ptr<Message const> const& message) -> std::size_t
{
    std::size_t started = 0;
    auto const standing = rank(*message);
    auto const blocked = standing == Rank::USER && is_blocked(*message);
    auto const& text = message->text();

    for (auto const priority : {Priority::HIGH, Priority::MEDIUM, Priority::LOW})
    {
        for (auto const& handler : registry_.rules(priority))
        {
            if (not handler->handles(message->command())) continue;
            if (blocked && not handler->unblockable) continue;
            if (is_restricted(*handler, *message)) continue;
            if (not handler->accepts_intent(message->intent())) continue;

            for (auto const& pattern : handler->patterns)
            {
                boost::smatch match;
                try
                {
                    if (not boost::regex_search(text, match, pattern, boost::match_continuous)) continue;
                }
                catch (std::exception const& e)
                {
                    log::error("dispatch", describe(e), " (", handler->name(), ")");
                    continue;
                }

                std::vector<std::string> groups;
                groups.reserve(match.size());
                for (auto const& group : match)
                {
                    groups.push_back(group.matched ? group.str() : std::string{});
                }

                Trigger trigger{message, std::move(groups), standing};

                if (handler->threaded)
                {
                    auto const queued = workers_.submit([this, handler, trigger](std::stop_token stop) {
                        invoke(*handler, trigger.with_stop_token(std::move(stop)));
                    });
                    if (not queued)
                    {
                        log::warning("dispatch", "worker queue full, dropped ", handler->name());
                        continue;
                    }
                }
                else
                {
                    invoke(*handler, trigger);
                }
                started++;
            }
        }
    }

    return started;
}

auto Dispatcher::run_job(HandlerPtr const& job) -> bool
{
    auto const queued = workers_.submit([this, job](std::stop_token stop) {
        call(*job, Trigger{nullptr, {}, Rank::USER, std::move(stop)});
    });
    if (not queued)
    {
        log::warning("dispatch", "worker queue full, skipped job ", job->name());
    }
    return queued;
}

auto Dispatcher::invoke(HandlerDescriptor const& handler, Trigger const& trigger) -> void
{
    auto const now = now_();
    auto const channel = trigger.is_private() ? std::string_view{} : trigger.sender();

    if (not handler.unblockable && not trigger.is_admin()
        && not limiter_.permit(handler.id, handler.rate, trigger.nick(), channel, now))
    {
        log::debug("dispatch", handler.name(), " rate limited for ", trigger.nick());
        return;
    }

    if (call(handler, trigger) != HandlerResult::NOLIMIT)
    {
        limiter_.record(handler.id, trigger.nick(), channel, now);
    }
}

auto Dispatcher::call(HandlerDescriptor const& handler, Trigger const& trigger) -> HandlerResult
{
    try
    {
        return handler.callback(trigger);
    }
    catch (std::exception const& e)
    {
        report(handler, trigger, describe(e));
    }
    catch (...)
    {
        report(handler, trigger, "unknown exception");
    }
    return HandlerResult::OK;
}

auto Dispatcher::report(HandlerDescriptor const& handler, Trigger const& trigger, std::string const& problem) -> void
{
    auto const signature = problem + " (" + handler.name() + ")";
    log::error("dispatch", signature);
    if (report_ && not trigger.sender().empty())
    {
        report_(trigger.sender(), signature);
    }
}

} // namespace lark
