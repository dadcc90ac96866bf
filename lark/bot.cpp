#include "lark/bot.hpp"

#include "lark/linebuffer.hpp"
#include "lark/logging.hpp"
#include "lark/message.hpp"
#include "lark/text.hpp"

#include <ircmsg.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/core/demangle.hpp>

#include <algorithm>
#include <typeinfo>

namespace lark {

Bot::Bot(boost::asio::io_context& io_context, Settings settings, KeyValueStore& store)
    : io_context_{io_context}
    , settings_{std::move(settings)}
    , store_{store}
    , connection_{Connection::create(io_context)}
    , rules_{settings_.prefix}
    , flood_{
        [this](std::string_view const recipient, std::string_view const text) {
            write({"PRIVMSG", std::string{recipient}}, text);
        },
        settings_.flood}
    , dispatcher_{
        rules_, limiter_, workers_, settings_,
        [this](std::string_view const recipient, std::string_view const text) {
            say(text, recipient);
        }}
    , watchdog_timer_{io_context}
    , ping_timer_{io_context}
    , nick_{settings_.nick}
    , last_read_{clock::now()}
    , last_write_{clock::now()}
    , workers_{settings_.worker_threads, settings_.worker_queue}
{
}

Bot::~Bot()
{
    workers_.shutdown();
}

auto Bot::run() -> boost::asio::awaitable<void>
{
    try
    {
        auto const description = co_await connection_->connect(settings_);
        log::info("connection", "connected ", description);
    }
    catch (std::exception const& e)
    {
        log::error("connection", settings_.host, ":", settings_.port, ": ", e.what());
        shutdown();
        co_return;
    }

    co_await serve();
}

auto Bot::serve() -> boost::asio::awaitable<void>
{
    cap_ended_ = false;
    capabilities_.reset();
    last_read_ = clock::now();
    last_write_ = clock::now();

    write_line("CAP LS 302");
    if (not settings_.server_password.empty())
    {
        write({"PASS"}, settings_.server_password);
    }
    write({"NICK", nick()});
    write({"USER", settings_.user.empty() ? nick() : settings_.user, "0", "*"},
        settings_.name.empty() ? nick() : settings_.name);

    boost::asio::co_spawn(io_context_, watchdog_thread(), boost::asio::detached);
    boost::asio::co_spawn(io_context_, ping_thread(), boost::asio::detached);
    for (auto const& job : rules_.jobs())
    {
        schedule_job(job);
    }

    LineBuffer buffer;
    try
    {
        while (not closed_)
        {
            auto const n = co_await connection_->read_some(buffer.prepare());
            buffer.commit(n);
            while (not closed_)
            {
                auto const line = buffer.next_line();
                if (not line) break;
                handle_line(*line);
            }
        }
    }
    catch (boost::system::system_error const& e)
    {
        if (closed_ || quitting_)
        {
            log::info("connection", "closed: ", e.code().message());
        }
        else
        {
            log::error("connection", "read failed: ", e.what());
        }
    }
    catch (std::exception const& e)
    {
        log::error("connection", boost::core::demangle(typeid(e).name()), ": ", e.what());
    }

    shutdown();
}

auto Bot::handle_line(std::string_view const raw) -> void
{
    last_read_ = clock::now();

    auto const text = decode_line(raw);
    log::debug("raw", "<< ", text);

    std::shared_ptr<Message const> message;
    try
    {
        message = std::make_shared<Message const>(Message::parse(text, nick()));
    }
    catch (irc_parse_error const& e)
    {
        log::debug("connection", "dropped line: ", e.what());
        return;
    }

    auto const& command = message->command();
    if (command == "PING")
    {
        if (message->params().empty())
        {
            write_line("PONG");
        }
        else
        {
            write({"PONG"}, message->params().back());
        }
    }
    else if (command == "433")
    {
        log::error("connection", "nickname ", message->param(1), " is already in use");
        shutdown();
        return;
    }
    else if (command == "ERROR")
    {
        log::error("server", message->text());
        if (quitting_)
        {
            dispatcher_.dispatch(message);
            shutdown();
            return;
        }
    }

    dispatcher_.dispatch(message);
}

auto Bot::shutdown() -> void
{
    if (closed_) return;
    closed_ = true;

    connection_->close();
    watchdog_timer_.cancel();
    ping_timer_.cancel();
    for (auto const& weak : timers_)
    {
        if (auto const timer = weak.lock())
        {
            timer->cancel();
        }
    }
    timers_.clear();

    for (auto const& hook : shutdown_hooks_)
    {
        try
        {
            hook();
        }
        catch (std::exception const& e)
        {
            log::error("shutdown", boost::core::demangle(typeid(e).name()), ": ", e.what());
        }
    }

    workers_.shutdown();
    privileges_.clear();
    flood_.clear();
}

auto Bot::watchdog_thread() -> boost::asio::awaitable<void>
{
    while (not closed_)
    {
        auto const deadline = last_read_.load() + settings_.timeout;
        if (clock::now() >= deadline)
        {
            log::error("connection", "no data from server in ", settings_.timeout.count(), "s");
            shutdown();
            co_return;
        }

        boost::system::error_code ec;
        watchdog_timer_.expires_at(deadline);
        co_await watchdog_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

auto Bot::ping_thread() -> boost::asio::awaitable<void>
{
    auto const interval = std::max<clock::duration>(settings_.timeout / 2, std::chrono::seconds{1});

    while (not closed_)
    {
        auto const due = last_write_.load() + interval;
        if (clock::now() >= due)
        {
            write_line("PING " + settings_.host);
            continue;
        }

        boost::system::error_code ec;
        ping_timer_.expires_at(due);
        co_await ping_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

auto Bot::register_rule(RuleSpec spec) -> HandlerPtr
{
    return rules_.add(std::move(spec));
}

auto Bot::register_capability(
    std::string const& plugin,
    std::vector<std::string> tokens,
    CapCallback callback
) -> void
{
    capabilities_.register_request(plugin, std::move(tokens), std::move(callback));
}

auto Bot::resume_capability_negotiation(std::vector<std::string> tokens, std::string plugin) -> void
{
    boost::asio::dispatch(io_context_,
        [this, request = CapabilityManager::normalize(std::move(tokens)), plugin = std::move(plugin)]() {
            auto const [was_complete, is_complete] = capabilities_.resume(request, plugin);
            if (not was_complete && is_complete)
            {
                end_capability_negotiation();
            }
        });
}

auto Bot::end_capability_negotiation() -> void
{
    if (cap_ended_) return;
    cap_ended_ = true;
    write_line("CAP END");
}

auto Bot::add_shutdown_hook(std::function<void()> hook) -> void
{
    shutdown_hooks_.push_back(std::move(hook));
}

auto Bot::schedule(clock::duration const delay, std::function<void()> action) -> void
{
    boost::asio::dispatch(io_context_, [this, delay, action = std::move(action)]() mutable {
        if (closed_) return;

        std::erase_if(timers_, [](auto const& weak) { return weak.expired(); });

        auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
        timers_.push_back(timer);
        timer->async_wait([this, timer, action = std::move(action)](boost::system::error_code const& ec) {
            if (not ec && not closed_)
            {
                action();
            }
        });
    });
}

auto Bot::schedule_job(HandlerPtr job) -> void
{
    auto const period = std::get<Interval>(job->kind).period;
    schedule(period, [this, job]() {
        dispatcher_.run_job(job);
        schedule_job(job);
    });
}

auto Bot::say(std::string_view const text, std::string_view const recipient, std::size_t const max_messages) -> void
{
    flood_.say(text, recipient, max_messages);
}

auto Bot::notice(std::string_view const text, std::string_view const recipient) -> void
{
    write({"NOTICE", std::string{recipient}}, text);
}

auto Bot::action(std::string_view const text, std::string_view const recipient) -> void
{
    say("\x01" "ACTION " + std::string{text} + "\x01", recipient);
}

auto Bot::reply(std::string_view const text, Trigger const& trigger, bool const as_notice) -> void
{
    if (as_notice)
    {
        notice(text, trigger.nick());
    }
    else
    {
        say(std::string{trigger.nick()} + ": " + std::string{text}, trigger.sender());
    }
}

auto Bot::write(std::vector<std::string> const& args, std::optional<std::string_view> const text) -> void
{
    std::string line;
    for (auto const& arg : args)
    {
        if (not line.empty()) line += ' ';
        line += arg;
    }
    if (text)
    {
        line += " :";
        line += *text;
    }
    write_line(line);
}

auto Bot::write_line(std::string_view const line) -> void
{
    last_write_ = clock::now();
    connection_->write(line);
}

auto Bot::join(std::string_view const channel, std::string_view const key) -> void
{
    if (key.empty())
    {
        write({"JOIN", std::string{channel}});
    }
    else
    {
        write({"JOIN", std::string{channel}, std::string{key}});
    }
}

auto Bot::part(std::string_view const channel, std::string_view const reason) -> void
{
    if (reason.empty())
    {
        write({"PART", std::string{channel}});
    }
    else
    {
        write({"PART", std::string{channel}}, reason);
    }
}

auto Bot::quit(std::string_view const message) -> void
{
    quitting_ = true;
    if (message.empty())
    {
        write_line("QUIT");
    }
    else
    {
        write({"QUIT"}, message);
    }
}

auto Bot::nick() const -> std::string
{
    std::lock_guard const lock{nick_mutex_};
    return nick_;
}

auto Bot::set_nick(std::string nick) -> void
{
    std::lock_guard const lock{nick_mutex_};
    nick_ = std::move(nick);
}

} // namespace lark
