#include "lark/flood.hpp"

#include "lark/identifier.hpp"
#include "lark/logging.hpp"
#include "lark/text.hpp"

#include <algorithm>
#include <thread>

namespace lark {

FloodControl::FloodControl(Send send, FloodSettings settings, Now now, Sleep sleep)
    : send_{std::move(send)}
    , settings_{settings}
    , now_{now ? std::move(now) : Now{clock::now}}
    , sleep_{sleep ? std::move(sleep) : Sleep{[](clock::duration const d) { std::this_thread::sleep_for(d); }}}
{
}

auto FloodControl::say(std::string_view const text, std::string_view const recipient, std::size_t const max_messages) -> void
{
    auto fragments = split_message(text, settings_.text_length, max_messages);

    std::lock_guard const lock{mutex_};
    auto& history = history_.try_emplace(std::string{recipient}).first->second;
    for (auto& fragment : fragments)
    {
        send_one(recipient, history, std::move(fragment));
    }
}

auto FloodControl::send_one(std::string_view const recipient, std::deque<Entry>& history, std::string text) -> void
{
    if (not history.empty())
    {
        auto const elapsed = now_() - history.back().time;
        if (elapsed < settings_.burst_window)
        {
            auto const excess = text.size() > settings_.free_length ? text.size() - settings_.free_length : 0;
            auto const penalty = std::chrono::duration_cast<clock::duration>(
                std::chrono::duration<double>{settings_.base_delay + excess / settings_.length_divisor});
            if (elapsed < penalty)
            {
                sleep_(penalty - elapsed);
            }
        }

        auto const now = now_();
        auto const window_start = history.size() > settings_.repeat_window
            ? history.end() - settings_.repeat_window
            : history.begin();

        auto const repeats = std::count_if(window_start, history.end(),
            [&text](Entry const& entry) { return entry.text == text; });
        if (static_cast<std::size_t>(repeats) >= settings_.repeat_threshold)
        {
            auto const first = std::find_if(window_start, history.end(),
                [&text](Entry const& entry) { return entry.text == text; });
            if (now - first->time < settings_.repeat_age)
            {
                auto const placeholders = std::count_if(window_start, history.end(),
                    [](Entry const& entry) { return entry.text == placeholder; });
                if (static_cast<std::size_t>(placeholders) >= settings_.placeholder_limit)
                {
                    log::debug("flood", "suppressed repeat to ", recipient);
                    return;
                }
                text = placeholder;
            }
        }
    }

    send_(recipient, text);

    history.push_back({now_(), std::move(text)});
    while (history.size() > settings_.history)
    {
        history.pop_front();
    }
}

auto FloodControl::recent(std::string_view const recipient) -> std::vector<std::string>
{
    std::lock_guard const lock{mutex_};

    std::vector<std::string> result;
    if (auto const it = history_.find(recipient); it != history_.end())
    {
        for (auto const& entry : it->second)
        {
            result.push_back(entry.text);
        }
    }
    return result;
}

auto FloodControl::clear() -> void
{
    std::lock_guard const lock{mutex_};
    history_.clear();
}

} // namespace lark
