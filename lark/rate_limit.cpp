#include "lark/rate_limit.hpp"

#include "lark/identifier.hpp"

namespace lark {

auto RateLimiter::permit(
    std::size_t const handler,
    RateLimits const& limits,
    std::string_view const nick,
    std::string_view const channel,
    clock::time_point const now
) -> bool
{
    std::lock_guard const lock{mutex_};

    auto const check = [&](Scope const scope, std::string identity, std::chrono::seconds const period) -> bool {
        if (period.count() <= 0) return true;

        auto const it = stamps_.find({scope, identity, handler});
        if (it == stamps_.end()) return true;

        if (now - it->second < period)
        {
            it->second = now;
            return false;
        }
        return true;
    };

    return check(Scope::USER, fold(nick), limits.user)
        && (channel.empty() || check(Scope::CHANNEL, fold(channel), limits.channel))
        && check(Scope::GLOBAL, {}, limits.global);
}

auto RateLimiter::record(
    std::size_t const handler,
    std::string_view const nick,
    std::string_view const channel,
    clock::time_point const now
) -> void
{
    std::lock_guard const lock{mutex_};

    stamps_.insert_or_assign({Scope::USER, fold(nick), handler}, now);
    if (not channel.empty())
    {
        stamps_.insert_or_assign({Scope::CHANNEL, fold(channel), handler}, now);
    }
    stamps_.insert_or_assign({Scope::GLOBAL, std::string{}, handler}, now);
}

} // namespace lark
