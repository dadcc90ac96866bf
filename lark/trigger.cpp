#include "lark/trigger.hpp"

namespace lark {

Trigger::Trigger(
    std::shared_ptr<Message const> message,
    std::vector<std::string> groups,
    Rank const rank,
    std::stop_token stop)
    : message_{std::move(message)}
    , groups_{std::move(groups)}
    , rank_{rank}
    , stop_{std::move(stop)}
{
}

auto Trigger::nick() const -> std::string_view
{
    return message_ ? std::string_view{message_->nick()} : std::string_view{};
}

auto Trigger::sender() const -> std::string_view
{
    return message_ ? std::string_view{message_->sender()} : std::string_view{};
}

auto Trigger::text() const -> std::string_view
{
    return message_ ? std::string_view{message_->text()} : std::string_view{};
}

auto Trigger::command() const -> std::string_view
{
    return message_ ? std::string_view{message_->command()} : std::string_view{};
}

auto Trigger::group(std::size_t const n) const -> std::string_view
{
    return n < groups_.size() ? std::string_view{groups_[n]} : std::string_view{};
}

auto Trigger::is_private() const -> bool
{
    return message_ && message_->is_private();
}

auto Trigger::with_stop_token(std::stop_token stop) const -> Trigger
{
    auto copy = *this;
    copy.stop_ = std::move(stop);
    return copy;
}

} // namespace lark
