#include "lark/rules.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace lark {

namespace {

auto compile(std::string const& expression, std::string const& owner) -> boost::regex
{
    try
    {
        return boost::regex{expression, boost::regex::perl | boost::regex::icase};
    }
    catch (boost::regex_error const& e)
    {
        throw rule_error{owner + ": bad pattern " + expression + ": " + e.what()};
    }
}

auto upper(std::string text) -> std::string
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char const c) { return std::toupper(c); });
    return text;
}

} // namespace

HandlerDescriptor::HandlerDescriptor(std::size_t const id, RuleSpec spec, std::vector<boost::regex> patterns)
    : id{id}
    , plugin{std::move(spec.plugin)}
    , label{std::move(spec.label)}
    , kind{std::move(spec.kind)}
    , patterns{std::move(patterns)}
    , events{std::move(spec.events)}
    , priority{spec.priority}
    , threaded{spec.threaded}
    , rate{spec.rate}
    , unblockable{spec.unblockable}
    , intents{std::move(spec.intents)}
    , callback{std::move(spec.callback)}
{
}

auto HandlerDescriptor::handles(std::string_view const command) const -> bool
{
    return std::find(events.begin(), events.end(), command) != events.end();
}

auto HandlerDescriptor::accepts_intent(std::optional<std::string_view> const intent) const -> bool
{
    if (intents.empty()) return true;
    if (not intent) return false;
    return std::find(intents.begin(), intents.end(), *intent) != intents.end();
}

RuleRegistry::RuleRegistry(std::string command_prefix)
    : command_prefix_{std::move(command_prefix)}
{
}

auto RuleRegistry::add(RuleSpec spec) -> HandlerPtr
{
    auto const owner = spec.plugin + "." + spec.label;
    if (not spec.callback)
    {
        throw rule_error{owner + ": missing callback"};
    }

    std::transform(spec.events.begin(), spec.events.end(), spec.events.begin(), upper);
    std::transform(spec.intents.begin(), spec.intents.end(), spec.intents.begin(), upper);

    std::vector<boost::regex> patterns;
    std::visit([&](auto const& kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, Patterns>)
        {
            for (auto const& expression : kind.expressions)
            {
                patterns.push_back(compile(expression, owner));
            }
        }
        else if constexpr (std::is_same_v<T, Commands>)
        {
            for (auto const& name : kind.names)
            {
                patterns.push_back(compile(command_prefix_ + "(" + regex_escape(name) + ")(?:\\s+(.*))?$", owner));
            }
        }
        else if constexpr (std::is_same_v<T, Events>)
        {
            patterns.push_back(compile(".*", owner));
        }
        else if constexpr (std::is_same_v<T, Interval>)
        {
            if (kind.period.count() <= 0)
            {
                throw rule_error{owner + ": interval must be positive"};
            }
        }
    }, spec.kind);

    if (patterns.empty() && not std::holds_alternative<Interval>(spec.kind))
    {
        throw rule_error{owner + ": no patterns"};
    }

    auto const priority = spec.priority;
    auto descriptor = std::make_shared<HandlerDescriptor const>(next_id_++, std::move(spec), std::move(patterns));

    if (descriptor->is_job())
    {
        jobs_.push_back(descriptor);
    }
    else
    {
        rules_[static_cast<std::size_t>(priority)].push_back(descriptor);
    }
    return descriptor;
}

auto RuleRegistry::size() const -> std::size_t
{
    auto n = jobs_.size();
    for (auto const& bucket : rules_)
    {
        n += bucket.size();
    }
    return n;
}

auto regex_escape(std::string_view const literal) -> std::string
{
    std::string result;
    for (auto const c : literal)
    {
        if (std::string_view{"\\^$.|?*+()[]{}"}.find(c) != std::string_view::npos)
        {
            result += '\\';
        }
        result += c;
    }
    return result;
}

} // namespace lark
