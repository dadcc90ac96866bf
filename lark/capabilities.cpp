#include "lark/capabilities.hpp"

#include "lark/logging.hpp"

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <typeinfo>

namespace lark {

auto CapabilityManager::normalize(std::vector<std::string> tokens) -> CapRequest
{
    std::erase_if(tokens, [](auto const& token) { return token.empty(); });
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

auto CapabilityManager::parse(std::string_view tokens) -> CapRequest
{
    std::vector<std::string> result;
    while (not tokens.empty())
    {
        auto const space = tokens.find(' ');
        result.emplace_back(tokens.substr(0, space));
        if (space == tokens.npos) break;
        tokens.remove_prefix(space + 1);
    }
    return normalize(std::move(result));
}

auto CapabilityManager::join(CapRequest const& request) -> std::string
{
    std::string result;
    for (auto const& token : request)
    {
        if (not result.empty()) result += ' ';
        result += token;
    }
    return result;
}

auto CapabilityManager::register_request(
    std::string const& plugin,
    std::vector<std::string> tokens,
    CapCallback callback
) -> void
{
    auto request = normalize(std::move(tokens));
    auto const text = join(request);
    if (request.empty())
    {
        throw capability_error{"empty capability request from " + plugin};
    }
    if (text.size() > max_request_length)
    {
        throw capability_error{"capability request too long: " + text};
    }

    registered_[std::move(request)].insert_or_assign(plugin, Owner{std::move(callback), false});
}

auto CapabilityManager::request_available(std::set<std::string, std::less<>> const& advertised) -> std::vector<CapRequest>
{
    std::vector<CapRequest> result;

    for (auto& [request, owners] : registered_)
    {
        auto const available = std::all_of(request.begin(), request.end(), [&](std::string_view token) {
            if (token.starts_with('-')) token.remove_prefix(1);
            return advertised.contains(token);
        });

        if (available && not requested_.contains(request))
        {
            for (auto& [_, owner] : owners)
            {
                owner.done = false;
            }
            requested_.insert(request);
            result.push_back(request);
        }
    }

    return result;
}

auto CapabilityManager::acknowledge(CapRequest const& request) -> std::optional<Results>
{
    return complete(request, true);
}

auto CapabilityManager::deny(CapRequest const& request) -> std::optional<Results>
{
    return complete(request, false);
}

auto CapabilityManager::complete(CapRequest const& request, bool const acknowledged) -> std::optional<Results>
{
    if (not requested_.contains(request))
    {
        log::debug("capabilities", "ignoring ", acknowledged ? "ACK" : "NAK", " for unrequested ", join(request));
        return std::nullopt;
    }

    if (acknowledged)
    {
        denied_.erase(request);
        acknowledged_.insert(request);
    }
    else
    {
        acknowledged_.erase(request);
        denied_.insert(request);
    }

    Results results;
    for (auto& [plugin, owner] : registered_[request])
    {
        auto status = CapStatus::DONE;
        if (owner.callback)
        {
            try
            {
                status = owner.callback(request, acknowledged);
            }
            catch (std::exception const& e)
            {
                log::error("capabilities", plugin, " callback failed: ",
                    boost::core::demangle(typeid(e).name()), ": ", e.what());
                status = CapStatus::ERROR;
            }
        }
        owner.done = status == CapStatus::DONE;
        results.emplace_back(plugin, status);
    }
    return results;
}

auto CapabilityManager::resume(CapRequest const& request, std::string const& plugin) -> std::pair<bool, bool>
{
    auto const was_complete = is_complete();

    auto const it = registered_.find(request);
    if (it == registered_.end() || not it->second.contains(plugin))
    {
        log::warning("capabilities", plugin, " resumed unknown request ", join(request));
        return {was_complete, was_complete};
    }

    it->second.at(plugin).done = true;
    return {was_complete, is_complete()};
}

auto CapabilityManager::is_complete() const -> bool
{
    return std::all_of(requested_.begin(), requested_.end(), [this](auto const& request) {
        auto const& owners = registered_.at(request);
        return std::all_of(owners.begin(), owners.end(), [](auto const& entry) {
            return entry.second.done;
        });
    });
}

auto CapabilityManager::is_enabled(std::string_view const capability) const -> bool
{
    return std::any_of(acknowledged_.begin(), acknowledged_.end(), [capability](auto const& request) {
        return std::find(request.begin(), request.end(), capability) != request.end();
    });
}

auto CapabilityManager::reset() -> void
{
    requested_.clear();
    acknowledged_.clear();
    denied_.clear();
    for (auto& entry : registered_)
    {
        for (auto& [plugin, owner] : entry.second)
        {
            owner.done = false;
        }
    }
}

} // namespace lark
