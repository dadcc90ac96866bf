#pragma once
/**
 * @file capabilities.hpp
 * @brief IRCv3 capability request bookkeeping
 *
 */

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lark {

/// @brief Outcome of a capability callback
enum class CapStatus {
    DONE,     ///< plugin has finished with the request
    CONTINUE, ///< plugin will resume negotiation later
    ERROR,    ///< negotiation must be aborted
};

/// @brief Sorted, duplicate-free tuple of capability tokens
using CapRequest = std::vector<std::string>;

/**
 * @brief Callback run when the server acknowledges or denies a request
 *
 * The second argument is true for ACK and false for NAK.
 */
using CapCallback = std::function<CapStatus(CapRequest const&, bool)>;

struct capability_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Tracks capability requests registered by plugins
 *
 * A request moves from registered to requested and then to either
 * acknowledged or denied. Several plugins may register the same
 * request; negotiation is complete only once every owner of every
 * requested tuple reports done.
 */
class CapabilityManager
{
public:
    using Results = std::vector<std::pair<std::string, CapStatus>>;

    /// @brief Maximum length of a space-joined request
    static constexpr std::size_t max_request_length = 500;

private:
    struct Owner {
        CapCallback callback;
        bool done = false;
    };

    std::map<CapRequest, std::map<std::string, Owner>> registered_;
    std::set<CapRequest> requested_;
    std::set<CapRequest> acknowledged_;
    std::set<CapRequest> denied_;

public:
    /// @brief Sort and deduplicate a list of tokens
    static auto normalize(std::vector<std::string> tokens) -> CapRequest;

    /// @brief Parse a space-separated token list as sent in ACK and NAK
    static auto parse(std::string_view tokens) -> CapRequest;

    /// @brief Render a request as its space-separated wire form
    static auto join(CapRequest const& request) -> std::string;

    /**
     * @brief Register a plugin's interest in a capability tuple
     *
     * Tokens prefixed with '-' ask for the capability to be disabled.
     *
     * @throw capability_error when the request is longer than 500 bytes
     */
    auto register_request(std::string const& plugin, std::vector<std::string> tokens, CapCallback callback = {}) -> void;

    /**
     * @brief Mark every satisfiable registered request as requested
     *
     * A request is satisfiable when each of its tokens, ignoring a
     * leading '-', is among the advertised capability names. Owner
     * done flags are reset for each request made.
     *
     * @param advertised capability names offered by the server
     * @return the requests to send, one CAP REQ each
     */
    auto request_available(std::set<std::string, std::less<>> const& advertised) -> std::vector<CapRequest>;

    /**
     * @brief Handle a CAP ACK for a request
     *
     * @return callback results per plugin, or nullopt when the request
     *         was never made
     */
    auto acknowledge(CapRequest const& request) -> std::optional<Results>;

    /**
     * @brief Handle a CAP NAK for a request
     *
     * @return callback results per plugin, or nullopt when the request
     *         was never made
     */
    auto deny(CapRequest const& request) -> std::optional<Results>;

    /**
     * @brief Mark a plugin as done with a request it continued earlier
     *
     * @return completion state before and after this call
     */
    auto resume(CapRequest const& request, std::string const& plugin) -> std::pair<bool, bool>;

    /// @brief True when every owner of every requested tuple is done
    auto is_complete() const -> bool;

    auto is_registered(CapRequest const& request) const -> bool { return registered_.contains(request); }
    auto is_requested(CapRequest const& request) const -> bool { return requested_.contains(request); }
    auto is_acknowledged(CapRequest const& request) const -> bool { return acknowledged_.contains(request); }
    auto is_denied(CapRequest const& request) const -> bool { return denied_.contains(request); }

    /// @brief True when the capability name is part of an acknowledged request
    auto is_enabled(std::string_view capability) const -> bool;

    /// @brief Forget per-connection state while keeping registrations
    auto reset() -> void;

private:
    auto complete(CapRequest const& request, bool acknowledged) -> std::optional<Results>;
};

} // namespace lark
