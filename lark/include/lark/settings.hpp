#pragma once
/**
 * @file settings.hpp
 * @brief Validated configuration consumed by the engine
 *
 */

#include "lark/flood.hpp"
#include "lark/logging.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lark {

enum class AuthMethod {
    NONE,
    SASL,     ///< SASL PLAIN during capability negotiation
    NICKSERV, ///< PRIVMSG to a services bot after registration
};

struct Settings
{
    // identity
    std::string nick;
    std::string user;
    std::string name;

    // server
    std::string host;
    std::uint16_t port = 6697;
    bool tls = true;
    bool verify_tls = true;
    std::string client_cert;
    std::string client_key;
    std::string server_password;
    std::string bind_host;

    /// @brief Inbound silence that closes the connection
    std::chrono::seconds timeout {120};

    /// @brief Longest capability negotiation before CAP END is forced
    std::chrono::seconds cap_timeout {30};

    std::vector<std::string> channels;
    std::vector<std::string> commands_on_connect;

    // access control
    std::string owner;
    std::vector<std::string> admins;
    std::vector<std::string> nick_blocks;
    std::vector<std::string> host_blocks;

    /// @brief Channel to the plugins allowed to respond there
    std::map<std::string, std::vector<std::string>> channel_plugins;

    /// @brief Regular expression introducing commands
    std::string prefix = "\\.";

    AuthMethod auth_method = AuthMethod::NONE;

    /// @brief PLAIN or EXTERNAL
    std::string sasl_mechanism = "PLAIN";
    std::string auth_username;
    std::string auth_password;
    std::string auth_target = "NickServ";

    log::Level log_level = log::Level::INFO;
    std::string log_file;

    std::size_t worker_threads = 4;
    std::size_t worker_queue = 64;

    std::size_t join_attempts = 10;
    std::chrono::seconds join_retry_delay {6};

    FloodSettings flood;
};

} // namespace lark
