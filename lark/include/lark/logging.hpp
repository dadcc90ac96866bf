#pragma once
/**
 * @file logging.hpp
 * @brief Leveled, thread-safe line logging to stderr and an optional file
 *
 */

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace lark::log {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

auto set_level(Level) -> void;
auto enabled(Level) -> bool;

/// @brief Parse "debug", "info", "warning", or "error"
auto parse_level(std::string_view) -> std::optional<Level>;

/**
 * @brief Additionally append log lines to a file
 *
 * @param path File to append to; empty disables the file sink
 * @throw std::system_error when the file cannot be opened
 */
auto set_file(std::string const& path) -> void;

/**
 * @brief Emit one log line
 *
 * @param level severity
 * @param location short name of the component reporting
 * @param message text of the entry
 */
auto write(Level level, std::string_view location, std::string_view message) -> void;

template <typename... Args>
auto emit(Level const level, std::string_view const location, Args const&... args) -> void
{
    if (enabled(level))
    {
        std::ostringstream os;
        (os << ... << args);
        write(level, location, os.str());
    }
}

template <typename... Args>
auto debug(std::string_view const location, Args const&... args) -> void
{
    emit(Level::DEBUG, location, args...);
}

template <typename... Args>
auto info(std::string_view const location, Args const&... args) -> void
{
    emit(Level::INFO, location, args...);
}

template <typename... Args>
auto warning(std::string_view const location, Args const&... args) -> void
{
    emit(Level::WARNING, location, args...);
}

template <typename... Args>
auto error(std::string_view const location, Args const&... args) -> void
{
    emit(Level::ERROR, location, args...);
}

} // namespace lark::log
