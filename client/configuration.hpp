#pragma once
/**
 * @file configuration.hpp
 * @brief Load engine settings from a Lua file
 *
 */

#include <lark/settings.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace lark {

/// @brief Settings file could not be loaded or holds an invalid value
struct configuration_error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Run a settings file and validate the table it returns
 *
 * @param path Lua source file
 * @return validated settings
 * @throw configuration_error naming the offending field
 */
auto load_settings(std::string const& path) -> Settings;

/**
 * @brief Run a settings chunk held in memory
 *
 * @param source Lua source text
 * @param name chunk name used in error messages
 * @throw configuration_error naming the offending field
 */
auto load_settings_string(std::string_view source, std::string const& name = "settings") -> Settings;

/// @brief ~/.config/lark/settings.lua, or a relative settings.lua without HOME
auto default_settings_path() -> std::string;

} // namespace lark
