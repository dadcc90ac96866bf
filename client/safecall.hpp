#pragma once
/**
 * @file safecall.hpp
 * @brief Call Lua functions with backtrace reporting
 *
 */

struct lua_State;

namespace lark {

/**
 * @brief Call a Lua function, converting errors into exceptions
 *
 * The function and its arguments are on the top of the stack. On
 * success the results are left in their place.
 *
 * @param L Lua interpreter handle
 * @param location Location to use in error reporting
 * @param args Number of function arguments on Lua stack
 * @param results Number of results to keep
 * @throw configuration_error carrying the error and a traceback
 */
auto safecall(lua_State* L, char const* location, int args, int results) -> void;

} // namespace lark
