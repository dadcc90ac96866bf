#include "safecall.hpp"

#include "configuration.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

#include <string>

namespace lark {

auto safecall(lua_State* const L, char const* const location, int const args, int const results) -> void
{
    lua_pushcfunction(L, [](auto const L){
        auto const msg = luaL_tolstring(L, 1, nullptr);
        luaL_traceback(L, L, msg, 1);
        return 1;
    });

    // f a1 a2.. eh
    lua_insert(L, -2-args);
    // eh f a1 a2..

    auto const handler = lua_gettop(L) - args - 1;
    auto const status = lua_pcall(L, args, results, handler);
    if (LUA_OK == status) {
        lua_remove(L, handler);
    } else {
        std::string message = "error in ";
        message += location;
        message += ": ";
        message += lua_tolstring(L, -1, nullptr);
        lua_pop(L, 2); /* error string, handler */
        throw configuration_error{message};
    }
}

} // namespace lark
