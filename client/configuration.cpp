#include "configuration.hpp"

#include "safecall.hpp"

extern "C" {
#include <lauxlib.h>
#include <lua.h>
#include <lualib.h>
}

#include <cstdlib>
#include <limits>
#include <optional>

namespace lark {

namespace {

/// @brief Interpreter that lives for one load
class LuaState final
{
    lua_State* L_;

public:
    LuaState() : L_{luaL_newstate()}
    {
        if (nullptr == L_)
        {
            throw configuration_error{"unable to create Lua state"};
        }
        luaL_requiref(L_, "_G", luaopen_base, 1);
        luaL_requiref(L_, LUA_STRLIBNAME, luaopen_string, 1);
        luaL_requiref(L_, LUA_TABLIBNAME, luaopen_table, 1);
        luaL_requiref(L_, LUA_MATHLIBNAME, luaopen_math, 1);
        lua_pop(L_, 4);
    }

    ~LuaState()
    {
        lua_close(L_);
    }

    LuaState(LuaState const&) = delete;
    LuaState(LuaState&&) = delete;
    auto operator=(LuaState const&) -> LuaState& = delete;
    auto operator=(LuaState&&) -> LuaState& = delete;

    auto get() const -> lua_State* { return L_; }
};

auto field_error(char const* const key, std::string_view const problem) -> configuration_error
{
    std::string message = "field '";
    message += key;
    message += "': ";
    message += problem;
    return configuration_error{message};
}

/**
 * @brief Typed access to the fields of the returned settings table
 *
 * Each accessor leaves the stack as it found it. Absent and nil
 * fields produce nullopt; fields of the wrong type throw.
 */
class TableReader final
{
    lua_State* L;
    int table;

    auto push(char const* const key, int const expected, char const* const type_name) const -> bool
    {
        auto const type = lua_getfield(L, table, key);
        if (LUA_TNIL == type)
        {
            lua_pop(L, 1);
            return false;
        }
        if (expected != type)
        {
            lua_pop(L, 1);
            throw field_error(key, std::string{"expected "} + type_name);
        }
        return true;
    }

    static auto list_from_top(lua_State* const L, char const* const key) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        auto const n = luaL_len(L, -1);
        for (lua_Integer i = 1; i <= n; ++i)
        {
            if (LUA_TSTRING != lua_rawgeti(L, -1, i))
            {
                lua_pop(L, 2);
                throw field_error(key, "expected a list of strings");
            }
            std::size_t len;
            auto const str = lua_tolstring(L, -1, &len);
            result.emplace_back(str, len);
            lua_pop(L, 1);
        }
        return result;
    }

public:
    TableReader(lua_State* const L, int const table) : L{L}, table{table} {}

    auto string(char const* const key) const -> std::optional<std::string>
    {
        if (not push(key, LUA_TSTRING, "string")) return std::nullopt;
        std::size_t len;
        auto const str = lua_tolstring(L, -1, &len);
        std::string result {str, len};
        lua_pop(L, 1);
        return result;
    }

    auto required_string(char const* const key) const -> std::string
    {
        auto result = string(key);
        if (not result || result->empty())
        {
            throw field_error(key, "required");
        }
        return *std::move(result);
    }

    auto boolean(char const* const key) const -> std::optional<bool>
    {
        if (not push(key, LUA_TBOOLEAN, "boolean")) return std::nullopt;
        bool const result = lua_toboolean(L, -1);
        lua_pop(L, 1);
        return result;
    }

    auto integer(char const* const key, lua_Integer const lo, lua_Integer const hi) const -> std::optional<lua_Integer>
    {
        if (not push(key, LUA_TNUMBER, "integer")) return std::nullopt;
        int isnum;
        auto const result = lua_tointegerx(L, -1, &isnum);
        lua_pop(L, 1);
        if (not isnum)
        {
            throw field_error(key, "expected integer");
        }
        if (result < lo || result > hi)
        {
            throw field_error(key, "must be between " + std::to_string(lo) + " and " + std::to_string(hi));
        }
        return result;
    }

    auto list(char const* const key) const -> std::optional<std::vector<std::string>>
    {
        if (not push(key, LUA_TTABLE, "list of strings")) return std::nullopt;
        auto result = list_from_top(L, key);
        lua_pop(L, 1);
        return result;
    }

    /// @brief Table mapping strings to lists of strings
    auto list_map(char const* const key) const -> std::optional<std::map<std::string, std::vector<std::string>>>
    {
        if (not push(key, LUA_TTABLE, "table")) return std::nullopt;
        std::map<std::string, std::vector<std::string>> result;
        lua_pushnil(L);
        while (lua_next(L, -2))
        {
            // key at -2, value at -1
            if (LUA_TSTRING != lua_type(L, -2) || LUA_TTABLE != lua_type(L, -1))
            {
                lua_pop(L, 3);
                throw field_error(key, "expected a table of string lists");
            }
            std::size_t len;
            auto const name = lua_tolstring(L, -2, &len);
            std::string entry {name, len};
            result[std::move(entry)] = list_from_top(L, key);
            lua_pop(L, 1);
        }
        lua_pop(L, 1);
        return result;
    }
};

template <typename T>
auto assign(T& target, std::optional<T> value) -> void
{
    if (value) target = *std::move(value);
}

auto parse_auth_method(std::string const& name) -> AuthMethod
{
    if (name == "sasl") return AuthMethod::SASL;
    if (name == "nickserv") return AuthMethod::NICKSERV;
    if (name == "none" || name.empty()) return AuthMethod::NONE;
    throw field_error("auth_method", "expected sasl, nickserv, or none");
}

/// @brief Build settings from the table on the top of the stack
auto settings_from_table(lua_State* const L) -> Settings
{
    if (not lua_istable(L, -1))
    {
        throw configuration_error{"settings file must return a table"};
    }

    TableReader const t {L, lua_gettop(L)};
    Settings s;

    constexpr auto int_max = std::numeric_limits<int>::max();

    s.nick = t.required_string("nick");
    s.host = t.required_string("host");
    assign(s.user, t.string("user"));
    assign(s.name, t.string("name"));

    assign(s.tls, t.boolean("tls"));
    assign(s.verify_tls, t.boolean("verify_tls"));
    s.port = static_cast<std::uint16_t>(t.integer("port", 1, 65535).value_or(s.tls ? 6697 : 6667));
    assign(s.client_cert, t.string("client_cert"));
    assign(s.client_key, t.string("client_key"));
    assign(s.server_password, t.string("server_password"));
    assign(s.bind_host, t.string("bind_host"));

    if (auto const timeout = t.integer("timeout", 2, int_max))
    {
        s.timeout = std::chrono::seconds{*timeout};
    }
    if (auto const timeout = t.integer("cap_timeout", 1, int_max))
    {
        s.cap_timeout = std::chrono::seconds{*timeout};
    }

    assign(s.channels, t.list("channels"));
    assign(s.commands_on_connect, t.list("commands_on_connect"));

    assign(s.owner, t.string("owner"));
    assign(s.admins, t.list("admins"));
    assign(s.nick_blocks, t.list("nick_blocks"));
    assign(s.host_blocks, t.list("host_blocks"));
    assign(s.channel_plugins, t.list_map("channel_plugins"));
    assign(s.prefix, t.string("prefix"));

    if (auto const method = t.string("auth_method"))
    {
        s.auth_method = parse_auth_method(*method);
    }
    assign(s.sasl_mechanism, t.string("sasl_mechanism"));
    if (s.sasl_mechanism != "PLAIN" && s.sasl_mechanism != "EXTERNAL")
    {
        throw field_error("sasl_mechanism", "expected PLAIN or EXTERNAL");
    }
    assign(s.auth_username, t.string("auth_username"));
    assign(s.auth_password, t.string("auth_password"));
    assign(s.auth_target, t.string("auth_target"));

    if (auto const level = t.string("log_level"))
    {
        auto const parsed = log::parse_level(*level);
        if (not parsed)
        {
            throw field_error("log_level", "expected debug, info, warning, or error");
        }
        s.log_level = *parsed;
    }
    assign(s.log_file, t.string("log_file"));

    if (auto const n = t.integer("worker_threads", 1, 256))
    {
        s.worker_threads = static_cast<std::size_t>(*n);
    }
    if (auto const n = t.integer("worker_queue", 1, int_max))
    {
        s.worker_queue = static_cast<std::size_t>(*n);
    }
    if (auto const n = t.integer("join_attempts", 0, int_max))
    {
        s.join_attempts = static_cast<std::size_t>(*n);
    }
    if (auto const n = t.integer("flood_text_length", 32, 400))
    {
        s.flood.text_length = static_cast<std::size_t>(*n);
    }

    return s;
}

} // namespace

auto load_settings(std::string const& path) -> Settings
{
    LuaState const lua;
    auto const L = lua.get();

    if (LUA_OK != luaL_loadfile(L, path.c_str()))
    {
        std::string message = "error in load: ";
        message += lua_tolstring(L, -1, nullptr);
        throw configuration_error{message};
    }
    safecall(L, path.c_str(), 0, 1);
    return settings_from_table(L);
}

auto load_settings_string(std::string_view const source, std::string const& name) -> Settings
{
    LuaState const lua;
    auto const L = lua.get();

    if (LUA_OK != luaL_loadbuffer(L, source.data(), source.size(), name.c_str()))
    {
        std::string message = "error in load: ";
        message += lua_tolstring(L, -1, nullptr);
        throw configuration_error{message};
    }
    safecall(L, name.c_str(), 0, 1);
    return settings_from_table(L);
}

auto default_settings_path() -> std::string
{
    if (auto const home = std::getenv("HOME"))
    {
        return std::string{home} + "/.config/lark/settings.lua";
    }
    return "settings.lua";
}

} // namespace lark
