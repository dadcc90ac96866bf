#pragma once
/**
 * @file identifier.hpp
 * @brief IRC case folding for nicknames and channel names
 *
 */

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lark {

/**
 * @brief Fold a single character using RFC 1459 rules
 *
 * ASCII letters fold to lower case and the characters {}|^
 * fold to []\~ respectively.
 */
inline constexpr auto fold_char(char const c) -> char
{
    switch (c) {
    case '{': return '[';
    case '}': return ']';
    case '|': return '\\';
    case '^': return '~';
    default: return 'A' <= c && c <= 'Z' ? c - 'A' + 'a' : c;
    }
}

/// @brief Case-fold an identifier
auto fold(std::string_view name) -> std::string;

/// @brief Compare two identifiers under IRC case folding
auto same_identifier(std::string_view a, std::string_view b) -> bool;

/// @brief Channel names begin with one of the standard channel prefixes
inline auto is_channel(std::string_view const name) -> bool
{
    return not name.empty() && std::string_view{"#&+!"}.find(name.front()) != std::string_view::npos;
}

/**
 * @brief Transparent hash under IRC case folding
 *
 * Spellings that fold to the same identifier hash alike, so keys keep
 * their original spelling and lookups take any view.
 */
struct IdentifierHash
{
    using is_transparent = void;
    auto operator()(std::string_view name) const -> std::size_t;
};

struct IdentifierEqual
{
    using is_transparent = void;
    auto operator()(std::string_view const a, std::string_view const b) const -> bool
    {
        return same_identifier(a, b);
    }
};

/// @brief Map keyed by nickname or channel name
template <typename T>
using IdentifierMap = std::unordered_map<std::string, T, IdentifierHash, IdentifierEqual>;

} // namespace lark
