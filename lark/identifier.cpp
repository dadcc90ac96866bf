#include "lark/identifier.hpp"

#include <algorithm>

namespace lark {

auto fold(std::string_view const name) -> std::string
{
    std::string result(name.size(), '\0');
    std::transform(name.begin(), name.end(), result.begin(), fold_char);
    return result;
}

auto same_identifier(std::string_view const a, std::string_view const b) -> bool
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
        [](char const x, char const y) { return fold_char(x) == fold_char(y); });
}

auto IdentifierHash::operator()(std::string_view const name) const -> std::size_t
{
    // FNV-1a over the folded bytes
    std::size_t h = 14695981039346656037ull;
    for (auto const c : name)
    {
        h ^= static_cast<unsigned char>(fold_char(c));
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace lark
