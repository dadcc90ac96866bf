#include "lark/store.hpp"

#include "lark/identifier.hpp"

namespace lark {

auto MemoryStore::get(std::string_view const owner, std::string_view const key) const -> std::optional<std::string>
{
    std::lock_guard const lock{mutex_};
    auto const it = values_.find({fold(owner), std::string{key}});
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

auto MemoryStore::set(std::string_view const owner, std::string_view const key, std::string value) -> void
{
    std::lock_guard const lock{mutex_};
    values_.insert_or_assign({fold(owner), std::string{key}}, std::move(value));
}

auto MemoryStore::erase(std::string_view const owner, std::string_view const key) -> bool
{
    std::lock_guard const lock{mutex_};
    return values_.erase(std::pair{fold(owner), std::string{key}}) > 0;
}

} // namespace lark
