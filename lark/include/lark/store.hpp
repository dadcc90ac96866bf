#pragma once
/**
 * @file store.hpp
 * @brief Key-value storage interface exposed to plugins
 *
 */

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lark {

/**
 * @brief Scalar values attached to nicknames and channels
 *
 * Owners are compared under IRC case folding.
 */
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual auto get(std::string_view owner, std::string_view key) const -> std::optional<std::string> = 0;
    virtual auto set(std::string_view owner, std::string_view key, std::string value) -> void = 0;

    /// @return true when a value was removed
    virtual auto erase(std::string_view owner, std::string_view key) -> bool = 0;
};

/// @brief Process-local store, safe for use from worker threads
class MemoryStore final : public KeyValueStore
{
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> values_;

public:
    auto get(std::string_view owner, std::string_view key) const -> std::optional<std::string> override;
    auto set(std::string_view owner, std::string_view key, std::string value) -> void override;
    auto erase(std::string_view owner, std::string_view key) -> bool override;
};

} // namespace lark
