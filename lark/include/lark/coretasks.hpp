#pragma once
/**
 * @file coretasks.hpp
 * @brief Built-in handlers that keep the engine's protocol state current
 *
 */

namespace lark {

class Bot;

/**
 * @brief Register the core protocol handlers on a bot
 *
 * Installs capability negotiation (including SASL when configured),
 * registration follow-up, membership and privilege tracking, and
 * join retries. All handlers are unblockable, unthreaded, and run at
 * high priority under the plugin name "coretasks".
 */
auto install_coretasks(Bot& bot) -> void;

} // namespace lark
