#pragma once
/**
 * @file connection.hpp
 * @brief Connection establishment and serialized line writing
 *
 */

#include "lark/settings.hpp"
#include "lark/stream.hpp"

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace lark {

class Connection final : public std::enable_shared_from_this<Connection>
{
public:
    static std::size_t const irc_buffer_size = 131'072;

private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer write_timer_;
    std::unique_ptr<Stream> stream_;

    /// @brief Orders lines submitted from different threads
    std::mutex write_mutex_;

    /// @brief Framed lines waiting for the writer, owned by the io thread
    std::deque<std::string> write_queue_;

    bool closed_ = false;

public:
    explicit Connection(boost::asio::io_context&);

    Connection(Connection const&) = delete;
    Connection(Connection&&) = delete;
    auto operator=(Connection const&) -> Connection& = delete;
    auto operator=(Connection&&) -> Connection& = delete;

    auto static create(boost::asio::io_context& io_context) -> std::shared_ptr<Connection>
    {
        return std::make_shared<Connection>(io_context);
    }

    /**
     * @brief Establish the TCP or TLS stream described by the settings
     *
     * @return Space-separated key=value pairs describing the connection
     */
    auto connect(Settings const& settings) -> boost::asio::awaitable<std::string>;

    /**
     * @brief Use an already established stream
     *
     * Starts the writer. Must be called on the io thread.
     */
    auto adopt(std::unique_ptr<Stream> stream) -> void;

    /// @brief Read bytes from the server
    auto read_some(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<std::size_t>;

    /**
     * @brief Queue one line for the server
     *
     * The line is stripped of CR and LF, truncated to 510 bytes,
     * and terminated. Safe to call from any thread; lines are
     * written in the order calls acquire the write lock.
     *
     * @param line IRC command without terminator
     */
    auto write(std::string_view line) -> void;

    /// @brief Abruptly close the connection. Must be called on the io thread.
    auto close() -> void;

    auto is_open() const -> bool { return stream_ && not closed_; }

private:
    auto enqueue(std::string framed) -> void;
    auto write_thread() -> boost::asio::awaitable<void>;
};

} // namespace lark
