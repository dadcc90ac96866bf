#pragma once
/**
 * @file stream.hpp
 * @brief Byte streams carrying an IRC session
 *
 */

#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include <cstddef>
#include <vector>

namespace lark {

class Stream
{
public:
    virtual ~Stream() = default;

    /// @brief Read at least one byte into the buffer
    virtual auto read_some(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<std::size_t> = 0;

    /// @brief Write every byte of every buffer
    virtual auto write(std::vector<boost::asio::const_buffer> const& buffers) -> boost::asio::awaitable<std::size_t> = 0;

    /// @brief Tear down the stream, failing pending operations
    virtual auto close() -> void = 0;
};

class TcpStream final : public Stream
{
    boost::asio::ip::tcp::socket socket_;

public:
    explicit TcpStream(boost::asio::ip::tcp::socket socket);

    auto read_some(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<std::size_t> override;
    auto write(std::vector<boost::asio::const_buffer> const& buffers) -> boost::asio::awaitable<std::size_t> override;
    auto close() -> void override;
};

class TlsStream final : public Stream
{
    boost::asio::ssl::context context_;
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_;

public:
    TlsStream(boost::asio::ip::tcp::socket socket, boost::asio::ssl::context context);

    /// @brief Underlying TLS stream, used to configure and handshake
    auto get() -> boost::asio::ssl::stream<boost::asio::ip::tcp::socket>& { return stream_; }

    auto read_some(boost::asio::mutable_buffer buffer) -> boost::asio::awaitable<std::size_t> override;
    auto write(std::vector<boost::asio::const_buffer> const& buffers) -> boost::asio::awaitable<std::size_t> override;
    auto close() -> void override;
};

} // namespace lark
