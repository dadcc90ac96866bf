#include "lark/stream.hpp"

#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace lark {

TcpStream::TcpStream(boost::asio::ip::tcp::socket socket)
    : socket_{std::move(socket)}
{
}

auto TcpStream::read_some(boost::asio::mutable_buffer const buffer) -> boost::asio::awaitable<std::size_t>
{
    return socket_.async_read_some(buffer, boost::asio::use_awaitable);
}

auto TcpStream::write(std::vector<boost::asio::const_buffer> const& buffers) -> boost::asio::awaitable<std::size_t>
{
    return boost::asio::async_write(socket_, buffers, boost::asio::use_awaitable);
}

auto TcpStream::close() -> void
{
    boost::system::error_code err;
    socket_.shutdown(socket_.shutdown_both, err);
    socket_.close(err);
}

TlsStream::TlsStream(boost::asio::ip::tcp::socket socket, boost::asio::ssl::context context)
    : context_{std::move(context)}
    , stream_{std::move(socket), context_}
{
}

auto TlsStream::read_some(boost::asio::mutable_buffer const buffer) -> boost::asio::awaitable<std::size_t>
{
    return stream_.async_read_some(buffer, boost::asio::use_awaitable);
}

auto TlsStream::write(std::vector<boost::asio::const_buffer> const& buffers) -> boost::asio::awaitable<std::size_t>
{
    return boost::asio::async_write(stream_, buffers, boost::asio::use_awaitable);
}

auto TlsStream::close() -> void
{
    boost::system::error_code err;
    auto& socket = stream_.lowest_layer();
    socket.shutdown(socket.shutdown_both, err);
    socket.close(err);
}

} // namespace lark
