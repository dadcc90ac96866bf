#include "lark/connection.hpp"

#include "lark/logging.hpp"
#include "lark/text.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/io/ios_state.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <fcntl.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace lark {

namespace {

using tcp_type = boost::asio::ip::tcp::socket;
using tls_type = boost::asio::ssl::stream<tcp_type>;

/// @brief Stream inserter for the SHA-256 digest of the peer's public key
struct KeyFingerprint
{
    SSL const* ssl;

    friend auto operator<<(std::ostream& os, KeyFingerprint const fp) -> std::ostream&
    {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
        unsigned int len = 0;

        auto const cert = SSL_get0_peer_certificate(fp.ssl);
        if (nullptr == cert || 1 != X509_pubkey_digest(cert, EVP_sha256(), digest.data(), &len))
        {
            return os << "unknown";
        }

        boost::io::ios_flags_saver const saver{os};
        os << std::hex << std::setfill('0');
        std::for_each(digest.begin(), digest.begin() + len,
            [&os](unsigned char const b) { os << std::setw(2) << unsigned{b}; });
        return os;
    }
};

/// @brief Socket options for a freshly connected server socket
auto prepare_socket(tcp_type& socket, std::size_t const buffer_size) -> void
{
    socket.set_option(boost::asio::ip::tcp::no_delay{true});
    socket.set_option(tcp_type::send_buffer_size{static_cast<int>(buffer_size)});
    socket.set_option(tcp_type::receive_buffer_size{static_cast<int>(buffer_size)});

    // keep the server connection out of any child process
    auto const fd = socket.native_handle();
    auto const flags = fcntl(fd, F_GETFD);
    if (-1 == flags || -1 == fcntl(fd, F_SETFD, flags | FD_CLOEXEC))
    {
        throw std::system_error{errno, std::generic_category(), "fcntl FD_CLOEXEC"};
    }
}

/**
 * @brief Throws a boost::system::system_error with the latest OpenSSL error.
 *
 * @param prefix A string to prefix the error message.
 */
[[noreturn]] auto openssl_error(char const* const prefix) -> void
{
    boost::system::error_code ec{
        static_cast<int>(::ERR_get_error()),
        boost::asio::error::get_ssl_category()
    };

    ::ERR_clear_error();

    throw boost::system::system_error{ec, prefix};
}

/// @brief ALPN protocol list containing only "irc"
constexpr std::array<unsigned char, 4> alpn_irc {3, 'i', 'r', 'c'};

auto build_ssl_context(Settings const& settings) -> boost::asio::ssl::context
{
    boost::asio::ssl::context ssl_context{boost::asio::ssl::context::method::tls_client};
    ssl_context.set_default_verify_paths();

    if (not settings.client_cert.empty())
    {
        ssl_context.use_certificate_chain_file(settings.client_cert);
        ssl_context.use_private_key_file(
            settings.client_key.empty() ? settings.client_cert : settings.client_key,
            boost::asio::ssl::context::file_format::pem);
    }
    return ssl_context;
}

/// @brief Per-connection TLS setup: buffering, ALPN, SNI and peer verification
auto prepare_tls(tls_type& stream, Settings const& settings, std::size_t const buffer_size) -> void
{
    auto const ssl = stream.native_handle();
    BIO_set_buffer_size(SSL_get_rbio(ssl), buffer_size);
    BIO_set_buffer_size(SSL_get_wbio(ssl), buffer_size);

    // returns 0 on success and leaves no error on the queue
    if (0 != SSL_set_alpn_protos(ssl, alpn_irc.data(), alpn_irc.size()))
    {
        throw std::runtime_error{"SSL_set_alpn_protos"};
    }

    if (1 != SSL_set_tlsext_host_name(ssl, settings.host.c_str()))
    {
        openssl_error("SSL_set_tlsext_host_name");
    }

    if (settings.verify_tls)
    {
        stream.set_verify_mode(boost::asio::ssl::verify_peer);
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(settings.host));
    }
}

} // namespace

Connection::Connection(boost::asio::io_context& io_context)
    : io_context_{io_context}
    , resolver_{io_context}
    , write_timer_{io_context, boost::asio::steady_timer::time_point::max()}
{
}

auto Connection::connect(Settings const& settings) -> boost::asio::awaitable<std::string>
{
    std::ostringstream os;

    auto const entries = co_await resolver_.async_resolve(
        settings.host, std::to_string(settings.port), boost::asio::use_awaitable);

    tcp_type socket{io_context_};
    boost::system::error_code ec = boost::asio::error::host_not_found;
    for (auto const& entry : entries)
    {
        socket.close();
        socket.open(entry.endpoint().protocol());
        if (not settings.bind_host.empty())
        {
            socket.bind({boost::asio::ip::make_address(settings.bind_host), 0});
        }
        co_await socket.async_connect(entry, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (not ec)
        {
            os << "tcp=" << entry.endpoint();
            break;
        }
        log::debug("connection", "connect to ", entry.endpoint(), " failed: ", ec.message());
    }
    if (ec)
    {
        throw boost::system::system_error{ec, "connect"};
    }

    prepare_socket(socket, irc_buffer_size);

    if (not settings.tls)
    {
        adopt(std::make_unique<TcpStream>(std::move(socket)));
        co_return os.str();
    }

    auto tls = std::make_unique<TlsStream>(std::move(socket), build_ssl_context(settings));
    auto& stream = tls->get();
    prepare_tls(stream, settings, irc_buffer_size);

    co_await stream.async_handshake(stream.client, boost::asio::use_awaitable);

    os << " tls=" << KeyFingerprint{stream.native_handle()};
    adopt(std::move(tls));
    co_return os.str();
}

auto Connection::adopt(std::unique_ptr<Stream> stream) -> void
{
    stream_ = std::move(stream);
    closed_ = false;
    boost::asio::co_spawn(io_context_, write_thread(), boost::asio::detached);
}

auto Connection::read_some(boost::asio::mutable_buffer const buffer) -> boost::asio::awaitable<std::size_t>
{
    if (not is_open())
    {
        throw boost::system::system_error{boost::asio::error::not_connected, "read"};
    }
    co_return co_await stream_->read_some(buffer);
}

auto Connection::write(std::string_view const line) -> void
{
    auto framed = frame_line(line);
    log::debug("raw", ">> ", std::string_view{framed}.substr(0, framed.size() - 2));

    std::lock_guard const lock{write_mutex_};
    boost::asio::post(io_context_, [self = shared_from_this(), framed = std::move(framed)]() mutable {
        self->enqueue(std::move(framed));
    });
}

auto Connection::enqueue(std::string framed) -> void
{
    if (closed_ || not stream_) return;

    auto const idle = write_queue_.empty();
    write_queue_.push_back(std::move(framed));
    if (idle)
    {
        write_timer_.cancel_one();
    }
}

auto Connection::write_thread() -> boost::asio::awaitable<void>
{
    auto const self = shared_from_this();

    try
    {
        for (;;)
        {
            if (write_queue_.empty())
            {
                // wait and ignore the cancellation errors
                boost::system::error_code ec;
                co_await write_timer_.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));

                if (write_queue_.empty())
                {
                    // canceled by close
                    co_return;
                }
            }

            if (closed_)
            {
                co_return;
            }

            auto const n = write_queue_.size();
            std::vector<boost::asio::const_buffer> buffers;
            buffers.reserve(n);
            std::for_each_n(write_queue_.begin(), n, [&buffers](std::string const& line) {
                buffers.push_back(boost::asio::buffer(line));
            });

            co_await stream_->write(buffers);
            write_queue_.erase(write_queue_.begin(), write_queue_.begin() + n);
        }
    }
    catch (boost::system::system_error const& e)
    {
        log::error("connection", "write failed: ", e.what());
        close();
    }
}

auto Connection::close() -> void
{
    if (closed_) return;
    closed_ = true;

    write_timer_.cancel();
    resolver_.cancel();
    if (stream_)
    {
        stream_->close();
    }
}

} // namespace lark
