#include "wirelink/transport/stream.hpp"

#include <asio/ssl/error.hpp>
#include <asio/ssl/host_name_verification.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace wirelink {

namespace {

std::string format_endpoint(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return {};
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// A peer that drops TCP without close_notify is treated as a clean end
std::error_code normalize_tls_error(const std::error_code& ec) {
    if (ec == asio::ssl::error::stream_truncated) {
        return asio::error::eof;
    }
    return ec;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TcpStream
// ═══════════════════════════════════════════════════════════════════════════

TcpStream::TcpStream(asio::ip::tcp::socket socket)
    : socket_(std::move(socket))
{}

asio::any_io_executor TcpStream::get_executor() {
    return socket_.get_executor();
}

asio::awaitable<StreamResult<std::size_t>> TcpStream::async_read_some(asio::mutable_buffer buffer) {
    try {
        co_return co_await socket_.async_read_some(buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(e.code());
    }
}

asio::awaitable<StreamResult<std::size_t>> TcpStream::async_write(asio::const_buffer buffer) {
    try {
        co_return co_await asio::async_write(socket_, buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(e.code());
    }
}

asio::awaitable<StreamResult<void>> TcpStream::async_shutdown() {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if (ec) {
        co_return tl::unexpected(ec);
    }
    co_return StreamResult<void>{};
}

void TcpStream::close() noexcept {
    asio::error_code ec;
    socket_.close(ec);
}

bool TcpStream::is_open() const {
    return socket_.is_open();
}

std::string TcpStream::remote_endpoint() const {
    return format_endpoint(socket_);
}

void TcpStream::set_no_delay(bool enabled) {
    asio::error_code ec;
    socket_.set_option(asio::ip::tcp::no_delay(enabled), ec);
}

// ═══════════════════════════════════════════════════════════════════════════
// TlsStream
// ═══════════════════════════════════════════════════════════════════════════

TlsStream::TlsStream(asio::ip::tcp::socket socket, std::shared_ptr<asio::ssl::context> context)
    : context_(std::move(context))
    , stream_(std::move(socket), *context_)
{}

asio::awaitable<StreamResult<void>> TlsStream::async_handshake(
    SslStream::handshake_type role,
    const std::string& server_name
) {
    if (role == SslStream::client && !server_name.empty()) {
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), server_name.c_str())) {
            co_return tl::unexpected(std::error_code(
                static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()
            ));
        }
        stream_.set_verify_callback(asio::ssl::host_name_verification(server_name));
    }

    try {
        co_await stream_.async_handshake(role, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(e.code());
    }
    co_return StreamResult<void>{};
}

asio::any_io_executor TlsStream::get_executor() {
    return stream_.get_executor();
}

asio::awaitable<StreamResult<std::size_t>> TlsStream::async_read_some(asio::mutable_buffer buffer) {
    try {
        co_return co_await stream_.async_read_some(buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(normalize_tls_error(e.code()));
    }
}

asio::awaitable<StreamResult<std::size_t>> TlsStream::async_write(asio::const_buffer buffer) {
    try {
        co_return co_await asio::async_write(stream_, buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(e.code());
    }
}

asio::awaitable<StreamResult<void>> TlsStream::async_shutdown() {
    asio::error_code ec;
    stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    if (ec) {
        co_return tl::unexpected(ec);
    }
    co_return StreamResult<void>{};
}

void TlsStream::close() noexcept {
    asio::error_code ec;
    stream_.lowest_layer().close(ec);
}

bool TlsStream::is_open() const {
    return stream_.lowest_layer().is_open();
}

std::string TlsStream::remote_endpoint() const {
    return format_endpoint(stream_.next_layer());
}

void TlsStream::set_no_delay(bool enabled) {
    asio::error_code ec;
    stream_.lowest_layer().set_option(asio::ip::tcp::no_delay(enabled), ec);
}

}  // namespace wirelink
