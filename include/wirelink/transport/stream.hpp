#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Byte Stream Interface
// ═══════════════════════════════════════════════════════════════════════════
// The transport under a Connection: a bidirectional ordered byte stream with
// half-close. Implementations wrap a plain TCP socket or a TLS stream over
// TCP. Errors come back as std::error_code values; end of stream is
// asio::error::eof for both.
//
// At most one read and one write may be outstanding at a time. The owning
// Connection guarantees this.

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/stream.hpp>

#include <tl/expected.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <system_error>

namespace wirelink {

template <typename T>
using StreamResult = tl::expected<T, std::error_code>;

class IStream {
public:
    virtual ~IStream() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Read whatever is available into `buffer` (at least one byte)
    [[nodiscard]] virtual asio::awaitable<StreamResult<std::size_t>> async_read_some(
        asio::mutable_buffer buffer
    ) = 0;

    /// Write all of `buffer`; completes once the transport accepted it
    [[nodiscard]] virtual asio::awaitable<StreamResult<std::size_t>> async_write(
        asio::const_buffer buffer
    ) = 0;

    /// Half-close: no more data will be sent, reading continues
    [[nodiscard]] virtual asio::awaitable<StreamResult<void>> async_shutdown() = 0;

    /// Close both directions; outstanding operations complete with
    /// operation_aborted
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    [[nodiscard]] virtual bool is_tls() const noexcept = 0;

    /// "address:port" of the peer, empty once the socket is closed
    [[nodiscard]] virtual std::string remote_endpoint() const = 0;

    virtual void set_no_delay(bool enabled) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// TcpStream
// ─────────────────────────────────────────────────────────────────────────────

class TcpStream final : public IStream {
public:
    explicit TcpStream(asio::ip::tcp::socket socket);

    asio::any_io_executor get_executor() override;
    asio::awaitable<StreamResult<std::size_t>> async_read_some(asio::mutable_buffer buffer) override;
    asio::awaitable<StreamResult<std::size_t>> async_write(asio::const_buffer buffer) override;
    asio::awaitable<StreamResult<void>> async_shutdown() override;
    void close() noexcept override;
    bool is_open() const override;
    bool is_tls() const noexcept override { return false; }
    std::string remote_endpoint() const override;
    void set_no_delay(bool enabled) override;

    [[nodiscard]] asio::ip::tcp::socket& socket() noexcept { return socket_; }

private:
    asio::ip::tcp::socket socket_;
};

// ─────────────────────────────────────────────────────────────────────────────
// TlsStream
// ─────────────────────────────────────────────────────────────────────────────
// TLS over TCP. The handshake is performed by whoever creates the stream
// (ServiceListener for inbound, connect() for outbound) before the stream is
// handed to a Connection.
//
// Half-close shuts down the TCP send direction without a close_notify alert,
// so the peer sees a truncated TLS stream; reads map that condition to eof.

class TlsStream final : public IStream {
public:
    using SslStream = asio::ssl::stream<asio::ip::tcp::socket>;

    TlsStream(asio::ip::tcp::socket socket, std::shared_ptr<asio::ssl::context> context);

    /// Run the TLS handshake. `server_name` sets SNI and enables hostname
    /// verification for clients; ignored for servers.
    [[nodiscard]] asio::awaitable<StreamResult<void>> async_handshake(
        SslStream::handshake_type role,
        const std::string& server_name = {}
    );

    asio::any_io_executor get_executor() override;
    asio::awaitable<StreamResult<std::size_t>> async_read_some(asio::mutable_buffer buffer) override;
    asio::awaitable<StreamResult<std::size_t>> async_write(asio::const_buffer buffer) override;
    asio::awaitable<StreamResult<void>> async_shutdown() override;
    void close() noexcept override;
    bool is_open() const override;
    bool is_tls() const noexcept override { return true; }
    std::string remote_endpoint() const override;
    void set_no_delay(bool enabled) override;

private:
    // Declared first: the SSL stream must be destroyed before its context
    std::shared_ptr<asio::ssl::context> context_;
    SslStream stream_;
};

}  // namespace wirelink
