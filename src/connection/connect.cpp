#include "wirelink/connection/connect.hpp"
#include "wirelink/log/logger.hpp"
#include "wirelink/transport/stream.hpp"

#include <asio/connect.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

namespace wirelink {

ConnectOptions& ConnectOptions::with_endpoint(std::string h, std::uint16_t p) {
    host = std::move(h);
    port = p;
    return *this;
}

ConnectOptions& ConnectOptions::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

ConnectOptions& ConnectOptions::with_tls(TlsConfig config) {
    tls = std::move(config);
    return *this;
}

ConnectOptions& ConnectOptions::with_ssl_context(std::shared_ptr<asio::ssl::context> context) {
    ssl_context = std::move(context);
    return *this;
}

ConnectOptions& ConnectOptions::with_connection_options(ConnectionOptions options) {
    connection = std::move(options);
    return *this;
}

namespace {

// Everything the connect timer may need to abort
struct ConnectAttempt {
    explicit ConnectAttempt(const asio::any_io_executor& executor)
        : resolver(executor)
        , socket(executor)
    {}

    void abort() {
        timed_out = true;
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
        if (tls) {
            tls->close();
        }
    }

    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    std::unique_ptr<TlsStream> tls;
    bool timed_out{false};
};

}  // namespace

asio::awaitable<NetResult<std::shared_ptr<Connection>>> connect(
    asio::any_io_executor executor,
    ConnectOptions options
) {
    const std::string target = options.host + ":" + std::to_string(options.port);
    TaggedLogger log("Connect_" + target, options.connection.logger);

    std::shared_ptr<asio::ssl::context> ssl_context = options.ssl_context;
    if (!ssl_context && options.tls) {
        auto built = make_ssl_context(*options.tls, TlsRole::Client);
        if (!built) {
            log.error("TLS setup failed: " + built.error().message);
            co_return tl::unexpected(built.error());
        }
        ssl_context = std::move(*built);
    }

    auto attempt = std::make_shared<ConnectAttempt>(executor);
    asio::steady_timer timer(executor);
    if (options.connect_timeout.count() > 0) {
        timer.expires_after(options.connect_timeout);
        timer.async_wait([attempt](const asio::error_code& ec) {
            if (!ec) {
                attempt->abort();
            }
        });
    }

    auto failure = [&](const char* stage, const std::error_code& ec) {
        if (attempt->timed_out) {
            return NetError::timeout(
                "Connect to " + target + " timed out after " +
                std::to_string(options.connect_timeout.count()) + " ms"
            );
        }
        auto error = NetError::transport(ec);
        error.message = std::string(stage) + " " + target + " failed: " + ec.message();
        return error;
    };

    // Resolve and connect
    std::optional<NetError> error;
    try {
        auto endpoints = co_await attempt->resolver.async_resolve(
            options.host, std::to_string(options.port), asio::use_awaitable
        );
        co_await asio::async_connect(attempt->socket, endpoints, asio::use_awaitable);
    } catch (const std::system_error& e) {
        error = failure("Connect to", e.code());
    }
    if (!error && attempt->timed_out) {
        error = failure("Connect to", asio::error::operation_aborted);
    }
    if (error) {
        log.warn(error->message);
        co_return tl::unexpected(*error);
    }

    std::unique_ptr<IStream> stream;
    if (ssl_context) {
        std::string server_name = options.host;
        if (options.tls && options.tls->server_name) {
            server_name = *options.tls->server_name;
        }

        attempt->tls = std::make_unique<TlsStream>(std::move(attempt->socket), ssl_context);
        auto handshake = co_await attempt->tls->async_handshake(TlsStream::SslStream::client, server_name);
        if (!handshake || attempt->timed_out) {
            auto handshake_error = failure(
                "TLS handshake with",
                handshake ? std::error_code(asio::error::operation_aborted) : handshake.error()
            );
            log.warn(handshake_error.message);
            co_return tl::unexpected(handshake_error);
        }
        stream = std::move(attempt->tls);
    } else {
        stream = std::make_unique<TcpStream>(std::move(attempt->socket));
    }
    timer.cancel();

    log.debug("Connected");
    co_return Connection::create(std::move(stream), std::move(options.connection));
}

}  // namespace wirelink
