#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Outbound connections
// ═══════════════════════════════════════════════════════════════════════════
// Usage:
//   auto conn = co_await connect(io.get_executor(),
//                                ConnectOptions{}.with_endpoint("localhost", 7000));
//   if (!conn) { ... conn.error() ... }
//   co_await (*conn)->write_int(1);

#include "wirelink/connection/connection.hpp"
#include "wirelink/connection/connection_options.hpp"
#include "wirelink/transport/tls_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wirelink {

struct ConnectOptions {
    std::string host{"localhost"};
    std::uint16_t port{0};

    // Give up on resolve + connect + handshake after this long. 0 = no limit.
    std::chrono::milliseconds connect_timeout{10'000};

    // TLS when set. ssl_context takes precedence over tls.
    std::optional<TlsConfig> tls;
    std::shared_ptr<asio::ssl::context> ssl_context;

    ConnectionOptions connection;

    ConnectOptions& with_endpoint(std::string h, std::uint16_t p);
    ConnectOptions& with_connect_timeout(std::chrono::milliseconds timeout);
    ConnectOptions& with_tls(TlsConfig config);
    ConnectOptions& with_ssl_context(std::shared_ptr<asio::ssl::context> context);
    ConnectOptions& with_connection_options(ConnectionOptions options);

    [[nodiscard]] bool uses_tls() const noexcept { return tls.has_value() || ssl_context != nullptr; }
};

/// Connect to options.host:options.port and return a started Connection.
/// Fails with Transport, or Timeout when connect_timeout elapses.
[[nodiscard]] asio::awaitable<NetResult<std::shared_ptr<Connection>>> connect(
    asio::any_io_executor executor,
    ConnectOptions options
);

}  // namespace wirelink
