#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Service Listener
// ═══════════════════════════════════════════════════════════════════════════
// TCP or TLS server producing started Connections.
//
// Pull mode (no handler):
//   auto server = ServiceListener::create(io.get_executor(), ListenerConfig{}.with_port(7000));
//   co_await server->listen();
//   auto conn = co_await server->accept();
//
// Handler mode: every connection nobody is waiting for in accept() is passed
// to the handler coroutine, which runs detached:
//   auto server = ServiceListener::create(exec, config, {},
//       [](std::shared_ptr<Connection> c) -> asio::awaitable<void> { ... });
//
// Delivery order for each new connection: the oldest pending accept(), then
// the handler, then (pull mode only) the FIFO queue drained by accept().

#include "wirelink/async/settlement.hpp"
#include "wirelink/codec/wire_codec.hpp"
#include "wirelink/connection/connection.hpp"
#include "wirelink/connection/connection_options.hpp"
#include "wirelink/log/logger.hpp"
#include "wirelink/transport/stream.hpp"
#include "wirelink/transport/tls_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace wirelink {

class ServiceListener;

// ─────────────────────────────────────────────────────────────────────────────
// Listener Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ListenerConfig {
    // Port to listen on. 0 = let the OS pick; port() reports it once listening.
    std::uint16_t port{0};

    // Local address to bind.
    std::string address{"0.0.0.0"};

    // Prefix of the listener's log tag: "<name>Service_<tcp|tls>_<port>".
    std::string name{"Connection"};

    // TLS when either is set. ssl_context takes precedence over tls.
    std::optional<TlsConfig> tls;
    std::shared_ptr<asio::ssl::context> ssl_context;

    // Options for connections built by the default factory.
    ConnectionOptions connection;

    // Opaque bag handed to the connection factory.
    Json options = Json::object();

    // Listener logger. If null, logs go to get_logger().
    std::shared_ptr<ILogger> logger;

    // Pause after a failed accept (EMFILE and the like) before trying again.
    std::chrono::milliseconds accept_retry_delay{100};

    ListenerConfig& with_port(std::uint16_t p);
    ListenerConfig& with_address(std::string addr);
    ListenerConfig& with_name(std::string n);
    ListenerConfig& with_tls(TlsConfig config);
    ListenerConfig& with_ssl_context(std::shared_ptr<asio::ssl::context> context);
    ListenerConfig& with_connection_options(ConnectionOptions opts);
    ListenerConfig& with_options(Json bag);
    ListenerConfig& with_logger(std::shared_ptr<ILogger> log);
    ListenerConfig& with_accept_retry_delay(std::chrono::milliseconds delay);
};

/// Builds the Connection (or a subclass) for an accepted stream. The result
/// is started by the listener.
using ConnectionFactory = std::function<std::shared_ptr<Connection>(
    std::unique_ptr<IStream> stream,
    ServiceListener& listener,
    const Json& options
)>;

/// Serves one connection; spawned detached per connection
using ConnectionHandler = std::function<asio::awaitable<void>(std::shared_ptr<Connection>)>;

// ─────────────────────────────────────────────────────────────────────────────
// ServiceListener
// ─────────────────────────────────────────────────────────────────────────────

class ServiceListener : public std::enable_shared_from_this<ServiceListener> {
public:
    ServiceListener(
        asio::any_io_executor executor,
        ListenerConfig config,
        ConnectionFactory factory = {},
        ConnectionHandler handler = {}
    );
    ~ServiceListener();

    ServiceListener(const ServiceListener&) = delete;
    ServiceListener& operator=(const ServiceListener&) = delete;

    [[nodiscard]] static std::shared_ptr<ServiceListener> create(
        asio::any_io_executor executor,
        ListenerConfig config,
        ConnectionFactory factory = {},
        ConnectionHandler handler = {}
    );

    /// Bind and start accepting. Resolves once listening; fails with Transport
    /// when binding fails and with Closed if close() comes first.
    [[nodiscard]] asio::awaitable<NetResult<void>> listen();

    /// Next connection: the oldest queued one, or the next to arrive.
    /// Concurrent calls are served in call order.
    [[nodiscard]] asio::awaitable<NetResult<std::shared_ptr<Connection>>> accept();

    /// Stop accepting. Pending listen()/accept() fail with Closed; delivered
    /// and queued connections are left alone.
    void close();

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool is_listening() const noexcept { return listening_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }
    [[nodiscard]] bool is_tls() const noexcept;
    [[nodiscard]] std::size_t queued() const noexcept { return queue_.size(); }
    [[nodiscard]] std::size_t pending_accepts() const noexcept { return accept_waiters_.size(); }
    [[nodiscard]] const std::string& tag() const noexcept { return log_.tag(); }
    [[nodiscard]] const ListenerConfig& config() const noexcept { return config_; }
    [[nodiscard]] asio::any_io_executor get_executor() const { return executor_; }

private:
    using AcceptSettlement = async::Settlement<std::shared_ptr<Connection>>;

    asio::awaitable<void> accept_loop(std::shared_ptr<ServiceListener> self);
    asio::awaitable<void> handshake(std::shared_ptr<ServiceListener> self, asio::ip::tcp::socket socket);
    void on_listening();
    void deliver(std::unique_ptr<IStream> stream);
    void spawn_handler(std::shared_ptr<Connection> connection);
    void update_tag();

    asio::any_io_executor executor_;
    ListenerConfig config_;
    ConnectionFactory factory_;
    ConnectionHandler handler_;
    TaggedLogger log_;

    asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<asio::ssl::context> ssl_context_;

    std::uint16_t port_;
    bool listening_{false};
    bool closed_{false};

    std::shared_ptr<async::Settlement<void>> listen_waiter_;
    std::deque<std::shared_ptr<AcceptSettlement>> accept_waiters_;
    std::deque<std::shared_ptr<Connection>> queue_;
};

}  // namespace wirelink
