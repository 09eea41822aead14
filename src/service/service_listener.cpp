#include "wirelink/service/service_listener.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <exception>

namespace wirelink {

// ═══════════════════════════════════════════════════════════════════════════
// ListenerConfig
// ═══════════════════════════════════════════════════════════════════════════

ListenerConfig& ListenerConfig::with_port(std::uint16_t p) {
    port = p;
    return *this;
}

ListenerConfig& ListenerConfig::with_address(std::string addr) {
    address = std::move(addr);
    return *this;
}

ListenerConfig& ListenerConfig::with_name(std::string n) {
    name = std::move(n);
    return *this;
}

ListenerConfig& ListenerConfig::with_tls(TlsConfig config) {
    tls = std::move(config);
    return *this;
}

ListenerConfig& ListenerConfig::with_ssl_context(std::shared_ptr<asio::ssl::context> context) {
    ssl_context = std::move(context);
    return *this;
}

ListenerConfig& ListenerConfig::with_connection_options(ConnectionOptions opts) {
    connection = std::move(opts);
    return *this;
}

ListenerConfig& ListenerConfig::with_options(Json bag) {
    options = std::move(bag);
    return *this;
}

ListenerConfig& ListenerConfig::with_logger(std::shared_ptr<ILogger> log) {
    logger = std::move(log);
    return *this;
}

ListenerConfig& ListenerConfig::with_accept_retry_delay(std::chrono::milliseconds delay) {
    accept_retry_delay = delay;
    return *this;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ServiceListener::ServiceListener(
    asio::any_io_executor executor,
    ListenerConfig config,
    ConnectionFactory factory,
    ConnectionHandler handler
)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , factory_(std::move(factory))
    , handler_(std::move(handler))
    , log_(std::string{}, config_.logger)
    , acceptor_(executor_)
    , ssl_context_(config_.ssl_context)
    , port_(config_.port)
{
    update_tag();
    log_.debug("Created");
}

ServiceListener::~ServiceListener() {
    asio::error_code ec;
    acceptor_.close(ec);
}

std::shared_ptr<ServiceListener> ServiceListener::create(
    asio::any_io_executor executor,
    ListenerConfig config,
    ConnectionFactory factory,
    ConnectionHandler handler
) {
    return std::make_shared<ServiceListener>(
        std::move(executor), std::move(config), std::move(factory), std::move(handler)
    );
}

bool ServiceListener::is_tls() const noexcept {
    return config_.tls.has_value() || config_.ssl_context != nullptr;
}

void ServiceListener::update_tag() {
    log_.set_tag(
        config_.name + "Service_" + (is_tls() ? "tls" : "tcp") + "_" + std::to_string(port_)
    );
}

// ═══════════════════════════════════════════════════════════════════════════
// Listen / Accept / Close
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<NetResult<void>> ServiceListener::listen() {
    auto self = shared_from_this();

    if (closed_) {
        co_return tl::unexpected(NetError::server_closed());
    }
    if (listening_ || listen_waiter_) {
        co_return tl::unexpected(NetError::protocol("Already listening"));
    }

    if (!ssl_context_ && config_.tls) {
        auto built = make_ssl_context(*config_.tls, TlsRole::Server);
        if (!built) {
            log_.error("TLS setup failed: " + built.error().message);
            co_return tl::unexpected(built.error());
        }
        ssl_context_ = std::move(*built);
    }

    asio::error_code ec;
    const auto address = asio::ip::make_address(config_.address, ec);
    if (ec) {
        co_return tl::unexpected(NetError::transport("Invalid listen address " + config_.address + ": " + ec.message()));
    }
    const asio::ip::tcp::endpoint endpoint(address, port_);

    auto bind_failure = [&](const char* stage) {
        auto error = NetError::transport(ec);
        error.message = std::string(stage) + " " + config_.address + ":" + std::to_string(port_) +
            " failed: " + ec.message();
        log_.error(error.message);
        asio::error_code ignored;
        acceptor_.close(ignored);
        return error;
    };

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        co_return tl::unexpected(bind_failure("Open"));
    }
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        co_return tl::unexpected(bind_failure("Configure"));
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        co_return tl::unexpected(bind_failure("Bind"));
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        co_return tl::unexpected(bind_failure("Listen on"));
    }

    // Listening is reported on the next executor turn
    listen_waiter_ = async::make_settlement<void>(executor_);
    auto waiter = listen_waiter_;
    asio::post(executor_, [self]() { self->on_listening(); });

    co_return co_await waiter->wait();
}

void ServiceListener::on_listening() {
    if (closed_) {
        return;
    }

    asio::error_code ec;
    const auto local = acceptor_.local_endpoint(ec);
    if (!ec) {
        port_ = local.port();
        update_tag();
    }
    listening_ = true;
    log_.info_fmt("Listening on port {} ({})", port_, is_tls() ? "tls" : "tcp");

    asio::co_spawn(executor_, accept_loop(shared_from_this()), asio::detached);

    if (listen_waiter_) {
        auto waiter = std::move(listen_waiter_);
        listen_waiter_.reset();
        waiter->resolve(NetResult<void>{});
    }
}

asio::awaitable<NetResult<std::shared_ptr<Connection>>> ServiceListener::accept() {
    auto self = shared_from_this();

    if (!queue_.empty()) {
        auto connection = std::move(queue_.front());
        queue_.pop_front();
        log_.debug("Accept served from queue");
        co_return connection;
    }
    if (closed_) {
        co_return tl::unexpected(NetError::server_closed());
    }

    auto waiter = async::make_settlement<std::shared_ptr<Connection>>(executor_);
    accept_waiters_.push_back(waiter);

    auto result = co_await waiter->wait();

    // Abandoned waits leave their entry behind
    accept_waiters_.erase(
        std::remove(accept_waiters_.begin(), accept_waiters_.end(), waiter),
        accept_waiters_.end()
    );
    co_return result;
}

void ServiceListener::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    listening_ = false;
    log_.info("Closing");

    asio::error_code ec;
    acceptor_.close(ec);

    if (listen_waiter_) {
        auto waiter = std::move(listen_waiter_);
        listen_waiter_.reset();
        waiter->reject(NetError::server_closed());
    }

    auto waiters = std::move(accept_waiters_);
    accept_waiters_.clear();
    for (const auto& waiter : waiters) {
        waiter->reject(NetError::server_closed());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Accept loop and delivery
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ServiceListener::accept_loop(std::shared_ptr<ServiceListener> self) {
    asio::steady_timer retry_timer(executor_);
    while (!closed_) {
        std::optional<asio::ip::tcp::socket> socket;
        try {
            socket.emplace(co_await acceptor_.async_accept(asio::use_awaitable));
        } catch (const std::system_error& e) {
            if (closed_ || e.code() == asio::error::operation_aborted) {
                break;
            }
            log_.warn(std::string("Accept failed: ") + e.what());
        }

        if (!socket) {
            // Errors like EMFILE persist until descriptors are released
            retry_timer.expires_after(config_.accept_retry_delay);
            co_await retry_timer.async_wait(asio::as_tuple(asio::use_awaitable));
            continue;
        }

        if (ssl_context_) {
            asio::co_spawn(executor_, handshake(self, std::move(*socket)), asio::detached);
        } else {
            deliver(std::make_unique<TcpStream>(std::move(*socket)));
        }
    }
    log_.debug("Accept loop stopped");
}

asio::awaitable<void> ServiceListener::handshake(
    std::shared_ptr<ServiceListener> self,
    asio::ip::tcp::socket socket
) {
    auto stream = std::make_unique<TlsStream>(std::move(socket), ssl_context_);
    const auto remote = stream->remote_endpoint();

    auto result = co_await stream->async_handshake(TlsStream::SslStream::server);
    if (!result) {
        log_.warn("TLS handshake with " + remote + " failed: " + result.error().message());
        stream->close();
        co_return;
    }
    if (closed_) {
        log_.debug("Dropping " + remote + ": closed during handshake");
        stream->close();
        co_return;
    }
    deliver(std::move(stream));
}

void ServiceListener::deliver(std::unique_ptr<IStream> stream) {
    const auto remote = stream->remote_endpoint();
    log_.debug("Connection from " + remote);

    std::shared_ptr<Connection> connection;
    if (factory_) {
        connection = factory_(std::move(stream), *this, config_.options);
    } else {
        connection = std::make_shared<Connection>(std::move(stream), config_.connection);
    }
    if (!connection) {
        log_.warn("Connection factory returned no connection for " + remote);
        return;
    }
    connection->start();

    std::weak_ptr<ServiceListener> weak = weak_from_this();
    connection->on_error([weak, remote](const NetError& error) {
        if (auto self = weak.lock()) {
            self->log_.debug("Connection " + remote + " error: " + error.describe());
        }
    });
    connection->on_close([weak, remote]() {
        if (auto self = weak.lock()) {
            self->log_.debug("Connection " + remote + " closed");
        }
    });

    while (!accept_waiters_.empty()) {
        auto waiter = std::move(accept_waiters_.front());
        accept_waiters_.pop_front();
        if (waiter->resolve(connection)) {
            return;
        }
    }

    if (!handler_) {
        queue_.push_back(std::move(connection));
        log_.debug_fmt("Queued, {} waiting", queue_.size());
        return;
    }
    spawn_handler(std::move(connection));
}

void ServiceListener::spawn_handler(std::shared_ptr<Connection> connection) {
    std::weak_ptr<ServiceListener> weak = weak_from_this();
    auto report = [weak](const std::string& message) {
        if (auto self = weak.lock()) {
            self->log_.error(message);
        } else {
            get_logger().error(message);
        }
    };
    asio::co_spawn(
        executor_,
        handler_(std::move(connection)),
        [report](std::exception_ptr error) {
            if (!error) {
                return;
            }
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                report(std::string("Connection handler failed: ") + e.what());
            } catch (...) {
                report("Connection handler failed: unknown exception");
            }
        }
    );
}

}  // namespace wirelink
