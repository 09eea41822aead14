// ─────────────────────────────────────────────────────────────────────────────
// Integration Tests - End-to-End Client/Service Exchanges
// ─────────────────────────────────────────────────────────────────────────────
// These tests drive a ServiceListener and outbound connect() together over
// loopback. They cover:
// - The typed request/reply exchange over plain TCP and over TLS
// - Certificate verification failures
// - WriteQueue ordering between independent producers

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "wirelink/wirelink.hpp"

#include "support/test_support.hpp"

#include <asio/co_spawn.hpp>

#include <string>
#include <vector>

using namespace wirelink;
using namespace std::chrono_literals;
using wirelink::test::expect_ok;
using wirelink::test::expect_value;
using wirelink::test::run_sync;
using wirelink::test::sleep_for;

// ═══════════════════════════════════════════════════════════════════════════
// Test Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace {

const Json kReply = {{"a", 1}, {"b", "test"}, {"c", {1, 2, 3}}};

// Server side of the exchange: int + string in, int + JSON out
asio::awaitable<void> answer(std::shared_ptr<Connection> conn) {
    auto request = co_await conn->read_int();
    auto text = co_await conn->read_string();
    if (!request || !text || *request != 1 || *text != std::optional<std::string>("teststring")) {
        conn->destroy();
        co_return;
    }
    (void)co_await conn->write_int(2);
    (void)co_await conn->write_json(kReply);
    (void)co_await conn->end();
}

struct Exchange {
    std::int32_t number{0};
    Json json;
};

// Client side of the exchange
asio::awaitable<Exchange> ask(std::shared_ptr<Connection> conn) {
    co_await expect_ok(conn->write_int(1));
    co_await expect_ok(conn->write_string("teststring"));

    Exchange exchange;
    exchange.number = co_await expect_value(conn->read_int());
    exchange.json = co_await expect_value(conn->read_json());
    co_return exchange;
}

std::shared_ptr<ServiceListener> start_listener(asio::io_context& io, ListenerConfig config) {
    auto server = ServiceListener::create(io.get_executor(), std::move(config), {}, answer);
    auto listening = run_sync(io, server->listen());
    REQUIRE(listening);
    return server;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Plain TCP
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Integration: request and reply over TCP", "[integration]") {
    asio::io_context io;
    auto server = start_listener(io, ListenerConfig{}.with_address("127.0.0.1"));
    const auto port = server->port();

    std::shared_ptr<Connection> client;
    Exchange exchange;
    run_sync(io, [&]() -> asio::awaitable<void> {
        client = co_await expect_value(
            connect(io.get_executor(), ConnectOptions{}.with_endpoint("127.0.0.1", port))
        );
        exchange = co_await ask(client);
    }());

    REQUIRE(exchange.number == 2);
    REQUIRE(exchange.json == kReply);
    REQUIRE(exchange.json["b"] == "test");
    REQUIRE_FALSE(client->is_tls());

    client->destroy();
    server->close();
}

TEST_CASE("Integration: compressed exchange", "[integration][compression]") {
    asio::io_context io;

    auto handler = [](std::shared_ptr<Connection> conn) -> asio::awaitable<void> {
        conn->set_compression(true, true);
        co_await answer(conn);
    };
    auto server = ServiceListener::create(
        io.get_executor(), ListenerConfig{}.with_address("127.0.0.1"), {}, handler
    );
    REQUIRE(run_sync(io, server->listen()));
    const auto port = server->port();

    std::shared_ptr<Connection> client;
    Exchange exchange;
    run_sync(io, [&]() -> asio::awaitable<void> {
        client = co_await expect_value(
            connect(io.get_executor(), ConnectOptions{}.with_endpoint("127.0.0.1", port))
        );
        client->set_compression(true, true);
        co_await expect_ok(client->write_int(1));
        co_await expect_ok(client->write_string("teststring"));
        co_await expect_ok(client->flush());
        exchange.number = co_await expect_value(client->read_int());
        exchange.json = co_await expect_value(client->read_json());
    }());

    REQUIRE(exchange.number == 2);
    REQUIRE(exchange.json == kReply);

    client->destroy();
    server->close();
}

// ═══════════════════════════════════════════════════════════════════════════
// TLS
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Integration: request and reply over TLS", "[integration][tls]") {
    asio::io_context io;
    const auto cert = wirelink::test::make_self_signed_certificate("localhost");

    auto server = start_listener(io, ListenerConfig{}
        .with_address("127.0.0.1")
        .with_tls(TlsConfig{}.with_certificate_pem(cert.certificate_pem, cert.private_key_pem)));
    REQUIRE(server->is_tls());
    REQUIRE(server->tag().find("_tls_") != std::string::npos);
    const auto port = server->port();

    const auto client_tls = TlsConfig{}
        .with_ca_pem(cert.certificate_pem)
        .with_server_name("localhost");

    std::shared_ptr<Connection> client;
    Exchange exchange;
    run_sync(io, [&]() -> asio::awaitable<void> {
        client = co_await expect_value(connect(
            io.get_executor(),
            ConnectOptions{}.with_endpoint("127.0.0.1", port).with_tls(client_tls)
        ));
        exchange = co_await ask(client);
    }());

    REQUIRE(client->is_tls());
    REQUIRE(exchange.number == 2);
    REQUIRE(exchange.json == kReply);

    client->destroy();
    server->close();
}

TEST_CASE("Integration: untrusted certificate fails the handshake", "[integration][tls]") {
    asio::io_context io;
    const auto served = wirelink::test::make_self_signed_certificate("localhost");
    const auto other = wirelink::test::make_self_signed_certificate("localhost");

    auto server = start_listener(io, ListenerConfig{}
        .with_address("127.0.0.1")
        .with_tls(TlsConfig{}.with_certificate_pem(served.certificate_pem, served.private_key_pem)));
    const auto port = server->port();

    auto result = run_sync(io, connect(
        io.get_executor(),
        ConnectOptions{}
            .with_endpoint("127.0.0.1", port)
            .with_tls(TlsConfig{}.with_ca_pem(other.certificate_pem).with_server_name("localhost"))
    ));

    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == NetErrorCode::Transport);
    REQUIRE(server->queued() == 0);

    server->close();
}

TEST_CASE("Integration: TLS listener without a certificate cannot listen", "[integration][tls]") {
    asio::io_context io;
    auto server = ServiceListener::create(
        io.get_executor(), ListenerConfig{}.with_address("127.0.0.1").with_tls(TlsConfig{})
    );

    auto result = run_sync(io, server->listen());
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == NetErrorCode::Transport);
}

// ═══════════════════════════════════════════════════════════════════════════
// WriteQueue
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Integration: WriteQueue keeps multi-part values together", "[integration][queue]") {
    asio::io_context io;
    auto pair = wirelink::test::make_connection_pair(io);
    WriteQueue queue(pair.client);

    auto slow = [](Connection& c) -> asio::awaitable<NetResult<void>> {
        auto head = co_await c.write_int(1);
        if (!head) {
            co_return head;
        }
        co_await sleep_for(30ms);
        co_return co_await c.write_string("first");
    };
    auto fast = [](Connection& c) -> asio::awaitable<NetResult<void>> {
        auto head = co_await c.write_int(2);
        if (!head) {
            co_return head;
        }
        co_return co_await c.write_string("second");
    };

    std::vector<NetResult<void>> results;
    auto record = [&results](std::exception_ptr error, NetResult<void> result) {
        if (!error) {
            results.push_back(std::move(result));
        }
    };
    asio::co_spawn(io, queue.run(slow), record);
    asio::co_spawn(io, queue.run(fast), record);

    std::vector<std::int32_t> ids;
    std::vector<std::optional<std::string>> texts;
    run_sync(io, [&]() -> asio::awaitable<void> {
        for (int i = 0; i < 2; ++i) {
            ids.push_back(co_await expect_value(pair.server->read_int()));
            texts.push_back(co_await expect_value(pair.server->read_string()));
        }
        co_await sleep_for(10ms);
    }());

    REQUIRE(ids == std::vector<std::int32_t>{1, 2});
    REQUIRE(texts == std::vector<std::optional<std::string>>{"first", "second"});
    REQUIRE(results.size() == 2);
    REQUIRE(results[0]);
    REQUIRE(results[1]);
    REQUIRE(queue.depth() == 0);

    pair.client->destroy();
    pair.server->destroy();
}

TEST_CASE("Integration: WriteQueue reports a latched error", "[integration][queue]") {
    asio::io_context io;
    auto pair = wirelink::test::make_connection_pair(io);
    pair.client->set_compression(true, false);

    WriteQueue queue(pair.client);
    bool ran = false;

    run_sync(io, [&]() -> asio::awaitable<void> {
        // Garbage where the client expects a frame header
        const Bytes garbage{0x09, 0x00, 0x00, 0x00, 0x00};
        co_await expect_ok(pair.server->write_raw(garbage));
        co_await sleep_for(30ms);
    }());
    REQUIRE(pair.client->latched_error().has_value());

    auto result = run_sync(io, queue.run([&ran](Connection&) -> asio::awaitable<NetResult<void>> {
        ran = true;
        co_return NetResult<void>{};
    }));

    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == NetErrorCode::Decompression);
    REQUIRE_FALSE(ran);

    pair.server->destroy();
}
