#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Shared helpers for the socket-level tests
// ─────────────────────────────────────────────────────────────────────────────

#include "wirelink/connection/connection.hpp"
#include "wirelink/log/logger.hpp"
#include "wirelink/transport/stream.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wirelink::test {

// ═══════════════════════════════════════════════════════════════════════════
// run_sync - drive the io_context until `coro` completes
// ═══════════════════════════════════════════════════════════════════════════
// Stops the context as soon as the coroutine is done, so background work
// (reader loops, accept loops) does not keep run() from returning. That work
// resumes on the next run_sync.

template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, std::move(coro), [&](std::exception_ptr error, T value) {
        if (error) {
            promise.set_exception(error);
        } else {
            promise.set_value(std::move(value));
        }
        io.stop();
    });

    io.restart();
    io.run();
    return future.get();
}

inline void run_sync(asio::io_context& io, asio::awaitable<void> coro) {
    std::promise<void> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, std::move(coro), [&](std::exception_ptr error) {
        if (error) {
            promise.set_exception(error);
        } else {
            promise.set_value();
        }
        io.stop();
    });

    io.restart();
    io.run();
    future.get();
}

inline asio::awaitable<void> sleep_for(std::chrono::milliseconds duration) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(duration);
    co_await timer.async_wait(asio::use_awaitable);
}

// Unwrap a NetResult inside a test coroutine; failures surface from run_sync
inline asio::awaitable<void> expect_ok(asio::awaitable<NetResult<void>> op) {
    auto result = co_await std::move(op);
    if (!result) {
        throw std::runtime_error("unexpected failure: " + result.error().describe());
    }
}

template <typename T>
asio::awaitable<T> expect_value(asio::awaitable<NetResult<T>> op) {
    auto result = co_await std::move(op);
    if (!result) {
        throw std::runtime_error("unexpected failure: " + result.error().describe());
    }
    co_return std::move(*result);
}

// ═══════════════════════════════════════════════════════════════════════════
// Loopback streams
// ═══════════════════════════════════════════════════════════════════════════

struct StreamPair {
    std::unique_ptr<IStream> client;
    std::unique_ptr<IStream> server;
};

inline StreamPair make_tcp_pair(asio::io_context& io) {
    asio::ip::tcp::acceptor acceptor(
        io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)
    );
    asio::ip::tcp::socket client(io);
    asio::ip::tcp::socket server(io);
    client.connect(acceptor.local_endpoint());
    acceptor.accept(server);
    return {
        std::make_unique<TcpStream>(std::move(client)),
        std::make_unique<TcpStream>(std::move(server))
    };
}

struct ConnectionPair {
    std::shared_ptr<Connection> client;
    std::shared_ptr<Connection> server;
};

inline ConnectionPair make_connection_pair(
    asio::io_context& io,
    ConnectionOptions client_options = {},
    ConnectionOptions server_options = {}
) {
    auto streams = make_tcp_pair(io);
    return {
        Connection::create(std::move(streams.client), std::move(client_options)),
        Connection::create(std::move(streams.server), std::move(server_options))
    };
}

inline Bytes bytes_of(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

// ═══════════════════════════════════════════════════════════════════════════
// CapturingLogger - records every message for inspection
// ═══════════════════════════════════════════════════════════════════════════

class CapturingLogger final : public ILogger {
public:
    explicit CapturingLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

    [[nodiscard]] bool contains(std::string_view needle) const {
        for (const auto& record : records_) {
            if (record.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Self-signed certificate for TLS tests
// ═══════════════════════════════════════════════════════════════════════════

struct TestCertificate {
    std::string certificate_pem;
    std::string private_key_pem;
};

namespace detail {

inline std::string drain_bio(BIO* bio) {
    char* data = nullptr;
    const long size = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<std::size_t>(size));
}

}  // namespace detail

inline TestCertificate make_self_signed_certificate(const std::string& host = "localhost") {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    if (!key || !cert) {
        throw std::runtime_error("OpenSSL key or certificate allocation failed");
    }

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24L * 60 * 60);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(
        name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(host.c_str()), -1, -1, 0
    );
    X509_set_issuer_name(cert.get(), name);

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
    const std::string san = "DNS:" + host;
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, san.c_str());
    if (ext == nullptr) {
        throw std::runtime_error("Cannot build subjectAltName");
    }
    X509_add_ext(cert.get(), ext, -1);
    X509_EXTENSION_free(ext);

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        throw std::runtime_error("Cannot sign test certificate");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), &BIO_free);
    PEM_write_bio_X509(cert_bio.get(), cert.get());
    PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr);

    return {detail::drain_bio(cert_bio.get()), detail::drain_bio(key_bio.get())};
}

}  // namespace wirelink::test
