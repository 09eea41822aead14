#ifndef WIRELINK_TRANSPORT_TLS_CONFIG_HPP
#define WIRELINK_TRANSPORT_TLS_CONFIG_HPP

#include "wirelink/error.hpp"

#include <asio/ssl/context.hpp>

#include <memory>
#include <optional>
#include <string>

namespace wirelink {

// ─────────────────────────────────────────────────────────────────────────────
// TLS Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Certificate material handed through to OpenSSL. The library never inspects
// certificates itself; verification is OpenSSL's job.

enum class TlsRole {
    Client,
    Server
};

struct TlsConfig {
    // PEM certificate chain presented to the peer.
    // Required for servers, optional (mutual TLS) for clients.
    std::string certificate_chain_file;

    // PEM private key matching certificate_chain_file.
    std::string private_key_file;

    // Same two as in-memory PEM, used when the file paths are empty.
    std::string certificate_chain_pem;
    std::string private_key_pem;

    // CA bundle for verifying the peer. With neither set, the system default
    // paths are used.
    std::string ca_file;
    std::string ca_pem;

    // Clients: verify the server certificate chain and host name.
    bool verify_peer{true};

    // Servers: demand and verify a client certificate (mutual TLS).
    bool require_client_certificate{false};

    // SNI and hostname verification name for clients.
    // Empty = use the host being connected to.
    std::optional<std::string> server_name;

    TlsConfig& with_certificate(std::string chain_file, std::string key_file);
    TlsConfig& with_certificate_pem(std::string chain_pem, std::string key_pem);
    TlsConfig& with_ca_file(std::string path);
    TlsConfig& with_ca_pem(std::string pem);
    TlsConfig& with_verify_peer(bool verify);
    TlsConfig& with_client_certificate_required(bool required);
    TlsConfig& with_server_name(std::string name);
};

/// Build an OpenSSL context for `role` from `config`. Fails with Transport when
/// certificate material cannot be loaded.
[[nodiscard]] NetResult<std::shared_ptr<asio::ssl::context>> make_ssl_context(
    const TlsConfig& config,
    TlsRole role
);

}  // namespace wirelink

#endif  // WIRELINK_TRANSPORT_TLS_CONFIG_HPP
