#include "wirelink/transport/tls_config.hpp"

#include <asio/buffer.hpp>

namespace wirelink {

TlsConfig& TlsConfig::with_certificate(std::string chain_file, std::string key_file) {
    certificate_chain_file = std::move(chain_file);
    private_key_file = std::move(key_file);
    return *this;
}

TlsConfig& TlsConfig::with_certificate_pem(std::string chain_pem, std::string key_pem) {
    certificate_chain_pem = std::move(chain_pem);
    private_key_pem = std::move(key_pem);
    return *this;
}

TlsConfig& TlsConfig::with_ca_file(std::string path) {
    ca_file = std::move(path);
    return *this;
}

TlsConfig& TlsConfig::with_ca_pem(std::string pem) {
    ca_pem = std::move(pem);
    return *this;
}

TlsConfig& TlsConfig::with_verify_peer(bool verify) {
    verify_peer = verify;
    return *this;
}

TlsConfig& TlsConfig::with_client_certificate_required(bool required) {
    require_client_certificate = required;
    return *this;
}

TlsConfig& TlsConfig::with_server_name(std::string name) {
    server_name = std::move(name);
    return *this;
}

NetResult<std::shared_ptr<asio::ssl::context>> make_ssl_context(
    const TlsConfig& config,
    TlsRole role
) {
    const auto method = (role == TlsRole::Server)
        ? asio::ssl::context::tls_server
        : asio::ssl::context::tls_client;
    auto ctx = std::make_shared<asio::ssl::context>(method);

    asio::error_code ec;
    ctx->set_options(
        asio::ssl::context::default_workarounds |
        asio::ssl::context::no_sslv2 |
        asio::ssl::context::no_sslv3 |
        asio::ssl::context::no_tlsv1 |
        asio::ssl::context::no_tlsv1_1,
        ec
    );
    if (ec) {
        return tl::unexpected(NetError::transport("TLS options: " + ec.message()));
    }

    if (!config.certificate_chain_file.empty()) {
        ctx->use_certificate_chain_file(config.certificate_chain_file, ec);
        if (ec) {
            return tl::unexpected(NetError::transport(
                "Cannot load certificate chain " + config.certificate_chain_file + ": " + ec.message()
            ));
        }
        ctx->use_private_key_file(config.private_key_file, asio::ssl::context::pem, ec);
        if (ec) {
            return tl::unexpected(NetError::transport(
                "Cannot load private key " + config.private_key_file + ": " + ec.message()
            ));
        }
    } else if (!config.certificate_chain_pem.empty()) {
        ctx->use_certificate_chain(asio::buffer(config.certificate_chain_pem), ec);
        if (ec) {
            return tl::unexpected(NetError::transport("Cannot load certificate chain: " + ec.message()));
        }
        ctx->use_private_key(asio::buffer(config.private_key_pem), asio::ssl::context::pem, ec);
        if (ec) {
            return tl::unexpected(NetError::transport("Cannot load private key: " + ec.message()));
        }
    } else if (role == TlsRole::Server) {
        return tl::unexpected(NetError::transport("TLS server requires a certificate and private key"));
    }

    if (!config.ca_file.empty()) {
        ctx->load_verify_file(config.ca_file, ec);
    }
    if (!ec && !config.ca_pem.empty()) {
        ctx->add_certificate_authority(asio::buffer(config.ca_pem), ec);
    }
    if (!ec && config.ca_file.empty() && config.ca_pem.empty()) {
        ctx->set_default_verify_paths(ec);
    }
    if (ec) {
        return tl::unexpected(NetError::transport("Cannot load CA certificates: " + ec.message()));
    }

    asio::ssl::verify_mode mode = asio::ssl::verify_none;
    if (role == TlsRole::Client && config.verify_peer) {
        mode = asio::ssl::verify_peer;
    } else if (role == TlsRole::Server && config.require_client_certificate) {
        mode = asio::ssl::verify_peer | asio::ssl::verify_fail_if_no_peer_cert;
    }
    ctx->set_verify_mode(mode, ec);
    if (ec) {
        return tl::unexpected(NetError::transport("TLS verify mode: " + ec.message()));
    }

    return ctx;
}

}  // namespace wirelink
