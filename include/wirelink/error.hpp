#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Network Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type for connections, the compression framer, the wire codec
// and the service listener. Every fallible operation returns NetResult<T>.

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace wirelink {

using Bytes = std::vector<std::uint8_t>;

/// Error codes for network operations
enum class NetErrorCode {
    Transport,      ///< Underlying stream error (latched by the connection)
    Closed,         ///< Operation on or during a closed connection or listener
    Ended,          ///< Peer half-closed before the operation completed
    Timeout,        ///< Read timer (or connect timer) elapsed
    Decompression,  ///< Malformed compressed frame (fatal for the connection)
    Compression,    ///< Deflate failed
    ProtocolLimit,  ///< Encoded value exceeds its format's size limit
    Protocol        ///< Malformed input or API misuse
};

[[nodiscard]] constexpr std::string_view to_string(NetErrorCode code) noexcept {
    switch (code) {
        case NetErrorCode::Transport:     return "Transport";
        case NetErrorCode::Closed:        return "Closed";
        case NetErrorCode::Ended:         return "Ended";
        case NetErrorCode::Timeout:       return "Timeout";
        case NetErrorCode::Decompression: return "Decompression";
        case NetErrorCode::Compression:   return "Compression";
        case NetErrorCode::ProtocolLimit: return "ProtocolLimit";
        case NetErrorCode::Protocol:      return "Protocol";
        default:                          return "Unknown";
    }
}

struct NetError {
    NetErrorCode code{NetErrorCode::Transport};
    std::string message;
    std::optional<std::error_code> cause;  ///< Set for transport errors

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static NetError transport(std::error_code ec) {
        return {NetErrorCode::Transport, ec.message(), ec};
    }

    [[nodiscard]] static NetError transport(std::string msg) {
        return {NetErrorCode::Transport, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError closed(std::string msg = "Connection closed") {
        return {NetErrorCode::Closed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError destroyed() {
        return {NetErrorCode::Closed, "Connection destroyed", std::nullopt};
    }

    [[nodiscard]] static NetError server_closed() {
        return {NetErrorCode::Closed, "Server closed", std::nullopt};
    }

    [[nodiscard]] static NetError ended(std::string msg = "Connection ended") {
        return {NetErrorCode::Ended, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError timeout(std::string msg = "Read timed out") {
        return {NetErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError decompression(std::string msg) {
        return {NetErrorCode::Decompression, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError compression(std::string msg) {
        return {NetErrorCode::Compression, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError protocol_limit(std::string msg) {
        return {NetErrorCode::ProtocolLimit, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static NetError protocol(std::string msg) {
        return {NetErrorCode::Protocol, std::move(msg), std::nullopt};
    }

    /// "<Code>: <message>" for logging
    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

/// Result type for network operations
template <typename T>
using NetResult = tl::expected<T, NetError>;

}  // namespace wirelink
