#ifndef WIRELINK_CONNECTION_CONNECTION_OPTIONS_HPP
#define WIRELINK_CONNECTION_CONNECTION_OPTIONS_HPP

#include "wirelink/codec/wire_codec.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace wirelink {

class ILogger;

// ─────────────────────────────────────────────────────────────────────────────
// Bandwidth statistics sink
// ─────────────────────────────────────────────────────────────────────────────
// Receives every wire byte count a connection records, in addition to the
// connection's own in/out counters. One sink may be shared by many
// connections on the same executor.

class IBandwidthStats {
public:
    virtual ~IBandwidthStats() = default;

    virtual void add_in_bytes(std::uint64_t count) = 0;
    virtual void add_out_bytes(std::uint64_t count) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection Options
// ─────────────────────────────────────────────────────────────────────────────
// Per-connection settings. Both peers must agree on string_format; nothing is
// negotiated on the wire.

struct ConnectionOptions {
    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    // No read or write activity for this long destroys the connection.
    // 0 = disabled.
    std::chrono::milliseconds idle_timeout{0};

    // Bound on each pending read. The read fails with Timeout; the connection
    // stays usable. 0 = disabled.
    std::chrono::milliseconds read_timeout{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Encoding
    // ─────────────────────────────────────────────────────────────────────────

    // Length-field layout used by read_string/write_string.
    codec::StringFormat string_format{codec::StringFormat::Current};

    // ─────────────────────────────────────────────────────────────────────────
    // Buffering
    // ─────────────────────────────────────────────────────────────────────────

    // Size of each transport read.
    std::size_t read_chunk_size{16 * 1024};

    // The reader stops pulling from the transport while this many bytes are
    // buffered and no read is waiting.
    std::size_t read_high_water_mark{1024 * 1024};  // 1 MiB

    // Largest accepted inbound compressed frame payload. 0 = no limit.
    std::size_t max_frame_length{0};

    // zlib level for outbound frames (-1 = zlib default).
    int compression_level{-1};

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    bool tcp_no_delay{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Observability
    // ─────────────────────────────────────────────────────────────────────────

    // Per-connection logger. If null, logs go to get_logger().
    std::shared_ptr<ILogger> logger;

    // Optional shared bandwidth sink.
    std::shared_ptr<IBandwidthStats> bandwidth_stats;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ConnectionOptions& with_idle_timeout(std::chrono::milliseconds timeout);
    ConnectionOptions& with_read_timeout(std::chrono::milliseconds timeout);
    ConnectionOptions& with_string_format(codec::StringFormat format);
    ConnectionOptions& with_read_chunk_size(std::size_t size);
    ConnectionOptions& with_read_high_water_mark(std::size_t bytes);
    ConnectionOptions& with_max_frame_length(std::size_t bytes);
    ConnectionOptions& with_compression_level(int level);
    ConnectionOptions& with_tcp_no_delay(bool enabled);
    ConnectionOptions& with_logger(std::shared_ptr<ILogger> log);
    ConnectionOptions& with_bandwidth_stats(std::shared_ptr<IBandwidthStats> stats);
};

}  // namespace wirelink

#endif  // WIRELINK_CONNECTION_CONNECTION_OPTIONS_HPP
