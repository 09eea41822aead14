#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Compression Framer
// ═══════════════════════════════════════════════════════════════════════════
// Length-prefixed, optionally deflated framing layered over a connection's
// raw byte stream.
//
// Frame layout:
//   [tag:1][length:4 big-endian][payload:length]
//   tag 0 = payload is raw, tag 1 = payload is zlib-deflated
//
// The framer performs no I/O. Outbound calls return the encoded frames the
// owner must write, in order. Inbound, feed() consumes whatever transport
// bytes are available and keeps partial header / payload state between calls,
// so a frame split across many reads (or across a cancelled read) is resumed
// rather than restarted.

#include "wirelink/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wirelink {

enum class FrameTag : std::uint8_t {
    Raw = 0,
    Deflated = 1
};

struct FramerConfig {
    /// Size of the outbound coalescing buffer
    std::size_t buffer_capacity{64000};

    /// zlib compression level (Z_DEFAULT_COMPRESSION = -1)
    int compression_level{-1};

    /// Largest accepted inbound frame payload (0 = no limit)
    std::size_t max_frame_length{0};
};

class CompressionFramer {
public:
    static constexpr std::size_t kDefaultBufferCapacity = 64000;
    static constexpr std::size_t kHeaderSize = 5;

    CompressionFramer() : CompressionFramer(FramerConfig{}) {}
    explicit CompressionFramer(FramerConfig config);

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound
    // ─────────────────────────────────────────────────────────────────────────

    /// Buffer `data` for compression. Returns the frames that became ready:
    /// none while the data fits, the previous buffer when it would overflow,
    /// one frame per capacity-sized chunk for oversized writes.
    [[nodiscard]] NetResult<std::vector<Bytes>> write(std::span<const std::uint8_t> data);

    /// Flush pending compressed data, then frame `data` as-is (tag 0)
    [[nodiscard]] NetResult<std::vector<Bytes>> write_uncompressed(std::span<const std::uint8_t> data);

    /// Frame for any pending buffered data; empty when nothing is pending
    [[nodiscard]] NetResult<std::vector<Bytes>> flush();

    [[nodiscard]] std::size_t pending_bytes() const noexcept { return pending_.size(); }

    [[nodiscard]] std::size_t buffer_capacity() const noexcept { return config_.buffer_capacity; }

    // ─────────────────────────────────────────────────────────────────────────
    // Inbound
    // ─────────────────────────────────────────────────────────────────────────

    /// Consume bytes from the front of `source` and append every completed
    /// frame's payload (inflated when tagged) to `sink`. Returns the number of
    /// frames completed. Errors are fatal: the stream position is lost.
    [[nodiscard]] NetResult<std::size_t> feed(Bytes& source, Bytes& sink);

    /// True while a frame header or payload is partially received
    [[nodiscard]] bool mid_frame() const noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Frame helpers
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Bytes encode_frame(FrameTag tag, std::span<const std::uint8_t> payload);

    [[nodiscard]] static NetResult<Bytes> deflate(std::span<const std::uint8_t> data, int level);

    [[nodiscard]] static NetResult<Bytes> inflate(std::span<const std::uint8_t> data);

private:
    [[nodiscard]] NetResult<Bytes> compress_pending();
    [[nodiscard]] NetResult<void> complete_frame(Bytes& sink);

    enum class ReadPhase : std::uint8_t { Header, Payload };

    FramerConfig config_;

    // Outbound coalescing buffer
    Bytes pending_;

    // Inbound state, kept across feed() calls
    ReadPhase phase_{ReadPhase::Header};
    std::array<std::uint8_t, kHeaderSize> header_{};
    std::size_t header_filled_{0};
    FrameTag frame_tag_{FrameTag::Raw};
    std::size_t frame_length_{0};
    Bytes payload_;
};

}  // namespace wirelink
