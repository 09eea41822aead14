#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Wire Codec
// ═══════════════════════════════════════════════════════════════════════════
// Stateless encode/decode rules for the values exchanged by Connection's typed
// helpers. All multi-byte numerics are big-endian.
//
//   int32    4 bytes, two's complement
//   byte     1 byte, signed
//   bool     1 byte, nonzero = true
//   float32  4 bytes, IEEE-754
//   int64    8 bytes, two's complement
//   string   null flag (1 = null), then length + UTF-8 bytes
//              Current: 4-byte unsigned length (max 2^32-1)
//              Legacy:  2-byte signed length   (max 32767)
//   utf      Legacy length + bytes, no null flag
//   json     nullable Current string holding the serialization
//   bytes    int32 length + raw bytes, never null
//
// There is no in-band version marker: both peers must be configured with the
// same StringFormat.

#include "wirelink/error.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wirelink {

using Json = nlohmann::json;

namespace codec {

enum class StringFormat : std::uint8_t {
    Current,  // 4-byte unsigned length
    Legacy    // 2-byte signed length
};

[[nodiscard]] constexpr std::string_view to_string(StringFormat format) noexcept {
    return format == StringFormat::Current ? "Current" : "Legacy";
}

inline constexpr std::uint8_t kStringNull = 1;
inline constexpr std::uint8_t kStringPresent = 0;

inline constexpr std::uint64_t kMaxCurrentStringLength = 0xFFFFFFFFull;
inline constexpr std::uint64_t kMaxLegacyStringLength = 0x7FFF;
inline constexpr std::uint64_t kMaxByteArrayLength = 0x7FFFFFFFull;

/// Size of the length field that follows the null flag
[[nodiscard]] constexpr std::size_t length_field_size(StringFormat format) noexcept {
    return format == StringFormat::Current ? 4 : 2;
}

[[nodiscard]] constexpr std::uint64_t max_string_length(StringFormat format) noexcept {
    return format == StringFormat::Current ? kMaxCurrentStringLength : kMaxLegacyStringLength;
}

// ─────────────────────────────────────────────────────────────────────────────
// Fixed-width primitives
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::array<std::uint8_t, 4> encode_int32(std::int32_t value) noexcept;
[[nodiscard]] std::int32_t decode_int32(std::span<const std::uint8_t, 4> bytes) noexcept;

[[nodiscard]] std::array<std::uint8_t, 1> encode_byte(std::int8_t value) noexcept;
[[nodiscard]] std::int8_t decode_byte(std::span<const std::uint8_t, 1> bytes) noexcept;

[[nodiscard]] std::array<std::uint8_t, 1> encode_bool(bool value) noexcept;
[[nodiscard]] bool decode_bool(std::span<const std::uint8_t, 1> bytes) noexcept;

[[nodiscard]] std::array<std::uint8_t, 4> encode_float(float value) noexcept;
[[nodiscard]] float decode_float(std::span<const std::uint8_t, 4> bytes) noexcept;

[[nodiscard]] std::array<std::uint8_t, 8> encode_int64(std::int64_t value) noexcept;
[[nodiscard]] std::int64_t decode_int64(std::span<const std::uint8_t, 8> bytes) noexcept;

[[nodiscard]] std::array<std::uint8_t, 4> encode_uint32(std::uint32_t value) noexcept;
[[nodiscard]] std::uint32_t decode_uint32(std::span<const std::uint8_t, 4> bytes) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Strings
// ─────────────────────────────────────────────────────────────────────────────

/// Null flag plus, for a present value, its length field. Fails with
/// ProtocolLimit when the value is too long for the format, so a caller that
/// writes the prefix first never emits a partial string.
[[nodiscard]] NetResult<Bytes> encode_string_prefix(
    std::optional<std::string_view> value,
    StringFormat format
);

/// Length field only (no null flag)
[[nodiscard]] NetResult<Bytes> encode_string_length(std::size_t length, StringFormat format);

/// Parse a length field of length_field_size(format) bytes
[[nodiscard]] NetResult<std::size_t> decode_string_length(
    std::span<const std::uint8_t> field,
    StringFormat format
);

/// Complete encoding in one buffer
[[nodiscard]] NetResult<Bytes> encode_string(
    std::optional<std::string_view> value,
    StringFormat format = StringFormat::Current
);

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

/// Serialization carried on the wire; JSON null maps to a null string
[[nodiscard]] NetResult<std::optional<std::string>> serialize_json(const Json& value);

/// Inverse of serialize_json
[[nodiscard]] NetResult<Json> parse_json(const std::optional<std::string>& text);

// ─────────────────────────────────────────────────────────────────────────────
// Byte arrays
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] NetResult<std::array<std::uint8_t, 4>> encode_byte_array_length(std::size_t length);

[[nodiscard]] NetResult<std::size_t> decode_byte_array_length(std::span<const std::uint8_t, 4> field);

[[nodiscard]] NetResult<Bytes> encode_byte_array(std::span<const std::uint8_t> data);

// ─────────────────────────────────────────────────────────────────────────────
// BufferReader - decodes values from a complete in-memory buffer
// ─────────────────────────────────────────────────────────────────────────────
// Reads fail with Protocol ("truncated") when the buffer runs out; the cursor
// is left unchanged by a failed read.

class BufferReader {
public:
    explicit BufferReader(std::span<const std::uint8_t> data) noexcept
        : data_(data)
    {}

    [[nodiscard]] NetResult<std::int32_t> read_int32();
    [[nodiscard]] NetResult<std::int8_t> read_byte();
    [[nodiscard]] NetResult<bool> read_bool();
    [[nodiscard]] NetResult<float> read_float();
    [[nodiscard]] NetResult<std::int64_t> read_int64();
    [[nodiscard]] NetResult<std::optional<std::string>> read_string(
        StringFormat format = StringFormat::Current
    );
    [[nodiscard]] NetResult<std::string> read_utf();
    [[nodiscard]] NetResult<Json> read_json();
    [[nodiscard]] NetResult<Bytes> read_byte_array();

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    [[nodiscard]] NetResult<std::span<const std::uint8_t>> take(std::size_t count);

    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

}  // namespace codec
}  // namespace wirelink
