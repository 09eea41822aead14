#include "wirelink/codec/wire_codec.hpp"

#include <bit>
#include <limits>

namespace wirelink::codec {

namespace {

template <std::size_t N, typename U>
std::array<std::uint8_t, N> to_big_endian(U value) noexcept {
    std::array<std::uint8_t, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[N - 1 - i] = static_cast<std::uint8_t>(value & 0xFFu);
        value = static_cast<U>(value >> 8);
    }
    return out;
}

template <typename U, std::size_t N>
U from_big_endian(std::span<const std::uint8_t, N> bytes) noexcept {
    U value = 0;
    for (std::size_t i = 0; i < N; ++i) {
        value = static_cast<U>((value << 8) | bytes[i]);
    }
    return value;
}

NetError string_too_long(std::size_t length, StringFormat format) {
    return NetError::protocol_limit(
        "String of " + std::to_string(length) + " bytes exceeds the " +
        std::string(to_string(format)) + " format limit of " +
        std::to_string(max_string_length(format)) + " bytes"
    );
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Fixed-width primitives
// ─────────────────────────────────────────────────────────────────────────────

std::array<std::uint8_t, 4> encode_int32(std::int32_t value) noexcept {
    return to_big_endian<4>(static_cast<std::uint32_t>(value));
}

std::int32_t decode_int32(std::span<const std::uint8_t, 4> bytes) noexcept {
    return static_cast<std::int32_t>(from_big_endian<std::uint32_t>(bytes));
}

std::array<std::uint8_t, 1> encode_byte(std::int8_t value) noexcept {
    return {static_cast<std::uint8_t>(value)};
}

std::int8_t decode_byte(std::span<const std::uint8_t, 1> bytes) noexcept {
    return static_cast<std::int8_t>(bytes[0]);
}

std::array<std::uint8_t, 1> encode_bool(bool value) noexcept {
    return {static_cast<std::uint8_t>(value ? 1 : 0)};
}

bool decode_bool(std::span<const std::uint8_t, 1> bytes) noexcept {
    return bytes[0] != 0;
}

std::array<std::uint8_t, 4> encode_float(float value) noexcept {
    return to_big_endian<4>(std::bit_cast<std::uint32_t>(value));
}

float decode_float(std::span<const std::uint8_t, 4> bytes) noexcept {
    return std::bit_cast<float>(from_big_endian<std::uint32_t>(bytes));
}

std::array<std::uint8_t, 8> encode_int64(std::int64_t value) noexcept {
    return to_big_endian<8>(static_cast<std::uint64_t>(value));
}

std::int64_t decode_int64(std::span<const std::uint8_t, 8> bytes) noexcept {
    return static_cast<std::int64_t>(from_big_endian<std::uint64_t>(bytes));
}

std::array<std::uint8_t, 4> encode_uint32(std::uint32_t value) noexcept {
    return to_big_endian<4>(value);
}

std::uint32_t decode_uint32(std::span<const std::uint8_t, 4> bytes) noexcept {
    return from_big_endian<std::uint32_t>(bytes);
}

// ─────────────────────────────────────────────────────────────────────────────
// Strings
// ─────────────────────────────────────────────────────────────────────────────

NetResult<Bytes> encode_string_length(std::size_t length, StringFormat format) {
    if (static_cast<std::uint64_t>(length) > max_string_length(format)) {
        return tl::unexpected(string_too_long(length, format));
    }

    if (format == StringFormat::Current) {
        const auto field = to_big_endian<4>(static_cast<std::uint32_t>(length));
        return Bytes(field.begin(), field.end());
    }
    const auto field = to_big_endian<2>(static_cast<std::uint16_t>(length));
    return Bytes(field.begin(), field.end());
}

NetResult<Bytes> encode_string_prefix(
    std::optional<std::string_view> value,
    StringFormat format
) {
    if (!value) {
        return Bytes{kStringNull};
    }

    auto length = encode_string_length(value->size(), format);
    if (!length) {
        return tl::unexpected(length.error());
    }

    Bytes prefix;
    prefix.reserve(1 + length->size());
    prefix.push_back(kStringPresent);
    prefix.insert(prefix.end(), length->begin(), length->end());
    return prefix;
}

NetResult<std::size_t> decode_string_length(
    std::span<const std::uint8_t> field,
    StringFormat format
) {
    if (field.size() != length_field_size(format)) {
        return tl::unexpected(NetError::protocol("String length field has wrong size"));
    }

    if (format == StringFormat::Current) {
        return static_cast<std::size_t>(
            from_big_endian<std::uint32_t>(field.first<4>())
        );
    }

    const auto length = static_cast<std::int16_t>(from_big_endian<std::uint16_t>(field.first<2>()));
    if (length < 0) {
        return tl::unexpected(NetError::protocol(
            "Negative legacy string length: " + std::to_string(length)
        ));
    }
    return static_cast<std::size_t>(length);
}

NetResult<Bytes> encode_string(
    std::optional<std::string_view> value,
    StringFormat format
) {
    auto encoded = encode_string_prefix(value, format);
    if (encoded && value) {
        encoded->insert(encoded->end(), value->begin(), value->end());
    }
    return encoded;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

NetResult<std::optional<std::string>> serialize_json(const Json& value) {
    if (value.is_null()) {
        return std::optional<std::string>{};
    }
    try {
        return std::optional<std::string>(value.dump());
    } catch (const Json::exception& e) {
        return tl::unexpected(NetError::protocol(
            "JSON value cannot be serialized: " + std::string(e.what())
        ));
    }
}

NetResult<Json> parse_json(const std::optional<std::string>& text) {
    // An empty string carries no document; it decodes like a null string
    if (!text || text->empty()) {
        return Json(nullptr);
    }
    try {
        return Json::parse(*text);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(NetError::protocol(
            "Failed to parse JSON: " + std::string(e.what())
        ));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Byte arrays
// ─────────────────────────────────────────────────────────────────────────────

NetResult<std::array<std::uint8_t, 4>> encode_byte_array_length(std::size_t length) {
    if (static_cast<std::uint64_t>(length) > kMaxByteArrayLength) {
        return tl::unexpected(NetError::protocol_limit(
            "Byte array of " + std::to_string(length) + " bytes exceeds the int32 length prefix"
        ));
    }
    return encode_int32(static_cast<std::int32_t>(length));
}

NetResult<std::size_t> decode_byte_array_length(std::span<const std::uint8_t, 4> field) {
    const std::int32_t length = decode_int32(field);
    if (length < 0) {
        return tl::unexpected(NetError::protocol(
            "Negative byte array length: " + std::to_string(length)
        ));
    }
    return static_cast<std::size_t>(length);
}

NetResult<Bytes> encode_byte_array(std::span<const std::uint8_t> data) {
    auto length = encode_byte_array_length(data.size());
    if (!length) {
        return tl::unexpected(length.error());
    }
    Bytes encoded(length->begin(), length->end());
    encoded.insert(encoded.end(), data.begin(), data.end());
    return encoded;
}

// ─────────────────────────────────────────────────────────────────────────────
// BufferReader
// ─────────────────────────────────────────────────────────────────────────────

NetResult<std::span<const std::uint8_t>> BufferReader::take(std::size_t count) {
    if (remaining() < count) {
        return tl::unexpected(NetError::protocol(
            "Buffer truncated: need " + std::to_string(count) +
            " bytes, have " + std::to_string(remaining())
        ));
    }
    auto view = data_.subspan(pos_, count);
    pos_ += count;
    return view;
}

NetResult<std::int32_t> BufferReader::read_int32() {
    return take(4).map([](auto bytes) { return decode_int32(bytes.template first<4>()); });
}

NetResult<std::int8_t> BufferReader::read_byte() {
    return take(1).map([](auto bytes) { return decode_byte(bytes.template first<1>()); });
}

NetResult<bool> BufferReader::read_bool() {
    return take(1).map([](auto bytes) { return decode_bool(bytes.template first<1>()); });
}

NetResult<float> BufferReader::read_float() {
    return take(4).map([](auto bytes) { return decode_float(bytes.template first<4>()); });
}

NetResult<std::int64_t> BufferReader::read_int64() {
    return take(8).map([](auto bytes) { return decode_int64(bytes.template first<8>()); });
}

NetResult<std::optional<std::string>> BufferReader::read_string(StringFormat format) {
    const std::size_t start = pos_;

    auto is_null = read_bool();
    if (!is_null) {
        return tl::unexpected(is_null.error());
    }
    if (*is_null) {
        return std::optional<std::string>{};
    }

    auto field = take(length_field_size(format));
    auto length = field.and_then([format](auto f) { return decode_string_length(f, format); });
    if (!length) {
        pos_ = start;
        return tl::unexpected(length.error());
    }

    auto body = take(*length);
    if (!body) {
        pos_ = start;
        return tl::unexpected(body.error());
    }
    return std::optional<std::string>(std::in_place, body->begin(), body->end());
}

NetResult<std::string> BufferReader::read_utf() {
    const std::size_t start = pos_;

    auto field = take(2);
    auto length = field.and_then([](auto f) { return decode_string_length(f, StringFormat::Legacy); });
    if (!length) {
        pos_ = start;
        return tl::unexpected(length.error());
    }

    auto body = take(*length);
    if (!body) {
        pos_ = start;
        return tl::unexpected(body.error());
    }
    return std::string(body->begin(), body->end());
}

NetResult<Json> BufferReader::read_json() {
    const std::size_t start = pos_;
    auto text = read_string(StringFormat::Current);
    if (!text) {
        return tl::unexpected(text.error());
    }
    auto parsed = parse_json(*text);
    if (!parsed) {
        pos_ = start;
    }
    return parsed;
}

NetResult<Bytes> BufferReader::read_byte_array() {
    const std::size_t start = pos_;

    auto field = take(4);
    auto length = field.and_then([](auto f) { return decode_byte_array_length(f.template first<4>()); });
    if (!length) {
        pos_ = start;
        return tl::unexpected(length.error());
    }

    auto body = take(*length);
    if (!body) {
        pos_ = start;
        return tl::unexpected(body.error());
    }
    return Bytes(body->begin(), body->end());
}

}  // namespace wirelink::codec
