// ─────────────────────────────────────────────────────────────────────────────
// Compression Framer Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "wirelink/compression/compression_framer.hpp"

#include <string_view>

using namespace wirelink;

namespace {

Bytes pattern(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 7));
    }
    return data;
}

Bytes concat(const std::vector<Bytes>& frames) {
    Bytes out;
    for (const auto& frame : frames) {
        out.insert(out.end(), frame.begin(), frame.end());
    }
    return out;
}

// Decode a complete wire image with a fresh framer
Bytes decode_all(Bytes wire) {
    CompressionFramer reader;
    Bytes sink;
    auto result = reader.feed(wire, sink);
    REQUIRE(result.has_value());
    REQUIRE(wire.empty());
    REQUIRE_FALSE(reader.mid_frame());
    return sink;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Outbound buffering
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Small writes are buffered until flush", "[framer]") {
    CompressionFramer framer;

    auto frames = framer.write(pattern(100));
    REQUIRE(frames.has_value());
    REQUIRE(frames->empty());
    REQUIRE(framer.pending_bytes() == 100);

    auto flushed = framer.flush();
    REQUIRE(flushed.has_value());
    REQUIRE(flushed->size() == 1);
    REQUIRE(flushed->front()[0] == static_cast<std::uint8_t>(FrameTag::Deflated));
    REQUIRE(framer.pending_bytes() == 0);

    auto again = framer.flush();
    REQUIRE(again.has_value());
    REQUIRE(again->empty());
}

TEST_CASE("Write sizes around the buffer capacity", "[framer]") {
    constexpr std::size_t cap = CompressionFramer::kDefaultBufferCapacity;
    const std::size_t size = GENERATE(std::size_t{0}, std::size_t{1}, cap - 1, cap, cap + 1, 3 * cap);

    CompressionFramer framer;
    const Bytes data = pattern(size);

    auto written = framer.write(data);
    REQUIRE(written.has_value());
    auto flushed = framer.flush();
    REQUIRE(flushed.has_value());

    std::vector<Bytes> frames = std::move(*written);
    frames.insert(frames.end(), flushed->begin(), flushed->end());

    if (size == 0) {
        REQUIRE(frames.empty());
    } else if (size <= cap) {
        REQUIRE(frames.size() == 1);
    } else {
        REQUIRE(frames.size() == (size + cap - 1) / cap);
        REQUIRE(framer.pending_bytes() == 0);
    }

    REQUIRE(decode_all(concat(frames)) == data);
}

TEST_CASE("Overflowing write flushes the previous buffer first", "[framer]") {
    FramerConfig config;
    config.buffer_capacity = 16;
    CompressionFramer framer(config);

    REQUIRE(framer.write(pattern(10))->empty());

    auto frames = framer.write(pattern(10));
    REQUIRE(frames.has_value());
    REQUIRE(frames->size() == 1);
    REQUIRE(framer.pending_bytes() == 10);
}

TEST_CASE("Uncompressed write keeps stream order", "[framer]") {
    CompressionFramer framer;
    const Bytes first{'a', 'b', 'c'};
    const Bytes second{'d', 'e'};

    REQUIRE(framer.write(first)->empty());

    auto frames = framer.write_uncompressed(second);
    REQUIRE(frames.has_value());
    REQUIRE(frames->size() == 2);
    REQUIRE((*frames)[0][0] == static_cast<std::uint8_t>(FrameTag::Deflated));
    REQUIRE((*frames)[1] == Bytes{0x00, 0x00, 0x00, 0x00, 0x02, 'd', 'e'});

    REQUIRE(decode_all(concat(*frames)) == Bytes{'a', 'b', 'c', 'd', 'e'});
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Frames split at every byte boundary are reassembled", "[framer]") {
    CompressionFramer writer;
    const Bytes data = pattern(300);
    REQUIRE(writer.write(data).has_value());
    auto frames = writer.write_uncompressed(pattern(20));
    REQUIRE(frames.has_value());
    const Bytes wire = concat(*frames);

    CompressionFramer reader;
    Bytes sink;
    std::size_t completed = 0;
    for (std::uint8_t byte : wire) {
        Bytes chunk{byte};
        auto result = reader.feed(chunk, sink);
        REQUIRE(result.has_value());
        REQUIRE(chunk.empty());
        completed += *result;
    }

    REQUIRE(completed == 2);
    REQUIRE_FALSE(reader.mid_frame());

    Bytes expected = data;
    const Bytes tail = pattern(20);
    expected.insert(expected.end(), tail.begin(), tail.end());
    REQUIRE(sink == expected);
}

TEST_CASE("Partial header is kept between feeds", "[framer]") {
    const Bytes frame = CompressionFramer::encode_frame(FrameTag::Raw, Bytes{'x', 'y'});

    CompressionFramer reader;
    Bytes sink;
    Bytes head(frame.begin(), frame.begin() + 3);
    REQUIRE(reader.feed(head, sink).value() == 0);
    REQUIRE(reader.mid_frame());
    REQUIRE(sink.empty());

    Bytes rest(frame.begin() + 3, frame.end());
    REQUIRE(reader.feed(rest, sink).value() == 1);
    REQUIRE(sink == Bytes{'x', 'y'});
}

TEST_CASE("Empty raw frame completes with no output", "[framer]") {
    Bytes wire = CompressionFramer::encode_frame(FrameTag::Raw, {});
    REQUIRE(wire.size() == CompressionFramer::kHeaderSize);

    CompressionFramer reader;
    Bytes sink;
    REQUIRE(reader.feed(wire, sink).value() == 1);
    REQUIRE(sink.empty());
}

TEST_CASE("Unknown frame tag is a decompression error", "[framer]") {
    Bytes wire{0x07, 0x00, 0x00, 0x00, 0x01, 0x00};

    CompressionFramer reader;
    Bytes sink;
    auto result = reader.feed(wire, sink);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == NetErrorCode::Decompression);
}

TEST_CASE("Corrupt deflate payload is a decompression error", "[framer]") {
    Bytes wire = CompressionFramer::encode_frame(FrameTag::Deflated, Bytes{1, 2, 3, 4, 5});

    CompressionFramer reader;
    Bytes sink;
    auto result = reader.feed(wire, sink);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == NetErrorCode::Decompression);
}

TEST_CASE("Frame length above the configured maximum is rejected", "[framer]") {
    FramerConfig config;
    config.max_frame_length = 8;
    CompressionFramer reader(config);

    Bytes wire = CompressionFramer::encode_frame(FrameTag::Raw, pattern(9));
    Bytes sink;
    auto result = reader.feed(wire, sink);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == NetErrorCode::ProtocolLimit);
}

TEST_CASE("deflate and inflate helpers agree", "[framer]") {
    Bytes data;
    for (int i = 0; i < 500; ++i) {
        const std::string_view word = "wirelink ";
        data.insert(data.end(), word.begin(), word.end());
    }
    auto deflated = CompressionFramer::deflate(data, 9);
    REQUIRE(deflated.has_value());
    REQUIRE(deflated->size() < data.size());

    auto inflated = CompressionFramer::inflate(*deflated);
    REQUIRE(inflated.has_value());
    REQUIRE(*inflated == data);
}
