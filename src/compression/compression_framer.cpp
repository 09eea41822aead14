#include "wirelink/compression/compression_framer.hpp"
#include "wirelink/codec/wire_codec.hpp"

#include <zlib.h>

#include <algorithm>
#include <string>

namespace wirelink {

namespace {

// Inflate output grows in steps of this size
constexpr std::size_t kInflateChunk = 64 * 1024;

// Cap on speculative reservation for a frame whose length came off the wire
constexpr std::size_t kMaxPayloadReserve = 1 << 20;

std::string zlib_message(const z_stream& stream, int rc) {
    if (stream.msg != nullptr) {
        return std::string(stream.msg);
    }
    return "zlib error " + std::to_string(rc);
}

}  // namespace

CompressionFramer::CompressionFramer(FramerConfig config)
    : config_(config)
{
    if (config_.buffer_capacity == 0) {
        config_.buffer_capacity = kDefaultBufferCapacity;
    }
    pending_.reserve(config_.buffer_capacity);
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

NetResult<std::vector<Bytes>> CompressionFramer::write(std::span<const std::uint8_t> data) {
    std::vector<Bytes> frames;
    const std::size_t capacity = config_.buffer_capacity;

    if (!pending_.empty() && pending_.size() + data.size() > capacity) {
        auto frame = compress_pending();
        if (!frame) {
            return tl::unexpected(frame.error());
        }
        frames.push_back(std::move(*frame));
    }

    if (data.size() <= capacity) {
        pending_.insert(pending_.end(), data.begin(), data.end());
        return frames;
    }

    // Oversized write: every chunk becomes its own frame, nothing is retained
    for (std::size_t offset = 0; offset < data.size(); offset += capacity) {
        const std::size_t len = std::min(capacity, data.size() - offset);
        auto deflated = deflate(data.subspan(offset, len), config_.compression_level);
        if (!deflated) {
            return tl::unexpected(deflated.error());
        }
        frames.push_back(encode_frame(FrameTag::Deflated, *deflated));
    }
    return frames;
}

NetResult<std::vector<Bytes>> CompressionFramer::write_uncompressed(std::span<const std::uint8_t> data) {
    auto frames = flush();
    if (!frames) {
        return frames;
    }
    frames->push_back(encode_frame(FrameTag::Raw, data));
    return frames;
}

NetResult<std::vector<Bytes>> CompressionFramer::flush() {
    std::vector<Bytes> frames;
    if (pending_.empty()) {
        return frames;
    }
    auto frame = compress_pending();
    if (!frame) {
        return tl::unexpected(frame.error());
    }
    frames.push_back(std::move(*frame));
    return frames;
}

NetResult<Bytes> CompressionFramer::compress_pending() {
    auto deflated = deflate(pending_, config_.compression_level);
    // The buffer is released even on failure; its content cannot be sent
    pending_.clear();
    if (!deflated) {
        return tl::unexpected(deflated.error());
    }
    return encode_frame(FrameTag::Deflated, *deflated);
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

bool CompressionFramer::mid_frame() const noexcept {
    return phase_ == ReadPhase::Payload || header_filled_ > 0;
}

NetResult<std::size_t> CompressionFramer::feed(Bytes& source, Bytes& sink) {
    std::size_t completed = 0;
    std::size_t offset = 0;
    NetResult<std::size_t> result = completed;

    while (offset < source.size()) {
        const std::size_t available = source.size() - offset;

        if (phase_ == ReadPhase::Header) {
            const std::size_t n = std::min(kHeaderSize - header_filled_, available);
            std::copy_n(source.begin() + static_cast<std::ptrdiff_t>(offset), n,
                        header_.begin() + static_cast<std::ptrdiff_t>(header_filled_));
            header_filled_ += n;
            offset += n;
            if (header_filled_ < kHeaderSize) {
                break;
            }

            const std::uint8_t tag = header_[0];
            frame_length_ = codec::decode_uint32(std::span<const std::uint8_t, 4>(header_.data() + 1, 4));
            header_filled_ = 0;

            if (tag != static_cast<std::uint8_t>(FrameTag::Raw) &&
                tag != static_cast<std::uint8_t>(FrameTag::Deflated)) {
                result = tl::unexpected(NetError::decompression(
                    "Unknown frame tag " + std::to_string(tag)
                ));
                break;
            }
            if (config_.max_frame_length > 0 && frame_length_ > config_.max_frame_length) {
                result = tl::unexpected(NetError::protocol_limit(
                    "Frame of " + std::to_string(frame_length_) +
                    " bytes exceeds limit of " + std::to_string(config_.max_frame_length)
                ));
                break;
            }

            frame_tag_ = static_cast<FrameTag>(tag);
            payload_.clear();
            payload_.reserve(std::min(frame_length_, kMaxPayloadReserve));
            phase_ = ReadPhase::Payload;
        } else {
            const std::size_t n = std::min(frame_length_ - payload_.size(), available);
            const auto first = source.begin() + static_cast<std::ptrdiff_t>(offset);
            payload_.insert(payload_.end(), first, first + static_cast<std::ptrdiff_t>(n));
            offset += n;
        }

        if (phase_ == ReadPhase::Payload && payload_.size() == frame_length_) {
            auto done = complete_frame(sink);
            if (!done) {
                result = tl::unexpected(done.error());
                break;
            }
            ++completed;
        }
    }

    source.erase(source.begin(), source.begin() + static_cast<std::ptrdiff_t>(offset));
    if (!result) {
        return result;
    }
    return completed;
}

NetResult<void> CompressionFramer::complete_frame(Bytes& sink) {
    phase_ = ReadPhase::Header;

    if (frame_tag_ == FrameTag::Deflated) {
        auto inflated = inflate(payload_);
        payload_.clear();
        if (!inflated) {
            return tl::unexpected(inflated.error());
        }
        sink.insert(sink.end(), inflated->begin(), inflated->end());
    } else {
        sink.insert(sink.end(), payload_.begin(), payload_.end());
        payload_.clear();
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame helpers
// ═══════════════════════════════════════════════════════════════════════════

Bytes CompressionFramer::encode_frame(FrameTag tag, std::span<const std::uint8_t> payload) {
    Bytes frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.push_back(static_cast<std::uint8_t>(tag));
    const auto length = codec::encode_uint32(static_cast<std::uint32_t>(payload.size()));
    frame.insert(frame.end(), length.begin(), length.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

NetResult<Bytes> CompressionFramer::deflate(std::span<const std::uint8_t> data, int level) {
    uLongf out_size = compressBound(static_cast<uLong>(data.size()));
    Bytes out(out_size);

    const int rc = compress2(
        out.data(), &out_size,
        data.data(), static_cast<uLong>(data.size()),
        level
    );
    if (rc != Z_OK) {
        return tl::unexpected(NetError::compression(
            "deflate failed: zlib error " + std::to_string(rc)
        ));
    }
    out.resize(out_size);
    return out;
}

NetResult<Bytes> CompressionFramer::inflate(std::span<const std::uint8_t> data) {
    z_stream stream{};
    int rc = inflateInit(&stream);
    if (rc != Z_OK) {
        return tl::unexpected(NetError::decompression("inflateInit failed: " + zlib_message(stream, rc)));
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    Bytes out;
    do {
        const std::size_t used = out.size();
        out.resize(used + kInflateChunk);
        stream.next_out = out.data() + used;
        stream.avail_out = static_cast<uInt>(kInflateChunk);

        rc = ::inflate(&stream, Z_NO_FLUSH);
        out.resize(used + (kInflateChunk - stream.avail_out));

        if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
            // Input ended before the deflate stream did
            break;
        }
        if (rc != Z_OK && rc != Z_STREAM_END) {
            const std::string message = zlib_message(stream, rc);
            inflateEnd(&stream);
            return tl::unexpected(NetError::decompression("inflate failed: " + message));
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        return tl::unexpected(NetError::decompression("inflate failed: truncated deflate stream"));
    }
    return out;
}

}  // namespace wirelink
