#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// A sequential, typed reader/writer over one byte stream.
//
// Usage:
//   auto conn = Connection::create(std::make_unique<TcpStream>(std::move(sock)));
//
//   co_await conn->write_int(1);
//   co_await conn->write_string("hello");
//   auto reply = co_await conn->read_json();
//   co_await conn->end();
//
// A reader loop pulls bytes from the stream into an inbound buffer; reads are
// served from that buffer. Writes go to the stream in call order and resolve
// when the stream accepted them. Optional per-direction compression routes
// bytes through a CompressionFramer.
//
// Threading: every member must be called from the stream's executor, which
// must not run on more than one thread at a time. Reads are not pipelined:
// one read_* may be pending at a time. Independent writers that emit
// multi-part values should serialize through a WriteQueue.
//
// The first transport or decompression error is latched: every later
// operation fails with it without touching the stream.

#include "wirelink/async/settlement.hpp"
#include "wirelink/codec/wire_codec.hpp"
#include "wirelink/compression/compression_framer.hpp"
#include "wirelink/connection/connection_options.hpp"
#include "wirelink/error.hpp"
#include "wirelink/log/logger.hpp"
#include "wirelink/transport/stream.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wirelink {

enum class WriteMode : std::uint8_t {
    Buffered,      ///< Coalesce in the compression buffer (when compressing)
    Uncompressed   ///< Flush pending data, then send as a raw frame
};

class Connection : public std::enable_shared_from_this<Connection> {
public:
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const NetError&)>;

    Connection(std::unique_ptr<IStream> stream, ConnectionOptions options = {});
    virtual ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Construct and start
    [[nodiscard]] static std::shared_ptr<Connection> create(
        std::unique_ptr<IStream> stream,
        ConnectionOptions options = {}
    );

    /// Begin reading from the stream and apply the configured timeouts.
    /// Must be called once the object is owned by a shared_ptr. Idempotent.
    void start();

    // ─────────────────────────────────────────────────────────────────────────
    // Raw I/O
    // ─────────────────────────────────────────────────────────────────────────

    /// With `count`: exactly that many bytes, waiting until they are buffered.
    /// Without: everything buffered (at least one byte).
    [[nodiscard]] asio::awaitable<NetResult<Bytes>> read_raw(
        std::optional<std::size_t> count = std::nullopt
    );

    /// Resolves once the stream accepted the bytes (or, when compressing in
    /// Buffered mode, once they are buffered).
    [[nodiscard]] asio::awaitable<NetResult<void>> write_raw(
        std::span<const std::uint8_t> data,
        WriteMode mode = WriteMode::Buffered
    );

    /// Send any pending compressed data; no-op otherwise
    [[nodiscard]] asio::awaitable<NetResult<void>> flush();

    // ─────────────────────────────────────────────────────────────────────────
    // Typed I/O
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<NetResult<std::int32_t>> read_int();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_int(std::int32_t value);

    [[nodiscard]] asio::awaitable<NetResult<std::int8_t>> read_byte();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_byte(std::int8_t value);

    [[nodiscard]] asio::awaitable<NetResult<bool>> read_bool();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_bool(bool value);

    [[nodiscard]] asio::awaitable<NetResult<float>> read_float();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_float(float value);

    [[nodiscard]] asio::awaitable<NetResult<std::int64_t>> read_long();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_long(std::int64_t value);

    /// Nullable string in the connection's string format
    [[nodiscard]] asio::awaitable<NetResult<std::optional<std::string>>> read_string();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_string(std::optional<std::string_view> value);

    /// Legacy non-nullable string: 2-byte length + bytes
    [[nodiscard]] asio::awaitable<NetResult<std::string>> read_utf();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_utf(std::string_view value);

    [[nodiscard]] asio::awaitable<NetResult<Bytes>> read_byte_array();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_byte_array(std::span<const std::uint8_t> data);

    [[nodiscard]] asio::awaitable<NetResult<Json>> read_json();
    [[nodiscard]] asio::awaitable<NetResult<void>> write_json(const Json& value);

    // ─────────────────────────────────────────────────────────────────────────
    // Control
    // ─────────────────────────────────────────────────────────────────────────

    /// Enable compression per direction. Flags only ever turn on.
    void set_compression(bool in, bool out);

    /// Idle timeout (0 = disabled)
    void set_timeout(std::chrono::milliseconds timeout);

    /// Per-read timeout (0 = disabled)
    void set_read_timeout(std::chrono::milliseconds timeout);

    /// Flush, then half-close the sending side
    [[nodiscard]] asio::awaitable<NetResult<void>> end();

    /// Close immediately; pending operations fail with Closed
    void destroy();

    void on_close(CloseHandler handler);
    void on_error(ErrorHandler handler);

    void set_bandwidth_stats(std::shared_ptr<IBandwidthStats> stats);

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() const { return executor_; }
    [[nodiscard]] const std::string& tag() const noexcept { return log_.tag(); }
    [[nodiscard]] const std::string& remote_address() const noexcept { return remote_address_; }
    [[nodiscard]] bool is_destroyed() const noexcept { return destroyed_; }
    [[nodiscard]] bool is_tls() const noexcept { return tls_; }
    [[nodiscard]] const std::optional<NetError>& latched_error() const noexcept { return latched_; }
    [[nodiscard]] bool compression_in() const noexcept { return compression_in_; }
    [[nodiscard]] bool compression_out() const noexcept { return compression_out_; }
    [[nodiscard]] std::uint64_t in_bytes() const noexcept { return in_bytes_; }
    [[nodiscard]] std::uint64_t out_bytes() const noexcept { return out_bytes_; }
    [[nodiscard]] std::size_t buffered_bytes() const noexcept;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return idle_timeout_; }
    [[nodiscard]] std::chrono::milliseconds read_timeout() const noexcept { return read_timeout_; }
    [[nodiscard]] const ConnectionOptions& options() const noexcept { return options_; }

protected:
    /// Logger carrying this connection's tag
    [[nodiscard]] ILogger& logger() noexcept { return log_; }

private:
    // Front-consumed byte buffer; compacts lazily
    struct ByteQueue {
        Bytes bytes;
        std::size_t head{0};

        [[nodiscard]] std::size_t size() const noexcept { return bytes.size() - head; }
        [[nodiscard]] bool empty() const noexcept { return size() == 0; }
        void append(std::span<const std::uint8_t> data);
        [[nodiscard]] Bytes take(std::size_t count);
        [[nodiscard]] Bytes take_all();
        void compact();
    };

    struct PendingRead {
        std::optional<std::size_t> count;
        std::shared_ptr<async::Settlement<Bytes>> settlement;
    };

    struct PendingWrite {
        std::vector<Bytes> frames;
        bool shutdown{false};  // half-close after the frames
        std::shared_ptr<async::Settlement<void>> settlement;
    };

    using ResumeSignal = asio::experimental::channel<void(asio::error_code)>;

    // Coroutines
    asio::awaitable<void> reader_loop(std::shared_ptr<Connection> self);
    asio::awaitable<void> write_pump(std::shared_ptr<Connection> self);
    asio::awaitable<NetResult<void>> enqueue_write(std::vector<Bytes> frames, bool shutdown = false);

    // String bodies with an explicit length-field layout
    asio::awaitable<NetResult<std::optional<std::string>>> read_string_in(codec::StringFormat format);
    asio::awaitable<NetResult<void>> write_string_in(
        std::optional<std::string_view> value,
        codec::StringFormat format
    );

    // Inbound helpers
    [[nodiscard]] ByteQueue& readable() noexcept;
    [[nodiscard]] std::optional<Bytes> take_buffered(std::optional<std::size_t> count);
    [[nodiscard]] bool read_waiting() const noexcept;
    [[nodiscard]] bool should_pause_reader() const noexcept;
    bool pump_frames();
    void satisfy_read();
    void resume_reader();
    void handle_remote_end();

    // Failure / teardown
    [[nodiscard]] std::optional<NetError> unusable_reason() const;
    void fail(NetError error);
    void teardown(const NetError& reason);
    void reject_writes(const NetError& reason, bool data_only);

    // Timers
    void note_activity() noexcept;
    void arm_idle_timer();
    void on_idle_timer();
    void arm_read_timer(const std::shared_ptr<async::Settlement<Bytes>>& settlement);

    void count_in(std::size_t bytes);
    void count_out(std::size_t bytes);

    // Stream
    asio::any_io_executor executor_;
    std::unique_ptr<IStream> stream_;
    ConnectionOptions options_;
    TaggedLogger log_;
    std::string remote_address_;
    bool tls_{false};

    // State
    bool started_{false};
    bool destroyed_{false};
    bool remote_ended_{false};
    bool local_ended_{false};
    bool local_shutdown_done_{false};
    bool close_notified_{false};
    std::optional<NetError> latched_;

    // Inbound
    ByteQueue inbound_;   // transport bytes
    ByteQueue decoded_;   // framer output when compression_in_
    std::optional<PendingRead> read_waiter_;
    bool reader_paused_{false};
    ResumeSignal resume_signal_;

    // Outbound
    std::deque<std::shared_ptr<PendingWrite>> write_queue_;  // front = in flight
    bool writing_{false};

    // Compression
    bool compression_in_{false};
    bool compression_out_{false};
    std::unique_ptr<CompressionFramer> framer_;

    // Timers
    std::chrono::milliseconds idle_timeout_{0};
    std::chrono::milliseconds read_timeout_{0};
    std::chrono::steady_clock::time_point last_activity_;
    asio::steady_timer idle_timer_;
    asio::steady_timer read_timer_;

    // Counters
    std::uint64_t in_bytes_{0};
    std::uint64_t out_bytes_{0};
    std::shared_ptr<IBandwidthStats> bandwidth_stats_;

    // Observers
    std::vector<CloseHandler> close_handlers_;
    std::vector<ErrorHandler> error_handlers_;
};

}  // namespace wirelink
