#include "wirelink/connection/connection.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace wirelink {

namespace {

// Consumed prefix of an inbound buffer is reclaimed past this size
constexpr std::size_t kCompactThreshold = 64 * 1024;

template <std::size_t N>
std::span<const std::uint8_t, N> fixed(const Bytes& bytes) {
    return std::span<const std::uint8_t, N>(bytes.data(), N);
}

Bytes text_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ByteQueue
// ═══════════════════════════════════════════════════════════════════════════

void Connection::ByteQueue::append(std::span<const std::uint8_t> data) {
    bytes.insert(bytes.end(), data.begin(), data.end());
}

Bytes Connection::ByteQueue::take(std::size_t count) {
    const auto first = bytes.begin() + static_cast<std::ptrdiff_t>(head);
    Bytes out(first, first + static_cast<std::ptrdiff_t>(count));
    head += count;
    if (head == bytes.size()) {
        bytes.clear();
        head = 0;
    } else if (head >= kCompactThreshold && head * 2 >= bytes.size()) {
        compact();
    }
    return out;
}

Bytes Connection::ByteQueue::take_all() {
    Bytes out;
    if (head == 0) {
        out.swap(bytes);
    } else {
        out.assign(bytes.begin() + static_cast<std::ptrdiff_t>(head), bytes.end());
        bytes.clear();
    }
    head = 0;
    return out;
}

void Connection::ByteQueue::compact() {
    if (head == 0) {
        return;
    }
    bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(head));
    head = 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

Connection::Connection(std::unique_ptr<IStream> stream, ConnectionOptions options)
    : executor_(stream->get_executor())
    , stream_(std::move(stream))
    , options_(std::move(options))
    , log_("Connection_" + stream_->remote_endpoint(), options_.logger)
    , remote_address_(stream_->remote_endpoint())
    , tls_(stream_->is_tls())
    , resume_signal_(executor_, 1)
    , idle_timeout_(options_.idle_timeout)
    , read_timeout_(options_.read_timeout)
    , last_activity_(std::chrono::steady_clock::now())
    , idle_timer_(executor_)
    , read_timer_(executor_)
    , bandwidth_stats_(options_.bandwidth_stats)
{}

Connection::~Connection() {
    // Observers are not notified from the destructor
    if (stream_) {
        stream_->close();
    }
}

std::shared_ptr<Connection> Connection::create(
    std::unique_ptr<IStream> stream,
    ConnectionOptions options
) {
    auto connection = std::make_shared<Connection>(std::move(stream), std::move(options));
    connection->start();
    return connection;
}

void Connection::start() {
    if (started_ || destroyed_) {
        return;
    }
    started_ = true;

    if (options_.tcp_no_delay) {
        stream_->set_no_delay(true);
    }
    note_activity();
    if (idle_timeout_.count() > 0) {
        arm_idle_timer();
    }

    asio::co_spawn(executor_, reader_loop(shared_from_this()), asio::detached);
    log_.debug(tls_ ? "Started (tls)" : "Started");
}

// ═══════════════════════════════════════════════════════════════════════════
// Raw I/O
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<NetResult<Bytes>> Connection::read_raw(std::optional<std::size_t> count) {
    auto self = shared_from_this();

    if (auto reason = unusable_reason()) {
        co_return tl::unexpected(*reason);
    }
    if (!started_) {
        co_return tl::unexpected(NetError::protocol("Connection not started"));
    }
    if (read_waiting()) {
        co_return tl::unexpected(NetError::protocol("read already in progress"));
    }

    if (auto ready = take_buffered(count)) {
        resume_reader();
        co_return std::move(*ready);
    }
    if (remote_ended_) {
        co_return tl::unexpected(NetError::ended());
    }

    auto settlement = async::make_settlement<Bytes>(executor_);
    read_waiter_ = PendingRead{count, settlement};
    arm_read_timer(settlement);
    resume_reader();

    auto result = co_await settlement->wait();

    if (read_waiter_ && read_waiter_->settlement == settlement) {
        read_waiter_.reset();
    }
    if (settlement->state() == async::SettlementState::TimedOut) {
        log_.debug_fmt("Read timed out after {} ms", read_timeout_.count());
    }
    co_return result;
}

asio::awaitable<NetResult<void>> Connection::write_raw(
    std::span<const std::uint8_t> data,
    WriteMode mode
) {
    auto self = shared_from_this();

    if (auto reason = unusable_reason()) {
        co_return tl::unexpected(*reason);
    }
    if (local_ended_) {
        co_return tl::unexpected(NetError::protocol("write after end"));
    }

    std::vector<Bytes> frames;
    if (compression_out_) {
        auto framed = (mode == WriteMode::Uncompressed)
            ? framer_->write_uncompressed(data)
            : framer_->write(data);
        if (!framed) {
            log_.warn("Compression failed: " + framed.error().message);
            co_return tl::unexpected(framed.error());
        }
        frames = std::move(*framed);
    } else if (!data.empty()) {
        frames.emplace_back(data.begin(), data.end());
    }

    if (frames.empty()) {
        co_return NetResult<void>{};
    }
    co_return co_await enqueue_write(std::move(frames));
}

asio::awaitable<NetResult<void>> Connection::flush() {
    auto self = shared_from_this();

    if (auto reason = unusable_reason()) {
        co_return tl::unexpected(*reason);
    }
    if (!compression_out_) {
        co_return NetResult<void>{};
    }

    auto frames = framer_->flush();
    if (!frames) {
        co_return tl::unexpected(frames.error());
    }
    if (frames->empty()) {
        co_return NetResult<void>{};
    }
    co_return co_await enqueue_write(std::move(*frames));
}

asio::awaitable<NetResult<void>> Connection::enqueue_write(std::vector<Bytes> frames, bool shutdown) {
    auto settlement = async::make_settlement<void>(executor_);
    write_queue_.push_back(std::make_shared<PendingWrite>(
        PendingWrite{std::move(frames), shutdown, settlement}
    ));

    if (!writing_) {
        writing_ = true;
        asio::co_spawn(executor_, write_pump(shared_from_this()), asio::detached);
    }
    co_return co_await settlement->wait();
}

asio::awaitable<void> Connection::write_pump(std::shared_ptr<Connection> self) {
    while (!write_queue_.empty() && !destroyed_) {
        auto job = write_queue_.front();
        bool ok = true;

        for (const auto& frame : job->frames) {
            auto written = co_await stream_->async_write(asio::buffer(frame));
            if (destroyed_) {
                ok = false;
                break;
            }
            if (!written) {
                fail(NetError::transport(written.error()));
                ok = false;
                break;
            }
            count_out(*written);
            note_activity();
        }

        if (ok && job->shutdown) {
            auto shut = co_await stream_->async_shutdown();
            if (destroyed_) {
                ok = false;
            } else if (!shut) {
                fail(NetError::transport(shut.error()));
                ok = false;
            } else {
                local_shutdown_done_ = true;
            }
        }

        // teardown() already rejected every queued settlement
        if (!ok) {
            break;
        }

        write_queue_.pop_front();
        job->settlement->resolve(NetResult<void>{});

        if (job->shutdown && remote_ended_) {
            teardown(NetError::closed());
        }
    }
    writing_ = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Typed I/O
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<NetResult<std::int32_t>> Connection::read_int() {
    auto bytes = co_await read_raw(4);
    if (!bytes) {
        co_return tl::unexpected(bytes.error());
    }
    co_return codec::decode_int32(fixed<4>(*bytes));
}

asio::awaitable<NetResult<void>> Connection::write_int(std::int32_t value) {
    const auto encoded = codec::encode_int32(value);
    co_return co_await write_raw(encoded);
}

asio::awaitable<NetResult<std::int8_t>> Connection::read_byte() {
    auto bytes = co_await read_raw(1);
    if (!bytes) {
        co_return tl::unexpected(bytes.error());
    }
    co_return codec::decode_byte(fixed<1>(*bytes));
}

asio::awaitable<NetResult<void>> Connection::write_byte(std::int8_t value) {
    const auto encoded = codec::encode_byte(value);
    co_return co_await write_raw(encoded);
}

asio::awaitable<NetResult<bool>> Connection::read_bool() {
    auto bytes = co_await read_raw(1);
    if (!bytes) {
        co_return tl::unexpected(bytes.error());
    }
    co_return codec::decode_bool(fixed<1>(*bytes));
}

asio::awaitable<NetResult<void>> Connection::write_bool(bool value) {
    const auto encoded = codec::encode_bool(value);
    co_return co_await write_raw(encoded);
}

asio::awaitable<NetResult<float>> Connection::read_float() {
    auto bytes = co_await read_raw(4);
    if (!bytes) {
        co_return tl::unexpected(bytes.error());
    }
    co_return codec::decode_float(fixed<4>(*bytes));
}

asio::awaitable<NetResult<void>> Connection::write_float(float value) {
    const auto encoded = codec::encode_float(value);
    co_return co_await write_raw(encoded);
}

asio::awaitable<NetResult<std::int64_t>> Connection::read_long() {
    auto bytes = co_await read_raw(8);
    if (!bytes) {
        co_return tl::unexpected(bytes.error());
    }
    co_return codec::decode_int64(fixed<8>(*bytes));
}

asio::awaitable<NetResult<void>> Connection::write_long(std::int64_t value) {
    const auto encoded = codec::encode_int64(value);
    co_return co_await write_raw(encoded);
}

asio::awaitable<NetResult<std::optional<std::string>>> Connection::read_string() {
    co_return co_await read_string_in(options_.string_format);
}

asio::awaitable<NetResult<void>> Connection::write_string(std::optional<std::string_view> value) {
    co_return co_await write_string_in(value, options_.string_format);
}

asio::awaitable<NetResult<std::optional<std::string>>> Connection::read_string_in(codec::StringFormat format) {
    auto flag = co_await read_raw(1);
    if (!flag) {
        co_return tl::unexpected(flag.error());
    }
    // Any nonzero flag marks a null string
    if (codec::decode_bool(fixed<1>(*flag))) {
        co_return std::optional<std::string>{};
    }

    auto field = co_await read_raw(codec::length_field_size(format));
    if (!field) {
        co_return tl::unexpected(field.error());
    }
    auto length = codec::decode_string_length(*field, format);
    if (!length) {
        co_return tl::unexpected(length.error());
    }

    auto body = co_await read_raw(*length);
    if (!body) {
        co_return tl::unexpected(body.error());
    }
    co_return std::optional<std::string>(std::in_place, body->begin(), body->end());
}

asio::awaitable<NetResult<void>> Connection::write_string_in(
    std::optional<std::string_view> value,
    codec::StringFormat format
) {
    // The prefix fails before anything is written when the value is too long
    auto prefix = codec::encode_string_prefix(value, format);
    if (!prefix) {
        co_return tl::unexpected(prefix.error());
    }

    auto written = co_await write_raw(*prefix);
    if (!written || !value) {
        co_return written;
    }
    const auto body = text_bytes(*value);
    co_return co_await write_raw(body);
}

asio::awaitable<NetResult<std::string>> Connection::read_utf() {
    auto field = co_await read_raw(codec::length_field_size(codec::StringFormat::Legacy));
    if (!field) {
        co_return tl::unexpected(field.error());
    }
    auto length = codec::decode_string_length(*field, codec::StringFormat::Legacy);
    if (!length) {
        co_return tl::unexpected(length.error());
    }

    auto body = co_await read_raw(*length);
    if (!body) {
        co_return tl::unexpected(body.error());
    }
    co_return std::string(body->begin(), body->end());
}

asio::awaitable<NetResult<void>> Connection::write_utf(std::string_view value) {
    auto field = codec::encode_string_length(value.size(), codec::StringFormat::Legacy);
    if (!field) {
        co_return tl::unexpected(field.error());
    }

    auto written = co_await write_raw(*field);
    if (!written) {
        co_return written;
    }
    const auto body = text_bytes(value);
    co_return co_await write_raw(body);
}

asio::awaitable<NetResult<Bytes>> Connection::read_byte_array() {
    auto field = co_await read_raw(4);
    if (!field) {
        co_return tl::unexpected(field.error());
    }
    auto length = codec::decode_byte_array_length(fixed<4>(*field));
    if (!length) {
        co_return tl::unexpected(length.error());
    }
    co_return co_await read_raw(*length);
}

asio::awaitable<NetResult<void>> Connection::write_byte_array(std::span<const std::uint8_t> data) {
    auto field = codec::encode_byte_array_length(data.size());
    if (!field) {
        co_return tl::unexpected(field.error());
    }

    auto written = co_await write_raw(*field);
    if (!written) {
        co_return written;
    }
    co_return co_await write_raw(data);
}

asio::awaitable<NetResult<Json>> Connection::read_json() {
    auto text = co_await read_string_in(codec::StringFormat::Current);
    if (!text) {
        co_return tl::unexpected(text.error());
    }
    co_return codec::parse_json(*text);
}

asio::awaitable<NetResult<void>> Connection::write_json(const Json& value) {
    auto text = codec::serialize_json(value);
    if (!text) {
        co_return tl::unexpected(text.error());
    }
    if (!*text) {
        co_return co_await write_string_in(std::nullopt, codec::StringFormat::Current);
    }
    co_return co_await write_string_in(std::string_view(**text), codec::StringFormat::Current);
}

// ═══════════════════════════════════════════════════════════════════════════
// Control
// ═══════════════════════════════════════════════════════════════════════════

void Connection::set_compression(bool in, bool out) {
    if ((in || out) && !framer_) {
        FramerConfig config;
        config.compression_level = options_.compression_level;
        config.max_frame_length = options_.max_frame_length;
        framer_ = std::make_unique<CompressionFramer>(config);
    }

    if (out && !compression_out_) {
        compression_out_ = true;
        log_.debug("Outbound compression enabled");
    }

    if (in && !compression_in_) {
        compression_in_ = true;
        log_.debug("Inbound compression enabled");
        // Bytes that arrived before this point are frames too
        if (!destroyed_ && !inbound_.empty() && pump_frames()) {
            satisfy_read();
        }
    }
}

void Connection::set_timeout(std::chrono::milliseconds timeout) {
    idle_timeout_ = std::max(timeout, std::chrono::milliseconds{0});
    if (destroyed_ || !started_) {
        return;
    }
    if (idle_timeout_.count() == 0) {
        idle_timer_.cancel();
        return;
    }
    arm_idle_timer();
}

void Connection::set_read_timeout(std::chrono::milliseconds timeout) {
    // Takes effect from the next read
    read_timeout_ = std::max(timeout, std::chrono::milliseconds{0});
}

asio::awaitable<NetResult<void>> Connection::end() {
    auto self = shared_from_this();

    if (auto reason = unusable_reason()) {
        co_return tl::unexpected(*reason);
    }
    if (local_ended_) {
        co_return NetResult<void>{};
    }

    std::vector<Bytes> frames;
    if (compression_out_) {
        auto flushed = framer_->flush();
        if (!flushed) {
            co_return tl::unexpected(flushed.error());
        }
        frames = std::move(*flushed);
    }

    local_ended_ = true;
    log_.debug("Ending");
    co_return co_await enqueue_write(std::move(frames), true);
}

void Connection::destroy() {
    if (destroyed_) {
        return;
    }
    log_.debug("Destroyed");
    teardown(latched_.value_or(NetError::destroyed()));
}

void Connection::on_close(CloseHandler handler) {
    if (close_notified_) {
        asio::post(executor_, std::move(handler));
        return;
    }
    close_handlers_.push_back(std::move(handler));
}

void Connection::on_error(ErrorHandler handler) {
    error_handlers_.push_back(std::move(handler));
}

void Connection::set_bandwidth_stats(std::shared_ptr<IBandwidthStats> stats) {
    bandwidth_stats_ = std::move(stats);
}

std::size_t Connection::buffered_bytes() const noexcept {
    return inbound_.size() + decoded_.size();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Reader Loop
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Connection::reader_loop(std::shared_ptr<Connection> self) {
    Bytes chunk(std::max<std::size_t>(options_.read_chunk_size, 1));

    while (!destroyed_) {
        if (should_pause_reader()) {
            reader_paused_ = true;
            log_.trace("Reader paused");
            auto [ec] = co_await resume_signal_.async_receive(asio::as_tuple(asio::use_awaitable));
            reader_paused_ = false;
            if (ec) {
                break;
            }
            continue;
        }

        auto received = co_await stream_->async_read_some(asio::buffer(chunk));
        if (destroyed_) {
            break;
        }
        if (!received) {
            if (received.error() == asio::error::eof) {
                handle_remote_end();
            } else {
                fail(NetError::transport(received.error()));
            }
            break;
        }

        count_in(*received);
        note_activity();
        inbound_.append(std::span<const std::uint8_t>(chunk.data(), *received));

        if (compression_in_ && !pump_frames()) {
            break;
        }
        satisfy_read();
    }
}

Connection::ByteQueue& Connection::readable() noexcept {
    return compression_in_ ? decoded_ : inbound_;
}

std::optional<Bytes> Connection::take_buffered(std::optional<std::size_t> count) {
    auto& buffer = readable();
    if (count) {
        if (buffer.size() < *count) {
            return std::nullopt;
        }
        return buffer.take(*count);
    }
    if (buffer.empty()) {
        return std::nullopt;
    }
    return buffer.take_all();
}

bool Connection::read_waiting() const noexcept {
    return read_waiter_ && read_waiter_->settlement->is_waiting();
}

bool Connection::should_pause_reader() const noexcept {
    return !read_waiting()
        && options_.read_high_water_mark > 0
        && buffered_bytes() >= options_.read_high_water_mark;
}

bool Connection::pump_frames() {
    inbound_.compact();
    auto completed = framer_->feed(inbound_.bytes, decoded_.bytes);
    if (!completed) {
        fail(completed.error());
        return false;
    }
    return true;
}

void Connection::satisfy_read() {
    if (!read_waiting()) {
        return;
    }
    auto ready = take_buffered(read_waiter_->count);
    if (!ready) {
        return;
    }
    auto settlement = std::move(read_waiter_->settlement);
    read_waiter_.reset();
    read_timer_.cancel();
    settlement->resolve(std::move(*ready));
}

void Connection::resume_reader() {
    if (reader_paused_) {
        (void)resume_signal_.try_send(asio::error_code{});
    }
}

void Connection::handle_remote_end() {
    remote_ended_ = true;
    if (compression_in_ && framer_->mid_frame()) {
        log_.warn("Peer ended inside a compressed frame");
    } else {
        log_.debug("Peer ended");
    }

    if (read_waiting()) {
        auto settlement = std::move(read_waiter_->settlement);
        read_waiter_.reset();
        read_timer_.cancel();
        settlement->reject(NetError::ended());
    }
    reject_writes(NetError::ended(), true);

    if (local_shutdown_done_) {
        teardown(NetError::closed());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Failure and teardown
// ═══════════════════════════════════════════════════════════════════════════

std::optional<NetError> Connection::unusable_reason() const {
    if (latched_) {
        return latched_;
    }
    if (destroyed_) {
        return NetError::destroyed();
    }
    return std::nullopt;
}

void Connection::fail(NetError error) {
    if (destroyed_) {
        return;
    }
    if (!latched_) {
        latched_ = std::move(error);
    }
    log_.warn("Failed: " + latched_->describe());

    const auto handlers = error_handlers_;
    for (const auto& handler : handlers) {
        handler(*latched_);
    }
    teardown(*latched_);
}

void Connection::teardown(const NetError& reason) {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    idle_timer_.cancel();
    read_timer_.cancel();
    stream_->close();

    if (read_waiting()) {
        read_waiter_->settlement->reject(reason);
    }
    read_waiter_.reset();
    reject_writes(reason, false);
    write_queue_.clear();
    resume_reader();

    if (!close_notified_) {
        close_notified_ = true;
        log_.debug("Closed");
        const auto handlers = close_handlers_;
        for (const auto& handler : handlers) {
            handler();
        }
    }
}

void Connection::reject_writes(const NetError& reason, bool data_only) {
    for (const auto& job : write_queue_) {
        if (data_only && job->shutdown) {
            continue;
        }
        job->settlement->reject(reason);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Timers and counters
// ═══════════════════════════════════════════════════════════════════════════

void Connection::note_activity() noexcept {
    last_activity_ = std::chrono::steady_clock::now();
}

void Connection::arm_idle_timer() {
    idle_timer_.expires_at(last_activity_ + idle_timeout_);
    idle_timer_.async_wait([weak = weak_from_this()](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_idle_timer();
        }
    });
}

void Connection::on_idle_timer() {
    if (destroyed_ || idle_timeout_.count() == 0) {
        return;
    }
    if (std::chrono::steady_clock::now() - last_activity_ < idle_timeout_) {
        arm_idle_timer();
        return;
    }

    log_.info_fmt("Idle for {} ms, destroying", idle_timeout_.count());
    if (!latched_) {
        latched_ = NetError::closed("Connection destroyed: idle timeout");
    }
    teardown(*latched_);
}

void Connection::arm_read_timer(const std::shared_ptr<async::Settlement<Bytes>>& settlement) {
    if (read_timeout_.count() == 0) {
        return;
    }
    read_timer_.expires_after(read_timeout_);
    read_timer_.async_wait([settlement](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        // Only the pending read fails; buffered bytes and frame state stay
        settlement->time_out(NetError::timeout());
    });
}

void Connection::count_in(std::size_t bytes) {
    in_bytes_ += bytes;
    if (bandwidth_stats_) {
        bandwidth_stats_->add_in_bytes(bytes);
    }
}

void Connection::count_out(std::size_t bytes) {
    out_bytes_ += bytes;
    if (bandwidth_stats_) {
        bandwidth_stats_->add_out_bytes(bytes);
    }
}

}  // namespace wirelink
