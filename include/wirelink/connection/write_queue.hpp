#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Write Queue
// ═══════════════════════════════════════════════════════════════════════════
// Serializes independent producers on one Connection so that their multi-part
// writes never interleave on the wire:
//
//   WriteQueue queue(conn);
//   co_await queue.run([&](Connection& c) -> asio::awaitable<NetResult<void>> {
//       auto r = co_await c.write_int(7);
//       if (!r) co_return r;
//       co_return co_await c.write_string("payload");
//   });
//
// Producers are served in the order they called run().

#include "wirelink/connection/connection.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>

#include <functional>
#include <memory>

namespace wirelink {

class WriteQueue {
public:
    using Producer = std::function<asio::awaitable<NetResult<void>>(Connection&)>;

    explicit WriteQueue(std::shared_ptr<Connection> connection);

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    /// Run `producer` once every earlier producer has finished
    [[nodiscard]] asio::awaitable<NetResult<void>> run(Producer producer);

    [[nodiscard]] const std::shared_ptr<Connection>& connection() const noexcept { return connection_; }

    /// Producers waiting or running
    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

private:
    // Holds one token while the queue is free; run() takes it and puts it back
    using Token = asio::experimental::channel<void(asio::error_code)>;

    std::shared_ptr<Connection> connection_;
    Token token_;
    std::size_t depth_{0};
};

}  // namespace wirelink
