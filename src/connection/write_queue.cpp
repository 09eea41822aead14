#include "wirelink/connection/write_queue.hpp"

#include <asio/as_tuple.hpp>
#include <asio/use_awaitable.hpp>

namespace wirelink {

WriteQueue::WriteQueue(std::shared_ptr<Connection> connection)
    : connection_(std::move(connection))
    , token_(connection_->get_executor(), 1)
{
    (void)token_.try_send(asio::error_code{});
}

asio::awaitable<NetResult<void>> WriteQueue::run(Producer producer) {
    ++depth_;
    auto [ec] = co_await token_.async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        --depth_;
        co_return tl::unexpected(NetError::closed("Write queue abandoned: " + ec.message()));
    }

    // Hands the token to the next producer however this one finishes
    struct Release {
        WriteQueue& queue;
        ~Release() {
            --queue.depth_;
            (void)queue.token_.try_send(asio::error_code{});
        }
    } release{*this};

    if (auto reason = connection_->latched_error()) {
        co_return tl::unexpected(*reason);
    }
    co_return co_await producer(*connection_);
}

}  // namespace wirelink
