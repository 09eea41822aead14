#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Settlement
// ═══════════════════════════════════════════════════════════════════════════
// One suspended operation. A coroutine co_awaits wait(); event sources (the
// reader loop, a write completion, close/end/error notifications, a timer)
// race to settle it. The first settle wins; every later attempt returns false
// and changes nothing.
//
//   Waiting ──resolve──▶ Resolved
//      │  ├───reject───▶ Rejected
//      │  └──time_out──▶ TimedOut
//
// Sources hold the Settlement by shared_ptr, so a late trigger after the
// waiter has gone away is harmless.

#include "wirelink/error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>

#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>

namespace wirelink::async {

enum class SettlementState : std::uint8_t {
    Waiting,
    TimedOut,
    Resolved,
    Rejected
};

[[nodiscard]] constexpr std::string_view to_string(SettlementState state) noexcept {
    switch (state) {
        case SettlementState::Waiting:  return "Waiting";
        case SettlementState::TimedOut: return "TimedOut";
        case SettlementState::Resolved: return "Resolved";
        case SettlementState::Rejected: return "Rejected";
    }
    return "Unknown";
}

template <typename T>
class Settlement {
public:
    using Channel = asio::experimental::channel<void(asio::error_code, NetResult<T>)>;

    explicit Settlement(asio::any_io_executor executor)
        : channel_(std::move(executor), 1)
    {}

    Settlement(const Settlement&) = delete;
    Settlement& operator=(const Settlement&) = delete;

    bool resolve(NetResult<T> value) {
        if (!value) {
            return settle(SettlementState::Rejected, std::move(value));
        }
        return settle(SettlementState::Resolved, std::move(value));
    }

    bool reject(NetError error) {
        return settle(SettlementState::Rejected, tl::unexpected(std::move(error)));
    }

    bool time_out(NetError error) {
        return settle(SettlementState::TimedOut, tl::unexpected(std::move(error)));
    }

    [[nodiscard]] SettlementState state() const noexcept { return state_; }

    [[nodiscard]] bool is_waiting() const noexcept { return state_ == SettlementState::Waiting; }

    /// Suspend until settled. Cancellation of the awaiting coroutine is
    /// reported as a Closed error.
    asio::awaitable<NetResult<T>> wait() {
        try {
            co_return co_await channel_.async_receive(asio::use_awaitable);
        } catch (const std::system_error& e) {
            state_ = SettlementState::Rejected;
            co_return tl::unexpected(NetError::closed(
                std::string("Operation abandoned: ") + e.what()
            ));
        }
    }

private:
    bool settle(SettlementState state, NetResult<T> value) {
        if (state_ != SettlementState::Waiting) {
            return false;
        }
        state_ = state;
        // Capacity 1 and a single settle: the send cannot fail for lack of room
        return channel_.try_send(asio::error_code{}, std::move(value));
    }

    Channel channel_;
    SettlementState state_{SettlementState::Waiting};
};

template <typename T>
[[nodiscard]] std::shared_ptr<Settlement<T>> make_settlement(asio::any_io_executor executor) {
    return std::make_shared<Settlement<T>>(std::move(executor));
}

}  // namespace wirelink::async
