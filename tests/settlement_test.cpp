// ─────────────────────────────────────────────────────────────────────────────
// Settlement Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "wirelink/async/settlement.hpp"

#include "support/test_support.hpp"

#include <asio/io_context.hpp>
#include <asio/post.hpp>

using namespace wirelink;
using namespace wirelink::async;
using wirelink::test::run_sync;

TEST_CASE("Settlement starts waiting", "[settlement]") {
    asio::io_context io;
    auto settlement = make_settlement<int>(io.get_executor());

    REQUIRE(settlement->state() == SettlementState::Waiting);
    REQUIRE(settlement->is_waiting());
    REQUIRE(to_string(SettlementState::TimedOut) == "TimedOut");
}

TEST_CASE("First settle wins", "[settlement]") {
    asio::io_context io;

    SECTION("resolve then reject") {
        auto settlement = make_settlement<int>(io.get_executor());
        REQUIRE(settlement->resolve(5));
        REQUIRE_FALSE(settlement->reject(NetError::closed()));
        REQUIRE_FALSE(settlement->time_out(NetError::timeout()));
        REQUIRE(settlement->state() == SettlementState::Resolved);

        auto result = run_sync(io, settlement->wait());
        REQUIRE(result.has_value());
        REQUIRE(*result == 5);
    }

    SECTION("time out then resolve") {
        auto settlement = make_settlement<int>(io.get_executor());
        REQUIRE(settlement->time_out(NetError::timeout()));
        REQUIRE_FALSE(settlement->resolve(1));
        REQUIRE(settlement->state() == SettlementState::TimedOut);

        auto result = run_sync(io, settlement->wait());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == NetErrorCode::Timeout);
    }
}

TEST_CASE("Resolving with an error value counts as a rejection", "[settlement]") {
    asio::io_context io;
    auto settlement = make_settlement<void>(io.get_executor());

    REQUIRE(settlement->resolve(tl::unexpected(NetError::ended())));
    REQUIRE(settlement->state() == SettlementState::Rejected);

    auto result = run_sync(io, settlement->wait());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == NetErrorCode::Ended);
}

TEST_CASE("A waiter suspended before settlement is resumed", "[settlement]") {
    asio::io_context io;
    auto settlement = make_settlement<std::string>(io.get_executor());

    asio::post(io, [settlement]() { settlement->resolve(std::string("done")); });

    auto result = run_sync(io, settlement->wait());
    REQUIRE(result.has_value());
    REQUIRE(*result == "done");
}
