//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/event_log.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/variant2/variant.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "events.hpp"
#include "test_utils.hpp"

using namespace poker;
using namespace poker::test;
namespace asio = boost::asio;

using event_vector = std::vector<board_modified_event>;

BOOST_AUTO_TEST_SUITE(memory_event_log_)

BOOST_AUTO_TEST_CASE(load_unknown_board)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();

        auto res = co_await log->load("b1");

        BOOST_TEST_REQUIRE(res.has_value());
        BOOST_TEST(res->empty());
    });
}

BOOST_AUTO_TEST_CASE(save_and_load)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();
        const event_vector events{added("p1", "Ann"), voted("p1", 3)};

        auto saved = co_await log->save("b1", events);
        BOOST_TEST_REQUIRE(saved.has_value());
        BOOST_TEST((*saved == events));

        auto loaded = co_await log->load("b1");
        BOOST_TEST_REQUIRE(loaded.has_value());
        BOOST_TEST((*loaded == events));

        // Boards are independent
        auto other = co_await log->load("b2");
        BOOST_TEST_REQUIRE(other.has_value());
        BOOST_TEST(other->empty());
    });
}

// A save must extend the stored sequence
BOOST_AUTO_TEST_CASE(save_conflict)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();
        auto initial = co_await log->save("b1", event_vector{added("p1", "Ann"), added("p2", "Bo")});
        BOOST_TEST_REQUIRE(initial.has_value());

        // Shorter
        auto res = co_await log->save("b1", event_vector{added("p1", "Ann")});
        BOOST_TEST(res.error() == error_code(errc::event_log_conflict));

        // Same length, different contents
        res = co_await log->save("b1", event_vector{added("p1", "Ann"), added("p3", "Cy")});
        BOOST_TEST(res.error() == error_code(errc::event_log_conflict));

        // Nothing changed
        auto loaded = co_await log->load("b1");
        BOOST_TEST((loaded.value() == event_vector{added("p1", "Ann"), added("p2", "Bo")}));
    });
}

BOOST_AUTO_TEST_CASE(load_update_available)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();
        auto saved = co_await log->save("b1", event_vector{added("p1", "Ann"), added("p2", "Bo"), voted("p1", 3)});
        BOOST_TEST_REQUIRE(saved.has_value());

        auto res = co_await log->load_update("b1", 1);
        BOOST_TEST_REQUIRE(res.has_value());
        BOOST_TEST((*res == event_vector{added("p2", "Bo"), voted("p1", 3)}));

        res = co_await log->load_update("b1", 0);
        BOOST_TEST_REQUIRE(res.has_value());
        BOOST_TEST(res->size() == 3u);
    });
}

BOOST_AUTO_TEST_CASE(load_update_invalid_position)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();
        auto saved = co_await log->save("b1", event_vector{added("p1", "Ann")});
        BOOST_TEST_REQUIRE(saved.has_value());

        auto res = co_await log->load_update("b1", 2);
        BOOST_TEST(res.error() == error_code(errc::invalid_position));

        // Unknown boards have no events
        res = co_await log->load_update("b2", 1);
        BOOST_TEST(res.error() == error_code(errc::invalid_position));
    });
}

// load_update suspends until a save adds events
BOOST_AUTO_TEST_CASE(load_update_waits)
{
    asio::io_context ctx;
    auto log = create_memory_event_log();
    std::optional<result<event_vector>> update;

    // Start waiting
    asio::co_spawn(
        ctx,
        [&]() -> asio::awaitable<void> { update = co_await log->load_update("b1", 0); },
        [](std::exception_ptr ptr) {
            if (ptr)
                std::rethrow_exception(ptr);
        }
    );
    ctx.poll();
    BOOST_TEST(!update.has_value());

    // A save that doesn't add events doesn't wake the waiter up
    run_coroutine(ctx, [&]() -> asio::awaitable<void> {
        auto saved = co_await log->save("b1", event_vector{});
        BOOST_TEST_REQUIRE(saved.has_value());
        co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);
        BOOST_TEST(!update.has_value());

        // Now add some
        saved = co_await log->save("b1", event_vector{added("p1", "Ann")});
        BOOST_TEST_REQUIRE(saved.has_value());
    });

    BOOST_TEST_REQUIRE(update.has_value());
    BOOST_TEST_REQUIRE(update->has_value());
    BOOST_TEST((**update == event_vector{added("p1", "Ann")}));
}

BOOST_AUTO_TEST_CASE(load_update_cancelled)
{
    asio::io_context ctx;
    auto log = create_memory_event_log();
    asio::cancellation_signal sig;
    std::optional<result<event_vector>> update;

    asio::co_spawn(
        ctx,
        [&]() -> asio::awaitable<void> { update = co_await log->load_update("b1", 0); },
        asio::bind_cancellation_slot(
            sig.slot(),
            [](std::exception_ptr ptr) {
                if (ptr)
                    std::rethrow_exception(ptr);
            }
        )
    );
    ctx.poll();
    BOOST_TEST(!update.has_value());
    BOOST_TEST(log->waiter_count() == 1u);

    sig.emit(asio::cancellation_type::terminal);
    ctx.run();

    BOOST_TEST_REQUIRE(update.has_value());
    BOOST_TEST(update->error() == error_code(asio::error::operation_aborted));

    // Neither the waiter nor the board are left behind
    BOOST_TEST(log->waiter_count() == 0u);
    BOOST_TEST(log->board_count() == 0u);
}

// Long-polls that time out repeatedly don't accumulate state
BOOST_AUTO_TEST_CASE(load_update_cancelled_repeatedly)
{
    asio::io_context ctx;
    auto log = create_memory_event_log();

    for (int i = 0; i < 5; ++i)
    {
        asio::cancellation_signal sig;
        std::optional<result<event_vector>> update;
        asio::co_spawn(
            ctx,
            [&]() -> asio::awaitable<void> { update = co_await log->load_update("idle", 0); },
            asio::bind_cancellation_slot(
                sig.slot(),
                [](std::exception_ptr ptr) {
                    if (ptr)
                        std::rethrow_exception(ptr);
                }
            )
        );
        ctx.restart();
        ctx.poll();
        sig.emit(asio::cancellation_type::terminal);
        ctx.restart();
        ctx.run();
        BOOST_TEST_REQUIRE(update.has_value());
        BOOST_TEST(update->error() == error_code(asio::error::operation_aborted));
    }

    BOOST_TEST(log->waiter_count() == 0u);
    BOOST_TEST(log->board_count() == 0u);
}

// Reading never creates boards. Only saving does
BOOST_AUTO_TEST_CASE(reads_dont_create_boards)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto log = create_memory_event_log();

        auto loaded = co_await log->load("unknown");
        BOOST_TEST_REQUIRE(loaded.has_value());
        auto update = co_await log->load_update("unknown", 1);
        BOOST_TEST(update.error() == error_code(errc::invalid_position));
        BOOST_TEST(log->board_count() == 0u);

        auto saved = co_await log->save("b1", event_vector{added("p1", "Ann")});
        BOOST_TEST_REQUIRE(saved.has_value());
        BOOST_TEST(log->board_count() == 1u);
    });
}

// Waking waiters up unregisters them
BOOST_AUTO_TEST_CASE(save_clears_waiters)
{
    asio::io_context ctx;
    auto log = create_memory_event_log();
    std::optional<result<event_vector>> update;

    asio::co_spawn(
        ctx,
        [&]() -> asio::awaitable<void> { update = co_await log->load_update("b1", 0); },
        [](std::exception_ptr ptr) {
            if (ptr)
                std::rethrow_exception(ptr);
        }
    );
    ctx.poll();
    BOOST_TEST(log->waiter_count() == 1u);

    run_coroutine(ctx, [&]() -> asio::awaitable<void> {
        auto saved = co_await log->save("b1", event_vector{added("p1", "Ann")});
        BOOST_TEST_REQUIRE(saved.has_value());
    });

    BOOST_TEST_REQUIRE(update.has_value());
    BOOST_TEST(update->has_value());
    BOOST_TEST(log->waiter_count() == 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(combined_event_log_)

BOOST_AUTO_TEST_CASE(load_and_save)
{
    run_coroutine([]() -> asio::awaitable<void> {
        auto board_log = create_memory_event_log();
        auto vote_types = create_configured_vote_type_log({"1", "fib"});
        auto log = create_combined_event_log(*vote_types, *board_log);

        // Vote types come first, even for unknown boards
        auto loaded = co_await log->load("b1");
        BOOST_TEST_REQUIRE(loaded.has_value());
        BOOST_TEST_REQUIRE(loaded->size() == 2u);
        BOOST_TEST(
            (loaded->at(0) == combined_event(vote_type_event(vote_type_added{"1", vote_validation::any_number})))
        );

        // Only board events reach the board log
        loaded->push_back(combined_event(added("p1", "Ann")));
        auto saved = co_await log->save("b1", std::move(*loaded));
        BOOST_TEST_REQUIRE(saved.has_value());

        auto board = co_await board_log->load("b1");
        BOOST_TEST((board.value() == event_vector{added("p1", "Ann")}));

        loaded = co_await log->load("b1");
        BOOST_TEST_REQUIRE(loaded.has_value());
        BOOST_TEST(loaded->size() == 3u);
    });
}

BOOST_AUTO_TEST_SUITE_END()
