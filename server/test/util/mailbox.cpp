//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/mailbox.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/test/unit_test.hpp>

#include <exception>
#include <string>
#include <vector>

#include "error.hpp"
#include "test_utils.hpp"

using namespace poker;
using namespace poker::test;
namespace asio = boost::asio;

BOOST_AUTO_TEST_SUITE(mailbox_)

BOOST_AUTO_TEST_CASE(push_pop)
{
    run_coroutine([]() -> asio::awaitable<void> {
        mailbox<std::string> mb(co_await asio::this_coro::executor);

        BOOST_TEST(mb.push("a"));
        BOOST_TEST(mb.push("b"));

        auto res = co_await mb.pop();
        BOOST_TEST(res.value() == "a");
        res = co_await mb.pop();
        BOOST_TEST(res.value() == "b");
    });
}

// pop suspends until an item is pushed
BOOST_AUTO_TEST_CASE(pop_waits)
{
    asio::io_context ctx;
    mailbox<int> mb(ctx.get_executor());
    std::vector<int> received;

    asio::co_spawn(
        ctx,
        [&]() -> asio::awaitable<void> {
            while (true)
            {
                auto res = co_await mb.pop();
                if (res.has_error())
                    co_return;
                received.push_back(*res);
            }
        },
        [](std::exception_ptr ptr) {
            if (ptr)
                std::rethrow_exception(ptr);
        }
    );
    ctx.poll();
    BOOST_TEST(received.empty());

    BOOST_TEST(mb.push(1));
    ctx.poll();
    BOOST_TEST(received == std::vector<int>{1}, boost::test_tools::per_element());

    BOOST_TEST(mb.push(2));
    BOOST_TEST(mb.push(3));
    ctx.poll();
    BOOST_TEST(received == (std::vector<int>{1, 2, 3}), boost::test_tools::per_element());

    // Closing makes the consumer exit
    mb.close();
    ctx.run();
}

// Items pushed before close are still delivered
BOOST_AUTO_TEST_CASE(close_drains)
{
    run_coroutine([]() -> asio::awaitable<void> {
        mailbox<int> mb(co_await asio::this_coro::executor);
        BOOST_TEST(mb.push(1));
        mb.close();
        BOOST_TEST(!mb.push(2));

        auto res = co_await mb.pop();
        BOOST_TEST(res.value() == 1);

        res = co_await mb.pop();
        BOOST_TEST(res.error() == error_code(asio::experimental::error::channel_closed));
    });
}

BOOST_AUTO_TEST_SUITE_END()
