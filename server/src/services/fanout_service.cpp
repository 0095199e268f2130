//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/fanout_service.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <string_view>

#include "error.hpp"
#include "services/board_broker.hpp"
#include "services/event_log.hpp"

namespace asio = boost::asio;
using asio::experimental::concurrent_channel;
using asio::experimental::make_parallel_group;
using asio::experimental::wait_for_one;
using namespace poker;

namespace {

static constexpr auto rethrow_handler = [](std::exception_ptr ex) {
    if (ex)
        std::rethrow_exception(ex);
};

class fanout_service_impl final : public fanout_service
{
    asio::any_io_executor ex_;
    board_event_log& log_;
    board_broker& broker_;
    std::chrono::milliseconds tick_interval_;

    // Signals that new events may be available. Holds at most one pending notification
    concurrent_channel<void(error_code)> signal_;

public:
    fanout_service_impl(
        asio::any_io_executor ex,
        board_event_log& log,
        board_broker& broker,
        std::chrono::milliseconds tick_interval
    )
        : ex_(ex), log_(log), broker_(broker), tick_interval_(tick_interval), signal_(std::move(ex), 1)
    {
    }

    void notify(std::string_view) override final { signal_.try_send(error_code()); }

    asio::awaitable<void> tick() override final
    {
        for (const auto& board_id : broker_.subscribed_boards())
        {
            auto events = co_await log_.load(board_id);
            if (events.has_error())
            {
                log_error(events.error(), "Loading events for fan-out", board_id);
                continue;
            }
            broker_.publish(board_id, std::move(events).value());
        }
    }

    asio::awaitable<void> run() override final
    {
        asio::steady_timer timer(co_await asio::this_coro::executor);

        while (true)
        {
            // Wait to be notified, or until the tick is due
            timer.expires_after(tick_interval_);
            auto gp = make_parallel_group(
                signal_.async_receive(asio::deferred),
                timer.async_wait(asio::deferred)
            );
            auto [order, channel_ec, timer_ec] = co_await gp.async_wait(wait_for_one(), asio::use_awaitable);

            // The channel is only closed by cancel()
            if (order[0] == 0u && channel_ec)
                co_return;

            co_await tick();
        }
    }

    void start_run() override final { asio::co_spawn(ex_, run(), rethrow_handler); }

    void cancel() override final { signal_.close(); }
};

}  // namespace

std::unique_ptr<fanout_service> poker::create_fanout_service(
    asio::any_io_executor ex,
    board_event_log& log,
    board_broker& broker,
    std::chrono::milliseconds tick_interval
)
{
    return std::unique_ptr<fanout_service>{new fanout_service_impl(std::move(ex), log, broker, tick_interval)};
}
