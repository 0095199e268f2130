//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_TRANSACTION_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_TRANSACTION_HPP

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "aggregate.hpp"
#include "error.hpp"
#include "services/event_log.hpp"
#include "services/retry_policy.hpp"

// Optimistic load-modify-save over an event log, wrapped in a retry policy.

namespace poker {

// Appends the events produced by an operation to the stored sequence.
// Specialize it when StoredEvent can't be constructed from NewEvent.
template <class StoredEvent, class NewEvent>
struct update_with
{
    static void append(std::vector<StoredEvent>& stored, const std::vector<NewEvent>& new_events)
    {
        stored.reserve(stored.size() + new_events.size());
        for (const auto& evt : new_events)
            stored.push_back(StoredEvent(evt));
    }
};

// The event type produced by an operation that runs against Aggregate
template <class Operation, class Aggregate>
using operation_event_t = typename std::invoke_result_t<const Operation&, const Aggregate&>::value_type;

// Runs operations against the aggregate folded from a log.
// An operation is a callable taking a const Aggregate& and returning
// a std::vector of new events. The new events are appended to the log.
// Aggregate must satisfy the requirements in aggregate.hpp.
template <class Aggregate>
class transaction
{
public:
    using stored_event_type = typename Aggregate::event_type;

    transaction(event_log<stored_event_type>& log, retry_strategy strategy)
        : log_(log), strategy_(std::move(strategy))
    {
    }

    // Runs op against the current state of key, retrying according to the strategy.
    // Returns the events the successful attempt appended.
    template <class Operation>
    boost::asio::awaitable<result<std::vector<operation_event_t<Operation, Aggregate>>>> execute(
        std::string_view key,
        Operation op
    )
    {
        retry_policy policy(strategy_);

        while (true)
        {
            auto res = co_await try_operation(key, op);
            if (res.has_value())
                co_return std::move(res);

            // Fatal errors won't go away by retrying
            error_code ec = res.error();
            if (classify(ec) == error_kind::fatal)
                co_return ec;

            // Ask the policy what to do
            auto instruction = policy.next();
            const auto* retry = boost::variant2::get_if<retry_after>(&instruction);
            if (!retry)
                co_return ec;

            if (retry->delay.count() > 0)
            {
                boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, retry->delay);
                auto [timer_ec] = co_await timer.async_wait(boost::asio::as_tuple);
                if (timer_ec)
                    co_return timer_ec;
            }
        }
    }

private:
    event_log<stored_event_type>& log_;
    retry_strategy strategy_;

    // A single load-modify-save attempt
    template <class Operation>
    boost::asio::awaitable<result<std::vector<operation_event_t<Operation, Aggregate>>>> try_operation(
        std::string_view key,
        const Operation& op
    )
    {
        using new_event_type = operation_event_t<Operation, Aggregate>;

        // Load the current sequence
        auto stored = co_await log_.load(key);
        if (stored.has_error())
            co_return stored.error();

        // Materialize the aggregate and run the operation
        auto agg = source<Aggregate>(*stored);
        std::vector<new_event_type> new_events = op(std::as_const(agg));
        if (new_events.empty())
            co_return new_events;

        // Append and save
        update_with<stored_event_type, new_event_type>::append(*stored, new_events);
        auto saved = co_await log_.save(key, std::move(*stored));
        if (saved.has_error())
            co_return saved.error();

        co_return new_events;
    }
};

}  // namespace poker

#endif
