//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_UTIL_MAILBOX_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_UTIL_MAILBOX_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <deque>
#include <mutex>
#include <utility>

#include "error.hpp"

namespace poker {

// An unbounded multi-producer, single-consumer queue. Pushing never suspends,
// so it can be called from synchronous code (e.g. while holding a mutex).
// Items are popped in the order they were pushed. Thread-safe.
template <class T>
class mailbox
{
    std::mutex mtx_;
    std::deque<T> items_;
    bool closed_{false};

    // Acts as a condition variable, so the consumer can be notified
    // when new items arrive. It holds at most one pending notification.
    boost::asio::experimental::concurrent_channel<void(error_code)> signal_;

public:
    explicit mailbox(boost::asio::any_io_executor ex) : signal_(std::move(ex), 1) {}
    mailbox(const mailbox&) = delete;
    mailbox& operator=(const mailbox&) = delete;

    // Enqueues an item. Returns false if the mailbox has been closed
    bool push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_)
                return false;
            items_.push_back(std::move(item));
        }

        // If a notification is already pending, this fails, which is fine
        signal_.try_send(error_code());
        return true;
    }

    // Suspends until an item is available and returns it.
    // Once the mailbox is closed, remaining items are still returned.
    // After that, fails with channel_closed.
    boost::asio::awaitable<result<T>> pop()
    {
        while (true)
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (!items_.empty())
                {
                    T res = std::move(items_.front());
                    items_.pop_front();
                    co_return res;
                }
                if (closed_)
                    co_return error_code(boost::asio::experimental::error::channel_closed);
            }

            // Wait to be notified
            auto [ec] = co_await signal_.async_receive(boost::asio::as_tuple);
            if (ec)
                co_return ec;
        }
    }

    // Makes further pushes fail and wakes up the consumer
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        signal_.try_send(error_code());
    }
};

}  // namespace poker

#endif
