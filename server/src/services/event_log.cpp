//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/event_log.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"
#include "events.hpp"

namespace asio = boost::asio;
using namespace poker;

namespace {

class memory_event_log final : public board_event_log
{
    // Notifies a coroutine waiting in load_update that a save happened
    using waiter_channel = asio::experimental::concurrent_channel<void(error_code)>;
    using waiter_list = std::vector<std::shared_ptr<waiter_channel>>;

    // The mutex is only held while accessing the maps, never across suspension points.
    // Entries in boards_ are only created by save. Entries in waiters_ are
    // removed as soon as they have no waiters.
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<board_modified_event>, std::less<>> boards_;
    std::map<std::string, waiter_list, std::less<>> waiters_;

    std::vector<board_modified_event> load_impl(std::string_view key)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = boards_.find(key);
        return it == boards_.end() ? std::vector<board_modified_event>{} : it->second;
    }

    result<std::vector<board_modified_event>> save_impl(
        std::string_view key,
        std::vector<board_modified_event>&& events
    )
    {
        waiter_list waiters;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto& stored = boards_.try_emplace(std::string(key)).first->second;

            // The stored sequence must be a prefix of the new one
            bool extends = events.size() >= stored.size() &&
                           std::equal(stored.begin(), stored.end(), events.begin());
            if (!extends)
                POKER_RETURN_ERROR(errc::event_log_conflict)

            stored = events;

            auto waiters_it = waiters_.find(key);
            if (waiters_it != waiters_.end())
            {
                waiters.swap(waiters_it->second);
                waiters_.erase(waiters_it);
            }
        }

        // Wake up any load_update callers
        for (auto& w : waiters)
            w->try_send(error_code());

        return std::move(events);
    }

    // Returns the update if available. Otherwise, registers chan to be notified
    // on the next save and returns an empty optional.
    std::optional<result<std::vector<board_modified_event>>> try_load_update(
        std::string_view key,
        std::size_t since,
        const std::shared_ptr<waiter_channel>& chan
    )
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = boards_.find(key);
        auto size = it == boards_.end() ? 0u : it->second.size();

        if (since > size)
        {
            static constexpr auto loc = BOOST_CURRENT_LOCATION;
            return result<std::vector<board_modified_event>>(error_code(error_code(errc::invalid_position), &loc));
        }
        if (since < size)
        {
            return std::vector<board_modified_event>(
                it->second.begin() + static_cast<std::ptrdiff_t>(since),
                it->second.end()
            );
        }

        waiters_[std::string(key)].push_back(chan);
        return std::nullopt;
    }

    // Unregisters a waiter that won't wait anymore
    void remove_waiter(std::string_view key, const std::shared_ptr<waiter_channel>& chan)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = waiters_.find(key);
        if (it == waiters_.end())
            return;
        auto& waiters = it->second;
        waiters.erase(std::remove(waiters.begin(), waiters.end(), chan), waiters.end());
        if (waiters.empty())
            waiters_.erase(it);
    }

public:
    asio::awaitable<result<std::vector<board_modified_event>>> load(std::string_view key) override final
    {
        co_return load_impl(key);
    }

    asio::awaitable<result<std::vector<board_modified_event>>> save(
        std::string_view key,
        std::vector<board_modified_event> events
    ) override final
    {
        co_return save_impl(key, std::move(events));
    }

    asio::awaitable<result<std::vector<board_modified_event>>> load_update(std::string_view key, std::size_t since)
        override final
    {
        auto chan = std::make_shared<waiter_channel>(co_await asio::this_coro::executor, 1);

        // A save may not add any event (e.g. a command that emitted nothing),
        // so we may need to wait several times
        while (true)
        {
            auto res = try_load_update(key, since, chan);
            if (res.has_value())
                co_return std::move(*res);

            auto [ec] = co_await chan->async_receive(asio::as_tuple);
            if (ec)
            {
                remove_waiter(key, chan);
                if (ec == asio::experimental::error::channel_cancelled)
                    co_return error_code(asio::error::operation_aborted);
                co_return ec;
            }
        }
    }

    std::size_t board_count() const override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return boards_.size();
    }

    std::size_t waiter_count() const override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t res = 0;
        for (const auto& w : waiters_)
            res += w.second.size();
        return res;
    }
};

class configured_vote_type_log final : public event_log<vote_type_event>
{
    std::vector<vote_type_event> events_;

public:
    configured_vote_type_log(const std::vector<std::string>& vote_type_ids)
    {
        events_.reserve(vote_type_ids.size());
        for (const auto& id : vote_type_ids)
            events_.push_back(vote_type_added{id, vote_validation::any_number});
    }

    asio::awaitable<result<std::vector<vote_type_event>>> load(std::string_view) override final
    {
        co_return events_;
    }

    asio::awaitable<result<std::vector<vote_type_event>>> save(
        std::string_view,
        std::vector<vote_type_event> events
    ) override final
    {
        co_return std::move(events);
    }
};

class combined_event_log final : public event_log<combined_event>
{
    event_log<vote_type_event>& vote_types_;
    event_log<board_modified_event>& board_;

public:
    combined_event_log(event_log<vote_type_event>& vote_types, event_log<board_modified_event>& board) noexcept
        : vote_types_(vote_types), board_(board)
    {
    }

    asio::awaitable<result<std::vector<combined_event>>> load(std::string_view key) override final
    {
        // Vote types go first, so replays see them before any vote
        auto vote_types = co_await vote_types_.load(key);
        if (vote_types.has_error())
            co_return vote_types.error();

        auto board = co_await board_.load(key);
        if (board.has_error())
            co_return board.error();

        std::vector<combined_event> res;
        res.reserve(vote_types->size() + board->size());
        for (auto& evt : *vote_types)
            res.push_back(combined_event(std::move(evt)));
        for (auto& evt : *board)
            res.push_back(combined_event(std::move(evt)));
        co_return res;
    }

    asio::awaitable<result<std::vector<combined_event>>> save(
        std::string_view key,
        std::vector<combined_event> events
    ) override final
    {
        // Split the sequence
        std::vector<vote_type_event> vote_types;
        std::vector<board_modified_event> board;
        for (const auto& evt : events)
        {
            if (const auto* board_evt = boost::variant2::get_if<board_modified_event>(&evt))
                board.push_back(*board_evt);
            else
                vote_types.push_back(boost::variant2::get<vote_type_event>(evt));
        }

        auto vote_types_result = co_await vote_types_.save(key, std::move(vote_types));
        if (vote_types_result.has_error())
            co_return vote_types_result.error();

        auto board_result = co_await board_.save(key, std::move(board));
        if (board_result.has_error())
            co_return board_result.error();

        co_return std::move(events);
    }
};

}  // namespace

std::unique_ptr<board_event_log> poker::create_memory_event_log()
{
    return std::unique_ptr<board_event_log>{new memory_event_log()};
}

std::unique_ptr<event_log<vote_type_event>> poker::create_configured_vote_type_log(
    const std::vector<std::string>& vote_type_ids
)
{
    return std::unique_ptr<event_log<vote_type_event>>{new configured_vote_type_log(vote_type_ids)};
}

std::unique_ptr<event_log<combined_event>> poker::create_combined_event_log(
    event_log<vote_type_event>& vote_types,
    event_log<board_modified_event>& board
)
{
    return std::unique_ptr<event_log<combined_event>>{new combined_event_log(vote_types, board)};
}
