//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/board_broker.hpp"

#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "events.hpp"

using namespace poker;

namespace {

class board_broker_impl final : public board_broker
{
    // The type of elements held by our subscription container
    struct subscription
    {
        session_id id;
        std::string board_id;
        std::weak_ptr<board_subscriber> subscriber;

        std::string_view board_id_sv() const noexcept { return board_id; }
    };

    // We need to efficiently index subscriptions by both session ID
    // (to disconnect) and board ID (to broadcast).
    // clang-format off
    using container_type = boost::multi_index::multi_index_container<
        subscription,
        boost::multi_index::indexed_by<
            // Index by session ID
            boost::multi_index::ordered_unique<
                boost::multi_index::member<subscription, session_id, &subscription::id>
            >,
            // Index by board ID
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<subscription, std::string_view, &subscription::board_id_sv>,
                std::less<>
            >
        >
    >;
    // clang-format on

    // No events known yet, and nobody asked for them
    struct empty_state
    {
    };

    // Some sessions asked for a replay, but we don't know the events yet
    struct replay_state
    {
        std::vector<std::weak_ptr<board_subscriber>> waiters;
    };

    // Events are known. loc is the number of events already broadcast
    struct loaded_state
    {
        std::vector<board_modified_event> events;
        std::size_t loc;
    };

    using board_state = boost::variant2::variant<empty_state, replay_state, loaded_state>;

    mutable std::mutex mtx_;
    container_type subscriptions_;
    std::map<std::string, board_state, std::less<>> boards_;

    board_state* find_board(std::string_view board_id)
    {
        auto it = boards_.find(board_id);
        return it == boards_.end() ? nullptr : &it->second;
    }

    // Removes the board record if no session is subscribed to it
    void remove_if_orphan(std::string_view board_id)
    {
        if (subscriptions_.get<1>().count(board_id) == 0u)
        {
            auto it = boards_.find(board_id);
            if (it != boards_.end())
                boards_.erase(it);
        }
    }

    static void update_events_impl(board_state& state, std::vector<board_modified_event>&& events)
    {
        if (auto* replay = boost::variant2::get_if<replay_state>(&state))
        {
            // Serve everyone waiting for a replay
            for (const auto& waiter : replay->waiters)
            {
                if (auto sub = waiter.lock())
                    sub->on_replay(events);
            }
        }

        if (auto* loaded = boost::variant2::get_if<loaded_state>(&state))
        {
            // Events past loc will be sent by the next broadcast
            loaded->loc = (std::min)(loaded->loc, events.size());
            loaded->events = std::move(events);
        }
        else
        {
            // The first sequence is considered already seen
            auto size = events.size();
            state = loaded_state{std::move(events), size};
        }
    }

    void broadcast_changes_impl(std::string_view board_id)
    {
        auto* state = find_board(board_id);
        if (!state)
            return;
        auto* loaded = boost::variant2::get_if<loaded_state>(state);
        if (!loaded)
            return;

        auto [first, last] = subscriptions_.get<1>().equal_range(board_id);
        std::vector<session_id> orphans;
        for (auto it = first; it != last; ++it)
        {
            if (it->subscriber.expired())
                orphans.push_back(it->id);
        }

        // Iterating events in the outer loop guarantees that every
        // subscriber sees them in board order
        for (std::size_t pos = loaded->loc; pos < loaded->events.size(); ++pos)
        {
            for (auto it = first; it != last; ++it)
            {
                if (auto sub = it->subscriber.lock())
                    sub->on_board_event(pos, loaded->events[pos]);
            }
        }
        loaded->loc = loaded->events.size();

        // Discard subscribers that are gone
        if (!orphans.empty())
        {
            for (const auto& id : orphans)
                subscriptions_.erase(id);
            remove_if_orphan(board_id);
        }
    }

public:
    void connect(session_id id, std::string board_id, std::weak_ptr<board_subscriber> subscriber) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        boards_.try_emplace(board_id);
        subscriptions_.insert(subscription{id, std::move(board_id), std::move(subscriber)});
    }

    void disconnect(session_id id) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end())
            return;
        std::string board_id = it->board_id;
        subscriptions_.erase(it);
        remove_if_orphan(board_id);
    }

    void replay_onto(std::string_view board_id, std::weak_ptr<board_subscriber> subscriber) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto* state = find_board(board_id);
        if (!state)
            return;

        if (auto* loaded = boost::variant2::get_if<loaded_state>(state))
        {
            if (auto sub = subscriber.lock())
                sub->on_replay(loaded->events);
        }
        else if (auto* replay = boost::variant2::get_if<replay_state>(state))
        {
            replay->waiters.push_back(std::move(subscriber));
        }
        else
        {
            *state = replay_state{{std::move(subscriber)}};
        }
    }

    void update_events(std::string_view board_id, std::vector<board_modified_event> events) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (auto* state = find_board(board_id))
            update_events_impl(*state, std::move(events));
    }

    void broadcast_changes(std::string_view board_id) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        broadcast_changes_impl(board_id);
    }

    void publish(std::string_view board_id, std::vector<board_modified_event> events) override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto* state = find_board(board_id);
        if (!state)
            return;
        update_events_impl(*state, std::move(events));
        broadcast_changes_impl(board_id);
    }

    std::vector<std::string> subscribed_boards() const override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> res;
        res.reserve(boards_.size());
        for (const auto& board : boards_)
            res.push_back(board.first);
        return res;
    }

    std::size_t subscriber_count(std::string_view board_id) const override final
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return subscriptions_.get<1>().count(board_id);
    }
};

}  // namespace

std::unique_ptr<board_broker> poker::create_board_broker()
{
    return std::unique_ptr<board_broker>{new board_broker_impl()};
}
