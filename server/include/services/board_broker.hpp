//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_BOARD_BROKER_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_BOARD_BROKER_HPP

#include <boost/uuid/uuid.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "events.hpp"

// Per-board fan-out bookkeeping. Tracks the sessions subscribed to each board,
// the events they have been sent, and the sessions waiting for a replay.
// Events are pushed to subscribers in board order.

namespace poker {

using session_id = boost::uuids::uuid;

// Any subscriber must implement this interface. Callbacks are invoked while
// the broker is locked, so they must not block nor call back into the broker.
class board_subscriber
{
public:
    virtual ~board_subscriber() {}

    // A new event was appended to the board, at the given position
    virtual void on_board_event(std::size_t position, const board_modified_event& evt) = 0;

    // The full sequence of events, as requested by replay_onto
    virtual void on_replay(const std::vector<board_modified_event>& events) = 0;
};

// This is an interface to reduce compile times. Thread-safe.
class board_broker
{
    // Implementation of connect_guarded
    struct connection_deleter
    {
        board_broker& self;
        session_id id;

        void operator()(board_subscriber*) const noexcept { self.disconnect(id); }
    };

public:
    virtual ~board_broker() {}

    // Subscribes a session to a board, creating the board record if required.
    // The broker only holds a weak reference to the subscriber: subscribers
    // that have been destroyed are discarded on the next broadcast.
    virtual void connect(session_id id, std::string board_id, std::weak_ptr<board_subscriber> subscriber) = 0;

    // Removes a session. The board record is removed with its last session.
    // If the session doesn't exist, the function is a no-op.
    virtual void disconnect(session_id id) = 0;

    // Requests the full event sequence for the board to be delivered
    // to subscriber via on_replay. If the broker already knows the events,
    // this happens immediately. Otherwise, it happens on the next update_events.
    // If the board has no record, the function is a no-op.
    virtual void replay_onto(std::string_view board_id, std::weak_ptr<board_subscriber> subscriber) = 0;

    // Provides the latest event sequence for a board. The first sequence a board
    // receives is considered already seen. It's delivered to replay waiters, but not broadcast.
    virtual void update_events(std::string_view board_id, std::vector<board_modified_event> events) = 0;

    // Sends every event that hasn't been broadcast yet to all subscribers of the board.
    virtual void broadcast_changes(std::string_view board_id) = 0;

    // update_events followed by broadcast_changes, atomically
    virtual void publish(std::string_view board_id, std::vector<board_modified_event> events) = 0;

    // Returns the IDs of all boards with at least a subscriber
    virtual std::vector<std::string> subscribed_boards() const = 0;

    // Returns the number of sessions subscribed to a board
    virtual std::size_t subscriber_count(std::string_view board_id) const = 0;

    // RAII-style connect. When the guard is destroyed, the session is disconnected.
    using connection_guard = std::unique_ptr<board_subscriber, connection_deleter>;
    connection_guard connect_guarded(session_id id, std::string board_id, std::shared_ptr<board_subscriber> subscriber)
    {
        auto* ptr = subscriber.get();
        connect(id, std::move(board_id), subscriber);
        return connection_guard(ptr, connection_deleter{*this, id});
    }
};

// Creates a concrete board_broker
std::unique_ptr<board_broker> create_board_broker();

}  // namespace poker

#endif
