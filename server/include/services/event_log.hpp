//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_EVENT_LOG_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_EVENT_LOG_HPP

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "events.hpp"

// Event stores. A store maps board IDs to append-only sequences of events.
// The position of an event within its sequence never changes.

namespace poker {

// Load/save interface, shared by all stores
template <class Event>
class event_log
{
public:
    using event_type = Event;

    virtual ~event_log() {}

    // Returns the full sequence of events for a board. An unknown board
    // yields an empty sequence.
    virtual boost::asio::awaitable<result<std::vector<Event>>> load(std::string_view key) = 0;

    // Replaces the sequence of events for a board. events must be an extension
    // of the sequence the caller loaded before computing it. Returns the stored sequence.
    virtual boost::asio::awaitable<result<std::vector<Event>>> save(
        std::string_view key,
        std::vector<Event> events
    ) = 0;
};

// The store for board modified events. Supports waiting for updates.
class board_event_log : public event_log<board_modified_event>
{
public:
    // Returns the events at positions >= since. If there are none yet,
    // suspends until the next save on key adds some.
    // Fails with errc::invalid_position if since is past the end of the log,
    // and with operation_aborted if the wait is cancelled.
    virtual boost::asio::awaitable<result<std::vector<board_modified_event>>> load_update(
        std::string_view key,
        std::size_t since
    ) = 0;

    // Number of boards with stored events
    virtual std::size_t board_count() const = 0;

    // Number of load_update calls currently waiting for a save
    virtual std::size_t waiter_count() const = 0;
};

// Creates an in-memory board store. It is safe to use from several threads.
// Saves that don't extend the stored sequence fail with errc::event_log_conflict.
std::unique_ptr<board_event_log> create_memory_event_log();

// Creates a read-only store that returns a VoteTypeAdded event per configured
// vote type, for every board. Saving to it has no effect.
std::unique_ptr<event_log<vote_type_event>> create_configured_vote_type_log(
    const std::vector<std::string>& vote_type_ids
);

// Composes a vote type store and a board store. Loading yields the vote type
// events first, then the board events. Saving splits the sequence back.
// The referenced stores must outlive the returned object.
std::unique_ptr<event_log<combined_event>> create_combined_event_log(
    event_log<vote_type_event>& vote_types,
    event_log<board_modified_event>& board
);

}  // namespace poker

#endif
