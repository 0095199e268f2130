//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_BOARD_QUERY_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_BOARD_QUERY_HPP

#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <map>
#include <vector>

#include "board_view.hpp"
#include "events.hpp"

// The per-session query state. A session subscribes to live events first and
// requests a replay afterwards, so live events may arrive before, after or
// overlapping the replay. board_query orders both sources by position so every
// event is applied exactly once and in board order.

namespace poker {

class board_query
{
public:
    // Handles a live event at the given position.
    // Returns true if the view changed as a result.
    bool on_live_event(std::size_t position, const board_modified_event& evt);

    // Handles a replay of the full event sequence. The replay is authoritative
    // for the positions it covers. Returns true, since the client must always
    // get the resulting view.
    bool on_replay(const std::vector<board_modified_event>& events);

    // Whether a replay has been received yet
    bool is_live() const noexcept { return boost::variant2::holds_alternative<live_state>(state_); }

    // The current view. Only meaningful if is_live()
    const board_view& view() const noexcept;

    // Number of events applied to view()
    std::size_t next_position() const noexcept;

    // Number of live events held because they can't be applied yet
    std::size_t pending_size() const noexcept { return pending_.size(); }

private:
    struct initial_state
    {
    };
    struct live_state
    {
        board_view view;
        std::size_t next{};
    };

    boost::variant2::variant<initial_state, live_state> state_;

    // Live events that arrived ahead of the current position, by position
    std::map<std::size_t, board_modified_event> pending_;

    // Applies every pending event that became contiguous with the view.
    // Returns true if the view changed
    bool drain_pending(live_state& st);
};

}  // namespace poker

#endif
