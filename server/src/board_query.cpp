//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "board_query.hpp"

#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <utility>
#include <vector>

#include "aggregate.hpp"
#include "board_view.hpp"
#include "events.hpp"

using namespace poker;

static const board_view empty_view{};

bool board_query::drain_pending(live_state& st)
{
    bool changed = false;
    auto it = pending_.begin();
    while (it != pending_.end() && it->first <= st.next)
    {
        // Events already covered by the view are dropped
        if (it->first == st.next)
        {
            changed = st.view.apply(it->second) || changed;
            ++st.next;
        }
        it = pending_.erase(it);
    }
    return changed;
}

bool board_query::on_live_event(std::size_t position, const board_modified_event& evt)
{
    auto* st = boost::variant2::get_if<live_state>(&state_);
    if (!st)
    {
        // Hold it until the replay arrives
        pending_.emplace(position, evt);
        return false;
    }

    if (position < st->next)
        return false;

    pending_.emplace(position, evt);
    return drain_pending(*st);
}

bool board_query::on_replay(const std::vector<board_modified_event>& events)
{
    live_state st{source<board_view>(events), events.size()};
    drain_pending(st);
    state_ = std::move(st);
    return true;
}

const board_view& board_query::view() const noexcept
{
    const auto* st = boost::variant2::get_if<live_state>(&state_);
    return st ? st->view : empty_view;
}

std::size_t board_query::next_position() const noexcept
{
    const auto* st = boost::variant2::get_if<live_state>(&state_);
    return st ? st->next : 0u;
}
