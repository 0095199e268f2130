//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "aggregate.hpp"

#include <boost/variant2/variant.hpp>

#include <type_traits>

#include "events.hpp"

using namespace poker;

void board_aggregate::apply(const board_modified_event& evt)
{
    if (const auto* added = boost::variant2::get_if<participant_added>(&evt))
    {
        participants_.insert_or_assign(added->participant_id, participant{added->participant_name});
    }
    else if (const auto* removed = boost::variant2::get_if<participant_removed>(&evt))
    {
        auto it = participants_.find(removed->participant_id);
        if (it != participants_.end())
            participants_.erase(it);
    }
}

void vote_type_list::apply(const vote_type_event& evt)
{
    const auto& added = boost::variant2::get<vote_type_added>(evt);
    vote_types_.insert_or_assign(added.vote_type_id, added.validation);
}

void combined_aggregate::apply(const combined_event& evt)
{
    boost::variant2::visit(
        [this](const auto& inner) {
            using T = std::decay_t<decltype(inner)>;
            if constexpr (std::is_same_v<T, board_modified_event>)
                board_.apply(inner);
            else
                vote_types_.apply(inner);
        },
        evt
    );
}
