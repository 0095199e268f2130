//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "board_view.hpp"

#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

#include "events.hpp"

using namespace poker;

bool board_view::apply(const board_modified_event& evt)
{
    if (const auto* added = boost::variant2::get_if<participant_added>(&evt))
    {
        // voting_complete is left untouched: a late joiner doesn't reopen
        // a completed round. Only clearing votes does.
        return participants_
            .push_back(participant{added->participant_id, added->participant_name, std::nullopt})
            .second;
    }
    else if (const auto* removed = boost::variant2::get_if<participant_removed>(&evt))
    {
        // number_voted keeps counting the removed participant's vote
        auto& by_id = participants_.get<1>();
        auto it = by_id.find(std::string_view(removed->participant_id));
        if (it == by_id.end())
            return false;
        by_id.erase(it);

        // The participant we were waiting for may have left
        update_voting_complete();
        return true;
    }
    else if (const auto* voted = boost::variant2::get_if<participant_voted>(&evt))
    {
        return on_vote(*voted);
    }
    else if (boost::variant2::holds_alternative<votes_cleared>(evt))
    {
        bool changed = voting_complete_ || number_voted_ != 0u;
        for (auto it = participants_.begin(); it != participants_.end(); ++it)
        {
            if (it->vote.has_value())
            {
                participants_.modify(it, [](participant& p) { p.vote.reset(); });
                changed = true;
            }
        }
        number_voted_ = 0;
        voting_complete_ = false;
        return changed;
    }

    // Negative events don't affect the view
    return false;
}

bool board_view::on_vote(const participant_voted& evt)
{
    // Only numeric votes are tracked
    const auto* value = boost::variant2::get_if<std::uint8_t>(&evt.vote.value);
    if (!value)
        return false;

    auto& by_id = participants_.get<1>();
    auto it = by_id.find(std::string_view(evt.participant_id));
    if (it == by_id.end())
        return false;

    if (it->vote == *value)
        return false;
    if (!it->vote.has_value())
        ++number_voted_;
    by_id.modify(it, [value](participant& p) { p.vote = *value; });
    update_voting_complete();
    return true;
}

void board_view::update_voting_complete()
{
    // Computed over the current participants, since removed participants
    // are still counted by number_voted. Never reset here: late joiners
    // don't reopen a completed round.
    if (participants_.empty())
        return;
    bool all_voted = std::all_of(participants_.begin(), participants_.end(), [](const participant& p) {
        return p.vote.has_value();
    });
    if (all_voted)
        voting_complete_ = true;
}

board_presentation board_view::present() const
{
    board_presentation res;
    res.voting_complete = voting_complete_;

    std::vector<std::uint8_t> votes;
    res.participants.reserve(participants_.size());
    for (const auto& p : participants_)
    {
        res.participants.push_back(participant_presentation{p.name, p.vote});
        if (p.vote.has_value() && *p.vote != 0u)
            votes.push_back(*p.vote);
    }

    // Statistics are only meaningful once everyone has voted
    if (voting_complete_ && !votes.empty())
    {
        std::sort(votes.begin(), votes.end());
        res.stats = vote_stats{votes[votes.size() / 2], votes.back(), votes.front()};
    }

    return res;
}
