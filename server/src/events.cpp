//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "events.hpp"

#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string_view>

using namespace poker;

bool poker::is_valid_vote(vote_validation validation, const vote_value& value) noexcept
{
    switch (validation)
    {
    case vote_validation::any_number: return boost::variant2::holds_alternative<std::uint8_t>(value);
    default: return false;
    }
}

namespace {

struct event_name_visitor
{
    std::string_view operator()(const participant_added&) const noexcept { return "ParticipantAdded"; }
    std::string_view operator()(const participant_not_added&) const noexcept { return "ParticipantNotAdded"; }
    std::string_view operator()(const participant_removed&) const noexcept { return "ParticipantRemoved"; }
    std::string_view operator()(const participant_could_not_be_removed&) const noexcept
    {
        return "ParticipantCouldNotBeRemoved";
    }
    std::string_view operator()(const participant_voted&) const noexcept { return "ParticipantVoted"; }
    std::string_view operator()(const participant_could_not_vote&) const noexcept
    {
        return "ParticipantCouldNotVote";
    }
    std::string_view operator()(const votes_cleared&) const noexcept { return "VotesCleared"; }
};

}  // namespace

std::string_view poker::event_name(const board_modified_event& evt) noexcept
{
    return boost::variant2::visit(event_name_visitor{}, evt);
}

bool poker::is_negative(const board_modified_event& evt) noexcept
{
    return boost::variant2::holds_alternative<participant_not_added>(evt) ||
           boost::variant2::holds_alternative<participant_could_not_be_removed>(evt) ||
           boost::variant2::holds_alternative<participant_could_not_vote>(evt);
}
