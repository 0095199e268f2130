//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "commands.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/variant2/variant.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "aggregate.hpp"
#include "events.hpp"

using namespace poker;

namespace {

// Vote validators. Each returns the reason why the vote should be rejected, if any.
// All validators run, so a rejected vote reports every reason at once.
using vote_validator = std::optional<participant_not_voted_reason> (*)(const combined_aggregate&, const cast_vote&);

std::optional<participant_not_voted_reason> be_valid_vote(const combined_aggregate& agg, const cast_vote& cmd)
{
    const auto* validation = agg.vote_types().find(cmd.vote.vote_type_id);
    if (!validation)
        return vote_type_does_not_exist{cmd.vote.vote_type_id};
    if (!is_valid_vote(*validation, cmd.vote.value))
        return invalid_vote{*validation, cmd.vote.value};
    return std::nullopt;
}

std::optional<participant_not_voted_reason> have_existing_participant(
    const combined_aggregate& agg,
    const cast_vote& cmd
)
{
    if (!agg.board().has_participant(cmd.participant_id))
        return participant_does_not_exist{};
    return std::nullopt;
}

constexpr vote_validator vote_validators[] = {be_valid_vote, have_existing_participant};

std::string generate_participant_id()
{
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

struct command_visitor
{
    const combined_aggregate& agg;

    std::vector<board_modified_event> operator()(const add_participant& cmd) const
    {
        if (cmd.participant_id.has_value() && agg.board().has_participant(*cmd.participant_id))
        {
            return {participant_not_added{*cmd.participant_id, participant_not_added_reason::already_exists}};
        }
        auto id = cmd.participant_id.has_value() ? *cmd.participant_id : generate_participant_id();
        return {participant_added{std::move(id), cmd.participant_name}};
    }

    std::vector<board_modified_event> operator()(const clear_votes&) const { return {votes_cleared{}}; }

    std::vector<board_modified_event> operator()(const remove_participant& cmd) const
    {
        if (!agg.board().has_participant(cmd.participant_id))
        {
            return {participant_could_not_be_removed{
                cmd.participant_id,
                participant_not_removed_reason::does_not_exist,
            }};
        }
        return {participant_removed{cmd.participant_id}};
    }

    std::vector<board_modified_event> operator()(const cast_vote& cmd) const
    {
        std::vector<participant_not_voted_reason> reasons;
        for (auto validator : vote_validators)
        {
            if (auto reason = validator(agg, cmd))
                reasons.push_back(std::move(*reason));
        }

        if (!reasons.empty())
            return {participant_could_not_vote{cmd.participant_id, std::move(reasons)}};
        return {participant_voted{cmd.participant_id, cmd.vote}};
    }

    std::vector<board_modified_event> operator()(const noop&) const { return {}; }
};

struct command_name_visitor
{
    std::string_view operator()(const add_participant&) const noexcept { return "AddParticipant"; }
    std::string_view operator()(const clear_votes&) const noexcept { return "ClearVotes"; }
    std::string_view operator()(const remove_participant&) const noexcept { return "RemoveParticipant"; }
    std::string_view operator()(const cast_vote&) const noexcept { return "Vote"; }
    std::string_view operator()(const noop&) const noexcept { return "Noop"; }
};

}  // namespace

std::vector<board_modified_event> poker::apply_command(const combined_aggregate& agg, const board_command& cmd)
{
    return boost::variant2::visit(command_visitor{agg}, cmd);
}

std::string_view poker::command_name(const board_command& cmd) noexcept
{
    return boost::variant2::visit(command_name_visitor{}, cmd);
}
