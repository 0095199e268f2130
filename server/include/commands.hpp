//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_COMMANDS_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_COMMANDS_HPP

#include <boost/variant2/variant.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aggregate.hpp"
#include "events.hpp"

// Commands that can be issued against a board. Applying a command is a pure
// function of the command-side aggregate. A command that fails validation
// yields a single negative event, never an error.

namespace poker {

struct add_participant
{
    std::string participant_name;

    // If not provided, a random UUID is generated
    std::optional<std::string> participant_id;

    bool operator==(const add_participant&) const = default;
};

struct clear_votes
{
    bool operator==(const clear_votes&) const = default;
};

struct remove_participant
{
    std::string participant_id;

    bool operator==(const remove_participant&) const = default;
};

struct cast_vote
{
    std::string participant_id;
    ballot vote;

    bool operator==(const cast_vote&) const = default;
};

struct noop
{
    bool operator==(const noop&) const = default;
};

using board_command = boost::variant2::variant<add_participant, clear_votes, remove_participant, cast_vote, noop>;

// Runs a command against the current state of a board, returning the events to append
std::vector<board_modified_event> apply_command(const combined_aggregate& agg, const board_command& cmd);

// The command name, as used in the wire format. Used for logging.
std::string_view command_name(const board_command& cmd) noexcept;

}  // namespace poker

#endif
