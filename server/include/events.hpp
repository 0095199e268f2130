//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_EVENTS_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_EVENTS_HPP

#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Event types stored in the event logs. Events are immutable records of
// a single change on a board. Negative events record a command that was
// rejected and don't change any state.

namespace poker {

// The value of a vote. Either a number or a free-form string
using vote_value = boost::variant2::variant<std::uint8_t, std::string>;

// How votes of a certain type are validated
enum class vote_validation
{
    any_number,
};

// Returns true if value is acceptable under the given validation
bool is_valid_vote(vote_validation validation, const vote_value& value) noexcept;

// A vote cast by a participant
struct ballot
{
    std::string vote_type_id;
    vote_value value;

    bool operator==(const ballot&) const = default;
};

//
// Board modified events
//

struct participant_added
{
    std::string participant_id;
    std::string participant_name;

    bool operator==(const participant_added&) const = default;
};

enum class participant_not_added_reason
{
    already_exists,
};

struct participant_not_added
{
    std::string participant_id;
    participant_not_added_reason reason;

    bool operator==(const participant_not_added&) const = default;
};

struct participant_removed
{
    std::string participant_id;

    bool operator==(const participant_removed&) const = default;
};

enum class participant_not_removed_reason
{
    does_not_exist,
};

struct participant_could_not_be_removed
{
    std::string participant_id;
    participant_not_removed_reason reason;

    bool operator==(const participant_could_not_be_removed&) const = default;
};

struct participant_voted
{
    std::string participant_id;
    ballot vote;

    bool operator==(const participant_voted&) const = default;
};

// Reasons why a vote may be rejected
struct participant_does_not_exist
{
    bool operator==(const participant_does_not_exist&) const = default;
};

struct vote_type_does_not_exist
{
    std::string vote_type_id;

    bool operator==(const vote_type_does_not_exist&) const = default;
};

struct invalid_vote
{
    vote_validation expected;
    vote_value received;

    bool operator==(const invalid_vote&) const = default;
};

using participant_not_voted_reason = boost::variant2::
    variant<participant_does_not_exist, vote_type_does_not_exist, invalid_vote>;

struct participant_could_not_vote
{
    std::string participant_id;
    std::vector<participant_not_voted_reason> reasons;

    bool operator==(const participant_could_not_vote&) const = default;
};

struct votes_cleared
{
    bool operator==(const votes_cleared&) const = default;
};

using board_modified_event = boost::variant2::variant<
    participant_added,
    participant_not_added,
    participant_removed,
    participant_could_not_be_removed,
    participant_voted,
    participant_could_not_vote,
    votes_cleared>;

//
// Vote type events
//

struct vote_type_added
{
    std::string vote_type_id;
    vote_validation validation;

    bool operator==(const vote_type_added&) const = default;
};

using vote_type_event = boost::variant2::variant<vote_type_added>;

// Any event that can be stored for a board
using combined_event = boost::variant2::variant<board_modified_event, vote_type_event>;

// The name of the event, as used in the wire format (e.g. "ParticipantAdded")
std::string_view event_name(const board_modified_event& evt) noexcept;

// True for events recording a rejected command
bool is_negative(const board_modified_event& evt) noexcept;

}  // namespace poker

#endif
