//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_API_API_TYPES_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>
#include <boost/json/value.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "board_view.hpp"
#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"

// This file contains type definitions for HTTP and websocket API objects.
// Enumerations and variants use external tagging: a variant alternative
// with data is an object with a single key, the alternative name, e.g.
// {"ParticipantVoted":{"vote":3}}. Alternatives without data may be
// sent as a plain string, e.g. "ClearVotes".
// Types for outgoing events are non-owning and lightweight,
// since they are only used as intermediate types for serialization.

namespace poker {

//
// Incoming messages (HTTP requests and websocket client events)
//

// Sent by the client to cast a numeric vote for the session's participant
struct vote_frame
{
    std::uint8_t vote;
};

// Sent by the client to get the full board state again
struct replay_request
{
};

// Sent by the client to run an arbitrary board command. The key is chosen
// by the client and echoed in the CommandResult or Error frame that answers it.
struct command_frame
{
    std::uint64_t key;
    board_command command;
};

// A variant that can represent any event that may be received from the client,
// or an error_code, if the client sent an invalid message
using any_client_event = boost::variant2::variant<
    error_code,  // Invalid, used to report errors
    vote_frame,
    replay_request,
    command_frame>;

// Parses a message received from the websocket client into a variant
// holding any of the valid client-side events.
any_client_event parse_client_event(std::string_view from);

// Parses the body of POST /board/{id}
result<board_command> parse_board_command(std::string_view from);

//
// Outgoing messages (HTTP responses and server events)
//

// Used within api_error, as a way to communicate specific error conditions
// to the client.
enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // The requested board doesn't exist
    not_found,

    // A long-poll requested events past the end of the board's log
    invalid_position,
};

// A REST API error. Used within HTTP error responses.
struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Event and presentation wire formats
boost::json::value event_to_json(const board_modified_event& evt);
boost::json::value events_to_json(boost::span<const board_modified_event> events);
boost::json::value presentation_to_json(const board_presentation& board);

// The response to GET /board/{id}/events and POST /board/{id}:
// a JSON array of events
struct events_response
{
    boost::span<const board_modified_event> events;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// The response to GET /board/{id}
struct board_response
{
    const board_presentation& board;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Sent to the client every time its view of the board changes
struct query_updated_event
{
    const board_presentation& board;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Sent to the client with the events emitted by one of its commands.
// Keyed commands get {"CommandResult":{"key":N,"events":[...]}}
struct command_result_event
{
    boost::span<const board_modified_event> events;
    std::optional<std::uint64_t> key{};

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Sent to the client when something went wrong.
// Failed keyed commands get {"Error":{"key":N,"message":"..."}}
struct error_event
{
    std::string_view message;
    std::optional<std::uint64_t> key{};

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

}  // namespace poker

#endif
