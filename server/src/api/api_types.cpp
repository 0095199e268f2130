//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "board_view.hpp"
#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"

using namespace poker;

namespace poker {

//
// BOOST_DESCRIBE_STRUCT is used to add reflection capabilities to structs.
// It's used by boost::json::value_to, value_from and try_value_from to
// automatically generate JSON parsing/serializing code.
//
// Describe metadata is defined in this .cpp file to reduce build times.
// Care must be taken to not redefine this metadata in other files, which is
// an ODR violation.
//
// Only types whose members map one to one to the wire format get metadata.
// Variants and enums use external tagging, which is handled by hand.
//

BOOST_DESCRIBE_STRUCT(vote_frame, (), (vote))
BOOST_DESCRIBE_STRUCT(remove_participant, (), (participant_id))
BOOST_DESCRIBE_STRUCT(participant_added, (), (participant_id, participant_name))
BOOST_DESCRIBE_STRUCT(participant_removed, (), (participant_id))

}  // namespace poker

namespace {

// We also define some helper structs with Describe metadata for outgoing
// types. This makes serialization code easier.

// API error wire format
struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

// An externally tagged value, either {"Tag": payload} or "Tag"
struct tagged_value
{
    std::string_view tag;

    // nullptr when the value was sent as a plain string
    const boost::json::value* payload;
};

}  // namespace

//
// Incoming types (HTTP requests, websocket client events)
//

static result<tagged_value> split_tagged(const boost::json::value& from, errc on_error)
{
    if (const auto* str = from.if_string())
        return tagged_value{*str, nullptr};

    const auto* obj = from.if_object();
    if (!obj || obj->size() != 1u)
        POKER_RETURN_ERROR(on_error)
    const auto& elm = *obj->begin();
    return tagged_value{elm.key(), &elm.value()};
}

// Alternatives without data accept "Tag", {"Tag":null} and {"Tag":{}}
static bool is_unit_payload(const boost::json::value* payload)
{
    if (!payload || payload->is_null())
        return true;
    const auto* obj = payload->if_object();
    return obj && obj->empty();
}

static result<std::string> parse_string_field(
    const boost::json::object& obj,
    std::string_view key,
    bool optional
)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null())
    {
        if (optional)
            return std::string();
        POKER_RETURN_ERROR(errc::request_parse_error)
    }
    const auto* str = it->value().if_string();
    if (!str)
        POKER_RETURN_ERROR(errc::request_parse_error)
    return std::string(*str);
}

static result<vote_value> parse_vote_value(const boost::json::value& from)
{
    auto tagged = split_tagged(from, errc::request_parse_error);
    if (tagged.has_error())
        return tagged.error();
    if (!tagged->payload)
        POKER_RETURN_ERROR(errc::request_parse_error)

    if (tagged->tag == "Number")
    {
        auto num = boost::json::try_value_to<std::uint8_t>(*tagged->payload);
        if (num.has_error())
            POKER_RETURN_ERROR(num.error())
        return vote_value(*num);
    }
    else if (tagged->tag == "String")
    {
        auto str = boost::json::try_value_to<std::string>(*tagged->payload);
        if (str.has_error())
            POKER_RETURN_ERROR(str.error())
        return vote_value(std::move(*str));
    }
    else
    {
        POKER_RETURN_ERROR(errc::request_parse_error)
    }
}

static result<ballot> parse_ballot(const boost::json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        POKER_RETURN_ERROR(errc::request_parse_error)

    auto vote_type_id = parse_string_field(*obj, "vote_type_id", false);
    if (vote_type_id.has_error())
        return vote_type_id.error();

    auto it = obj->find("value");
    if (it == obj->end())
        POKER_RETURN_ERROR(errc::request_parse_error)
    auto value = parse_vote_value(it->value());
    if (value.has_error())
        return value.error();

    return ballot{std::move(*vote_type_id), std::move(*value)};
}

static result<board_command> parse_add_participant(const boost::json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        POKER_RETURN_ERROR(errc::request_parse_error)

    auto name = parse_string_field(*obj, "participant_name", false);
    if (name.has_error())
        return name.error();

    // participant_id may be omitted or null
    add_participant res{std::move(*name), std::nullopt};
    auto it = obj->find("participant_id");
    if (it != obj->end() && !it->value().is_null())
    {
        auto id = parse_string_field(*obj, "participant_id", false);
        if (id.has_error())
            return id.error();
        res.participant_id = std::move(*id);
    }
    return board_command(std::move(res));
}

static result<board_command> parse_cast_vote(const boost::json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        POKER_RETURN_ERROR(errc::request_parse_error)

    auto participant_id = parse_string_field(*obj, "participant_id", false);
    if (participant_id.has_error())
        return participant_id.error();

    auto it = obj->find("vote");
    if (it == obj->end())
        POKER_RETURN_ERROR(errc::request_parse_error)
    auto vote = parse_ballot(it->value());
    if (vote.has_error())
        return vote.error();

    return board_command(cast_vote{std::move(*participant_id), std::move(*vote)});
}

static result<board_command> parse_board_command_value(const boost::json::value& msg)
{
    // Get the command type
    auto tagged = split_tagged(msg, errc::request_parse_error);
    if (tagged.has_error())
        return tagged.error();
    const auto* payload = tagged->payload;

    // Parse the command, depending on its type
    if (tagged->tag == "AddParticipant" && payload)
    {
        return parse_add_participant(*payload);
    }
    else if (tagged->tag == "ClearVotes" && is_unit_payload(payload))
    {
        return board_command(clear_votes{});
    }
    else if (tagged->tag == "RemoveParticipant" && payload)
    {
        auto cmd = boost::json::try_value_to<remove_participant>(*payload);
        if (cmd.has_error())
            POKER_RETURN_ERROR(cmd.error())
        return board_command(std::move(*cmd));
    }
    else if (tagged->tag == "Vote" && payload)
    {
        return parse_cast_vote(*payload);
    }
    else if (tagged->tag == "Noop" && is_unit_payload(payload))
    {
        return board_command(noop{});
    }
    else
    {
        // Unknown type
        POKER_RETURN_ERROR(errc::request_parse_error)
    }
}

result<board_command> poker::parse_board_command(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        POKER_RETURN_ERROR(ec)

    return parse_board_command_value(msg);
}

// {"key": N, "command": <board command>}
static result<command_frame> parse_command_frame(const boost::json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        POKER_RETURN_ERROR(errc::websocket_parse_error)

    auto key_it = obj->find("key");
    if (key_it == obj->end())
        POKER_RETURN_ERROR(errc::websocket_parse_error)
    auto key = boost::json::try_value_to<std::uint64_t>(key_it->value());
    if (key.has_error())
        POKER_RETURN_ERROR(key.error())

    auto cmd_it = obj->find("command");
    if (cmd_it == obj->end())
        POKER_RETURN_ERROR(errc::websocket_parse_error)
    auto cmd = parse_board_command_value(cmd_it->value());
    if (cmd.has_error())
        return cmd.error();

    return command_frame{*key, std::move(*cmd)};
}

any_client_event poker::parse_client_event(std::string_view from)
{
    error_code ec;

    // Parse the JSON
    auto msg = boost::json::parse(from, ec);
    if (ec)
        POKER_RETURN_ERROR(ec)

    // Get the message type
    auto tagged = split_tagged(msg, errc::websocket_parse_error);
    if (tagged.has_error())
        return tagged.error();

    // Parse the message, depending on its type
    if (tagged->tag == "ParticipantVoted" && tagged->payload)
    {
        // Parse the payload
        auto parsed_payload = boost::json::try_value_to<vote_frame>(*tagged->payload);
        if (parsed_payload.has_error())
            POKER_RETURN_ERROR(parsed_payload.error())
        return parsed_payload.value();
    }
    else if (tagged->tag == "Replay" && is_unit_payload(tagged->payload))
    {
        return replay_request{};
    }
    else if (tagged->tag == "Command" && tagged->payload)
    {
        auto frame = parse_command_frame(*tagged->payload);
        if (frame.has_error())
            return frame.error();
        return std::move(*frame);
    }
    else
    {
        // Unknown type
        POKER_RETURN_ERROR(errc::websocket_parse_error)
    }
}

//
// Outgoing types (HTTP responses, websocket server events)
//

static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::not_found: return "NOT_FOUND";
    case api_error_id::invalid_position: return "INVALID_POSITION";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

static std::string_view to_string(vote_validation input)
{
    switch (input)
    {
    case vote_validation::any_number:
    default: return "AnyNumber";
    }
}

std::string api_error::to_json() const
{
    wire_api_error err{to_string(error_id), error_message};
    return boost::json::serialize(boost::json::value_from(err));
}

static boost::json::value make_tagged(std::string_view tag, boost::json::value payload)
{
    boost::json::object res;
    res.emplace(tag, std::move(payload));
    return res;
}

static boost::json::value serialize_vote_value(const vote_value& input)
{
    return boost::variant2::visit(
        [](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::uint8_t>)
                return make_tagged("Number", static_cast<int>(value));
            else
                return make_tagged("String", boost::json::string_view(value));
        },
        input
    );
}

static boost::json::value serialize_ballot(const ballot& input)
{
    boost::json::object res;
    res.emplace("vote_type_id", input.vote_type_id);
    res.emplace("value", serialize_vote_value(input.value));
    return res;
}

static boost::json::value serialize_reason(const participant_not_voted_reason& input)
{
    struct visitor
    {
        boost::json::value operator()(const participant_does_not_exist&) const { return "DoesNotExist"; }
        boost::json::value operator()(const vote_type_does_not_exist& r) const
        {
            return make_tagged("VoteTypeDoesNotExist", boost::json::string_view(r.vote_type_id));
        }
        boost::json::value operator()(const invalid_vote& r) const
        {
            boost::json::object payload;
            payload.emplace("expected", to_string(r.expected));
            payload.emplace("received", serialize_vote_value(r.received));
            return make_tagged("InvalidVote", std::move(payload));
        }
    };
    return boost::variant2::visit(visitor{}, input);
}

namespace {

// Serializes the payload of an event. A null payload means that the
// event is serialized as a plain string holding its name.
struct event_payload_serializer
{
    boost::json::value operator()(const participant_added& evt) const { return boost::json::value_from(evt); }

    boost::json::value operator()(const participant_not_added& evt) const
    {
        return boost::json::object({
            {"participant_id", evt.participant_id},
            {"reason",         "AlreadyExists"   },
        });
    }

    boost::json::value operator()(const participant_removed& evt) const { return boost::json::value_from(evt); }

    boost::json::value operator()(const participant_could_not_be_removed& evt) const
    {
        return boost::json::object({
            {"participant_id", evt.participant_id},
            {"reason",         "DoesNotExist"    },
        });
    }

    boost::json::value operator()(const participant_voted& evt) const
    {
        boost::json::object payload;
        payload.emplace("participant_id", evt.participant_id);
        payload.emplace("vote", serialize_ballot(evt.vote));
        return payload;
    }

    boost::json::value operator()(const participant_could_not_vote& evt) const
    {
        boost::json::array reasons;
        reasons.reserve(evt.reasons.size());
        for (const auto& reason : evt.reasons)
            reasons.push_back(serialize_reason(reason));

        boost::json::object payload;
        payload.emplace("participant_id", evt.participant_id);
        payload.emplace("reasons", std::move(reasons));
        return payload;
    }

    boost::json::value operator()(const votes_cleared&) const { return nullptr; }
};

}  // namespace

boost::json::value poker::event_to_json(const board_modified_event& evt)
{
    auto payload = boost::variant2::visit(event_payload_serializer{}, evt);
    if (payload.is_null())
        return boost::json::string(event_name(evt));
    return make_tagged(event_name(evt), std::move(payload));
}

boost::json::value poker::events_to_json(boost::span<const board_modified_event> events)
{
    boost::json::array res;
    res.reserve(events.size());
    for (const auto& evt : events)
        res.push_back(event_to_json(evt));
    return res;
}

boost::json::value poker::presentation_to_json(const board_presentation& board)
{
    boost::json::array participants;
    participants.reserve(board.participants.size());
    for (const auto& p : board.participants)
    {
        boost::json::object elm;
        elm.emplace("name", p.name);
        if (p.vote)
            elm.emplace("vote", static_cast<int>(*p.vote));
        else
            elm.emplace("vote", nullptr);
        participants.push_back(std::move(elm));
    }

    boost::json::object res;
    res.emplace("participants", std::move(participants));
    res.emplace("voting_complete", board.voting_complete);

    // Stats are flattened into the top-level object, and omitted if absent
    if (board.stats)
    {
        res.emplace("average", static_cast<int>(board.stats->average));
        res.emplace("max", static_cast<int>(board.stats->max));
        res.emplace("min", static_cast<int>(board.stats->min));
    }
    return res;
}

std::string events_response::to_json() const { return boost::json::serialize(events_to_json(events)); }

std::string board_response::to_json() const { return boost::json::serialize(presentation_to_json(board)); }

std::string query_updated_event::to_json() const
{
    return boost::json::serialize(make_tagged("QueryUpdated", presentation_to_json(board)));
}

std::string command_result_event::to_json() const
{
    if (!key)
        return boost::json::serialize(make_tagged("CommandResult", events_to_json(events)));

    boost::json::object payload;
    payload.emplace("key", *key);
    payload.emplace("events", events_to_json(events));
    return boost::json::serialize(make_tagged("CommandResult", std::move(payload)));
}

std::string error_event::to_json() const
{
    if (!key)
        return boost::json::serialize(make_tagged("Error", boost::json::string_view(message)));

    boost::json::object payload;
    payload.emplace("key", *key);
    payload.emplace("message", boost::json::string_view(message));
    return boost::json::serialize(make_tagged("Error", std::move(payload)));
}
