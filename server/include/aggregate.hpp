//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_AGGREGATE_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_AGGREGATE_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "events.hpp"

// Command-side models. These are folded from the event log before a command
// runs, and are used to validate it. They are never persisted.
//
// Every model M exposes:
//   - M::event_type, the event it folds.
//   - void apply(const M::event_type&), which applies an event in place.
//   - A default constructor, yielding the state of an empty log.
// Models must be deterministic: folding a sequence yields the same
// state as folding any prefix and then applying the rest.

namespace poker {

// Folds a sequence of events into a model, starting from its default state
template <class Model, class EventRange>
Model source(const EventRange& events)
{
    Model res;
    for (const auto& evt : events)
        res.apply(evt);
    return res;
}

// The participants of a board, as seen when validating commands.
// Only tracks additions and removals: votes and negative events are no-ops.
class board_aggregate
{
public:
    using event_type = board_modified_event;

    struct participant
    {
        std::string name;

        bool operator==(const participant&) const = default;
    };

    using participant_map = std::map<std::string, participant, std::less<>>;

    void apply(const board_modified_event& evt);

    bool has_participant(std::string_view id) const { return participants_.find(id) != participants_.end(); }
    const participant_map& participants() const noexcept { return participants_; }

    bool operator==(const board_aggregate&) const = default;

private:
    participant_map participants_;
};

// The vote types available for a board
class vote_type_list
{
public:
    using event_type = vote_type_event;

    void apply(const vote_type_event& evt);

    // Returns the validation for the given vote type, or nullptr if it doesn't exist
    const vote_validation* find(std::string_view vote_type_id) const
    {
        auto it = vote_types_.find(vote_type_id);
        return it == vote_types_.end() ? nullptr : &it->second;
    }

    std::size_t size() const noexcept { return vote_types_.size(); }

    bool operator==(const vote_type_list&) const = default;

private:
    std::map<std::string, vote_validation, std::less<>> vote_types_;
};

// Everything a board command needs to be validated
class combined_aggregate
{
public:
    using event_type = combined_event;

    // Dispatches to the appropriate sub-model
    void apply(const combined_event& evt);

    const vote_type_list& vote_types() const noexcept { return vote_types_; }
    const board_aggregate& board() const noexcept { return board_; }

    bool operator==(const combined_aggregate&) const = default;

private:
    vote_type_list vote_types_;
    board_aggregate board_;
};

}  // namespace poker

#endif
