//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_BOARD_VIEW_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_BOARD_VIEW_HPP

#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "events.hpp"

// The query-side model of a board, served to clients. It is folded from
// the same events as board_aggregate, but tracks votes and voting progress.

namespace poker {

// Statistics over the numeric votes of a completed round
struct vote_stats
{
    std::uint8_t average;  // median of the non-zero votes
    std::uint8_t max;
    std::uint8_t min;

    bool operator==(const vote_stats&) const = default;
};

// A participant, as shown to clients
struct participant_presentation
{
    std::string name;
    std::optional<std::uint8_t> vote;

    bool operator==(const participant_presentation&) const = default;
};

// What clients get to see about a board
struct board_presentation
{
    std::vector<participant_presentation> participants;
    bool voting_complete{};

    // Only present when voting is complete and there is at least a non-zero vote
    std::optional<vote_stats> stats;

    bool operator==(const board_presentation&) const = default;
};

class board_view
{
public:
    using event_type = board_modified_event;

    // Applies a single event in place. Returns true if the state changed
    bool apply(const board_modified_event& evt);

    // Renders the current state
    board_presentation present() const;

    bool voting_complete() const noexcept { return voting_complete_; }
    std::size_t number_voted() const noexcept { return number_voted_; }
    std::size_t num_participants() const noexcept { return participants_.size(); }

    bool operator==(const board_view&) const = default;

private:
    struct participant
    {
        std::string id;
        std::string name;
        std::optional<std::uint8_t> vote;

        std::string_view id_sv() const noexcept { return id; }

        bool operator==(const participant&) const = default;
    };

    // Participants are presented in insertion order, but we need efficient
    // lookup by ID, too.
    // clang-format off
    using container_type = boost::multi_index::multi_index_container<
        participant,
        boost::multi_index::indexed_by<
            // Insertion order
            boost::multi_index::sequenced<>,
            // Index by participant ID
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<participant, std::string_view, &participant::id_sv>,
                std::less<>
            >
        >
    >;
    // clang-format on

    container_type participants_;
    std::size_t number_voted_{};
    bool voting_complete_{};

    bool on_vote(const participant_voted& evt);
    void update_voting_complete();
};

}  // namespace poker

#endif
