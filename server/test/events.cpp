//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "events.hpp"

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "aggregate.hpp"
#include "board_view.hpp"
#include "test_utils.hpp"

using namespace poker;
using namespace poker::test;

BOOST_AUTO_TEST_SUITE(events_)

BOOST_AUTO_TEST_CASE(is_valid_vote_any_number)
{
    BOOST_TEST(is_valid_vote(vote_validation::any_number, vote_value(std::uint8_t(0))));
    BOOST_TEST(is_valid_vote(vote_validation::any_number, vote_value(std::uint8_t(255))));
    BOOST_TEST(!is_valid_vote(vote_validation::any_number, vote_value(std::string("3"))));
}

BOOST_AUTO_TEST_CASE(event_name_)
{
    BOOST_TEST(event_name(added("p1", "Ann")) == "ParticipantAdded");
    BOOST_TEST(event_name(removed("p1")) == "ParticipantRemoved");
    BOOST_TEST(event_name(voted("p1", 3)) == "ParticipantVoted");
    BOOST_TEST(event_name(votes_cleared{}) == "VotesCleared");
    BOOST_TEST(
        event_name(participant_not_added{"p1", participant_not_added_reason::already_exists}) ==
        "ParticipantNotAdded"
    );
}

BOOST_AUTO_TEST_CASE(is_negative_)
{
    BOOST_TEST(is_negative(participant_not_added{"p1", participant_not_added_reason::already_exists}));
    BOOST_TEST(is_negative(participant_could_not_be_removed{"p1", participant_not_removed_reason::does_not_exist})
    );
    BOOST_TEST(is_negative(participant_could_not_vote{"p1", {participant_does_not_exist{}}}));
    BOOST_TEST(!is_negative(added("p1", "Ann")));
    BOOST_TEST(!is_negative(removed("p1")));
    BOOST_TEST(!is_negative(voted("p1", 1)));
    BOOST_TEST(!is_negative(votes_cleared{}));
}

//
// Projections
//

// Negative events leave every model untouched
BOOST_AUTO_TEST_CASE(negative_events_are_noops)
{
    const std::vector<board_modified_event> base{added("p1", "Ann"), voted("p1", 3)};
    const std::vector<board_modified_event> negatives{
        participant_not_added{"p1", participant_not_added_reason::already_exists},
        participant_could_not_be_removed{"p2", participant_not_removed_reason::does_not_exist},
        participant_could_not_vote{"p2", {participant_does_not_exist{}, vote_type_does_not_exist{"bad"}}},
    };

    auto with_negatives = base;
    with_negatives.insert(with_negatives.end(), negatives.begin(), negatives.end());

    BOOST_TEST((source<board_aggregate>(base) == source<board_aggregate>(with_negatives)));
    BOOST_TEST((source<board_view>(base) == source<board_view>(with_negatives)));
}

// Building a model twice from the same sequence yields equal models
BOOST_AUTO_TEST_CASE(sourcing_is_deterministic)
{
    const std::vector<board_modified_event> events{
        added("p1", "Ann"),
        added("p2", "Bo"),
        voted("p1", 3),
        removed("p2"),
        votes_cleared{},
        voted("p1", 8),
    };

    BOOST_TEST((source<board_view>(events) == source<board_view>(events)));
    BOOST_TEST((source<board_aggregate>(events) == source<board_aggregate>(events)));
}

BOOST_AUTO_TEST_CASE(board_aggregate_participants)
{
    auto agg = source<board_aggregate>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        added("p2", "Bo"),
        removed("p1"),
        removed("p3"),
    });

    BOOST_TEST(!agg.has_participant("p1"));
    BOOST_TEST(agg.has_participant("p2"));
    BOOST_TEST(agg.participants().size() == 1u);
    BOOST_TEST(agg.participants().at("p2").name == "Bo");
}

BOOST_AUTO_TEST_CASE(combined_aggregate_dispatch)
{
    auto agg = make_aggregate({"1", "2"}, {added("p1", "Ann")});

    BOOST_TEST(agg.vote_types().size() == 2u);
    BOOST_TEST_REQUIRE(agg.vote_types().find("1") != nullptr);
    BOOST_TEST((*agg.vote_types().find("1") == vote_validation::any_number));
    BOOST_TEST(agg.vote_types().find("bad") == nullptr);
    BOOST_TEST(agg.board().has_participant("p1"));
}

BOOST_AUTO_TEST_SUITE_END()
