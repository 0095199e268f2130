//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "board_view.hpp"

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "aggregate.hpp"
#include "events.hpp"
#include "test_utils.hpp"

using namespace poker;
using namespace poker::test;

namespace {

// Two participants that have both voted
std::vector<board_modified_event> complete_round()
{
    return {
        added("p1", "Ann"),
        added("p2", "Bo"),
        voted("p1", 3),
        voted("p2", 5),
    };
}

}  // namespace

BOOST_AUTO_TEST_SUITE(board_view_)

BOOST_AUTO_TEST_CASE(empty)
{
    board_view view;
    auto pres = view.present();
    BOOST_TEST(pres.participants.empty());
    BOOST_TEST(!pres.voting_complete);
    BOOST_TEST(!pres.stats.has_value());
}

BOOST_AUTO_TEST_CASE(add_and_vote)
{
    auto pres = source<board_view>(complete_round()).present();

    const std::vector<participant_presentation> expected{
        {"Ann", 3},
        {"Bo",  5},
    };
    BOOST_TEST((pres.participants == expected));
    BOOST_TEST(pres.voting_complete);
    BOOST_TEST_REQUIRE(pres.stats.has_value());
    BOOST_TEST(pres.stats->min == 3u);
    BOOST_TEST(pres.stats->max == 5u);
    BOOST_TEST(pres.stats->average == 5u);  // element at index 1 of [3, 5]
}

BOOST_AUTO_TEST_CASE(partial_vote)
{
    auto view = source<board_view>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        added("p2", "Bo"),
        voted("p1", 3),
    });
    auto pres = view.present();

    BOOST_TEST(!pres.voting_complete);
    BOOST_TEST(!pres.stats.has_value());
    BOOST_TEST((pres.participants[0].vote == std::optional<std::uint8_t>(3)));
    BOOST_TEST(!pres.participants[1].vote.has_value());
    BOOST_TEST(view.number_voted() == 1u);
}

BOOST_AUTO_TEST_CASE(clear_votes_resets_completion)
{
    auto events = complete_round();
    events.push_back(votes_cleared{});
    auto view = source<board_view>(events);
    auto pres = view.present();

    BOOST_TEST(!pres.voting_complete);
    BOOST_TEST(!pres.stats.has_value());
    BOOST_TEST_REQUIRE(pres.participants.size() == 2u);
    BOOST_TEST(!pres.participants[0].vote.has_value());
    BOOST_TEST(!pres.participants[1].vote.has_value());
    BOOST_TEST(view.number_voted() == 0u);
}

// Zero votes count towards completion but are excluded from statistics
BOOST_AUTO_TEST_CASE(zero_votes_excluded_from_stats)
{
    auto pres = source<board_view>(std::vector<board_modified_event>{
                                       added("p1", "Ann"),
                                       added("p2", "Bo"),
                                       added("p3", "Cy"),
                                       voted("p1", 0),
                                       voted("p2", 8),
                                       voted("p3", 2),
                                   })
                    .present();

    BOOST_TEST(pres.voting_complete);
    BOOST_TEST_REQUIRE(pres.stats.has_value());
    BOOST_TEST(pres.stats->min == 2u);
    BOOST_TEST(pres.stats->max == 8u);
    BOOST_TEST(pres.stats->average == 8u);
}

BOOST_AUTO_TEST_CASE(only_zero_votes_no_stats)
{
    auto pres = source<board_view>(std::vector<board_modified_event>{
                                       added("p1", "Ann"),
                                       voted("p1", 0),
                                   })
                    .present();

    BOOST_TEST(pres.voting_complete);
    BOOST_TEST(!pres.stats.has_value());
}

BOOST_AUTO_TEST_CASE(revote_doesnt_double_count)
{
    auto view = source<board_view>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        added("p2", "Bo"),
        voted("p1", 3),
        voted("p1", 8),
    });

    BOOST_TEST(view.number_voted() == 1u);
    BOOST_TEST(!view.voting_complete());
    BOOST_TEST((view.present().participants[0].vote == std::optional<std::uint8_t>(8)));
}

// Votes by unknown participants and votes that aren't numbers are ignored
BOOST_AUTO_TEST_CASE(ignored_votes)
{
    auto base = source<board_view>(std::vector<board_modified_event>{added("p1", "Ann")});
    auto view = base;
    view.apply(voted("ghost", 3));
    view.apply(participant_voted{
        "p1",
        ballot{"1", vote_value(std::string("XL"))}
    });

    BOOST_TEST((view == base));
}

BOOST_AUTO_TEST_CASE(participants_in_insertion_order)
{
    auto pres = source<board_view>(std::vector<board_modified_event>{
                                       added("z", "Zoe"),
                                       added("a", "Al"),
                                       added("m", "Mo"),
                                       removed("a"),
                                   })
                    .present();

    BOOST_TEST_REQUIRE(pres.participants.size() == 2u);
    BOOST_TEST(pres.participants[0].name == "Zoe");
    BOOST_TEST(pres.participants[1].name == "Mo");
}

// A participant joining after everyone voted doesn't reopen the round
BOOST_AUTO_TEST_CASE(late_join_keeps_voting_complete)
{
    auto events = complete_round();
    events.push_back(added("p3", "Cy"));
    auto pres = source<board_view>(events).present();

    BOOST_TEST(pres.voting_complete);
    BOOST_TEST_REQUIRE(pres.participants.size() == 3u);
    BOOST_TEST(!pres.participants[2].vote.has_value());
    BOOST_TEST(pres.stats.has_value());
}

// Removing a participant that voted doesn't decrement the vote count,
// but completion only looks at the participants still on the board
BOOST_AUTO_TEST_CASE(remove_keeps_vote_count)
{
    auto view = source<board_view>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        added("p2", "Bo"),
        added("p3", "Cy"),
        voted("p1", 3),
        removed("p1"),
        voted("p2", 5),
    });

    // Cy hasn't voted yet
    BOOST_TEST(view.num_participants() == 2u);
    BOOST_TEST(view.number_voted() == 2u);
    BOOST_TEST(!view.voting_complete());
    BOOST_TEST(!view.present().stats.has_value());
}

// A voter leaves, then the remaining participants finish voting
BOOST_AUTO_TEST_CASE(voter_leaves_then_round_completes)
{
    auto pres = source<board_view>(std::vector<board_modified_event>{
                                       added("p1", "Ann"),
                                       added("p2", "Bo"),
                                       added("p3", "Cy"),
                                       voted("p1", 3),
                                       voted("p2", 5),
                                       removed("p1"),
                                       voted("p3", 8),
                                   })
                    .present();

    BOOST_TEST(pres.voting_complete);
    BOOST_TEST_REQUIRE(pres.stats.has_value());
    BOOST_TEST(pres.stats->min == 5u);
    BOOST_TEST(pres.stats->max == 8u);
    BOOST_TEST(pres.stats->average == 8u);
}

// The only participant that hadn't voted leaves
BOOST_AUTO_TEST_CASE(pending_participant_leaves)
{
    auto view = source<board_view>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        added("p2", "Bo"),
        added("p3", "Cy"),
        voted("p1", 3),
        voted("p2", 5),
    });
    BOOST_TEST(!view.voting_complete());

    view.apply(removed("p3"));

    BOOST_TEST(view.voting_complete());
    BOOST_TEST_REQUIRE(view.present().stats.has_value());
    BOOST_TEST(view.present().stats->average == 5u);
}

// Everyone leaves. An empty board is never complete
BOOST_AUTO_TEST_CASE(everyone_leaves)
{
    auto view = source<board_view>(std::vector<board_modified_event>{
        added("p1", "Ann"),
        removed("p1"),
    });

    BOOST_TEST(!view.voting_complete());
}

// A vote after a late join doesn't reopen the round either
BOOST_AUTO_TEST_CASE(revote_after_late_join_keeps_voting_complete)
{
    auto events = complete_round();
    events.push_back(added("p3", "Cy"));
    events.push_back(voted("p1", 8));

    BOOST_TEST(source<board_view>(events).voting_complete());
}

BOOST_AUTO_TEST_CASE(apply_reports_changes)
{
    struct
    {
        const char* name;
        board_modified_event evt;
        bool expected;
    } test_cases[] = {
        {"new participant",      added("p3", "Cy"),                                     true },
        {"existing participant", added("p1", "Ann"),                                    false},
        {"new vote",             voted("p2", 5),                                        true },
        {"changed vote",         voted("p1", 8),                                        true },
        {"same vote",            voted("p1", 3),                                        false},
        {"unknown voter",        voted("ghost", 3),                                     false},
        {"removal",              removed("p1"),                                         true },
        {"unknown removal",      removed("ghost"),                                      false},
        {"clear votes",          votes_cleared{},                                       true },
        {"negative event",       participant_could_not_vote{"ghost", {participant_does_not_exist{}}}, false},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auto view = source<board_view>(std::vector<board_modified_event>{
                added("p1", "Ann"),
                added("p2", "Bo"),
                voted("p1", 3),
            });
            BOOST_TEST(view.apply(tc.evt) == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(clear_on_empty_round_is_no_change)
{
    auto view = source<board_view>(std::vector<board_modified_event>{added("p1", "Ann")});
    BOOST_TEST(!view.apply(votes_cleared{}));
}

BOOST_AUTO_TEST_SUITE_END()
