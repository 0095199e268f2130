//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <future>
#include <thread>

#include "client.hpp"

using namespace poker::test;
namespace json = boost::json;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

constexpr const char* add_ann = R"%({"AddParticipant": {"participant_name": "Ann", "participant_id": "p1"}})%";
constexpr const char* add_bo = R"%({"AddParticipant": {"participant_name": "Bo", "participant_id": "p2"}})%";

}  // namespace

BOOST_AUTO_TEST_SUITE(http_integration)

BOOST_AUTO_TEST_CASE(execute_command)
{
    server_runner runner;

    auto res = runner.request(http::verb::post, "/board/b1", add_ann);

    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(
        json::parse(res.body) ==
        json::parse(R"%([{"ParticipantAdded": {"participant_id": "p1", "participant_name": "Ann"}}])%")
    );

    // Repeating it yields a negative event
    res = runner.request(http::verb::post, "/board/b1", add_ann);
    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(
        json::parse(res.body) ==
        json::parse(R"%([{"ParticipantNotAdded": {"participant_id": "p1", "reason": "AlreadyExists"}}])%")
    );
}

BOOST_AUTO_TEST_CASE(execute_command_errors)
{
    server_runner runner;

    // Invalid body
    auto res = runner.request(http::verb::post, "/board/b1", R"%({"Unknown": null})%");
    BOOST_TEST(res.status == http::status::bad_request);
    BOOST_TEST(json::parse(res.body).at("id") == "BAD_REQUEST");

    // Invalid content type
    res = runner.request(http::verb::post, "/board/b1", add_ann, "text/plain");
    BOOST_TEST(res.status == http::status::bad_request);
}

BOOST_AUTO_TEST_CASE(get_board)
{
    server_runner runner;
    runner.request(http::verb::post, "/board/b1", add_ann);
    runner.request(http::verb::post, "/board/b1", add_bo);
    runner.request(
        http::verb::post,
        "/board/b1",
        R"%({"Vote": {"participant_id": "p1", "vote": {"vote_type_id": "1", "value": {"Number": 3}}}})%"
    );

    auto res = runner.request(http::verb::get, "/board/b1");

    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(
        json::parse(res.body) == json::parse(R"%({
            "participants": [{"name": "Ann", "vote": 3}, {"name": "Bo", "vote": null}],
            "voting_complete": false
        })%")
    );
}

BOOST_AUTO_TEST_CASE(get_board_not_found)
{
    server_runner runner;

    auto res = runner.request(http::verb::get, "/board/unknown");

    BOOST_TEST(res.status == http::status::not_found);
    BOOST_TEST(json::parse(res.body).at("id") == "NOT_FOUND");
}

BOOST_AUTO_TEST_CASE(get_events)
{
    server_runner runner;
    runner.request(http::verb::post, "/board/b1", add_ann);
    runner.request(http::verb::post, "/board/b1", add_bo);

    // All events
    auto res = runner.request(http::verb::get, "/board/b1/events");
    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(json::parse(res.body).as_array().size() == 2u);

    // Events after a position
    res = runner.request(http::verb::get, "/board/b1/events?since=1");
    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(
        json::parse(res.body) ==
        json::parse(R"%([{"ParticipantAdded": {"participant_id": "p2", "participant_name": "Bo"}}])%")
    );

    // Past the end
    res = runner.request(http::verb::get, "/board/b1/events?since=5");
    BOOST_TEST(res.status == http::status::bad_request);
    BOOST_TEST(json::parse(res.body).at("id") == "INVALID_POSITION");

    // Not a number
    res = runner.request(http::verb::get, "/board/b1/events?since=abc");
    BOOST_TEST(res.status == http::status::bad_request);
}

// A long-poll at the end of the log completes when a command adds events
BOOST_AUTO_TEST_CASE(get_events_long_poll)
{
    server_runner runner;
    runner.request(http::verb::post, "/board/b1", add_ann);

    auto fut = std::async(std::launch::async, [&runner] {
        return runner.request(http::verb::get, "/board/b1/events?since=1");
    });

    // Give the request some time to reach the server
    std::this_thread::sleep_for(100ms);
    runner.request(http::verb::post, "/board/b1", add_bo);

    auto res = fut.get();
    BOOST_TEST(res.status == http::status::ok);
    BOOST_TEST(
        json::parse(res.body) ==
        json::parse(R"%([{"ParticipantAdded": {"participant_id": "p2", "participant_name": "Bo"}}])%")
    );
}

BOOST_AUTO_TEST_CASE(routing_errors)
{
    server_runner runner;

    BOOST_TEST(runner.request(http::verb::get, "/unknown").status == http::status::not_found);
    BOOST_TEST(runner.request(http::verb::delete_, "/board/b1").status == http::status::method_not_allowed);
}

BOOST_AUTO_TEST_SUITE_END()
