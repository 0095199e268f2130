//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

#include "error.hpp"

using namespace poker;
using string_vector = std::vector<std::string>;

namespace {

constexpr const char* variables[] = {
    "POKER_VOTE_TYPES",
    "POKER_RETRY_ATTEMPTS",
    "POKER_RETRY_DELAY_MS",
    "POKER_POLL_INTERVAL_MS",
};

// Makes sure tests don't see variables set by other tests or the environment
struct fixture
{
    fixture() { clear(); }
    ~fixture() { clear(); }

    static void clear()
    {
        for (const char* var : variables)
            ::unsetenv(var);
    }

    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(config_)

BOOST_AUTO_TEST_CASE(split_vote_types_)
{
    BOOST_TEST(split_vote_types("1") == string_vector{"1"}, boost::test_tools::per_element());
    BOOST_TEST(split_vote_types("1,fib,tshirt") == (string_vector{"1", "fib", "tshirt"}), boost::test_tools::per_element());
    BOOST_TEST(split_vote_types("1,,2,") == (string_vector{"1", "2"}), boost::test_tools::per_element());
    BOOST_TEST(split_vote_types("").empty());
}

BOOST_FIXTURE_TEST_CASE(defaults, fixture)
{
    auto res = apply_environment(application_config{"127.0.0.1", 8080});

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->ip == "127.0.0.1");
    BOOST_TEST(res->port == 8080u);
    BOOST_TEST(res->vote_types == string_vector{"1"}, boost::test_tools::per_element());
    BOOST_TEST(res->retry_attempts == 0u);
    BOOST_TEST(res->retry_delay.count() == 0);
    BOOST_TEST(res->poll_interval.count() == 1000);
}

BOOST_FIXTURE_TEST_CASE(from_environment, fixture)
{
    set("POKER_VOTE_TYPES", "1,fib");
    set("POKER_RETRY_ATTEMPTS", "3");
    set("POKER_RETRY_DELAY_MS", "20");
    set("POKER_POLL_INTERVAL_MS", "250");

    auto res = apply_environment(application_config{"127.0.0.1", 8080});

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->vote_types == (string_vector{"1", "fib"}), boost::test_tools::per_element());
    BOOST_TEST(res->retry_attempts == 3u);
    BOOST_TEST(res->retry_delay.count() == 20);
    BOOST_TEST(res->poll_interval.count() == 250);
}

BOOST_FIXTURE_TEST_CASE(invalid_number, fixture)
{
    set("POKER_RETRY_ATTEMPTS", "three");

    auto res = apply_environment(application_config{"127.0.0.1", 8080});

    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == error_code(errc::invalid_config));
}

BOOST_FIXTURE_TEST_CASE(out_of_range, fixture)
{
    set("POKER_RETRY_ATTEMPTS", "300");

    auto res = apply_environment(application_config{"127.0.0.1", 8080});

    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == error_code(errc::invalid_config));
}

BOOST_FIXTURE_TEST_CASE(zero_poll_interval, fixture)
{
    set("POKER_POLL_INTERVAL_MS", "0");

    auto res = apply_environment(application_config{"127.0.0.1", 8080});

    BOOST_TEST_REQUIRE(res.has_error());
    BOOST_TEST(res.error().ec == error_code(errc::invalid_config));
}

BOOST_AUTO_TEST_SUITE_END()
