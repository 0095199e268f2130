//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/retry_policy.hpp"

#include <boost/test/unit_test.hpp>
#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

using namespace poker;
using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(retry_policy_)

BOOST_AUTO_TEST_CASE(no_retry_)
{
    retry_policy policy(no_retry());
    BOOST_TEST((policy.next() == retry_instruction(abort_retry{})));
    BOOST_TEST(policy.retry_count() == 1u);
}

BOOST_AUTO_TEST_CASE(fixed_retry_)
{
    retry_policy policy(fixed_retry(10ms, 2));

    BOOST_TEST((policy.next() == retry_instruction(retry_after{10ms})));
    BOOST_TEST((policy.next() == retry_instruction(retry_after{10ms})));
    BOOST_TEST((policy.next() == retry_instruction(abort_retry{})));
    BOOST_TEST((policy.next() == retry_instruction(abort_retry{})));
    BOOST_TEST(policy.retry_count() == 4u);
}

BOOST_AUTO_TEST_CASE(fixed_retry_zero_retries)
{
    retry_policy policy(fixed_retry(0ms, 0));
    BOOST_TEST((policy.next() == retry_instruction(abort_retry{})));
}

// The strategy sees the previous instruction and the number of retries so far
BOOST_AUTO_TEST_CASE(custom_strategy)
{
    std::optional<retry_instruction> seen_previous;
    std::uint8_t seen_count = 0;
    retry_policy policy([&](const std::optional<retry_instruction>& previous, std::uint8_t count) {
        seen_previous = previous;
        seen_count = count;
        return retry_instruction(retry_after{std::chrono::milliseconds(count * 100)});
    });

    policy.next();
    BOOST_TEST(!seen_previous.has_value());
    BOOST_TEST(seen_count == 0u);

    policy.next();
    BOOST_TEST_REQUIRE(seen_previous.has_value());
    BOOST_TEST((*seen_previous == retry_instruction(retry_after{0ms})));
    BOOST_TEST(seen_count == 1u);

    BOOST_TEST((policy.next() == retry_instruction(retry_after{200ms})));
}

BOOST_AUTO_TEST_SUITE_END()
