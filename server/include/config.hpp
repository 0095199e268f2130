//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_CONFIG_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace poker {

// Server-wide settings
struct application_config
{
    // Where the server listens
    std::string ip;
    unsigned short port{};

    // Vote types available in every board (POKER_VOTE_TYPES)
    std::vector<std::string> vote_types{"1"};

    // How many times a command is retried on transient errors (POKER_RETRY_ATTEMPTS)
    std::uint8_t retry_attempts{0};

    // Delay between command retries (POKER_RETRY_DELAY_MS)
    std::chrono::milliseconds retry_delay{0};

    // How often subscribed boards are polled for new events (POKER_POLL_INTERVAL_MS)
    std::chrono::milliseconds poll_interval{1000};
};

// Splits a comma-separated list, skipping empty items
std::vector<std::string> split_vote_types(std::string_view value);

// Overrides the fields in cfg that have an environment variable set.
// Fails with errc::invalid_config if a variable holds an invalid value.
result_with_message<application_config> apply_environment(application_config cfg);

}  // namespace poker

#endif
