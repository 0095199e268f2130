//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

using namespace poker;

template <class Int>
static result_with_message<Int> parse_env_number(const char* name, std::string_view value)
{
    Int res{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), res);
    if (ec != std::errc() || ptr != value.data() + value.size())
    {
        return error_with_message{
            errc::invalid_config,
            std::string(name) + ": expected a non-negative integer, got '" + std::string(value) + "'"
        };
    }
    return res;
}

std::vector<std::string> poker::split_vote_types(std::string_view value)
{
    std::vector<std::string> res;
    while (!value.empty())
    {
        auto pos = value.find(',');
        auto item = value.substr(0, pos);
        if (!item.empty())
            res.emplace_back(item);
        if (pos == std::string_view::npos)
            break;
        value.remove_prefix(pos + 1);
    }
    return res;
}

result_with_message<application_config> poker::apply_environment(application_config cfg)
{
    if (const char* value = std::getenv("POKER_VOTE_TYPES"))
        cfg.vote_types = split_vote_types(value);

    if (const char* value = std::getenv("POKER_RETRY_ATTEMPTS"))
    {
        auto num = parse_env_number<std::uint8_t>("POKER_RETRY_ATTEMPTS", value);
        if (num.has_error())
            return num.error();
        cfg.retry_attempts = *num;
    }

    if (const char* value = std::getenv("POKER_RETRY_DELAY_MS"))
    {
        auto num = parse_env_number<std::uint32_t>("POKER_RETRY_DELAY_MS", value);
        if (num.has_error())
            return num.error();
        cfg.retry_delay = std::chrono::milliseconds(*num);
    }

    if (const char* value = std::getenv("POKER_POLL_INTERVAL_MS"))
    {
        auto num = parse_env_number<std::uint32_t>("POKER_POLL_INTERVAL_MS", value);
        if (num.has_error())
            return num.error();

        if (*num == 0u)
            return error_with_message{errc::invalid_config, "POKER_POLL_INTERVAL_MS: must be positive"};
        cfg.poll_interval = std::chrono::milliseconds(*num);
    }

    return cfg;
}
