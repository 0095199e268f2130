//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

using namespace poker;

retry_strategy poker::no_retry()
{
    return [](const std::optional<retry_instruction>&, std::uint8_t) -> retry_instruction {
        return abort_retry{};
    };
}

retry_strategy poker::fixed_retry(std::chrono::milliseconds delay, std::uint8_t max_retries)
{
    return [delay, max_retries](const std::optional<retry_instruction>&, std::uint8_t retry_count
           ) -> retry_instruction {
        if (retry_count < max_retries)
            return retry_after{delay};
        return abort_retry{};
    };
}

retry_instruction retry_policy::next()
{
    auto res = strategy_(previous_, retry_count_);
    if (retry_count_ < std::numeric_limits<std::uint8_t>::max())
        ++retry_count_;
    previous_ = res;
    return res;
}
