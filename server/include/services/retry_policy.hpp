//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_RETRY_POLICY_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_RETRY_POLICY_HPP

#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

// Pluggable retry strategies for the command runner.

namespace poker {

// Retry the operation once the delay elapses
struct retry_after
{
    std::chrono::milliseconds delay;

    bool operator==(const retry_after&) const = default;
};

// Give up and report the last error
struct abort_retry
{
    bool operator==(const abort_retry&) const = default;
};

using retry_instruction = boost::variant2::variant<retry_after, abort_retry>;

// Decides what to do after a failed attempt. Gets passed the instruction
// it returned the previous time (empty after the first failure) and the
// number of retries performed so far.
using retry_strategy = std::function<
    retry_instruction(const std::optional<retry_instruction>& previous, std::uint8_t retry_count)>;

// Aborts on the first failure
retry_strategy no_retry();

// Retries up to max_retries times, waiting delay between attempts
retry_strategy fixed_retry(std::chrono::milliseconds delay, std::uint8_t max_retries);

// Carries a strategy's state across the attempts of a single execution.
// Create one per execution.
class retry_policy
{
    retry_strategy strategy_;
    std::uint8_t retry_count_{};
    std::optional<retry_instruction> previous_;

public:
    explicit retry_policy(retry_strategy strategy) : strategy_(std::move(strategy)) {}

    // Asks the strategy what to do after a failed attempt
    retry_instruction next();

    std::uint8_t retry_count() const noexcept { return retry_count_; }
};

}  // namespace poker

#endif
