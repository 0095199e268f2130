//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_COMMAND_RUNNER_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_COMMAND_RUNNER_HPP

#include <boost/asio/awaitable.hpp>

#include <string_view>
#include <utility>
#include <vector>

#include "aggregate.hpp"
#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"
#include "services/event_log.hpp"
#include "services/retry_policy.hpp"
#include "services/transaction.hpp"

namespace poker {

// Executes board commands against a combined (vote types + board) log
class command_runner
{
    transaction<combined_aggregate> tx_;

public:
    command_runner(event_log<combined_event>& log, retry_strategy strategy) : tx_(log, std::move(strategy)) {}

    // Runs cmd against the board identified by key. Returns the events that were appended.
    // Validation failures are reported as negative events, not as errors.
    boost::asio::awaitable<result<std::vector<board_modified_event>>> execute(
        std::string_view key,
        const board_command& cmd
    );
};

}  // namespace poker

#endif
