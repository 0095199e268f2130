//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/command_runner.hpp"

#include <boost/asio/awaitable.hpp>

#include <string_view>
#include <vector>

#include "aggregate.hpp"
#include "commands.hpp"
#include "events.hpp"

namespace asio = boost::asio;
using namespace poker;

asio::awaitable<result<std::vector<board_modified_event>>> command_runner::execute(
    std::string_view key,
    const board_command& cmd
)
{
    co_return co_await tx_.execute(key, [&cmd](const combined_aggregate& agg) { return apply_command(agg, cmd); });
}
