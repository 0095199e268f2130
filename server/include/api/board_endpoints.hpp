//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_API_BOARD_ENDPOINTS_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_API_BOARD_ENDPOINTS_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions for board endpoints. The board ID is
// available as the request's path parameter.

namespace poker {

class shared_state;

// POST /board/{id}
boost::asio::awaitable<response_builder::response_type> handle_execute_command(
    request_context& ctx,
    shared_state& st
);

// GET /board/{id}
boost::asio::awaitable<response_builder::response_type> handle_get_board(request_context& ctx, shared_state& st);

// GET /board/{id}/events
boost::asio::awaitable<response_builder::response_type> handle_get_events(request_context& ctx, shared_state& st);

}  // namespace poker

#endif
