//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_API_BOARD_WEBSOCKET_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_API_BOARD_WEBSOCKET_HPP

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "error.hpp"
#include "util/websocket.hpp"

namespace poker {

// Forward declaration
class shared_state;

// Heartbeat settings for board sessions
struct heartbeat_config
{
    // How often pings are sent
    std::chrono::milliseconds ping_interval{1000};

    // A client that doesn't answer pings for this long is disconnected
    std::chrono::milliseconds client_timeout{5000};
};

// Runs a board websocket session until the client disconnects or an error occurs.
// The websocket handshake must have been performed. The participant name
// is taken from the name query parameter of the upgrade request.
boost::asio::awaitable<error_with_message> handle_board_websocket(
    websocket socket,
    std::string board_id,
    std::shared_ptr<shared_state> state,
    heartbeat_config heartbeat = {}
);

}  // namespace poker

#endif
