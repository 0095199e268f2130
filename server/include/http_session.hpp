//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_HTTP_SESSION_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/url/segments_view.hpp>

namespace poker {

// Forward declaration
class shared_state;

// Runs a HTTP session until the connection is closed or an error is encountered.
// This will serve the board API over HTTP or run a board websocket session,
// depending on what the client requested.
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
);

// Matches decoded path segments against a pattern like /board/{id}/events.
// On success, returns the value of the {id} segment.
std::optional<std::string> match_path(std::string_view pattern, const boost::urls::segments_view& segs);

}  // namespace poker

#endif
