//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <string_view>

namespace poker {

// A wrapper around beast's websocket stream that handles concurrent writes
// and reduces build times by keeping Beast instantiations in a separate .cpp file.
class websocket
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructors, assignments, destructor
    websocket(
        boost::asio::ip::tcp::socket sock,
        upgrade_request_type&& upgrade_request,
        boost::beast::flat_buffer buffer
    );
    websocket(const websocket&) = delete;
    websocket(websocket&&) noexcept;
    websocket& operator=(const websocket&) = delete;
    websocket& operator=(websocket&&) noexcept;
    ~websocket();

    // Returns the upgrade HTTP request
    const upgrade_request_type& upgrade_request() const noexcept;

    // Runs the websocket handshake. Must be called before any other operation
    boost::asio::awaitable<boost::system::error_code> accept();

    // Reads a message from the client. The returned view is valid until the next
    // read is performed. Only a single read should be outstanding at each time.
    boost::asio::awaitable<boost::system::result<std::string_view>> read();

    // Writes a message to the client. Only a single write, ping or close
    // should be outstanding at each time. Sessions funnel all their output
    // through a single writer coroutine to guarantee this.
    boost::asio::awaitable<boost::system::error_code> write(std::string_view buff);

    // Sends a ping frame. Counts as a write.
    boost::asio::awaitable<boost::system::error_code> ping();

    // The last time a pong was received from the client. Pongs are only
    // processed while a read is outstanding. Before the first pong, this
    // is the time accept() was called.
    std::chrono::steady_clock::time_point last_pong() const noexcept;

    // Closes the websocket, sending close_code to the client. Counts as a write.
    boost::asio::awaitable<boost::system::error_code> close(unsigned close_code);
};

}  // namespace poker

#endif
