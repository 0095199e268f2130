//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_FANOUT_SERVICE_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_FANOUT_SERVICE_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <string_view>

// Background loop that feeds the board broker. On every tick, or when
// notified, it loads the latest events of every board with subscribers
// and publishes them to the broker.

namespace poker {

// Forward declarations
class board_event_log;
class board_broker;

// This is an interface to reduce compile times.
class fanout_service
{
public:
    virtual ~fanout_service() {}

    // Wakes up the loop before the next tick is due. Thread-safe
    virtual void notify(std::string_view board_id) = 0;

    // Loads and publishes events for all subscribed boards once
    virtual boost::asio::awaitable<void> tick() = 0;

    // Runs the loop until cancel() is called
    virtual boost::asio::awaitable<void> run() = 0;

    // Spawns run() as a separate coroutine
    virtual void start_run() = 0;

    // Makes run() exit
    virtual void cancel() = 0;
};

// Creates a fanout_service. log and broker must outlive the returned object.
std::unique_ptr<fanout_service> create_fanout_service(
    boost::asio::any_io_executor ex,
    board_event_log& log,
    board_broker& broker,
    std::chrono::milliseconds tick_interval
);

}  // namespace poker

#endif
