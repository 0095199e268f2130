//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_APPLICATION_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_APPLICATION_HPP

#include <boost/asio/io_context.hpp>

#include <memory>

#include "config.hpp"
#include "error.hpp"

namespace poker {

// Forward declaration
class shared_state;

// Owns the event loop and all the server's singleton objects.
// Used by main() and by the integration tests.
class application
{
    application_config config_;

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    boost::asio::io_context ctx_{1};

    // Singleton objects shared by all connections
    std::shared_ptr<shared_state> st_;

    // Stops background tasks and the event loop. Must run within the event loop
    void shutdown();

public:
    explicit application(application_config config);
    application(const application&) = delete;
    application(application&&) = delete;
    application& operator=(const application&) = delete;
    application& operator=(application&&) = delete;
    ~application();

    const application_config& config() const noexcept { return config_; }

    // Creates the shared objects, binds the listening socket and launches
    // background tasks. Returns an error if the server can't listen.
    error_code setup();

    // Runs the event loop until stop() is called. If handle_signals is true,
    // SIGINT and SIGTERM also stop the application.
    void run_until_completion(bool handle_signals);

    // Makes run_until_completion return. Thread-safe.
    void stop();
};

}  // namespace poker

#endif
