//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "application.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <memory>
#include <string>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "listener.hpp"
#include "services/command_sidecar.hpp"
#include "services/fanout_service.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace poker;

application::application(application_config config) : config_(std::move(config)) {}

application::~application() {}

error_code application::setup()
{
    error_code ec;

    // The physical endpoint where our server will listen
    auto address = asio::ip::make_address(config_.ip, ec);
    if (ec)
        return ec;
    asio::ip::tcp::endpoint listening_endpoint(address, config_.port);

    // Singleton objects shared by all connections
    st_ = std::make_shared<shared_state>(config_, ctx_.get_executor());

    // Start listening for HTTP connections
    ec = launch_http_listener(ctx_.get_executor(), listening_endpoint, st_);
    if (ec)
        return ec;

    // Launch the command sidecar and the fan-out loop
    st_->sidecar().start_run();
    st_->fanout().start_run();

    log_info("Listening", config_.ip + ":" + std::to_string(config_.port));
    return error_code();
}

void application::shutdown()
{
    // Stop the background loops
    st_->sidecar().cancel();
    st_->fanout().cancel();

    // Stop the io_context. This will cause run() to return
    ctx_.stop();
}

void application::run_until_completion(bool handle_signals)
{
    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    std::unique_ptr<asio::signal_set> signals;
    if (handle_signals)
    {
        signals = std::make_unique<asio::signal_set>(ctx_.get_executor(), SIGINT, SIGTERM);
        signals->async_wait([this](error_code ec, int) {
            if (!ec)
                shutdown();
        });
    }

    // Run the io_context. This will block until the context is stopped by
    // a signal or a call to stop()
    ctx_.run();
}

void application::stop()
{
    asio::post(ctx_, [this] { shutdown(); });
}
