//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SHARED_STATE_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "events.hpp"

namespace poker {

// Forward declaration
struct application_config;
template <class Event>
class event_log;
class board_event_log;
class command_runner;
class command_sidecar;
class board_broker;
class fanout_service;

// Contains singleton objects shared by all sessions in the server
class shared_state
{
    struct
    {
        std::unique_ptr<event_log<vote_type_event>> vote_types_;
        std::unique_ptr<board_event_log> board_log_;
        std::unique_ptr<event_log<combined_event>> combined_log_;
        std::unique_ptr<command_runner> runner_;
        std::unique_ptr<board_broker> broker_;
        std::unique_ptr<fanout_service> fanout_;
        std::unique_ptr<command_sidecar> sidecar_;
    } impl_;

public:
    shared_state(const application_config& cfg, boost::asio::any_io_executor ex);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    board_event_log& board_log() noexcept { return *impl_.board_log_; }
    event_log<combined_event>& combined_log() noexcept { return *impl_.combined_log_; }
    board_broker& broker() noexcept { return *impl_.broker_; }
    fanout_service& fanout() noexcept { return *impl_.fanout_; }
    command_sidecar& sidecar() noexcept { return *impl_.sidecar_; }
};

}  // namespace poker

#endif
