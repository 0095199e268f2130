//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string_view>

#include "config.hpp"
#include "services/board_broker.hpp"
#include "services/command_runner.hpp"
#include "services/command_sidecar.hpp"
#include "services/event_log.hpp"
#include "services/fanout_service.hpp"
#include "services/retry_policy.hpp"

using namespace poker;

static retry_strategy make_retry_strategy(const application_config& cfg)
{
    return cfg.retry_attempts ? fixed_retry(cfg.retry_delay, cfg.retry_attempts) : no_retry();
}

shared_state::shared_state(const application_config& cfg, boost::asio::any_io_executor ex)
{
    // Members depend on each other, so they're created in order
    impl_.vote_types_ = create_configured_vote_type_log(cfg.vote_types);
    impl_.board_log_ = create_memory_event_log();
    impl_.combined_log_ = create_combined_event_log(*impl_.vote_types_, *impl_.board_log_);
    impl_.runner_ = std::make_unique<command_runner>(*impl_.combined_log_, make_retry_strategy(cfg));
    impl_.broker_ = create_board_broker();
    impl_.fanout_ = create_fanout_service(ex, *impl_.board_log_, *impl_.broker_, cfg.poll_interval);

    // Committed commands wake up the fan-out loop, so clients don't wait for the next tick
    impl_.sidecar_ = create_command_sidecar(
        ex,
        *impl_.runner_,
        [fanout = impl_.fanout_.get()](std::string_view board_id) { fanout->notify(board_id); }
    );
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
