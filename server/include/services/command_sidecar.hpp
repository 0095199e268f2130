//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_SERVICES_COMMAND_SIDECAR_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_SERVICES_COMMAND_SIDECAR_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"

// Serializes command execution. All sessions submit their commands here,
// and a single consumer runs them in arrival order, so every command is
// validated against all previously accepted events.

namespace poker {

// Forward declaration
class command_runner;

// The outcome of a command, as seen by whoever submitted it
using command_outcome = result<std::vector<board_modified_event>>;

// An optional value chosen by whoever submits a command, handed back
// with its outcome. Allows matching outcomes to commands.
using command_key = std::optional<std::uint64_t>;

// Receives the outcome of submitted commands. Implementations must not block
// nor call back into the sidecar.
class command_reply_target
{
public:
    virtual ~command_reply_target() {}

    virtual void on_command_result(const command_outcome& outcome, command_key key) = 0;
};

// Invoked after a command appended events to a board
using commit_handler = std::function<void(std::string_view board_id)>;

// This is an interface to reduce compile times.
class command_sidecar
{
public:
    virtual ~command_sidecar() {}

    // Enqueues a command for execution. Never suspends. The outcome is delivered
    // to reply_to if it's still alive by then, and dropped otherwise.
    // Pass an empty pointer if you're not interested in the outcome.
    // key is passed back to reply_to along with the outcome.
    // Returns false if the sidecar has been stopped.
    virtual bool submit(
        std::string board_id,
        board_command cmd,
        std::weak_ptr<command_reply_target> reply_to,
        command_key key = std::nullopt
    ) = 0;

    // Runs the consumer loop until cancel() is called and the queue is drained
    virtual boost::asio::awaitable<void> run() = 0;

    // Spawns run() as a separate coroutine
    virtual void start_run() = 0;

    // Stops accepting commands and makes run() exit once the queue is empty
    virtual void cancel() = 0;
};

// Creates a command_sidecar. The runner must outlive the returned object.
// on_commit may be empty.
std::unique_ptr<command_sidecar> create_command_sidecar(
    boost::asio::any_io_executor ex,
    command_runner& runner,
    commit_handler on_commit
);

}  // namespace poker

#endif
