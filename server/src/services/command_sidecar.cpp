//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/command_sidecar.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"
#include "services/command_runner.hpp"
#include "util/mailbox.hpp"

namespace asio = boost::asio;
using namespace poker;

namespace {

// An exception handler for coroutines that rethrows any exception thrown by
// the coroutine. Errors are handled with error_code's, so an exception
// here is something critical.
static constexpr auto rethrow_handler = [](std::exception_ptr ex) {
    if (ex)
        std::rethrow_exception(ex);
};

class command_sidecar_impl final : public command_sidecar
{
    struct command_item
    {
        std::string board_id;
        board_command cmd;
        std::weak_ptr<command_reply_target> reply_to;
        command_key key;
    };

    asio::any_io_executor ex_;
    command_runner& runner_;
    commit_handler on_commit_;
    mailbox<command_item> queue_;

    asio::awaitable<void> process(command_item& item)
    {
        auto outcome = co_await runner_.execute(item.board_id, item.cmd);
        if (outcome.has_error())
        {
            log_error(outcome.error(), "Executing command", command_name(item.cmd));
        }
        else
        {
            // Commands rejected by validation still succeed, recording negative events
            bool rejected = std::any_of(outcome->begin(), outcome->end(), [](const board_modified_event& evt) {
                return is_negative(evt);
            });
            log_info(
                "Command executed",
                std::string(command_name(item.cmd)) + " on board " + item.board_id + (rejected ? " (rejected)" : "")
            );
            if (!outcome->empty() && on_commit_)
                on_commit_(item.board_id);
        }

        // Deliver the outcome. A dead recipient is not an error
        if (auto target = item.reply_to.lock())
            target->on_command_result(outcome, item.key);
    }

public:
    command_sidecar_impl(asio::any_io_executor ex, command_runner& runner, commit_handler on_commit)
        : ex_(ex), runner_(runner), on_commit_(std::move(on_commit)), queue_(std::move(ex))
    {
    }

    bool submit(
        std::string board_id,
        board_command cmd,
        std::weak_ptr<command_reply_target> reply_to,
        command_key key
    ) override final
    {
        return queue_.push(command_item{std::move(board_id), std::move(cmd), std::move(reply_to), key});
    }

    asio::awaitable<void> run() override final
    {
        // Commands are processed strictly one after another
        while (true)
        {
            auto item = co_await queue_.pop();
            if (item.has_error())
                co_return;
            co_await process(*item);
        }
    }

    void start_run() override final { asio::co_spawn(ex_, run(), rethrow_handler); }

    void cancel() override final { queue_.close(); }
};

}  // namespace

std::unique_ptr<command_sidecar> poker::create_command_sidecar(
    asio::any_io_executor ex,
    command_runner& runner,
    commit_handler on_commit
)
{
    return std::unique_ptr<command_sidecar>{new command_sidecar_impl(std::move(ex), runner, std::move(on_commit))};
}
