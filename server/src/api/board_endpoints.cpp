//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/board_endpoints.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "aggregate.hpp"
#include "api/api_types.hpp"
#include "board_view.hpp"
#include "error.hpp"
#include "events.hpp"
#include "request_context.hpp"
#include "services/command_sidecar.hpp"
#include "services/event_log.hpp"
#include "shared_state.hpp"

using namespace poker;
namespace asio = boost::asio;

namespace {

// Receives the outcome of a command submitted through the HTTP API
class http_reply_target final : public command_reply_target
{
    std::optional<command_outcome> outcome_;
    asio::experimental::concurrent_channel<void(error_code)> done_;

public:
    explicit http_reply_target(asio::any_io_executor ex) : done_(std::move(ex), 1) {}

    void on_command_result(const command_outcome& outcome, command_key) override final
    {
        outcome_ = outcome;
        done_.try_send(error_code());
    }

    // Suspends until the sidecar replies
    asio::awaitable<command_outcome> wait()
    {
        auto [ec] = co_await done_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec)
            co_return ec;
        co_return std::move(*outcome_);
    }
};

// Parses the since query parameter. An empty optional means that it wasn't specified
static result<std::optional<std::size_t>> parse_since(const request_context& ctx)
{
    auto value = ctx.query_param("since");
    if (!value)
        return std::optional<std::size_t>();

    std::size_t res{};
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), res);
    if (ec != std::errc() || ptr != value->data() + value->size())
        POKER_RETURN_ERROR(errc::request_parse_error)
    return std::optional<std::size_t>(res);
}

}  // namespace

asio::awaitable<response_builder::response_type> poker::handle_execute_command(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto body = ctx.json_body();
    if (body.has_error())
        co_return ctx.response().bad_request_json("Invalid content type");
    auto cmd = parse_board_command(*body);
    if (cmd.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    // Hand it to the sidecar and wait for the outcome
    auto reply = std::make_shared<http_reply_target>(co_await asio::this_coro::executor);
    if (!st.sidecar().submit(std::string(ctx.path_param()), std::move(*cmd), reply))
        co_return ctx.response().internal_server_error(errc::command_failed, "Command sidecar is stopped");
    auto outcome = co_await reply->wait();

    // Handle errors
    if (outcome.has_error())
        co_return ctx.response().internal_server_error(outcome.error(), "Executing command");

    co_return ctx.response().json_response(events_response{*outcome});
}

asio::awaitable<response_builder::response_type> poker::handle_get_board(request_context& ctx, shared_state& st)
{
    // Load the events
    auto events = co_await st.board_log().load(ctx.path_param());
    if (events.has_error())
        co_return ctx.response().internal_server_error(events.error(), "Loading board events");

    // A board that never got any event doesn't exist
    if (events->empty())
        co_return ctx.response().not_found_json("Board not found");

    // Build the presentation
    auto board = source<board_view>(*events).present();
    co_return ctx.response().json_response(board_response{board});
}

asio::awaitable<response_builder::response_type> poker::handle_get_events(request_context& ctx, shared_state& st)
{
    // Parse params
    auto since = parse_since(ctx);
    if (since.has_error())
        co_return ctx.response().bad_request_json("since: invalid value");

    // Without since, return the full sequence. Otherwise, wait until there
    // are events past since
    result<std::vector<board_modified_event>> events;
    if (since->has_value())
        events = co_await st.board_log().load_update(ctx.path_param(), **since);
    else
        events = co_await st.board_log().load(ctx.path_param());

    // Handle errors
    if (events.has_error())
    {
        if (events.error() == errc::invalid_position)
        {
            co_return ctx.response()
                .bad_request_json(api_error_id::invalid_position, "since: past the end of the event log");
        }
        else if (events.error() == asio::error::operation_aborted && since->has_value())
        {
            // The long-poll timed out without new events
            co_return ctx.response().json_response(events_response{});
        }
        co_return ctx.response().internal_server_error(events.error(), "Loading board events");
    }

    co_return ctx.response().json_response(events_response{*events});
}
