//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/board_websocket.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/url/parse.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/variant2/variant.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/api_types.hpp"
#include "board_query.hpp"
#include "commands.hpp"
#include "error.hpp"
#include "events.hpp"
#include "services/board_broker.hpp"
#include "services/command_sidecar.hpp"
#include "services/fanout_service.hpp"
#include "shared_state.hpp"
#include "util/mailbox.hpp"
#include "util/websocket.hpp"

using namespace poker;
namespace asio = boost::asio;
using asio::experimental::make_parallel_group;
using asio::experimental::wait_for_one;

namespace {

// Votes cast through the websocket use this vote type
constexpr std::string_view websocket_vote_type = "1";

// Sent to the client when a command fails. Error details are logged, not sent.
constexpr std::string_view command_error_message = "There was an error processing your command.";

// Messages delivered to a session by other components. They're
// processed one at a time by the session's writer coroutine.
struct live_event_message
{
    std::size_t position;
    board_modified_event event;
};

struct replay_message
{
    std::vector<board_modified_event> events;
};

struct command_result_message
{
    command_outcome outcome;
    command_key key;
};

struct error_message
{
    std::string message;
    command_key key;
};

// Asks the writer to send a ping frame
struct ping_message
{
};

using session_message = boost::variant2::
    variant<live_event_message, replay_message, command_result_message, error_message, ping_message>;

// Retrieves the participant name from the upgrade request. Empty if not present
static std::string get_participant_name(const websocket::upgrade_request_type& req)
{
    auto url = boost::urls::parse_origin_form(req.target());
    if (url.has_error())
        return std::string();
    auto params = url->params();
    auto it = params.find("name");
    return it == params.end() ? std::string() : std::string((*it).value);
}

// Events are broadcast to sessions using the board_broker.
// We must implement the board_subscriber interface to use it.
// Each websocket session becomes a subscriber, and also the recipient
// of the results of the commands it submits.
class board_websocket_session final : public board_subscriber,
                                      public command_reply_target,
                                      public std::enable_shared_from_this<board_websocket_session>
{
    websocket ws_;
    std::shared_ptr<shared_state> st_;
    std::string board_id_;
    heartbeat_config heartbeat_;

    // Identifies this session in the broker
    session_id id_;

    // The participant this session acts on behalf of
    std::string participant_id_;

    // Written by subscriber and reply callbacks, read by the writer coroutine
    mailbox<session_message> mailbox_;

    // Owned by the writer coroutine
    board_query query_;

    // Leaves the board when the session finishes
    struct participant_deleter
    {
        void operator()(board_websocket_session* self) const noexcept { self->leave_board(); }
    };
    using participant_guard = std::unique_ptr<board_websocket_session, participant_deleter>;

    void leave_board()
    {
        if (!st_->sidecar().submit(board_id_, remove_participant{participant_id_}, {}))
            log_error(errc::command_failed, "Removing participant", participant_id_);
        log_info("Session disconnected", participant_id_ + " from board " + board_id_);
    }

    void submit_command(board_command cmd, command_key key = std::nullopt)
    {
        if (!st_->sidecar().submit(board_id_, std::move(cmd), weak_from_this(), key))
            mailbox_.push(error_message{std::string(command_error_message), key});
    }

    void request_replay()
    {
        st_->broker().replay_onto(board_id_, weak_from_this());

        // The broker only learns about the board's events on the next tick
        st_->fanout().notify(board_id_);
    }

    // Transforms a session message into the frame to be sent to the client.
    // An empty result means that nothing should be sent.
    struct message_visitor
    {
        board_query& query;

        std::optional<std::string> operator()(const live_event_message& msg) const
        {
            if (!query.on_live_event(msg.position, msg.event))
                return std::nullopt;
            return query_updated_event{query.view().present()}.to_json();
        }

        std::optional<std::string> operator()(const replay_message& msg) const
        {
            query.on_replay(msg.events);
            return query_updated_event{query.view().present()}.to_json();
        }

        std::optional<std::string> operator()(const command_result_message& msg) const
        {
            if (msg.outcome.has_error())
                return error_event{command_error_message, msg.key}.to_json();
            return command_result_event{msg.outcome.value(), msg.key}.to_json();
        }

        std::optional<std::string> operator()(const error_message& msg) const
        {
            return error_event{msg.message, msg.key}.to_json();
        }

        std::optional<std::string> operator()(ping_message) const { return std::nullopt; }
    };

    // Reads client frames and dispatches them
    asio::awaitable<error_code> read_loop()
    {
        while (true)
        {
            // Read a message
            auto raw_msg = co_await ws_.read();
            if (raw_msg.has_error())
                co_return raw_msg.error();

            // Deserialize it
            auto msg = parse_client_event(raw_msg.value());

            // Dispatch. Parse errors are reported to the client, but don't end the session
            if (const auto* ec = boost::variant2::get_if<error_code>(&msg))
            {
                log_error(*ec, "Parsing websocket message", raw_msg.value());
                mailbox_.push(error_message{"Invalid message: " + ec->message(), std::nullopt});
            }
            else if (const auto* vote = boost::variant2::get_if<vote_frame>(&msg))
            {
                submit_command(cast_vote{
                    participant_id_,
                    ballot{std::string(websocket_vote_type), vote_value(vote->vote)}
                });
            }
            else if (auto* frame = boost::variant2::get_if<command_frame>(&msg))
            {
                submit_command(std::move(frame->command), frame->key);
            }
            else
            {
                request_replay();
            }
        }
    }

    // Sends frames to the client as messages arrive. This is the only
    // coroutine writing to the websocket once the session is running
    asio::awaitable<error_code> write_loop()
    {
        while (true)
        {
            auto msg = co_await mailbox_.pop();
            if (msg.has_error())
                co_return msg.error();

            if (boost::variant2::holds_alternative<ping_message>(*msg))
            {
                auto ec = co_await ws_.ping();
                if (ec)
                    co_return ec;
                continue;
            }

            auto frame = boost::variant2::visit(message_visitor{query_}, *msg);
            if (frame)
            {
                auto ec = co_await ws_.write(*frame);
                if (ec)
                    co_return ec;
            }
        }
    }

    // Pings the client periodically and detects dead clients
    asio::awaitable<error_code> heartbeat_loop()
    {
        asio::steady_timer timer(co_await asio::this_coro::executor);

        while (true)
        {
            timer.expires_after(heartbeat_.ping_interval);
            auto [ec] = co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
            if (ec)
                co_return ec;

            if (std::chrono::steady_clock::now() - ws_.last_pong() > heartbeat_.client_timeout)
                POKER_CO_RETURN_ERROR(errc::client_timeout)

            mailbox_.push(ping_message{});
        }
    }

public:
    board_websocket_session(
        websocket socket,
        std::string board_id,
        std::shared_ptr<shared_state> state,
        heartbeat_config heartbeat,
        asio::any_io_executor ex
    )
        : ws_(std::move(socket)),
          st_(std::move(state)),
          board_id_(std::move(board_id)),
          heartbeat_(heartbeat),
          id_(boost::uuids::random_generator()()),
          participant_id_(boost::uuids::to_string(boost::uuids::random_generator()())),
          mailbox_(std::move(ex))
    {
    }

    // Subscriber callbacks. Called by the broker while holding its lock, so they must not block
    void on_board_event(std::size_t position, const board_modified_event& evt) override final
    {
        mailbox_.push(live_event_message{position, evt});
    }

    void on_replay(const std::vector<board_modified_event>& events) override final
    {
        mailbox_.push(replay_message{events});
    }

    // Command reply callback
    void on_command_result(const command_outcome& outcome, command_key key) override final
    {
        mailbox_.push(command_result_message{outcome, key});
    }

    // Runs the session until completion
    asio::awaitable<error_with_message> run()
    {
        // Every session needs a participant name. Closing the websocket is
        // preferred over failing the upgrade, since the client doesn't have
        // access to upgrade failure information.
        auto name = get_participant_name(ws_.upgrade_request());
        if (name.empty())
        {
            log_error(errc::request_parse_error, "Websocket session without participant name");
            co_await ws_.close(boost::beast::websocket::policy_error);  // Ignore the result
            co_return error_with_message{};
        }

        // Subscribe to live events first, so no event is lost while the replay is in flight
        auto broker_guard = st_->broker().connect_guarded(id_, board_id_, shared_from_this());
        request_replay();

        // Join the board. Leave it when we're done
        submit_command(add_participant{std::move(name), participant_id_});
        participant_guard guard(this);
        log_info("Session connected", participant_id_ + " to board " + board_id_);

        // Run the three loops until one of them exits. The others get cancelled
        auto ex = co_await asio::this_coro::executor;
        auto gp = make_parallel_group(
            asio::co_spawn(ex, read_loop(), asio::deferred),
            asio::co_spawn(ex, write_loop(), asio::deferred),
            asio::co_spawn(ex, heartbeat_loop(), asio::deferred)
        );
        auto [order, read_exc, read_ec, write_exc, write_ec, hb_exc, hb_ec] = co_await gp.async_wait(
            wait_for_one(),
            asio::use_awaitable
        );

        // Unexpected errors in any of the loops are propagated
        for (const auto& exc : {read_exc, write_exc, hb_exc})
        {
            if (exc)
                std::rethrow_exception(exc);
        }

        // Report the error of the loop that finished first
        const std::array<error_code, 3> ecs{read_ec, write_ec, hb_ec};
        co_return error_with_message{ecs[order[0]]};
    }
};

}  // namespace

asio::awaitable<error_with_message> poker::handle_board_websocket(
    websocket socket,
    std::string board_id,
    std::shared_ptr<shared_state> state,
    heartbeat_config heartbeat
)
{
    auto ex = co_await asio::this_coro::executor;
    auto sess = std::make_shared<board_websocket_session>(
        std::move(socket),
        std::move(board_id),
        std::move(state),
        heartbeat,
        std::move(ex)
    );
    co_return co_await sess->run();
}
