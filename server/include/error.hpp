//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PLANNINGPOKER_SERVER_INCLUDE_ERROR_HPP
#define PLANNINGPOKER_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio and Beast.

namespace poker {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    websocket_parse_error = 1,  // Data received from the websocket client didn't match the format we expected
    request_parse_error,        // An HTTP request body or query string was malformed
    not_found,                  // couldn't retrieve a certain resource, it doesn't exist
    invalid_position,           // load_update was called with a position past the end of the log
    store_unavailable,          // the event store couldn't serve the request. Worth retrying
    event_log_conflict,         // a save would overwrite events that the writer didn't observe
    command_failed,             // a command couldn't be executed and retries were exhausted
    client_timeout,             // a websocket client stopped answering pings
    uncaught_exception,         // an API handler threw an unexpected exception
    invalid_content_type,       // an endpoint received an unsupported Content-Type
    invalid_config,             // a configuration value couldn't be parsed
};

// The error category for errc
const boost::system::error_category& get_poker_category() noexcept;

// Allows constructing error_code from errc
inline boost::system::error_code make_error_code(errc v) noexcept
{
    return boost::system::error_code(static_cast<int>(v), get_poker_category());
}

// How the command runner should react to a failed attempt
enum class error_kind
{
    transient,  // Retrying the same attempt may succeed
    conflict,   // The log changed under us. A fresh attempt reloads it
    fatal,      // Don't retry
};

// Maps an error code onto error_kind
error_kind classify(error_code ec) noexcept;

// An error code with a diagnostic string
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// Like result<T>, but carrying diagnostics on failure
template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Required by result_with_message
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location&);

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

// Logs an informational message to stderr
void log_info(std::string_view what, std::string_view details = "");

}  // namespace poker

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<poker::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define POKER_RETURN_ERROR(e)                                                     \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define POKER_CO_RETURN_ERROR(e)                                                     \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
