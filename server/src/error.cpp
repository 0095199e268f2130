//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace poker {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    websocket_parse_error,
    request_parse_error,
    not_found,
    invalid_position,
    store_unavailable,
    event_log_conflict,
    command_failed,
    client_timeout,
    uncaught_exception,
    invalid_content_type,
    invalid_config
)

}  // namespace poker

namespace {

static const char* to_string(poker::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown poker error>");
}

// Custom category for poker::errc. Exposed by get_poker_category
class poker_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "poker"; }
    std::string message(int ev) const final override { return to_string(static_cast<poker::errc>(ev)); }
};

static poker_category cat;

}  // namespace

const boost::system::error_category& poker::get_poker_category() noexcept { return cat; }

poker::error_kind poker::classify(error_code ec) noexcept
{
    if (ec == errc::event_log_conflict)
        return error_kind::conflict;
    if (ec == errc::store_unavailable || ec == boost::asio::error::try_again)
        return error_kind::transient;
    return error_kind::fatal;
}

[[noreturn]] void poker::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void poker::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void poker::log_info(std::string_view what, std::string_view details)
{
    std::clog << what;
    if (!details.empty())
        std::clog << ": " << details;
    std::clog << '\n';
}
