/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between Asio error codes and mailsend::errc for network I/O.

*/

#pragma once

#include <string>
#include <string_view>

#include <boost/asio/ssl/error.hpp>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/result.hpp>

namespace mailsend::net
{

enum class io_stage
{
    resolve,
    connect,
    handshake,
    read,
    write
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::handshake: return "handshake";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const asio::error_code& ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == asio::error::timed_out)
        return errc::net_timeout;
    if (ec == asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated)
        return errc::net_eof;
    if (ec == asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == asio::error::connection_reset || ec == asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
    }
    return errc::net_io_failed;
}

/**
One line description of a failed network operation, as shown to the user.

@param stage   Stage of the connection.
@param ec      Error reported by Asio.
@param timeout Flag if the operation was cancelled by its deadline.
@return        Text such as `connect failed: Connection refused`.
**/
[[nodiscard]] inline std::string describe_net_error(io_stage stage, const asio::error_code& ec, bool timeout)
{
    std::string text(stage_name(stage));
    text += " failed: ";
    text += timeout ? std::string("operation timed out") : ec.message();
    return text;
}

} // namespace mailsend::net
