/*

tls_mode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string_view>

namespace mailsend::net
{

/**
When TLS is negotiated on a connection.

SMTPS (port 465) runs the handshake right after the TCP connect. The clear text mode only serves local test servers.
**/
enum class tls_mode
{
    none,
    implicit
};

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

} // namespace mailsend::net
