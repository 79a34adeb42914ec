/*

error.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <stdexcept>
#include <string>

#include <mailsend/detail/result.hpp>

namespace mailsend::smtp
{

/**
SMTP protocol failure: a rejected command, an unexpected reply or a misuse of the session.
**/
class error : public std::runtime_error
{
public:
    error(const std::string& msg, const std::string& details, errc code = errc::smtp_invalid_state, int status = 0)
        : std::runtime_error(msg), details_(details), code_(code), status_(status)
    {
    }

    error(const char* msg, const std::string& details, errc code = errc::smtp_invalid_state, int status = 0)
        : std::runtime_error(msg), details_(details), code_(code), status_(status)
    {
    }

    std::string details() const { return details_; }

    errc code() const noexcept { return code_; }

    /// Reply code of the server, zero when the failure is not a server reply.
    int status() const noexcept { return status_; }

protected:
    std::string details_;
    errc code_;
    int status_;
};

} // namespace mailsend::smtp
