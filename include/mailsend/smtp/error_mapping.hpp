/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between SMTP reply codes and mailsend::errc.

*/

#pragma once

#include <string_view>

#include <mailsend/detail/result.hpp>

namespace mailsend::smtp
{

enum class command_kind
{
    greeting,
    ehlo,
    helo,
    auth,
    mail_from,
    rcpt_to,
    data_cmd,
    data_body,
    quit,
    other
};

[[nodiscard]] constexpr std::string_view command_name(command_kind k) noexcept
{
    switch (k)
    {
        case command_kind::greeting: return "greeting";
        case command_kind::ehlo: return "EHLO";
        case command_kind::helo: return "HELO";
        case command_kind::auth: return "AUTH";
        case command_kind::mail_from: return "MAIL FROM";
        case command_kind::rcpt_to: return "RCPT TO";
        case command_kind::data_cmd: return "DATA";
        case command_kind::data_body: return "message data";
        case command_kind::quit: return "QUIT";
        case command_kind::other: return "command";
    }
    return "command";
}

[[nodiscard]] constexpr bool is_temporary(int code) noexcept
{
    return code >= 400 && code < 500;
}

[[nodiscard]] constexpr bool is_permanent(int code) noexcept
{
    return code >= 500 && code < 600;
}

[[nodiscard]] inline errc map_smtp_reply(command_kind k, int code) noexcept
{
    switch (k)
    {
        case command_kind::greeting:
            return errc::smtp_greeting_rejected;
        case command_kind::ehlo:
        case command_kind::helo:
            return errc::smtp_ehlo_rejected;
        case command_kind::auth:
            return errc::smtp_auth_failed;
        case command_kind::mail_from:
            return errc::smtp_mail_from_rejected;
        case command_kind::rcpt_to:
            return errc::smtp_rejected_recipient;
        case command_kind::data_cmd:
        case command_kind::data_body:
            return errc::smtp_data_rejected;
        case command_kind::quit:
        case command_kind::other:
            break;
    }

    if (is_temporary(code))
        return errc::smtp_temporary_failure;
    if (is_permanent(code))
        return errc::smtp_permanent_failure;
    return errc::smtp_bad_reply;
}

} // namespace mailsend::smtp
