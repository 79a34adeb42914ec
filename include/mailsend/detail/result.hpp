/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Exceptions raised inside the transport are bridged into result<T> once, at
the outermost scope of a send.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mailsend
{

/// Error categories for mailsend operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Network errors (100-199)
    net_resolve_failed = 100,
    net_connect_failed = 101,
    net_connection_refused = 102,
    net_connection_reset = 103,
    net_timeout = 104,
    net_eof = 105,
    net_io_failed = 106,
    net_cancelled = 107,
    tls_handshake_failed = 120,
    tls_verify_failed = 121,

    // SMTP errors (400-499)
    smtp_bad_reply = 400,
    smtp_greeting_rejected = 401,
    smtp_ehlo_rejected = 402,
    smtp_auth_failed = 403,
    smtp_auth_unsupported = 404,
    smtp_mail_from_rejected = 405,
    smtp_rejected_recipient = 406,
    smtp_data_rejected = 407,
    smtp_invalid_state = 408,
    smtp_temporary_failure = 409,
    smtp_permanent_failure = 410,

    // MIME errors (600-699)
    mime_invalid_header = 600,

    // Input validation (700-799)
    invalid_argument = 700,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "Success";
        case errc::net_resolve_failed: return "Host name resolution failed";
        case errc::net_connect_failed: return "Connection failed";
        case errc::net_connection_refused: return "Connection refused";
        case errc::net_connection_reset: return "Connection reset";
        case errc::net_timeout: return "Operation timed out";
        case errc::net_eof: return "Connection closed by peer";
        case errc::net_io_failed: return "Network I/O failed";
        case errc::net_cancelled: return "Operation cancelled";
        case errc::tls_handshake_failed: return "TLS handshake failed";
        case errc::tls_verify_failed: return "TLS verification failed";
        case errc::smtp_bad_reply: return "Malformed SMTP reply";
        case errc::smtp_greeting_rejected: return "SMTP greeting rejected";
        case errc::smtp_ehlo_rejected: return "SMTP EHLO/HELO rejected";
        case errc::smtp_auth_failed: return "SMTP authentication failed";
        case errc::smtp_auth_unsupported: return "SMTP authentication mechanism unavailable";
        case errc::smtp_mail_from_rejected: return "SMTP sender rejected";
        case errc::smtp_rejected_recipient: return "SMTP recipient rejected";
        case errc::smtp_data_rejected: return "SMTP message data rejected";
        case errc::smtp_invalid_state: return "SMTP session in invalid state";
        case errc::smtp_temporary_failure: return "SMTP temporary failure";
        case errc::smtp_permanent_failure: return "SMTP permanent failure";
        case errc::mime_invalid_header: return "Invalid message header";
        case errc::invalid_argument: return "Invalid argument";
        case errc::internal_error: return "Internal error";
    }
    return "Unknown error";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code) << " (" << static_cast<std::uint16_t>(code) << ')';
}

[[nodiscard]] constexpr bool is_network_error(errc code) noexcept
{
    const auto c = static_cast<std::uint16_t>(code);
    return c >= 100 && c < 200;
}

/// Rich error type with category, message, detail and the originating system error
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Message and detail as one line, suitable for a diagnostic
    [[nodiscard]] std::string to_string() const
    {
        std::string out = message.empty() ? std::string(mailsend::to_string(code)) : message;
        if (!detail.empty())
        {
            out += ' ';
            out += detail;
        }
        for (char& ch : out)
        {
            if (ch == '\r' || ch == '\n')
                ch = ' ';
        }
        return out;
    }
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] result<T> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected<error_info>(std::move(err));
}

} // namespace detail

} // namespace mailsend
