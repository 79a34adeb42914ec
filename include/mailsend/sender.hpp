/*

sender.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

One shot sending of a plain text message: build, connect, authenticate, send, quit.

*/

#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/exception_bridge.hpp>
#include <mailsend/detail/log.hpp>
#include <mailsend/detail/result.hpp>
#include <mailsend/mime/message.hpp>
#include <mailsend/net/tls_mode.hpp>
#include <mailsend/net/tls_options.hpp>
#include <mailsend/smtp/client.hpp>
#include <mailsend/smtp/types.hpp>

namespace mailsend
{

/**
Everything needed for one send. Filled by the command line parser, passed by value.
**/
struct send_config
{
    std::string smtp_server;
    unsigned short smtp_port = 0;
    std::string smtp_user;
    std::string smtp_password;
    std::string from_email;
    std::string to_email;
    std::string subject;
    std::string body;

    smtp::auth_method auth = smtp::auth_method::auto_detect;
    /// Deadline of each network operation; none when absent.
    std::optional<std::chrono::seconds> timeout;
    net::tls_mode tls_mode = net::tls_mode::implicit;
    net::tls_options tls;
};

/**
Building the message from the configuration.

@param cfg Configuration holding the addresses, subject and body.
@return    Message with the fields set verbatim.
@throw mime_error Empty address or header injection attempt.
**/
[[nodiscard]] inline message build_message(const send_config& cfg)
{
    return message(cfg.from_email, cfg.to_email, cfg.subject, cfg.body);
}

[[nodiscard]] inline smtp::options make_smtp_options(const send_config& cfg)
{
    smtp::options opts;
    opts.tls = cfg.tls;
    opts.default_tls_mode = cfg.tls_mode;
    opts.auth = cfg.auth;
    if (cfg.timeout.has_value())
        opts.timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(*cfg.timeout);
    return opts;
}

/**
Sending the message described by the configuration.

Once the connection exists, QUIT is attempted on every path. A QUIT failure is only logged: it never replaces an
earlier failure, and after an accepted message the send is still reported as successful.

@param executor Executor running the session.
@param cfg      Configuration.
@return         Error describing the first failure.
**/
[[nodiscard]] inline asio::awaitable<result<void>> async_send_mail(asio::any_io_executor executor, send_config cfg)
{
    auto msg = protect([&cfg]() { return build_message(cfg); }, errc::mime_invalid_header);
    if (!msg)
        co_return fail<void>(std::move(msg).error());

    smtp::client session(executor, make_smtp_options(cfg));

    auto connected = co_await protect_awaitable([&]() -> asio::awaitable<void>
    {
        co_await session.connect(cfg.smtp_server, cfg.smtp_port);
    }, errc::net_connect_failed);
    if (!connected)
    {
        session.close();
        co_return fail<void>(std::move(connected).error());
    }

    auto sent = co_await protect_awaitable([&]() -> asio::awaitable<void>
    {
        co_await session.read_greeting();
        co_await session.ehlo();
        co_await session.authenticate(cfg.smtp_user, cfg.smtp_password);
        co_await session.send(*msg);
    }, errc::internal_error);

    if (session.is_connected())
    {
        auto quit = co_await protect_awaitable([&]() -> asio::awaitable<void>
        {
            co_await session.quit();
        }, errc::net_io_failed);
        if (!quit)
        {
            if (sent)
                MAILSEND_WARN("QUIT failed after the message was accepted: " + quit.error().to_string());
            else
                MAILSEND_DEBUG("QUIT failed: " + quit.error().to_string());
        }
    }
    session.close();

    if (!sent)
        co_return fail<void>(std::move(sent).error());
    MAILSEND_INFO("Message sent to " + cfg.to_email);
    co_return ok();
}

/**
Blocking version of `async_send_mail()`, running the session on a private I/O context.
**/
[[nodiscard]] inline result<void> send_mail(const send_config& cfg)
{
    asio::io_context context;
    std::optional<result<void>> outcome;
    asio::co_spawn(context, async_send_mail(context.get_executor(), cfg),
        [&outcome](std::exception_ptr eptr, result<void> res)
        {
            if (eptr)
                outcome = fail<void>(from_exception(eptr, errc::internal_error));
            else
                outcome = std::move(res);
        });
    context.run();

    if (!outcome.has_value())
        return fail<void>(errc::internal_error, "Send did not complete.");
    return std::move(*outcome);
}

} // namespace mailsend
