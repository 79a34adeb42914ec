/*

smtp/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailsend/codec/codec.hpp>
#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/log.hpp>
#include <mailsend/detail/sanitize.hpp>
#include <mailsend/detail/sasl.hpp>
#include <mailsend/mime/message.hpp>
#include <mailsend/net/deadline.hpp>
#include <mailsend/net/dialog.hpp>
#include <mailsend/net/error_mapping.hpp>
#include <mailsend/net/tls_mode.hpp>
#include <mailsend/net/upgradable_stream.hpp>
#include <mailsend/smtp/error.hpp>
#include <mailsend/smtp/error_mapping.hpp>
#include <mailsend/smtp/types.hpp>

namespace mailsend::smtp
{

using namespace mailsend::asio;

/**
SMTP client session over an optionally TLS protected connection.

The operations follow RFC 5321 ordering: `connect()`, `read_greeting()`, `ehlo()`, `authenticate()`, `send()`,
`quit()`. Each of them throws `smtp::error` on a protocol failure and `net::dialog_error` on a transport failure.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using tcp_type = tcp;

    explicit client(executor_type executor, options opts = {})
        : executor_(executor),
          options_(std::move(opts)),
          tls_context_(ssl::context::tls_client)
    {
    }

    explicit client(io_context& context, options opts = {})
        : client(context.get_executor(), std::move(opts))
    {
    }

    client(const client&) = delete;

    client& operator=(const client&) = delete;

    executor_type get_executor() const { return executor_; }

    /**
    Connecting with the default TLS mode of the options.
    **/
    awaitable<void> connect(const std::string& host, unsigned short port)
    {
        co_await connect_impl(host, std::to_string(port), options_.default_tls_mode);
    }

    awaitable<void> connect(const std::string& host, unsigned short port, mailsend::net::tls_mode mode)
    {
        co_await connect_impl(host, std::to_string(port), mode);
    }

    awaitable<reply> read_greeting()
    {
        co_return co_await read_greeting_impl();
    }

    awaitable<reply> ehlo(std::string domain = {})
    {
        co_return co_await ehlo_impl(std::move(domain));
    }

    /**
    Authenticating with the mechanism of the options.
    **/
    awaitable<void> authenticate(const std::string& username, const std::string& password)
    {
        co_await authenticate_impl(username, password, options_.auth);
    }

    awaitable<void> authenticate(const std::string& username, const std::string& password, auth_method method)
    {
        co_await authenticate_impl(username, password, method);
    }

    /**
    Sending a message.

    @param msg Message to send.
    @param env Envelope; the addresses of the message are used for the empty fields.
    @return    Final reply of the server to the message data.
    **/
    awaitable<reply> send(const mailsend::message& msg, const envelope& env = envelope{})
    {
        co_return co_await send_impl(msg, env);
    }

    /**
    Ending the session with QUIT and closing the connection.

    The reply code is not checked, the connection is closed in any case.
    **/
    awaitable<reply> quit()
    {
        if (state_ == state::disconnected)
            throw error("Connection is not established.", "");
        reply rep;
        try
        {
            rep = co_await command_impl("QUIT", command_kind::quit);
        }
        catch (...)
        {
            close();
            throw;
        }
        close();
        co_return rep;
    }

    /**
    Closing the connection without QUIT.
    **/
    void close() noexcept
    {
        if (dialog_.has_value())
            dialog_->close();
        dialog_.reset();
        state_ = state::disconnected;
        reset_capabilities();
    }

    [[nodiscard]] bool is_connected() const noexcept
    {
        return state_ != state::disconnected;
    }

    [[nodiscard]] bool is_authenticated() const noexcept
    {
        return state_ == state::authenticated;
    }

    const capabilities& server_capabilities() const { return capabilities_; }

    const std::string& server_name() const { return server_name_; }

    /**
    Extracting the address used in the envelope from a header value.

    `Name <user@host>` gives `user@host`; a value without angle brackets is returned trimmed.
    **/
    static std::string envelope_address(std::string_view value)
    {
        const auto open = value.rfind('<');
        if (open != std::string_view::npos)
        {
            const auto close = value.find('>', open);
            if (close != std::string_view::npos)
                return std::string(value.substr(open + 1, close - open - 1));
        }
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            value.remove_prefix(1);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            value.remove_suffix(1);
        return std::string(value);
    }

    static void append_smtp_data_terminator(std::string& data)
    {
        if (ends_with_crlf(data))
            data += codec::END_OF_MESSAGE + codec::END_OF_LINE;
        else
            data += codec::END_OF_LINE + codec::END_OF_MESSAGE + codec::END_OF_LINE;
    }

private:
    enum class state
    {
        disconnected,
        connected,
        greeted,
        ehlo_done,
        authenticated
    };

    using dialog_type = mailsend::net::dialog<mailsend::net::upgradable_stream>;

    static bool ends_with_crlf(std::string_view data) noexcept
    {
        return data.size() >= 2 && data[data.size() - 2] == '\r' && data[data.size() - 1] == '\n';
    }

    static bool allows_helo_fallback(int status) noexcept
    {
        return status == 500 || status == 502 || status == 504;
    }

    bool has_helo_or_ehlo() const noexcept
    {
        return state_ == state::ehlo_done || state_ == state::authenticated;
    }

    void reset_capabilities() noexcept
    {
        capabilities_.entries.clear();
        capabilities_known_ = false;
        server_name_.clear();
    }

    std::string resolve_sni(std::string_view host) const
    {
        std::string sni = options_.default_sni.empty() ? std::string(host) : options_.default_sni;
        mailsend::detail::ensure_no_crlf_or_nul(sni, "sni");
        return sni;
    }

    dialog_type& dialog()
    {
        if (!dialog_.has_value())
            throw error("Connection is not established.", "");
        return *dialog_;
    }

    void configure_trace()
    {
        if (!dialog_.has_value())
            return;
        dialog_->set_trace_protocol("SMTP");
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
    }

    static mailsend::net::dialog_error connection_error(mailsend::net::io_stage stage, const std::string& endpoint,
        const asio::error_code& ec, bool timed_out)
    {
        return mailsend::net::dialog_error(mailsend::net::map_net_error(stage, ec, timed_out), "Connection failure.",
            endpoint + " " + mailsend::net::describe_net_error(stage, ec, timed_out), ec);
    }

    awaitable<void> connect_impl(const std::string& host, const std::string& service, mailsend::net::tls_mode mode)
    {
        if (state_ != state::disconnected)
            throw error("Connection is already established.", "");
        mailsend::detail::ensure_no_crlf_or_nul(host, "host");
        const std::string endpoint = host + ":" + service;
        MAILSEND_DEBUG("SMTP connecting to " + endpoint + " (tls " + std::string(mailsend::net::to_string(mode)) + ")");

        asio::error_code ec;
        tcp_type::resolver resolver(executor_);
        tcp_type::resolver::results_type endpoints;
        {
            mailsend::net::deadline_guard deadline(executor_, options_.timeout, [&resolver]() { resolver.cancel(); });
            endpoints = co_await resolver.async_resolve(host, service, redirect_error(use_awaitable, ec));
            if (ec)
                throw connection_error(mailsend::net::io_stage::resolve, endpoint, ec, deadline.expired());
        }

        mailsend::net::upgradable_stream stream(executor_);
        {
            mailsend::net::deadline_guard deadline(executor_, options_.timeout, [&stream]()
            {
                asio::error_code ignore_ec;
                stream.lowest_layer().cancel(ignore_ec);
            });
            co_await async_connect(stream.lowest_layer(), endpoints, redirect_error(use_awaitable, ec));
            if (ec)
                throw connection_error(mailsend::net::io_stage::connect, endpoint, ec, deadline.expired());
        }

        if (mode == mailsend::net::tls_mode::implicit)
        {
            mailsend::net::deadline_guard deadline(executor_, options_.timeout, [&stream]()
            {
                asio::error_code ignore_ec;
                stream.lowest_layer().cancel(ignore_ec);
            });
            auto tls_res = co_await stream.start_tls(tls_context_, resolve_sni(host), options_.tls);
            if (!tls_res)
            {
                if (deadline.expired())
                    throw connection_error(mailsend::net::io_stage::handshake, endpoint, asio::error::timed_out, true);
                const auto& err = tls_res.error();
                throw mailsend::net::dialog_error(err.code, err.message, endpoint + " " + err.detail);
            }
        }

        dialog_.emplace(std::move(stream), mailsend::net::DEFAULT_MAX_LINE_LENGTH, options_.timeout);
        configure_trace();
        state_ = state::connected;
        reset_capabilities();
        MAILSEND_DEBUG("SMTP connected to " + endpoint);
    }

    awaitable<reply> read_greeting_impl()
    {
        if (state_ != state::connected)
            throw error("Greeting requires an established connection.", "");
        reply rep = co_await read_reply_impl();
        if (rep.status != 220)
            throw error("Connection rejection.", rep.summary(), map_smtp_reply(command_kind::greeting, rep.status),
                rep.status);
        state_ = state::greeted;
        co_return rep;
    }

    awaitable<reply> ehlo_impl(std::string domain)
    {
        if (state_ != state::greeted)
            throw error("EHLO requires a greeting.", "");

        if (domain.empty())
            domain = options_.helo_name.empty() ? default_hostname() : options_.helo_name;
        mailsend::detail::ensure_no_crlf_or_nul(domain, "helo_name");

        reset_capabilities();
        reply rep = co_await command_impl("EHLO " + domain, command_kind::ehlo);
        if (!rep.is_positive_completion())
        {
            if (!allows_helo_fallback(rep.status))
                throw error("EHLO rejection.", rep.summary(), map_smtp_reply(command_kind::ehlo, rep.status),
                    rep.status);

            reply helo_rep = co_await command_impl("HELO " + domain, command_kind::helo);
            if (!helo_rep.is_positive_completion())
                throw error("HELO rejection.", helo_rep.summary(), map_smtp_reply(command_kind::helo, helo_rep.status),
                    helo_rep.status);
            state_ = state::ehlo_done;
            co_return helo_rep;
        }

        if (!rep.lines.empty())
        {
            const std::string& first = rep.lines.front();
            const auto space_pos = first.find(' ');
            server_name_ = space_pos == std::string::npos ? first : first.substr(0, space_pos);
        }
        parse_capabilities(rep);
        capabilities_known_ = true;
        state_ = state::ehlo_done;
        co_return rep;
    }

    awaitable<void> authenticate_impl(const std::string& username, const std::string& password, auth_method method)
    {
        mailsend::detail::ensure_no_crlf_or_nul(username, "username");
        mailsend::detail::ensure_no_crlf_or_nul(password, "password");
        if (!has_helo_or_ehlo())
            throw error("Authentication requires EHLO/HELO.", "");
        if (state_ == state::authenticated)
            throw error("Already authenticated.", "");

        const auto* auth_params = capabilities_known_ ? capabilities_.parameters("AUTH") : nullptr;
        if (auth_params == nullptr)
            throw error("AUTH not supported.", "Server did not advertise AUTH.", errc::smtp_auth_unsupported);

        // With auto detection every advertised mechanism is tried in turn until one is accepted.
        const std::vector<auth_method> candidates = resolve_auth_methods(method, *auth_params);
        std::optional<error> last_rejection;
        for (const auth_method candidate : candidates)
        {
            try
            {
                MAILSEND_DEBUG("SMTP authenticating with " + std::string(to_string(candidate)));
                co_await authenticate_with(candidate, username, password);
                state_ = state::authenticated;
                co_return;
            }
            catch (const error& exc)
            {
                if (exc.code() != errc::smtp_auth_failed)
                    throw;
                last_rejection = exc;
            }
        }
        throw *last_rejection;
    }

    awaitable<void> authenticate_with(auth_method method, const std::string& username, const std::string& password)
    {
        switch (method)
        {
            case auth_method::plain:
                co_await authenticate_plain_impl(username, password);
                break;
            case auth_method::login:
                co_await authenticate_login_impl(username, password);
                break;
            case auth_method::cram_md5:
                co_await authenticate_cram_md5_impl(username, password);
                break;
            case auth_method::auto_detect:
                throw error("AUTH auto-detect resolution failed.", "", errc::internal_error);
        }
    }

    awaitable<void> authenticate_plain_impl(const std::string& username, const std::string& password)
    {
        const std::string encoded = mailsend::sasl::encode_plain(username, password);

        reply rep = co_await command_impl("AUTH PLAIN " + encoded, command_kind::auth);
        if (rep.status == 334)
            rep = co_await command_impl(encoded, command_kind::auth, true);

        if (!rep.is_positive_completion())
            throw auth_rejection(rep);
    }

    awaitable<void> authenticate_login_impl(const std::string& username, const std::string& password)
    {
        reply rep = co_await command_impl("AUTH LOGIN", command_kind::auth);
        if (rep.status != 334)
            throw auth_rejection(rep);

        rep = co_await command_impl(mailsend::sasl::encode_login(username), command_kind::auth, true);
        if (rep.status != 334)
            throw auth_rejection(rep);

        rep = co_await command_impl(mailsend::sasl::encode_login(password), command_kind::auth, true);
        if (!rep.is_positive_completion())
            throw auth_rejection(rep);
    }

    awaitable<void> authenticate_cram_md5_impl(const std::string& username, const std::string& password)
    {
        reply rep = co_await command_impl("AUTH CRAM-MD5", command_kind::auth);
        if (rep.status != 334)
            throw auth_rejection(rep);

        auto response = mailsend::sasl::encode_cram_md5(username, password, rep.lines.empty() ? "" : rep.lines.front());
        if (!response)
        {
            // Abort the exchange so that the session can continue with another mechanism.
            co_await command_impl("*", command_kind::auth);
            throw error(response.error().message, response.error().detail, errc::smtp_auth_failed, rep.status);
        }

        rep = co_await command_impl(*response, command_kind::auth, true);
        if (!rep.is_positive_completion())
            throw auth_rejection(rep);
    }

    static error auth_rejection(const reply& rep)
    {
        return error("Authentication rejection.", rep.summary(), map_smtp_reply(command_kind::auth, rep.status),
            rep.status);
    }

    awaitable<reply> send_impl(const mailsend::message& msg, const envelope& env)
    {
        if (!has_helo_or_ehlo())
            throw error("Send requires EHLO/HELO.", "");

        const std::string mail_from = env.mail_from.empty() ? envelope_address(msg.from()) : env.mail_from;
        std::vector<std::string> recipients = env.rcpt_to;
        if (recipients.empty())
            recipients.push_back(envelope_address(msg.to()));
        mailsend::detail::ensure_no_crlf_or_nul(mail_from, "mail_from");
        for (const auto& rcpt : recipients)
            mailsend::detail::ensure_no_crlf_or_nul(rcpt, "rcpt_to");

        message_format_options_t opts;
        opts.dot_escape = true;
        std::string data;
        msg.format(data, opts);
        append_smtp_data_terminator(data);

        std::string mail_cmd = "MAIL FROM:<" + mail_from + ">";
        if (options_.use_size_extension && capabilities_known_ && capabilities_.supports("SIZE"))
            mail_cmd += " SIZE=" + std::to_string(data.size());

        reply rep = co_await command_impl(mail_cmd, command_kind::mail_from);
        if (!rep.is_positive_completion())
            throw error("Mail sender rejection.", rep.summary(), map_smtp_reply(command_kind::mail_from, rep.status),
                rep.status);

        for (const auto& rcpt : recipients)
        {
            rep = co_await command_impl("RCPT TO:<" + rcpt + ">", command_kind::rcpt_to);
            if (!rep.is_positive_completion())
                throw error("Mail recipient rejection.", rep.summary(), map_smtp_reply(command_kind::rcpt_to, rep.status),
                    rep.status);
        }

        rep = co_await command_impl("DATA", command_kind::data_cmd);
        if (rep.status != 354)
            throw error("Mail message rejection.", rep.summary(), map_smtp_reply(command_kind::data_cmd, rep.status),
                rep.status);

        MAILSEND_TRACE_SEND("SMTP", "<message data: " + std::to_string(data.size()) + " bytes>");
        co_await dialog().write_raw(std::move(data));
        rep = co_await read_reply_impl();
        if (!rep.is_positive_completion())
            throw error("Mail message rejection.", rep.summary(), map_smtp_reply(command_kind::data_body, rep.status),
                rep.status);
        MAILSEND_DEBUG("SMTP message accepted: " + rep.summary());
        co_return rep;
    }

    /**
    Sending a command and reading its reply. A `secret` line is a SASL response and never reaches the trace.
    **/
    awaitable<reply> command_impl(std::string line, command_kind kind, bool secret = false)
    {
        if (secret)
            co_await dialog().write_secret_line(std::move(line));
        else
            co_await dialog().write_line(std::move(line));
        reply rep = co_await read_reply_impl();
        if (rep.status == 421 && kind != command_kind::quit)
        {
            // The server is closing the transmission channel.
            close();
            throw error("Service not available.", rep.summary(), errc::smtp_temporary_failure, rep.status);
        }
        co_return rep;
    }

    /**
    Reading one reply, continuation lines included.

    Each line is `<code>-<text>` while more follow and `<code> <text>` (or a bare code) for the last one. All the lines
    must carry the same code.
    **/
    awaitable<reply> read_reply_impl()
    {
        reply rep;
        bool last = false;
        while (!last)
        {
            const std::string line = co_await dialog().read_line();
            const bool has_code = line.size() >= 3 && std::all_of(line.begin(), line.begin() + 3,
                [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
            const char separator = line.size() > 3 ? line[3] : ' ';
            if (!has_code || (separator != ' ' && separator != '-'))
                throw error("Parsing server failure.", line, errc::smtp_bad_reply);

            const int code = std::stoi(line.substr(0, 3));
            if (rep.status != 0 && rep.status != code)
                throw error("Parsing server failure.", line, errc::smtp_bad_reply);
            rep.status = code;
            rep.lines.push_back(line.size() > 4 ? line.substr(4) : std::string());
            last = separator == ' ';
        }
        co_return rep;
    }

    static std::string default_hostname()
    {
        asio::error_code ec;
        std::string name = ip::host_name(ec);
        if (ec || name.empty())
            return "localhost";
        return name;
    }

    /**
    Filling the capability table from an EHLO reply, keyword upper cased and parameters split on spaces.

    The first line is the server greeting. `AUTH=LOGIN` style lines of older servers are read as `AUTH LOGIN`.
    **/
    void parse_capabilities(const reply& rep)
    {
        capabilities_.entries.clear();
        for (std::size_t i = 1; i < rep.lines.size(); ++i)
        {
            std::istringstream words(rep.lines[i]);
            std::string keyword;
            if (!(words >> keyword))
                continue;

            std::vector<std::string> params;
            const auto equal_pos = keyword.find('=');
            if (equal_pos != std::string::npos)
            {
                if (equal_pos + 1 < keyword.size())
                    params.push_back(keyword.substr(equal_pos + 1));
                keyword.erase(equal_pos);
            }
            for (std::string word; words >> word;)
                params.push_back(std::move(word));

            auto& slot = capabilities_.entries[to_upper_ascii(keyword)];
            slot.insert(slot.end(), std::make_move_iterator(params.begin()), std::make_move_iterator(params.end()));
        }
    }

    static std::string to_upper_ascii(std::string_view input)
    {
        std::string out(input);
        std::transform(out.begin(), out.end(), out.begin(),
            [](char ch) { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - ('a' - 'A')) : ch; });
        return out;
    }

    /**
    Mechanisms to try, in order, for the requested method and the advertised `AUTH` parameters.

    @throw error Category `smtp_auth_unsupported` when nothing usable is advertised.
    **/
    static std::vector<auth_method> resolve_auth_methods(auth_method method, const std::vector<std::string>& params)
    {
        // Strongest first.
        static constexpr std::pair<auth_method, std::string_view> known[] = {
            {auth_method::cram_md5, "CRAM-MD5"}, {auth_method::plain, "PLAIN"}, {auth_method::login, "LOGIN"}};

        const auto advertised = [&params](std::string_view name)
        {
            return std::any_of(params.begin(), params.end(),
                [name](const std::string& param) { return to_upper_ascii(param) == name; });
        };

        std::vector<auth_method> methods;
        for (const auto& [candidate, name] : known)
        {
            if (method != auth_method::auto_detect && method != candidate)
                continue;
            if (advertised(name))
                methods.push_back(candidate);
            else if (method == candidate)
                throw error("AUTH " + std::string(name) + " not advertised by the server.", "",
                    errc::smtp_auth_unsupported);
        }
        if (methods.empty())
            throw error("No supported AUTH mechanisms advertised.", "", errc::smtp_auth_unsupported);
        return methods;
    }

    executor_type executor_;
    options options_;
    ssl::context tls_context_;
    std::optional<dialog_type> dialog_;
    std::string server_name_;
    capabilities capabilities_;
    state state_{state::disconnected};
    bool capabilities_known_{false};
};

} // namespace mailsend::smtp
