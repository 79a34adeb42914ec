/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/log.hpp>
#include <mailsend/detail/redact.hpp>
#include <mailsend/detail/result.hpp>
#include <mailsend/net/deadline.hpp>
#include <mailsend/net/error_mapping.hpp>

namespace mailsend
{
namespace net
{

using namespace mailsend::asio;

/// Default maximum line length for network protocols (RFC 5321: 998 + CRLF, but commonly 8K)
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Error of the line oriented transport: I/O failure, timeout, closed connection or overlong line.
**/
class dialog_error : public std::runtime_error
{
public:
    dialog_error(const std::string& msg, const std::string& details)
        : std::runtime_error(msg), details_(details)
    {
    }

    dialog_error(errc code, const std::string& msg, const std::string& details, asio::error_code sys = {})
        : std::runtime_error(msg), details_(details), code_(code), sys_(sys)
    {
    }

    std::string details() const { return details_; }

    errc code() const noexcept { return code_; }

    asio::error_code system_code() const noexcept { return sys_; }

protected:
    std::string details_;
    errc code_{errc::net_io_failed};
    asio::error_code sys_;
};

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (socket, ssl stream, etc.). Every operation is a coroutine that throws `dialog_error` on
failure and is bounded by the optional timeout.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    dialog(const dialog&) = delete;

    dialog& operator=(const dialog&) = delete;

    ~dialog() = default;

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /**
    Sending a line to network.

    @param line Line to send, CRLF added if missing.
    @throw dialog_error Network failure or timeout.
    **/
    awaitable<void> write_line(std::string line)
    {
        std::string payload = normalize_line(line);
        trace_line(mailsend::log::direction::send, payload);
        co_await write_impl(std::move(payload));
    }

    /**
    Sending a line made entirely of credentials, such as a SASL response.

    With trace redaction on, the trace shows `<redacted>` whatever the content.

    @param line Line to send, CRLF added if missing.
    @throw dialog_error Network failure or timeout.
    **/
    awaitable<void> write_secret_line(std::string line)
    {
        std::string payload = normalize_line(line);
        if (redact_secrets_in_trace_)
            trace_line(mailsend::log::direction::send, std::string(mailsend::detail::REDACTED) + "\r\n");
        else
            trace_line(mailsend::log::direction::send, payload);
        co_await write_impl(std::move(payload));
    }

    /**
    Sending raw data to network, used for the message content.

    @param data Data to send as is.
    @throw dialog_error Network failure or timeout.
    **/
    awaitable<void> write_raw(std::string data)
    {
        co_await write_impl(std::move(data));
    }

    /**
    Receiving a line from network.

    @return Line without the trailing CRLF.
    @throw dialog_error Network failure, timeout, closed connection or line longer than the limit.
    **/
    awaitable<std::string> read_line()
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
        {
            asio::error_code ec;
            deadline_guard deadline(stream_.get_executor(), timeout_, [this]() { cancel(); });
            co_await asio::async_read_until(stream_, asio::dynamic_buffer(read_buffer_, max_line_length_ + 2), '\n',
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::not_found)
                throw dialog_error(errc::net_io_failed, "Line too long.", "Server line exceeds "
                    + std::to_string(max_line_length_) + " characters.", ec);
            if (ec)
                throw make_error(io_stage::read, ec, deadline.expired());
            pos = read_buffer_.find('\n');
        }

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            throw dialog_error(errc::net_io_failed, "Line too long.", "Server line exceeds "
                + std::to_string(max_line_length_) + " characters.");
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace_line(mailsend::log::direction::receive, line);
        co_return line;
    }

    /**
    Cancelling the pending operations on the underlying socket.
    **/
    void cancel() noexcept
    {
        asio::error_code ignore_ec;
        stream_.lowest_layer().cancel(ignore_ec);
    }

    /**
    Closing the underlying socket without a TLS shutdown.
    **/
    void close() noexcept
    {
        asio::error_code ignore_ec;
        stream_.lowest_layer().shutdown(tcp::socket::shutdown_both, ignore_ec);
        stream_.lowest_layer().close(ignore_ec);
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

protected:
    awaitable<void> write_impl(std::string payload)
    {
        asio::error_code ec;
        deadline_guard deadline(stream_.get_executor(), timeout_, [this]() { cancel(); });
        co_await asio::async_write(stream_, asio::buffer(payload), asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            throw make_error(io_stage::write, ec, deadline.expired());
    }

    static dialog_error make_error(io_stage stage, const asio::error_code& ec, bool timed_out)
    {
        const errc code = map_net_error(stage, ec, timed_out);
        if (code == errc::net_eof)
            return dialog_error(code, "Connection closed by server.", std::string(stage_name(stage)) + " failed.", ec);
        return dialog_error(code, "Network failure.", describe_net_error(stage, ec, timed_out), ec);
    }

    static std::string normalize_line(std::string_view line)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);
        std::string out(line);
        out += "\r\n";
        return out;
    }

    void trace_line(mailsend::log::direction dir, std::string_view data) const
    {
        auto& logger = mailsend::log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == mailsend::log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, dir, mailsend::detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;

    std::string trace_protocol_{"NET"};
    bool redact_secrets_in_trace_{true};
};

} // namespace net
} // namespace mailsend
