/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process wide diagnostics of mailsend: leveled records and the SMTP protocol
trace, written to a text stream (standard error by default) or handed to a
callback.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>

namespace mailsend::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

enum class direction : std::uint8_t
{
    send,
    receive
};

/**
One diagnostic record. Protocol trace records carry `trace_info` and an empty message.
**/
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_name(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "trace";
        case level::debug: return "debug";
        case level::info:  return "info";
        case level::warn:  return "warn";
        case level::error: return "error";
        case level::off:   return "off";
    }
    return "unknown";
}

/// Inverse of `level_name()`, as accepted by `--log_level`.
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (level lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::off})
    {
        if (name == level_name(lvl))
            return lvl;
    }
    return std::nullopt;
}

/**
Masking control characters of traced protocol data and cutting it to `max_len` characters.
**/
[[nodiscard]] inline std::string sanitize_trace(std::string_view data, std::size_t max_len = 500)
{
    while (!data.empty() && (data.back() == '\r' || data.back() == '\n'))
        data.remove_suffix(1);

    std::string out;
    const bool truncated = data.size() > max_len;
    out.reserve(std::min(data.size(), max_len) + 16);
    for (char ch : data.substr(0, max_len))
        out += static_cast<unsigned char>(ch) < 32 ? '.' : ch;
    if (truncated)
        out += "... [truncated]";
    return out;
}

/**
Text form of a record, without the line terminator.

Records read `[hh:mm:ss.mmm] mailsend warn: <message>`, protocol traces read `[hh:mm:ss.mmm] SMTP >>> <data>`.
**/
[[nodiscard]] inline std::string format_entry(const entry& e)
{
    const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "[%02d:%02d:%02d.%03d]",
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::string line(stamp);
    if (e.trace_info)
    {
        line += ' ';
        line += e.trace_info->protocol;
        line += e.trace_info->dir == direction::send ? " >>> " : " <<< ";
        line += sanitize_trace(e.trace_info->data);
        return line;
    }
    line += " mailsend ";
    line += level_name(e.lvl);
    line += ": ";
    line += e.message;
    return line;
}

/**
Diagnostics sink shared by the whole process.

Records below the threshold are dropped before any formatting. The protocol trace is switched separately and ignores
the threshold. A callback, when set, receives every accepted record instead of the stream.
**/
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /**
    Redirecting the text output.

    @param out Stream receiving the records, it must outlive its use by the logger.
    @return    Previous stream.
    **/
    std::ostream& set_stream(std::ostream& out)
    {
        std::lock_guard lock(mutex_);
        std::ostream& previous = *stream_;
        stream_ = &out;
        return previous;
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        dispatch(entry{lvl, std::chrono::system_clock::now(), std::string(message), loc, std::nullopt});
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        dispatch(entry{level::trace, std::chrono::system_clock::now(), {}, loc,
            entry::trace_info_t{dir, std::string(protocol), std::string(data)}});
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            *stream_ << format_entry(e) << '\n';
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::warn)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
    std::ostream* stream_{&std::cerr};
};

/**
Applying a logger configuration for the lifetime of the object and restoring the previous one afterwards.
**/
class scoped_config
{
public:
    scoped_config(level lvl, bool trace, std::ostream& out)
        : previous_level_(logger::instance().get_level()),
          previous_trace_(logger::instance().is_trace_enabled()),
          previous_stream_(logger::instance().set_stream(out))
    {
        logger::instance().set_level(lvl);
        logger::instance().set_trace_enabled(trace);
    }

    scoped_config(const scoped_config&) = delete;

    scoped_config& operator=(const scoped_config&) = delete;

    ~scoped_config()
    {
        auto& inst = logger::instance();
        inst.set_stream(previous_stream_);
        inst.set_trace_enabled(previous_trace_);
        inst.set_level(previous_level_);
    }

private:
    level previous_level_;
    bool previous_trace_;
    std::ostream& previous_stream_;
};

#define MAILSEND_LOG(lvl, msg) \
    ::mailsend::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILSEND_DEBUG(msg)  MAILSEND_LOG(::mailsend::log::level::debug, msg)
#define MAILSEND_INFO(msg)   MAILSEND_LOG(::mailsend::log::level::info, msg)
#define MAILSEND_WARN(msg)   MAILSEND_LOG(::mailsend::log::level::warn, msg)

#define MAILSEND_TRACE_SEND(protocol, data) \
    ::mailsend::log::logger::instance().trace_protocol(protocol, ::mailsend::log::direction::send, data)

} // namespace mailsend::log
