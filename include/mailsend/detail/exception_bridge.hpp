/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turning the exceptions of the SMTP and network layers into `mailsend::result` values.

*/

#pragma once

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/result.hpp>
#include <mailsend/mime/message.hpp>
#include <mailsend/net/dialog.hpp>
#include <mailsend/smtp/error.hpp>

namespace mailsend
{

namespace detail
{

template<class>
struct coroutine_result;

template<class T, class Executor>
struct coroutine_result<mailsend::asio::awaitable<T, Executor>>
{
    using type = T;
};

/// Value produced by awaiting what `F` returns.
template<class F>
using coroutine_result_t = typename coroutine_result<std::remove_cvref_t<std::invoke_result_t<F>>>::type;

inline error_info error_from(errc code, const std::exception& exc, std::string details, std::error_code ec,
    const std::source_location& where)
{
    return make_error(code, exc.what(), std::move(details), ec, where);
}

} // namespace detail

/**
Converting a captured exception to an error.

SMTP and network exceptions keep their own category, a message construction failure maps to `mime_invalid_header` and
`std::invalid_argument` to `invalid_argument`. Anything else is reported under `fallback`.
**/
[[nodiscard]] inline error_info from_exception(std::exception_ptr eptr, errc fallback,
    std::source_location where = std::source_location::current())
{
    if (!eptr)
        return make_error(fallback, "unknown exception", std::string{}, {}, where);

    try
    {
        std::rethrow_exception(eptr);
    }
    catch (const smtp::error& exc)
    {
        return detail::error_from(exc.code(), exc, exc.details(), {}, where);
    }
    catch (const net::dialog_error& exc)
    {
        return detail::error_from(exc.code(), exc, exc.details(), exc.system_code(), where);
    }
    catch (const mime_error& exc)
    {
        return detail::error_from(errc::mime_invalid_header, exc, exc.details(), {}, where);
    }
    catch (const asio::system_error& exc)
    {
        return detail::error_from(fallback, exc, {}, exc.code(), where);
    }
    catch (const std::system_error& exc)
    {
        return detail::error_from(fallback, exc, {}, exc.code(), where);
    }
    catch (const std::invalid_argument& exc)
    {
        return detail::error_from(errc::invalid_argument, exc, {}, {}, where);
    }
    catch (const std::exception& exc)
    {
        return detail::error_from(fallback, exc, {}, {}, where);
    }
    catch (...)
    {
        return make_error(fallback, "unknown exception", std::string{}, {}, where);
    }
}

/**
Running `f` and turning its value, or the exception it throws, into a result.
**/
template<class F>
[[nodiscard]] auto protect(F&& f, errc fallback) -> result<std::invoke_result_t<F>>
{
    try
    {
        if constexpr (std::is_void_v<std::invoke_result_t<F>>)
        {
            std::invoke(std::forward<F>(f));
            return ok();
        }
        else
            return ok(std::invoke(std::forward<F>(f)));
    }
    catch (...)
    {
        return detail::make_unexpected(from_exception(std::current_exception(), fallback));
    }
}

/**
Coroutine counterpart of `protect()`: `f` returns an awaitable which is awaited inside the guard.
**/
template<class F>
[[nodiscard]] auto protect_awaitable(F&& f, errc fallback)
    -> mailsend::asio::awaitable<result<detail::coroutine_result_t<F>>>
{
    // co_await is not allowed inside a handler, the exception is carried out of it.
    std::exception_ptr eptr;
    try
    {
        if constexpr (std::is_void_v<detail::coroutine_result_t<F>>)
        {
            co_await std::invoke(std::forward<F>(f));
            co_return ok();
        }
        else
            co_return ok(co_await std::invoke(std::forward<F>(f)));
    }
    catch (...)
    {
        eptr = std::current_exception();
    }
    co_return detail::make_unexpected(from_exception(eptr, fallback));
}

} // namespace mailsend
