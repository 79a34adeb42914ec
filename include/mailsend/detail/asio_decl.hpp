/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio names used by mailsend, gathered in `mailsend::asio`.

*/

#pragma once

#include <boost/asio/version.hpp>

// Boost 1.74 ships Boost.Asio 1.18, the first release with a usable awaitable and redirect_error.
#if BOOST_ASIO_VERSION < 101800
#error "mailsend requires Boost.Asio 1.18 or newer (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "mailsend requires C++20 coroutine support in Boost.Asio"
#endif

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace mailsend::asio
{

// Execution and coroutines.
using boost::asio::any_io_executor;
using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::io_context;
using boost::asio::redirect_error;
using boost::asio::steady_timer;
using boost::asio::use_awaitable;
using boost::asio::use_future;
namespace this_coro = boost::asio::this_coro;

// Buffers and stream operations; the blocking forms serve the test servers.
using boost::asio::async_connect;
using boost::asio::async_read_until;
using boost::asio::async_write;
using boost::asio::buffer;
using boost::asio::dynamic_buffer;
using boost::asio::read_until;
using boost::asio::streambuf;
using boost::asio::write;

namespace error = boost::asio::error;
namespace ip = boost::asio::ip;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using error_code = boost::system::error_code;
using system_error = boost::system::system_error;

} // namespace mailsend::asio
