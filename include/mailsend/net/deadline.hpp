/*

deadline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <mailsend/detail/asio_decl.hpp>

namespace mailsend::net
{

/**
Scope bound deadline of one asynchronous operation.

When the timer fires while the guard is alive, the expiry action runs (usually cancelling the socket), making the
pending operation complete with `operation_aborted`; `expired()` then tells a timeout from other cancellations. Without
a duration the guard does nothing.
**/
class deadline_guard
{
public:
    using duration = std::chrono::steady_clock::duration;

    deadline_guard(asio::any_io_executor executor, std::optional<duration> timeout, std::function<void()> on_expire)
        : state_(std::make_shared<state>())
    {
        if (!timeout.has_value())
            return;

        state_->on_expire = std::move(on_expire);
        timer_ = std::make_unique<asio::steady_timer>(executor);
        timer_->expires_after(*timeout);
        timer_->async_wait([state = state_](const asio::error_code& ec)
        {
            if (ec || !state->active)
                return;
            state->expired = true;
            if (state->on_expire)
                state->on_expire();
        });
    }

    deadline_guard(const deadline_guard&) = delete;

    deadline_guard& operator=(const deadline_guard&) = delete;

    ~deadline_guard()
    {
        state_->active = false;
        state_->on_expire = nullptr;
        if (timer_)
            timer_->cancel();
    }

    [[nodiscard]] bool expired() const noexcept
    {
        return state_->expired;
    }

private:
    struct state
    {
        bool active = true;
        bool expired = false;
        std::function<void()> on_expire;
    };

    std::shared_ptr<state> state_;
    std::unique_ptr<asio::steady_timer> timer_;
};

} // namespace mailsend::net
