// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <ringside/async/uring_fiber_scheduler.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/op.hpp>
#include <ringside/async/reactor.hpp>
#include <ringside/core/assert.h>

#include <boost/fiber/context.hpp>
#include <boost/fiber/scheduler.hpp>
#include <boost/fiber/type.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

UringFiberScheduler::UringFiberScheduler(ReactorHandle reactor)
    : reactor_(std::move(reactor))
{
    RINGSIDE_ASSERT(static_cast<bool>(reactor_));
}

void UringFiberScheduler::awakened(context *ctx) noexcept
{
    RINGSIDE_DEBUG_ASSERT(ctx != nullptr);
    RINGSIDE_DEBUG_ASSERT(!ctx->ready_is_linked());

    if (!ctx->is_context(boost::fibers::type::dispatcher_context)) {
        ++ready_cnt_;
    }

    ctx->ready_link(ready_queue_);
}

context *UringFiberScheduler::pick_next() noexcept
{
    if (ready_queue_.empty()) {
        return nullptr;
    }

    context *ctx = &ready_queue_.front();
    ready_queue_.pop_front();

    if (!ctx->is_context(boost::fibers::type::dispatcher_context)) {
        --ready_cnt_;
    }

    return ctx;
}

bool UringFiberScheduler::has_ready_fibers() const noexcept
{
    return ready_cnt_ > 0;
}

void UringFiberScheduler::suspend_until(
    std::chrono::steady_clock::time_point const &abs_time) noexcept
{
    if (auto const r = reactor_.flush_submissions(); !r) {
        LOG_ERROR(
            "fiber scheduler failed to flush submissions: {}",
            r.assume_error().message());
    }
    if (reactor_.flush_completions() > 0) {
        return;
    }
    if (reactor_.kernel_owned_count() == 0) {
        // Only a sleeping fiber can become ready
        if (abs_time != std::chrono::steady_clock::time_point::max()) {
            std::this_thread::sleep_until(abs_time);
        }
        return;
    }
    if (abs_time == std::chrono::steady_clock::time_point::max()) {
        if (auto const r = reactor_.wait(); !r) {
            LOG_WARNING(
                "fiber scheduler wait failed: {}", r.assume_error().message());
            return;
        }
    }
    else {
        // A sleeping fiber must wake on time even if nothing completes
        auto const now = std::chrono::steady_clock::now();
        if (abs_time <= now) {
            return;
        }
        auto const r = reactor_.wait_for(abs_time - now);
        if (!r && r.assume_error() != std::errc::timer_expired) {
            LOG_WARNING(
                "fiber scheduler wait failed: {}", r.assume_error().message());
            return;
        }
    }
    reactor_.flush_completions();
}

void UringFiberScheduler::notify() noexcept
{
    // No-op for single-threaded usage
}

CompletionResult await_op(Op &op)
{
    context *const ctx = context::active();
    for (;;) {
        auto ret = op.poll([ctx] { ctx->get_scheduler()->schedule(ctx); });
        if (ret.has_value()) {
            return std::move(*ret);
        }
        ctx->suspend();
    }
}

RINGSIDE_ASYNC_NAMESPACE_END
