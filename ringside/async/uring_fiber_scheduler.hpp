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

#pragma once

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/op.hpp>
#include <ringside/async/reactor.hpp>

#include <boost/fiber/algo/algorithm.hpp>
#include <boost/fiber/context.hpp>
#include <boost/fiber/scheduler.hpp>

#include <chrono>
#include <cstdint>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

using boost::fibers::context;

/*! \brief Boost.Fiber scheduling algorithm driven by a reactor.

When no fiber is ready, queued submissions are flushed, the thread blocks in
the reactor until a completion arrives, and completions are drained, which
wakes the fibers awaiting them. Install on the reactor's thread with
`boost::fibers::use_scheduling_algorithm<UringFiberScheduler>(handle)`.
*/
class UringFiberScheduler final : public boost::fibers::algo::algorithm
{
    ReactorHandle reactor_;
    boost::fibers::scheduler::ready_queue_type ready_queue_{};
    uint32_t ready_cnt_{0};

public:
    explicit UringFiberScheduler(ReactorHandle reactor);

    ~UringFiberScheduler() override = default;

    UringFiberScheduler(UringFiberScheduler const &) = delete;
    UringFiberScheduler(UringFiberScheduler &&) = delete;
    UringFiberScheduler &operator=(UringFiberScheduler const &) = delete;
    UringFiberScheduler &operator=(UringFiberScheduler &&) = delete;

    void awakened(context *ctx) noexcept override;
    context *pick_next() noexcept override;
    bool has_ready_fibers() const noexcept override;
    void suspend_until(
        std::chrono::steady_clock::time_point const &) noexcept override;
    void notify() noexcept override;
};

//! Suspend the calling fiber until the next completion of `op`
CompletionResult await_op(Op &op);

RINGSIDE_ASYNC_NAMESPACE_END
