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

#include <ringside/async/reactor.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/lifecycle.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/reactor_state.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/async/uring_ring.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

size_t ReactorHandle::flush_completions() const
{
    return borrow()->flush_completions();
}

Result<void> ReactorHandle::flush_submissions() const
{
    return borrow()->flush_submissions();
}

Result<unsigned> ReactorHandle::wait() const
{
    return borrow()->ring().submit_and_wait(1);
}

Result<unsigned>
ReactorHandle::wait_for(std::chrono::nanoseconds const timeout) const
{
    return borrow()->ring().submit_and_wait_for(1, timeout);
}

size_t ReactorHandle::operation_count() const
{
    return borrow()->operations().size();
}

size_t ReactorHandle::pending_submission_count() const
{
    return borrow()->pending_submissions();
}

size_t ReactorHandle::kernel_owned_count() const
{
    return borrow()->operations().kernel_owned();
}

int ReactorHandle::fd() const
{
    return borrow()->ring().fd();
}

OperationId
ReactorHandle::submit(io_uring_sqe sqe, CompletionPolicy const policy) const
{
    auto state = borrow();
    OperationId const id = state->operations().insert(policy);
    sqe.user_data = id.user_data();
    state->push(sqe);
    return id;
}

void ReactorHandle::submit_untracked(io_uring_sqe sqe) const
{
    sqe.user_data = CANCEL_USER_DATA;
    borrow()->push(sqe);
}

std::optional<CompletionResult>
ReactorHandle::poll(OperationId const id, Waker waker) const
{
    return borrow()->operations().poll(id, std::move(waker));
}

bool ReactorHandle::ignore(
    OperationId const id, std::shared_ptr<void> keep_alive) const
{
    return borrow()->operations().ignore(id, std::move(keep_alive));
}

Result<Reactor> Reactor::create(ReactorConfig const &config)
{
    auto ring = UringRing::create(config);
    if (!ring) {
        return ring.as_failure();
    }
    return Reactor{std::move(ring).assume_value()};
}

Reactor::Reactor(std::unique_ptr<Ring> ring)
    : ReactorHandle(std::make_shared<detail::ReactorCell>(
          std::in_place, std::move(ring)))
{
}

Reactor::~Reactor()
{
    if (cell_ != nullptr) {
        shutdown();
    }
}

size_t Reactor::shutdown()
{
    size_t drained = 0;
    if (cell_ == nullptr) {
        return drained;
    }
    size_t const in_flight = kernel_owned_count();
    if (in_flight == 0) {
        return drained;
    }
    LOG_INFO(
        "reactor on fd {} waiting for {} operations in flight",
        fd(),
        in_flight);
    while (kernel_owned_count() > 0) {
        if (auto const r = flush_submissions(); !r) {
            LOG_WARNING(
                "submission flush during reactor shutdown failed, retrying: {}",
                r.assume_error().message());
        }
        // If waiting fails it is attempted again on the next loop
        if (auto const r = wait(); !r) {
            LOG_WARNING(
                "wait during reactor shutdown failed, retrying: {}",
                r.assume_error().message());
        }
        drained += flush_completions();
    }
    LOG_DEBUG("reactor shutdown drained {} completions", drained);
    return drained;
}

RINGSIDE_ASYNC_NAMESPACE_END
