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

#include <ringside/async/ops.hpp>

#include <ringside/async/config.hpp>
#include <ringside/async/current.hpp>
#include <ringside/async/lifecycle.hpp>
#include <ringside/async/op.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/reactor.hpp>
#include <ringside/core/assert.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>

#include <liburing.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

namespace
{
    io_uring_sqe make_sqe() noexcept
    {
        io_uring_sqe sqe;
        std::memset(&sqe, 0, sizeof(sqe));
        return sqe;
    }

    Op submit_op(
        io_uring_sqe const &sqe, std::shared_ptr<void> resources,
        CompletionPolicy const policy = CompletionPolicy::single_shot)
    {
        ReactorHandle const &reactor = expect_current_reactor();
        OperationId const id = reactor.submit(sqe, policy);
        return Op{reactor, id, std::move(resources)};
    }
}

Op nop()
{
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_nop(&sqe);
    return submit_op(sqe, nullptr);
}

Op read_at(int const fd, SharedBuffer buffer, uint64_t const offset)
{
    RINGSIDE_ASSERT(buffer != nullptr);
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_read(
        &sqe,
        fd,
        buffer->data(),
        detail::io_length(buffer->size()),
        offset);
    return submit_op(sqe, std::move(buffer));
}

Op write_at(int const fd, SharedBuffer buffer, uint64_t const offset)
{
    RINGSIDE_ASSERT(buffer != nullptr);
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_write(
        &sqe,
        fd,
        buffer->data(),
        detail::io_length(buffer->size()),
        offset);
    return submit_op(sqe, std::move(buffer));
}

Op fsync(int const fd)
{
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_fsync(&sqe, fd, 0);
    return submit_op(sqe, nullptr);
}

Op close(int const fd)
{
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_close(&sqe, fd);
    return submit_op(sqe, nullptr);
}

Op timeout(std::chrono::nanoseconds const duration)
{
    auto const secs =
        std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto ts = std::make_shared<__kernel_timespec>();
    ts->tv_sec = secs.count();
    ts->tv_nsec = (duration - secs).count();
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_timeout(&sqe, ts.get(), 0, 0);
    return submit_op(sqe, std::move(ts));
}

Op poll_multishot(int const fd, unsigned const poll_mask)
{
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_poll_multishot(&sqe, fd, poll_mask);
    return submit_op(sqe, nullptr, CompletionPolicy::multi_shot);
}

void cancel(OperationId const target)
{
    io_uring_sqe sqe = make_sqe();
    io_uring_prep_cancel64(&sqe, target.user_data(), 0);
    expect_current_reactor().submit_untracked(sqe);
}

RINGSIDE_ASYNC_NAMESPACE_END
