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

#include <ringside/async/uring_ring.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <cstddef>
#include <cstring>
#include <memory>
#include <system_error>

#include <liburing.h>
#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

UringRing::UringRing(PrivateTag) noexcept
{
    std::memset(&ring_, 0, sizeof(ring_));
    std::memset(&params_, 0, sizeof(params_));
}

Result<std::unique_ptr<UringRing>> UringRing::create(RingConfig const &config)
{
    RINGSIDE_ASSERT(config.entries > 0);
    auto ring = std::make_unique<UringRing>(PrivateTag{});
    if (config.sq_thread_cpu.has_value()) {
        ring->params_.flags |= IORING_SETUP_SQPOLL | IORING_SETUP_SQ_AFF;
        ring->params_.sq_thread_cpu = *config.sq_thread_cpu;
        ring->params_.sq_thread_idle = config.sq_thread_idle_ms;
    }
    int const ret = io_uring_queue_init_params(
        config.entries, &ring->ring_, &ring->params_);
    if (ret < 0) {
        std::error_code const ec = errno_to_error_code(-ret);
        LOG_ERROR(
            "io_uring_queue_init_params with {} entries failed: {}",
            config.entries,
            ec.message());
        return ec;
    }
    ring->initialised_ = true;
    LOG_INFO(
        "io_uring fd {} created with {} sq entries, {} cq entries{}",
        ring->fd(),
        ring->params_.sq_entries,
        ring->params_.cq_entries,
        ring->is_sqpoll() ? ", sq polling thread" : "");
    return ring;
}

UringRing::~UringRing()
{
    if (initialised_) {
        io_uring_queue_exit(&ring_);
    }
}

bool UringRing::push(io_uring_sqe const &sqe)
{
    io_uring_sqe *const slot = io_uring_get_sqe(&ring_);
    if (slot == nullptr) {
        return false;
    }
    *slot = sqe;
    return true;
}

Result<unsigned> UringRing::submit()
{
    int const ret = io_uring_submit(&ring_);
    if (ret < 0) {
        return errno_to_error_code(-ret);
    }
    return static_cast<unsigned>(ret);
}

Result<unsigned> UringRing::submit_and_wait(unsigned const want)
{
    int const ret = io_uring_submit_and_wait(&ring_, want);
    if (ret < 0) {
        return errno_to_error_code(-ret);
    }
    return static_cast<unsigned>(ret);
}

Result<unsigned> UringRing::submit_and_wait_for(
    unsigned const want, std::chrono::nanoseconds const timeout)
{
    auto const secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    __kernel_timespec ts;
    ts.tv_sec = secs.count();
    ts.tv_nsec = (timeout - secs).count();
    io_uring_cqe *cqe = nullptr;
    int const ret =
        io_uring_submit_and_wait_timeout(&ring_, &cqe, want, &ts, nullptr);
    if (ret < 0) {
        return errno_to_error_code(-ret);
    }
    return static_cast<unsigned>(ret);
}

size_t UringRing::drain_completions(completion_visitor const &visit)
{
    unsigned head;
    io_uring_cqe *cqe;
    unsigned count = 0;
    io_uring_for_each_cqe(&ring_, head, cqe)
    {
        visit(Completion{cqe->user_data, cqe->res, cqe->flags});
        ++count;
    }
    io_uring_cq_advance(&ring_, count);
    return count;
}

RINGSIDE_ASYNC_NAMESPACE_END
