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

#include <ringside/async/config.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/core/result.hpp>

#include <liburing.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

struct RingConfig
{
    static constexpr unsigned DEFAULT_ENTRIES = 256;

    unsigned entries{DEFAULT_ENTRIES};
    //! If set, a kernel thread bound to this cpu polls the submission ring
    std::optional<unsigned> sq_thread_cpu{};
    unsigned sq_thread_idle_ms{1000};
};

//! `Ring` implemented over liburing
class UringRing final : public Ring
{
    io_uring ring_;
    io_uring_params params_;
    bool initialised_{false};

    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    //! Use create()
    explicit UringRing(PrivateTag) noexcept;

    static Result<std::unique_ptr<UringRing>> create(RingConfig const &);

    ~UringRing() override;

    UringRing(UringRing const &) = delete;
    UringRing(UringRing &&) = delete;
    UringRing &operator=(UringRing const &) = delete;
    UringRing &operator=(UringRing &&) = delete;

    bool push(io_uring_sqe const &sqe) override;
    Result<unsigned> submit() override;
    Result<unsigned> submit_and_wait(unsigned want) override;
    Result<unsigned> submit_and_wait_for(
        unsigned want, std::chrono::nanoseconds timeout) override;
    size_t drain_completions(completion_visitor const &visit) override;

    int fd() const noexcept override
    {
        return ring_.ring_fd;
    }

    unsigned sq_entries() const noexcept override
    {
        return params_.sq_entries;
    }

    unsigned cq_entries() const noexcept
    {
        return params_.cq_entries;
    }

    bool is_sqpoll() const noexcept
    {
        return (params_.flags & IORING_SETUP_SQPOLL) != 0;
    }
};

RINGSIDE_ASYNC_NAMESPACE_END
