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
#include <ringside/async/operations.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/core/result.hpp>

#include <cstddef>
#include <deque>
#include <memory>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

/*! \brief Exclusive owner of the ring, the operation registry and the
queue of entries not yet accepted by the kernel.

Not thread safe, and not reentrant: access it through an
`ExclusiveCell<ReactorState>`.
*/
class ReactorState
{
    // Declared before ops_ so the registry is checked for emptiness before
    // the ring goes away
    std::unique_ptr<Ring> ring_;
    Operations ops_;
    std::deque<io_uring_sqe> submissions_;

public:
    explicit ReactorState(std::unique_ptr<Ring> ring);

    ReactorState(ReactorState const &) = delete;
    ReactorState(ReactorState &&) = delete;
    ReactorState &operator=(ReactorState const &) = delete;
    ReactorState &operator=(ReactorState &&) = delete;

    Ring &ring() noexcept
    {
        return *ring_;
    }

    Operations &operations() noexcept
    {
        return ops_;
    }

    size_t pending_submissions() const noexcept
    {
        return submissions_.size();
    }

    //! Queue an entry for the next submission flush
    void push(io_uring_sqe const &sqe)
    {
        submissions_.push_back(sqe);
    }

    //! Drain every visible completion into the registry. Returns the number
    //! of completion events consumed, including cancellation ones.
    size_t flush_completions();

    //! Move queued entries into the kernel ring and submit them. EBUSY from
    //! the kernel is absorbed; any other error is returned.
    Result<void> flush_submissions();
};

RINGSIDE_ASYNC_NAMESPACE_END
