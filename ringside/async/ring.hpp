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
#include <ringside/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <functional>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

/*! \brief The kernel submission/completion ring pair.

This is the one boundary where correctness depends on the caller: an entry
handed to `push()` may reference memory the kernel reads from or writes into
at any time until the matching completion has been drained. Everything above
this interface enforces that by keeping the operation's slot, and through it
the memory, alive until then.
*/
class Ring
{
public:
    using completion_visitor = std::function<void(Completion const &)>;

    virtual ~Ring() = default;

    //! Copy an entry into the submission ring. Returns false if it is full.
    virtual bool push(io_uring_sqe const &sqe) = 0;

    //! Hand everything pushed so far to the kernel. Never blocks.
    virtual Result<unsigned> submit() = 0;

    //! Submit, then block until at least `want` completions are available
    virtual Result<unsigned> submit_and_wait(unsigned want) = 0;

    //! As submit_and_wait(), failing with ETIME if `timeout` elapses first
    virtual Result<unsigned>
    submit_and_wait_for(unsigned want, std::chrono::nanoseconds timeout) = 0;

    //! Visit and consume every completion currently visible, returning how
    //! many there were
    virtual size_t drain_completions(completion_visitor const &visit) = 0;

    //! Pollable descriptor of the ring
    virtual int fd() const noexcept = 0;

    virtual unsigned sq_entries() const noexcept = 0;
};

RINGSIDE_ASYNC_NAMESPACE_END
