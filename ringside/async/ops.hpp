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
#include <ringside/async/op.hpp>
#include <ringside/async/operations.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

// Builders for common operations. Each queues its entry on the reactor
// current for this thread, see Reactor::with().

using SharedBuffer = std::shared_ptr<std::vector<std::byte>>;

namespace detail
{
    //! Length field of a read or write entry. Larger buffers are transferred
    //! short, as the kernel caps a single transfer well below this anyway.
    constexpr unsigned io_length(size_t const size) noexcept
    {
        return static_cast<unsigned>(
            std::min<size_t>(size, std::numeric_limits<unsigned>::max()));
    }
}

Op nop();

//! Completes with the number of bytes read into `buffer`, which may be
//! short
Op read_at(int fd, SharedBuffer buffer, uint64_t offset);

//! Completes with the number of bytes written from `buffer`
Op write_at(int fd, SharedBuffer buffer, uint64_t offset);

Op fsync(int fd);

Op close(int fd);

//! Completes with ETIME once `duration` has elapsed
Op timeout(std::chrono::nanoseconds duration);

//! Multi-shot: one completion per readiness event until cancelled
Op poll_multishot(int fd, unsigned poll_mask);

//! Ask the kernel to cancel `target`. The request itself is untracked, the
//! target still posts its own final completion.
void cancel(OperationId target);

RINGSIDE_ASYNC_NAMESPACE_END
