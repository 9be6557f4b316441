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

#include <ringside/async/reactor_state.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <quill/Quill.h>

#include <cerrno>
#include <cstddef>
#include <memory>
#include <utility>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

ReactorState::ReactorState(std::unique_ptr<Ring> ring)
    : ring_(std::move(ring))
{
    RINGSIDE_ASSERT(ring_ != nullptr);
}

size_t ReactorState::flush_completions()
{
    return ring_->drain_completions([this](Completion const &cqe) {
        if (cqe.user_data == CANCEL_USER_DATA) {
            // The cancel request's own completion. The cancelled operation
            // posts a completion of its own which is handled normally.
            return;
        }
        ops_.complete(
            OperationId::from_user_data(cqe.user_data),
            to_result(cqe.res),
            cqe.flags);
    });
}

Result<void> ReactorState::flush_submissions()
{
    bool submitted = false;
    while (!submissions_.empty()) {
        size_t pushed = 0;
        while (!submissions_.empty()) {
            // A full ring leaves the entry at the front, preserving order
            if (!ring_->push(submissions_.front())) {
                break;
            }
            submissions_.pop_front();
            ++pushed;
        }
        if (pushed == 0 && submitted) {
            // The kernel has not consumed the ring yet
            break;
        }

        for (;;) {
            auto const r = ring_->submit();
            if (r) {
                submitted = true;
                break;
            }
            if (r.assume_error() != errno_to_error_code(EBUSY)) {
                LOG_ERROR(
                    "io_uring submit failed with {} entries still queued: {}",
                    submissions_.size(),
                    r.assume_error().message());
                return r.as_failure();
            }
            size_t const drained = flush_completions();
            LOG_DEBUG("io_uring submit busy, drained {} completions", drained);
            if (drained == 0) {
                // Saturated, progress needs the caller to wait
                return success();
            }
        }
    }
    return success();
}

RINGSIDE_ASYNC_NAMESPACE_END
