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
#include <ringside/async/current.hpp>
#include <ringside/async/lifecycle.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/reactor_state.hpp>
#include <ringside/async/ring.hpp>
#include <ringside/async/uring_ring.hpp>
#include <ringside/core/exclusive_cell.hpp>
#include <ringside/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

using ReactorConfig = RingConfig;

namespace detail
{
    using ReactorCell = ExclusiveCell<ReactorState>;
}

/*! \brief Shared reference to a reactor's state, for use within the thread
that owns the reactor.

Every call takes the exclusive borrow of the state for its duration, so none
of these may be made from inside a `Waker`.
*/
class ReactorHandle
{
protected:
    std::shared_ptr<detail::ReactorCell> cell_;

public:
    ReactorHandle() = default;

    explicit ReactorHandle(std::shared_ptr<detail::ReactorCell> cell) noexcept
        : cell_(std::move(cell))
    {
    }

    explicit operator bool() const noexcept
    {
        return cell_ != nullptr;
    }

    bool same_reactor(ReactorHandle const &o) const noexcept
    {
        return cell_ == o.cell_;
    }

    [[nodiscard]] detail::ReactorCell::Borrow borrow() const noexcept
    {
        RINGSIDE_ASSERT(cell_ != nullptr);
        return cell_->borrow();
    }

    //! Returns the number of completion events drained
    size_t flush_completions() const;

    Result<void> flush_submissions() const;

    //! Submit anything pushed and block until a completion is available.
    //! The only blocking call.
    Result<unsigned> wait() const;

    //! As wait(), failing with ETIME once `timeout` has elapsed
    Result<unsigned> wait_for(std::chrono::nanoseconds timeout) const;

    //! Live slots, including finished operations whose results have not
    //! been collected yet
    size_t operation_count() const;

    //! Operations still waiting for their final completion
    size_t kernel_owned_count() const;

    size_t pending_submission_count() const;

    //! The ring descriptor, for multiplexing with other event sources
    int fd() const;

    //! Register a new operation and queue its entry. `sqe.user_data` is
    //! overwritten with the operation's id.
    OperationId submit(
        io_uring_sqe sqe,
        CompletionPolicy policy = CompletionPolicy::single_shot) const;

    //! Queue an entry which has no slot, its completion is discarded
    void submit_untracked(io_uring_sqe sqe) const;

    std::optional<CompletionResult> poll(OperationId, Waker waker) const;

    bool ignore(OperationId, std::shared_ptr<void> keep_alive) const;
};

/*! \brief Owns an io_uring reactor.

Destruction blocks until every operation in flight has posted its final
completion, as until then the kernel may write into memory the operations
own.
*/
class Reactor final : public ReactorHandle
{
public:
    static Result<Reactor> create(ReactorConfig const &config = {});

    explicit Reactor(std::unique_ptr<Ring> ring);

    Reactor(Reactor &&) noexcept = default;
    Reactor(Reactor const &) = delete;
    Reactor &operator=(Reactor const &) = delete;
    Reactor &operator=(Reactor &&) = delete;

    ~Reactor();

    ReactorHandle handle() const noexcept
    {
        return *this;
    }

    //! Run `f` with this reactor as the current one for this thread
    template <class F>
    decltype(auto) with(F &&f) const
    {
        ScopedCurrentReactor const scope{*this};
        return std::forward<F>(f)();
    }

    /*! \brief Block until the kernel owns no operation.

    Errors from submitting or waiting are logged and retried, never
    returned. Returns the number of completion events drained. Results of
    operations whose observers are still alive stay in the registry.
    */
    size_t shutdown();
};

RINGSIDE_ASYNC_NAMESPACE_END
