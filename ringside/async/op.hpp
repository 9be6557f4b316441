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
#include <ringside/async/lifecycle.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/reactor.hpp>

#include <memory>
#include <optional>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

/*! \brief Observer of one submitted operation.

Holds whatever memory the kernel may touch for the operation. Destroying an
`Op` before its final completion hands that memory over to the reactor,
which releases it once the kernel is done with it.
*/
class Op
{
    ReactorHandle reactor_;
    OperationId id_{};
    std::shared_ptr<void> resources_;
    bool finished_{true};

    void release_() noexcept;

public:
    Op() = default;
    Op(ReactorHandle reactor, OperationId id, std::shared_ptr<void> resources);

    Op(Op const &) = delete;
    Op &operator=(Op const &) = delete;
    Op(Op &&other) noexcept;
    Op &operator=(Op &&other) noexcept;

    ~Op()
    {
        release_();
    }

    OperationId id() const noexcept
    {
        return id_;
    }

    //! True once the final completion has been handed out
    bool is_finished() const noexcept
    {
        return finished_;
    }

    //! Take the next completion, or arrange for `waker` to be called when
    //! one arrives
    std::optional<CompletionResult> poll(Waker waker);
};

RINGSIDE_ASYNC_NAMESPACE_END
