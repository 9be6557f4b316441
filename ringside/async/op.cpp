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

#include <ringside/async/op.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/lifecycle.hpp>
#include <ringside/async/operations.hpp>
#include <ringside/async/reactor.hpp>
#include <ringside/core/assert.h>

#include <memory>
#include <optional>
#include <utility>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

Op::Op(
    ReactorHandle reactor, OperationId const id,
    std::shared_ptr<void> resources)
    : reactor_(std::move(reactor))
    , id_(id)
    , resources_(std::move(resources))
    , finished_(false)
{
}

Op::Op(Op &&other) noexcept
    : reactor_(std::move(other.reactor_))
    , id_(other.id_)
    , resources_(std::move(other.resources_))
    , finished_(std::exchange(other.finished_, true))
{
}

Op &Op::operator=(Op &&other) noexcept
{
    if (this != &other) {
        release_();
        reactor_ = std::move(other.reactor_);
        id_ = other.id_;
        resources_ = std::move(other.resources_);
        finished_ = std::exchange(other.finished_, true);
    }
    return *this;
}

void Op::release_() noexcept
{
    if (!finished_) {
        finished_ = true;
        reactor_.ignore(id_, std::move(resources_));
    }
}

std::optional<CompletionResult> Op::poll(Waker waker)
{
    RINGSIDE_ASSERT_PRINTF(
        !finished_, "operation polled after its final completion");
    auto ret = reactor_.poll(id_, std::move(waker));
    if (ret.has_value() && !reactor_.borrow()->operations().contains(id_)) {
        finished_ = true;
        resources_.reset();
    }
    return ret;
}

RINGSIDE_ASYNC_NAMESPACE_END
