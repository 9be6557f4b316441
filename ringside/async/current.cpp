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

#include <ringside/async/current.hpp>

#include <ringside/async/config.hpp>
#include <ringside/async/reactor.hpp>
#include <ringside/core/assert.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

namespace detail
{
    ReactorHandle const *&current_reactor_slot() noexcept
    {
        static thread_local ReactorHandle const *v = nullptr;
        return v;
    }
}

ReactorHandle const *current_reactor() noexcept
{
    return detail::current_reactor_slot();
}

ReactorHandle const &expect_current_reactor() noexcept
{
    ReactorHandle const *const reactor = detail::current_reactor_slot();
    RINGSIDE_ASSERT_PRINTF(
        reactor != nullptr,
        "no reactor is active on this thread, enter one with Reactor::with()");
    return *reactor;
}

ScopedCurrentReactor::ScopedCurrentReactor(ReactorHandle const &reactor) noexcept
    : previous_(detail::current_reactor_slot())
{
    RINGSIDE_ASSERT_PRINTF(
        previous_ == nullptr || previous_->same_reactor(reactor),
        "a different reactor is already active on this thread");
    detail::current_reactor_slot() = &reactor;
}

ScopedCurrentReactor::~ScopedCurrentReactor()
{
    detail::current_reactor_slot() = previous_;
}

RINGSIDE_ASYNC_NAMESPACE_END
