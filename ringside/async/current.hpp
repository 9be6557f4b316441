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

RINGSIDE_ASYNC_NAMESPACE_BEGIN

class ReactorHandle;

//! The reactor active on this thread, or nullptr
ReactorHandle const *current_reactor() noexcept;

//! The reactor active on this thread. Aborts if there is none.
ReactorHandle const &expect_current_reactor() noexcept;

/*! \brief Publishes a reactor as the current one for this thread for the
lifetime of the object.

The previous value is restored on destruction, including during unwinding.
Reentering with the reactor already active is fine, activating a different
reactor while one is active is not.
*/
class ScopedCurrentReactor
{
    ReactorHandle const *previous_;

public:
    explicit ScopedCurrentReactor(ReactorHandle const &reactor) noexcept;
    ~ScopedCurrentReactor();

    ScopedCurrentReactor(ScopedCurrentReactor const &) = delete;
    ScopedCurrentReactor(ScopedCurrentReactor &&) = delete;
    ScopedCurrentReactor &operator=(ScopedCurrentReactor const &) = delete;
    ScopedCurrentReactor &operator=(ScopedCurrentReactor &&) = delete;
};

RINGSIDE_ASYNC_NAMESPACE_END
