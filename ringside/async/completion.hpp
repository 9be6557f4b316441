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
#include <ringside/core/result.hpp>

#include <cstdint>
#include <limits>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

//! user_data of entries that never map to an operation slot, such as the
//! request half of a cancellation
inline constexpr uint64_t CANCEL_USER_DATA =
    std::numeric_limits<uint64_t>::max();

//! One completion queue entry, as posted by the kernel
struct Completion
{
    uint64_t user_data{0};
    int32_t res{0};
    uint32_t flags{0};
};

//! A translated completion as delivered to the observer of an operation
struct CompletionResult
{
    Result<uint32_t> result;
    uint32_t flags;
};

/*! \brief Translate a raw CQE result code.

Non negative values are success (typically a byte count), `-e` is the errno
`e` in the system category. INT32_MIN is not a valid result and aborts.
*/
Result<uint32_t> to_result(int32_t res) noexcept;

inline CompletionResult to_completion_result(Completion const &cqe) noexcept
{
    return CompletionResult{to_result(cqe.res), cqe.flags};
}

RINGSIDE_ASYNC_NAMESPACE_END
