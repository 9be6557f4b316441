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

#include <ringside/async/completion.hpp>

#include <ringside/async/config.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <cstdint>
#include <limits>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

Result<uint32_t> to_result(int32_t const res) noexcept
{
    if (res >= 0) {
        return static_cast<uint32_t>(res);
    }
    // Has no errno counterpart, and negating it overflows
    RINGSIDE_ASSERT_PRINTF(
        res != std::numeric_limits<int32_t>::min(),
        "completion result %d is not a negated errno",
        res);
    return errno_to_error_code(-res);
}

RINGSIDE_ASYNC_NAMESPACE_END
