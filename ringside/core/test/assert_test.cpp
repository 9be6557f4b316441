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

#include <ringside/core/assert.h>

#include <gtest/gtest.h>

TEST(AssertDeathTest, reports_expression_and_location)
{
    EXPECT_DEATH(
        {
            int const x = 1;
            RINGSIDE_ASSERT(x == 2);
        },
        "assert_test.cpp.*Assertion 'x == 2' failed");
}

TEST(AssertDeathTest, printf_message)
{
    EXPECT_DEATH(
        RINGSIDE_ASSERT_PRINTF(false, "%d operations left", 3),
        "3 operations left");
}

TEST(AssertDeathTest, abort_printf)
{
    EXPECT_DEATH(RINGSIDE_ABORT_PRINTF("fatal %s", "here"), "fatal here");
}

TEST(AssertTest, passing_assertion_is_silent)
{
    RINGSIDE_ASSERT(1 + 1 == 2);
    RINGSIDE_ASSERT_PRINTF(true, "%s", "unused");
}
