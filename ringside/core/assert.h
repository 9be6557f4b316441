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

#include <ringside/core/likely.h>

#include <stddef.h>

#ifdef __cplusplus
extern "C"
{
#endif

__attribute__((noreturn)) void ringside_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

__attribute__((noreturn, format(printf, 5, 6))) void
ringside_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...);

#ifdef __cplusplus
}
#endif

#define RINGSIDE_ASSERT(expr)                                                  \
    do {                                                                       \
        if (RINGSIDE_UNLIKELY(!(expr))) {                                      \
            ringside_assertion_failed(                                         \
                #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__);               \
        }                                                                      \
    }                                                                          \
    while (0)

#define RINGSIDE_ASSERT_PRINTF(expr, format, ...)                              \
    do {                                                                       \
        if (RINGSIDE_UNLIKELY(!(expr))) {                                      \
            ringside_assertion_failed_printf(                                  \
                #expr,                                                         \
                __PRETTY_FUNCTION__,                                           \
                __FILE__,                                                      \
                __LINE__,                                                      \
                format,                                                        \
                ##__VA_ARGS__);                                                \
        }                                                                      \
    }                                                                          \
    while (0)

#define RINGSIDE_ABORT()                                                       \
    ringside_assertion_failed(NULL, __PRETTY_FUNCTION__, __FILE__, __LINE__)

#define RINGSIDE_ABORT_PRINTF(format, ...)                                     \
    ringside_assertion_failed_printf(                                          \
        NULL, __PRETTY_FUNCTION__, __FILE__, __LINE__, format, ##__VA_ARGS__)

#ifdef NDEBUG
    #define RINGSIDE_DEBUG_ASSERT(expr)                                        \
        do {                                                                   \
            (void)sizeof(expr);                                                \
        }                                                                      \
        while (0)
#else
    #define RINGSIDE_DEBUG_ASSERT(expr) RINGSIDE_ASSERT(expr)
#endif
