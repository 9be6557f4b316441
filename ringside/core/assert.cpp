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

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

namespace
{
    void write_stderr(char const *buffer, int written) noexcept
    {
        if (written <= 0) {
            return;
        }
        if (write(STDERR_FILENO, buffer, (size_t)written) == -1) {
            // Suppress warning
        }
    }

    int format_location(
        char *buffer, size_t size, char const *expr, char const *function,
        char const *file, long line) noexcept
    {
        int const written =
            (expr != nullptr)
                ? snprintf(
                      buffer,
                      size,
                      "%s:%ld: %s: Assertion '%s' failed.\n",
                      file,
                      line,
                      function,
                      expr)
                : snprintf(
                      buffer, size, "%s:%ld: %s: Aborted.\n", file, line, function);
        return (written > 0 && (size_t)written < size) ? written
                                                        : (int)size - 1;
    }
}

extern "C" void ringside_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line)
{
    char buffer[1024];
    write_stderr(
        buffer,
        format_location(buffer, sizeof(buffer), expr, function, file, line));
    abort();
}

extern "C" void ringside_assertion_failed_printf(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const format, ...)
{
    char buffer[4096];
    int const written =
        format_location(buffer, sizeof(buffer), expr, function, file, line);
    write_stderr(buffer, written);

    va_list args;
    va_start(args, format);
    int const msg_written = vsnprintf(buffer, sizeof(buffer) - 1, format, args);
    va_end(args);
    if (msg_written > 0) {
        int const len = ((size_t)msg_written < sizeof(buffer) - 1)
                            ? msg_written
                            : (int)sizeof(buffer) - 2;
        buffer[len] = '\n';
        write_stderr(buffer, len + 1);
    }
    abort();
}
