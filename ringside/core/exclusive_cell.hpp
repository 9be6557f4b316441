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

#include <ringside/core/assert.h>
#include <ringside/core/config.hpp>

#include <utility>

RINGSIDE_NAMESPACE_BEGIN

/*! \brief Single threaded interior mutability with a runtime checked
exclusive borrow.

Only one `Borrow` may be outstanding at a time. Taking a second one is a
logic error (there is no parallelism to race with) and aborts.
*/
template <class T>
class ExclusiveCell
{
    T value_;
    bool borrowed_{false};

public:
    class Borrow
    {
        ExclusiveCell *cell_;

    public:
        explicit Borrow(ExclusiveCell *const cell) noexcept
            : cell_(cell)
        {
            cell_->borrowed_ = true;
        }

        Borrow(Borrow const &) = delete;
        Borrow &operator=(Borrow const &) = delete;
        Borrow &operator=(Borrow &&) = delete;

        Borrow(Borrow &&other) noexcept
            : cell_(std::exchange(other.cell_, nullptr))
        {
        }

        ~Borrow()
        {
            if (cell_ != nullptr) {
                cell_->borrowed_ = false;
            }
        }

        T &operator*() const noexcept
        {
            return cell_->value_;
        }

        T *operator->() const noexcept
        {
            return &cell_->value_;
        }
    };

    template <class... Args>
    explicit ExclusiveCell(std::in_place_t, Args &&...args)
        : value_(std::forward<Args>(args)...)
    {
    }

    ExclusiveCell(ExclusiveCell const &) = delete;
    ExclusiveCell(ExclusiveCell &&) = delete;
    ExclusiveCell &operator=(ExclusiveCell const &) = delete;
    ExclusiveCell &operator=(ExclusiveCell &&) = delete;

    ~ExclusiveCell()
    {
        RINGSIDE_ASSERT_PRINTF(
            !borrowed_, "ExclusiveCell destroyed while still borrowed");
    }

    [[nodiscard]] Borrow borrow() noexcept
    {
        RINGSIDE_ASSERT_PRINTF(
            !borrowed_,
            "ExclusiveCell is already borrowed, reentrant mutation is a "
            "logic error");
        return Borrow{this};
    }

    bool is_borrowed() const noexcept
    {
        return borrowed_;
    }
};

RINGSIDE_NAMESPACE_END
