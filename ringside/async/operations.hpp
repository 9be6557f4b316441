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
#include <ringside/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

//! Stable handle to an operation slot. The generation makes a stale id
//! distinguishable from a later occupant of the same index.
struct OperationId
{
    uint32_t index{0};
    uint32_t generation{0};

    constexpr uint64_t user_data() const noexcept
    {
        return (static_cast<uint64_t>(generation) << 32) | index;
    }

    static constexpr OperationId from_user_data(uint64_t const v) noexcept
    {
        return OperationId{
            static_cast<uint32_t>(v), static_cast<uint32_t>(v >> 32)};
    }

    friend constexpr bool
    operator==(OperationId const &, OperationId const &) = default;
};

/*! \brief Generational slab of in-flight operations.

A slot lives until its final completion has been handed to the observer, or
arrived after the observer went away. Destroying the registry while it holds
any slot is fatal: either the kernel may still write into freed memory, or
an operation leaked without an observer.
*/
class Operations
{
    static constexpr uint32_t NO_FREE_SLOT =
        std::numeric_limits<uint32_t>::max();

    struct Slot
    {
        std::optional<Lifecycle> lifecycle;
        uint32_t generation{0};
        uint32_t next_free{NO_FREE_SLOT};
    };

    std::vector<Slot> slots_;
    uint32_t free_head_{NO_FREE_SLOT};
    size_t size_{0};
    size_t kernel_owned_{0};

    Slot *live_slot_(OperationId) noexcept;
    Slot &expect_live_slot_(OperationId, char const *what) noexcept;
    void free_slot_(Slot &, uint32_t index) noexcept;

public:
    static constexpr size_t INITIAL_CAPACITY = 64;

    Operations();
    ~Operations();

    Operations(Operations const &) = delete;
    Operations(Operations &&) = delete;
    Operations &operator=(Operations const &) = delete;
    Operations &operator=(Operations &&) = delete;

    //! Never fails, grows the backing storage when needed
    OperationId insert(CompletionPolicy policy = CompletionPolicy::single_shot);

    //! nullptr once the operation has been removed
    Lifecycle *get(OperationId) noexcept;

    bool contains(OperationId const id) noexcept
    {
        return get(id) != nullptr;
    }

    //! Discard a slot whose final completion has arrived
    void remove(OperationId);

    //! Feed a kernel completion in. Returns true if the slot was removed.
    bool complete(OperationId, Result<uint32_t> result, uint32_t flags);

    //! Observer side. Removes the slot once its final completion has been
    //! handed out.
    std::optional<CompletionResult> poll(OperationId, Waker waker);

    //! Observer dropped. Returns true if the slot was removed immediately.
    bool ignore(OperationId, std::shared_ptr<void> keep_alive);

    size_t size() const noexcept
    {
        return size_;
    }

    bool empty() const noexcept
    {
        return size_ == 0;
    }

    //! Slots still waiting for their final completion
    size_t kernel_owned() const noexcept
    {
        return kernel_owned_;
    }

    size_t capacity() const noexcept
    {
        return slots_.capacity();
    }
};

RINGSIDE_ASYNC_NAMESPACE_END
