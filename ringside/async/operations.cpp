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

#include <ringside/async/operations.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/async/lifecycle.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/likely.h>
#include <ringside/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

Operations::Operations()
{
    slots_.reserve(INITIAL_CAPACITY);
}

Operations::~Operations()
{
    RINGSIDE_ASSERT_PRINTF(
        kernel_owned_ == 0,
        "%zu operations still in flight, the kernel may write into freed "
        "memory",
        kernel_owned_);
    RINGSIDE_ASSERT_PRINTF(
        size_ == 0,
        "%zu completed operations were never collected by an observer",
        size_);
}

Operations::Slot *Operations::live_slot_(OperationId const id) noexcept
{
    if (RINGSIDE_UNLIKELY(id.index >= slots_.size())) {
        return nullptr;
    }
    Slot &slot = slots_[id.index];
    if (!slot.lifecycle.has_value() || slot.generation != id.generation) {
        return nullptr;
    }
    return &slot;
}

Operations::Slot &
Operations::expect_live_slot_(OperationId const id, char const *const what) noexcept
{
    Slot *const slot = live_slot_(id);
    RINGSIDE_ASSERT_PRINTF(
        slot != nullptr,
        "%s of operation index %u generation %u which is not in flight",
        what,
        id.index,
        id.generation);
    return *slot;
}

OperationId Operations::insert(CompletionPolicy const policy)
{
    uint32_t index;
    if (free_head_ != NO_FREE_SLOT) {
        index = free_head_;
        free_head_ = slots_[index].next_free;
    }
    else {
        // The last index is never handed out so no id can encode to
        // CANCEL_USER_DATA
        RINGSIDE_ASSERT_PRINTF(
            slots_.size() < NO_FREE_SLOT,
            "operation registry exhausted at %zu slots",
            slots_.size());
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }
    Slot &slot = slots_[index];
    RINGSIDE_DEBUG_ASSERT(!slot.lifecycle.has_value());
    slot.lifecycle.emplace(policy);
    slot.next_free = NO_FREE_SLOT;
    ++size_;
    ++kernel_owned_;
    OperationId const id{index, slot.generation};
    RINGSIDE_DEBUG_ASSERT(id.user_data() != CANCEL_USER_DATA);
    return id;
}

Lifecycle *Operations::get(OperationId const id) noexcept
{
    Slot *const slot = live_slot_(id);
    return (slot != nullptr) ? &*slot->lifecycle : nullptr;
}

void Operations::remove(OperationId const id)
{
    Slot &slot = expect_live_slot_(id, "remove");
    RINGSIDE_ASSERT_PRINTF(
        !slot.lifecycle->kernel_owned(),
        "remove of operation index %u generation %u before its final "
        "completion, drop it with ignore()",
        id.index,
        id.generation);
    free_slot_(slot, id.index);
}

void Operations::free_slot_(Slot &slot, uint32_t const index) noexcept
{
    slot.lifecycle.reset();
    ++slot.generation;
    slot.next_free = free_head_;
    free_head_ = index;
    --size_;
}

bool Operations::complete(
    OperationId const id, Result<uint32_t> result, uint32_t const flags)
{
    Slot &slot = expect_live_slot_(id, "completion");
    bool const removable = slot.lifecycle->complete(std::move(result), flags);
    if (!slot.lifecycle->kernel_owned()) {
        --kernel_owned_;
    }
    if (removable) {
        free_slot_(slot, id.index);
        return true;
    }
    return false;
}

std::optional<CompletionResult>
Operations::poll(OperationId const id, Waker waker)
{
    Slot &slot = expect_live_slot_(id, "poll");
    auto ret = slot.lifecycle->poll(std::move(waker));
    if (slot.lifecycle->is_finished()) {
        remove(id);
    }
    return ret;
}

bool Operations::ignore(OperationId const id, std::shared_ptr<void> keep_alive)
{
    Slot &slot = expect_live_slot_(id, "ignore");
    if (slot.lifecycle->ignore(std::move(keep_alive))) {
        remove(id);
        return true;
    }
    return false;
}

RINGSIDE_ASYNC_NAMESPACE_END
