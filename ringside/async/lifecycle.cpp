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

#include <ringside/async/lifecycle.hpp>

#include <ringside/async/completion.hpp>
#include <ringside/async/config.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

Lifecycle::State Lifecycle::state() const noexcept
{
    if (ignored_) {
        return State::ignored;
    }
    if (!completions_.empty()) {
        return State::completed;
    }
    if (waker_) {
        return State::waiting;
    }
    return State::submitted;
}

bool Lifecycle::is_final(uint32_t const flags) const noexcept
{
    return policy_ == CompletionPolicy::single_shot ||
           (flags & IORING_CQE_F_MORE) == 0;
}

bool Lifecycle::complete(Result<uint32_t> result, uint32_t const flags)
{
    RINGSIDE_ASSERT_PRINTF(
        !final_received_,
        "completion arrived after the final completion of an operation "
        "(state %s)",
        to_string(state()));
    final_received_ = is_final(flags);
    if (ignored_) {
        if (final_received_) {
            keep_alive_.reset();
            return true;
        }
        return false;
    }
    completions_.push_back(CompletionResult{std::move(result), flags});
    if (waker_) {
        Waker waker = std::exchange(waker_, nullptr);
        waker();
    }
    return false;
}

std::optional<CompletionResult> Lifecycle::poll(Waker waker)
{
    RINGSIDE_ASSERT_PRINTF(!ignored_, "ignored operations cannot be polled");
    if (!completions_.empty()) {
        waker_ = nullptr;
        CompletionResult ret = std::move(completions_.front());
        completions_.pop_front();
        return ret;
    }
    RINGSIDE_ASSERT_PRINTF(
        !final_received_,
        "operation polled after its final completion was taken");
    waker_ = std::move(waker);
    return std::nullopt;
}

bool Lifecycle::ignore(std::shared_ptr<void> keep_alive)
{
    RINGSIDE_ASSERT(!ignored_);
    completions_.clear();
    waker_ = nullptr;
    if (final_received_) {
        return true;
    }
    ignored_ = true;
    keep_alive_ = std::move(keep_alive);
    return false;
}

char const *to_string(Lifecycle::State const state) noexcept
{
    switch (state) {
    case Lifecycle::State::submitted:
        return "submitted";
    case Lifecycle::State::waiting:
        return "waiting";
    case Lifecycle::State::completed:
        return "completed";
    case Lifecycle::State::ignored:
        return "ignored";
    }
    return "unknown";
}

RINGSIDE_ASYNC_NAMESPACE_END
