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
#include <ringside/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

//! Decides which completion of an operation is its last one
enum class CompletionPolicy : uint8_t
{
    //! The first completion ends the operation
    single_shot,
    //! Completions carrying IORING_CQE_F_MORE are followed by more
    multi_shot
};

//! Invoked once when a completion arrives for a waiting observer. Must not
//! reenter the reactor.
using Waker = std::function<void()>;

/*! \brief The state machine of one in-flight operation.

    submitted --poll--> waiting --complete--> completed --poll--> finished
    submitted --complete--> completed
    submitted|waiting --ignore--> ignored --final complete--> removable

An ignored operation keeps the resources the kernel may still write into
alive until its final completion arrives, and never surfaces a result.
*/
class Lifecycle
{
public:
    enum class State : uint8_t
    {
        submitted,
        waiting,
        completed,
        ignored
    };

private:
    CompletionPolicy policy_;
    bool final_received_{false};
    bool ignored_{false};
    Waker waker_;
    std::deque<CompletionResult> completions_;
    std::shared_ptr<void> keep_alive_;

public:
    explicit Lifecycle(
        CompletionPolicy const policy = CompletionPolicy::single_shot)
        : policy_(policy)
    {
    }

    Lifecycle(Lifecycle const &) = delete;
    Lifecycle(Lifecycle &&) = default;
    Lifecycle &operator=(Lifecycle const &) = delete;
    Lifecycle &operator=(Lifecycle &&) = default;

    State state() const noexcept;

    CompletionPolicy policy() const noexcept
    {
        return policy_;
    }

    //! True if a completion with these flags ends the operation
    bool is_final(uint32_t flags) const noexcept;

    //! True until the final completion arrives, the kernel may still write
    //! into the operation's memory
    bool kernel_owned() const noexcept
    {
        return !final_received_;
    }

    //! True once the final completion arrived and has been handed out
    bool is_finished() const noexcept
    {
        return final_received_ && !ignored_ && completions_.empty();
    }

    size_t buffered_completions() const noexcept
    {
        return completions_.size();
    }

    //! Feed a completion in. Returns true if the slot can now be removed.
    bool complete(Result<uint32_t> result, uint32_t flags);

    //! Take the oldest buffered completion, or register `waker` to be
    //! invoked when one arrives
    std::optional<CompletionResult> poll(Waker waker);

    //! The observer went away. Returns true if the slot can be removed now,
    //! otherwise `keep_alive` is held until the final completion.
    bool ignore(std::shared_ptr<void> keep_alive);
};

char const *to_string(Lifecycle::State) noexcept;

RINGSIDE_ASYNC_NAMESPACE_END
