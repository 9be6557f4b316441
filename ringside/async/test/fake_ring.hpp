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
#include <ringside/async/ring.hpp>
#include <ringside/core/assert.h>
#include <ringside/core/result.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include <liburing/io_uring.h>

RINGSIDE_ASYNC_NAMESPACE_BEGIN

namespace test
{
    /*! \brief Scriptable stand in for the kernel side of an io_uring.

    Pushed entries sit in the submission ring until a successful submit
    consumes them, unless consumption is stalled. Consumed entries are in
    flight until completed by the test, automatically on submit, or one per
    blocking wait.
    */
    class FakeRing final : public Ring
    {
        unsigned const sq_entries_;
        std::vector<io_uring_sqe> sq_;
        std::deque<uint64_t> in_flight_;
        std::deque<Completion> cq_;
        std::deque<int> submit_errors_;
        std::deque<int> wait_errors_;
        std::optional<int32_t> auto_complete_res_;
        bool stalled_{false};
        bool complete_on_wait_{false};

        void consume_()
        {
            for (auto const &sqe : sq_) {
                consumed.push_back(sqe.user_data);
                consumed_opcodes.push_back(sqe.opcode);
                if (auto_complete_res_.has_value()) {
                    cq_.push_back(Completion{
                        sqe.user_data,
                        sqe.user_data == CANCEL_USER_DATA
                            ? 0
                            : *auto_complete_res_,
                        0});
                }
                else {
                    in_flight_.push_back(sqe.user_data);
                }
            }
            sq_.clear();
        }

    public:
        //! user_data of every entry the kernel consumed, in order
        std::vector<uint64_t> consumed;
        std::vector<uint8_t> consumed_opcodes;
        //! Entries waiting in the submission ring at each successful submit
        std::vector<size_t> submit_calls;
        size_t submit_attempts{0};
        size_t wait_calls{0};
        size_t timed_wait_calls{0};

        explicit FakeRing(unsigned const sq_entries = 8)
            : sq_entries_(sq_entries)
        {
        }

        static constexpr int FD = 1000;

        // Kernel behaviour knobs

        void fail_next_submit(int const errc)
        {
            submit_errors_.push_back(errc);
        }

        void fail_next_wait(int const errc)
        {
            wait_errors_.push_back(errc);
        }

        void stall(bool const v)
        {
            stalled_ = v;
        }

        void auto_complete(std::optional<int32_t> const res)
        {
            auto_complete_res_ = res;
        }

        void complete_on_wait(bool const v)
        {
            complete_on_wait_ = v;
        }

        //! Kernel catches up with a stalled submission ring
        void consume()
        {
            consume_();
        }

        // Completion injection

        void post(Completion const &cqe)
        {
            cq_.push_back(cqe);
        }

        void complete(uint64_t const user_data, int32_t const res, uint32_t const flags = 0)
        {
            for (auto it = in_flight_.begin(); it != in_flight_.end(); ++it) {
                if (*it == user_data) {
                    if ((flags & IORING_CQE_F_MORE) == 0) {
                        in_flight_.erase(it);
                    }
                    cq_.push_back(Completion{user_data, res, flags});
                    return;
                }
            }
            RINGSIDE_ABORT_PRINTF(
                "user_data %llu is not in flight",
                (unsigned long long)user_data);
        }

        void complete_oldest(int32_t const res)
        {
            RINGSIDE_ASSERT(!in_flight_.empty());
            cq_.push_back(Completion{in_flight_.front(), res, 0});
            in_flight_.pop_front();
        }

        size_t in_flight() const noexcept
        {
            return in_flight_.size();
        }

        size_t sq_size() const noexcept
        {
            return sq_.size();
        }

        size_t cq_size() const noexcept
        {
            return cq_.size();
        }

        // Ring

        bool push(io_uring_sqe const &sqe) override
        {
            if (sq_.size() >= sq_entries_) {
                return false;
            }
            sq_.push_back(sqe);
            return true;
        }

        Result<unsigned> submit() override
        {
            ++submit_attempts;
            if (!submit_errors_.empty()) {
                int const errc = submit_errors_.front();
                submit_errors_.pop_front();
                return errno_to_error_code(errc);
            }
            auto const n = static_cast<unsigned>(sq_.size());
            submit_calls.push_back(n);
            if (!stalled_) {
                consume_();
            }
            return n;
        }

        Result<unsigned> submit_and_wait(unsigned const want) override
        {
            ++wait_calls;
            if (!wait_errors_.empty()) {
                int const errc = wait_errors_.front();
                wait_errors_.pop_front();
                return errno_to_error_code(errc);
            }
            auto const n = static_cast<unsigned>(sq_.size());
            if (!stalled_) {
                consume_();
            }
            if (cq_.size() < want && complete_on_wait_ && !in_flight_.empty()) {
                complete_oldest(0);
            }
            RINGSIDE_ASSERT_PRINTF(
                cq_.size() >= want,
                "fake ring would block forever: %zu completions, %zu in "
                "flight",
                cq_.size(),
                in_flight_.size());
            return n;
        }

        //! Never sleeps, times out at once when nothing can complete
        Result<unsigned> submit_and_wait_for(
            unsigned const want, std::chrono::nanoseconds) override
        {
            ++timed_wait_calls;
            if (!wait_errors_.empty()) {
                int const errc = wait_errors_.front();
                wait_errors_.pop_front();
                return errno_to_error_code(errc);
            }
            auto const n = static_cast<unsigned>(sq_.size());
            if (!stalled_) {
                consume_();
            }
            if (cq_.size() < want && complete_on_wait_ && !in_flight_.empty()) {
                complete_oldest(0);
            }
            if (cq_.size() < want) {
                return errno_to_error_code(ETIME);
            }
            return n;
        }

        size_t drain_completions(completion_visitor const &visit) override
        {
            size_t const count = cq_.size();
            while (!cq_.empty()) {
                Completion const cqe = cq_.front();
                cq_.pop_front();
                visit(cqe);
            }
            return count;
        }

        int fd() const noexcept override
        {
            return FD;
        }

        unsigned sq_entries() const noexcept override
        {
            return sq_entries_;
        }
    };
}

RINGSIDE_ASYNC_NAMESPACE_END
