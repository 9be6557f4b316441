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
#include <ringside/async/lifecycle.hpp>

#include <gtest/gtest.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <set>
#include <utility>
#include <vector>

#include <liburing/io_uring.h>

using namespace ringside;
using namespace ringside::async;

TEST(OperationsTest, user_data_round_trip)
{
    OperationId const id{17, 3};
    EXPECT_EQ(id.user_data(), (uint64_t(3) << 32) | 17);
    EXPECT_EQ(OperationId::from_user_data(id.user_data()), id);
    EXPECT_NE(id.user_data(), CANCEL_USER_DATA);
}

TEST(OperationsTest, insert_complete_poll_remove)
{
    Operations ops;
    EXPECT_TRUE(ops.empty());
    EXPECT_GE(ops.capacity(), Operations::INITIAL_CAPACITY);

    auto const a = ops.insert();
    auto const b = ops.insert();
    EXPECT_NE(a.index, b.index);
    EXPECT_EQ(ops.size(), 2u);
    ASSERT_NE(ops.get(a), nullptr);
    EXPECT_EQ(ops.get(a)->state(), Lifecycle::State::submitted);

    EXPECT_FALSE(ops.complete(a, 10u, 0));
    EXPECT_EQ(ops.get(a)->state(), Lifecycle::State::completed);
    auto r = ops.poll(a, [] {});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->result.value(), 10u);
    // Handing out the final completion removes the slot
    EXPECT_EQ(ops.get(a), nullptr);
    EXPECT_EQ(ops.size(), 1u);

    EXPECT_FALSE(ops.complete(b, 0u, 0));
    ops.remove(b);
    EXPECT_TRUE(ops.empty());
    EXPECT_FALSE(ops.contains(b));
}

TEST(OperationsTest, stale_id_does_not_resolve)
{
    Operations ops;
    auto const a = ops.insert();
    EXPECT_FALSE(ops.complete(a, 0u, 0));
    ops.remove(a);
    auto const b = ops.insert();
    // Index reused, generation differs
    EXPECT_EQ(a.index, b.index);
    EXPECT_NE(a.generation, b.generation);
    EXPECT_EQ(ops.get(a), nullptr);
    EXPECT_NE(ops.get(b), nullptr);
    EXPECT_FALSE(ops.complete(b, 0u, 0));
    ops.remove(b);
}

TEST(OperationsTest, ignored_slot_removed_on_its_completion_only)
{
    Operations ops;
    auto const id = ops.insert();
    EXPECT_FALSE(ops.poll(id, [] {}).has_value());
    auto keep = std::make_shared<int>(5);
    std::weak_ptr<int> const watch = keep;
    EXPECT_FALSE(ops.ignore(id, std::move(keep)));
    EXPECT_EQ(ops.size(), 1u);
    EXPECT_FALSE(watch.expired());

    // Unrelated traffic does not release it
    auto const other = ops.insert();
    EXPECT_FALSE(ops.complete(other, 0u, 0));
    EXPECT_TRUE(ops.contains(id));
    EXPECT_FALSE(watch.expired());

    EXPECT_TRUE(ops.complete(id, 4096u, 0));
    EXPECT_FALSE(ops.contains(id));
    EXPECT_TRUE(watch.expired());

    ASSERT_TRUE(ops.poll(other, [] {}).has_value());
    EXPECT_TRUE(ops.empty());
}

TEST(OperationsTest, ignore_completed_removes_immediately)
{
    Operations ops;
    auto const id = ops.insert();
    EXPECT_FALSE(ops.complete(id, 1u, 0));
    EXPECT_TRUE(ops.ignore(id, nullptr));
    EXPECT_TRUE(ops.empty());
}

TEST(OperationsTest, multi_shot_slot_lives_until_final)
{
    Operations ops;
    auto const id = ops.insert(CompletionPolicy::multi_shot);
    EXPECT_FALSE(ops.complete(id, 1u, IORING_CQE_F_MORE));
    ASSERT_TRUE(ops.poll(id, [] {}).has_value());
    EXPECT_TRUE(ops.contains(id));
    EXPECT_FALSE(ops.complete(id, 1u, 0));
    ASSERT_TRUE(ops.poll(id, [] {}).has_value());
    EXPECT_FALSE(ops.contains(id));
}

TEST(OperationsTest, kernel_owned_counts_slots_awaiting_final_completion)
{
    Operations ops;
    auto const single = ops.insert();
    auto const multi = ops.insert(CompletionPolicy::multi_shot);
    EXPECT_EQ(ops.kernel_owned(), 2u);

    EXPECT_FALSE(ops.complete(single, 0u, 0));
    EXPECT_FALSE(ops.complete(multi, 0u, IORING_CQE_F_MORE));
    EXPECT_EQ(ops.kernel_owned(), 1u);
    EXPECT_EQ(ops.size(), 2u);

    EXPECT_FALSE(ops.complete(multi, 0u, 0));
    EXPECT_EQ(ops.kernel_owned(), 0u);
    EXPECT_EQ(ops.size(), 2u);

    ASSERT_TRUE(ops.poll(single, [] {}).has_value());
    ASSERT_TRUE(ops.poll(multi, [] {}).has_value());
    ASSERT_TRUE(ops.poll(multi, [] {}).has_value());
    EXPECT_TRUE(ops.empty());
}

TEST(OperationsTest, ids_unique_among_live_and_reused_only_after_removal)
{
    Operations ops;
    std::mt19937 rng{20240917};
    std::vector<OperationId> live;
    std::set<uint32_t> live_indices;
    std::set<uint32_t> ever_removed;
    for (int i = 0; i < 5000; ++i) {
        bool const do_insert = live.empty() || (rng() % 3) != 0;
        if (do_insert) {
            auto const id = ops.insert();
            ASSERT_TRUE(live_indices.insert(id.index).second)
                << "index " << id.index << " handed out while live";
            if (id.generation > 0) {
                EXPECT_TRUE(ever_removed.contains(id.index));
            }
            live.push_back(id);
        }
        else {
            size_t const pick = rng() % live.size();
            auto const id = live[pick];
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(pick));
            if (rng() % 2) {
                EXPECT_FALSE(ops.complete(id, uint32_t(i), 0));
                ASSERT_TRUE(ops.poll(id, [] {}).has_value());
            }
            else {
                EXPECT_FALSE(ops.ignore(id, nullptr));
                EXPECT_TRUE(ops.contains(id));
                EXPECT_TRUE(ops.complete(id, uint32_t(i), 0));
            }
            EXPECT_FALSE(ops.contains(id));
            live_indices.erase(id.index);
            ever_removed.insert(id.index);
        }
        ASSERT_EQ(ops.size(), live.size());
    }
    for (auto const &id : live) {
        EXPECT_FALSE(ops.complete(id, 0u, 0));
        ops.remove(id);
    }
}

TEST(OperationsDeathTest, destroyed_with_operations_in_flight)
{
    EXPECT_DEATH(
        {
            Operations ops;
            (void)ops.insert();
        },
        "still in flight");
}

TEST(OperationsDeathTest, completion_for_unknown_operation)
{
    EXPECT_DEATH(
        {
            Operations ops;
            auto const id = ops.insert();
            (void)ops.complete(id, 0u, 0);
            ops.remove(id);
            (void)ops.complete(id, 0u, 0);
        },
        "not in flight");
}

TEST(OperationsDeathTest, destroyed_with_uncollected_result)
{
    EXPECT_DEATH(
        {
            Operations ops;
            auto const id = ops.insert();
            (void)ops.complete(id, to_result(0), 0);
        },
        "never collected");
}

TEST(OperationsDeathTest, remove_before_final_completion)
{
    EXPECT_DEATH(
        {
            Operations ops;
            auto const id = ops.insert(CompletionPolicy::multi_shot);
            (void)ops.complete(id, 0u, IORING_CQE_F_MORE);
            ops.remove(id);
        },
        "before its final completion");
}
