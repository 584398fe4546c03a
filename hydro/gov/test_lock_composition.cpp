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

#include <hydro/core/decimal.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/lock_composition.hpp>
#include <hydro/gov/lock_store.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/state/storage.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <utility>
#include <vector>

using namespace hydro;
using namespace hydro::gov;

namespace
{
    using Composition = std::vector<std::pair<uint64_t, Decimal>>;
}

struct LockCompositionTest : public ::testing::Test
{
    Storage storage;
    Variables vars{storage};
    LockStore locks{vars};

    void split(
        uint64_t const parent, uint64_t const first, uint64_t const second,
        Decimal const &second_fraction)
    {
        locks.add_successors(
            parent,
            {{.lock_id = first,
              .fraction =
                  Decimal::one().checked_sub(second_fraction).value()},
             {.lock_id = second, .fraction = second_fraction}});
    }

    void merge(std::vector<uint64_t> const &parents, uint64_t const child)
    {
        for (uint64_t const parent : parents) {
            locks.add_successors(
                parent, {{.lock_id = child, .fraction = Decimal::one()}});
        }
    }
};

TEST_F(LockCompositionTest, untouched_lock_is_its_own_composition)
{
    EXPECT_EQ(
        get_current_lock_composition(locks, 7).value(),
        (Composition{{7, Decimal::one()}}));
}

TEST_F(LockCompositionTest, split_then_merge)
{
    // 0 -> 1, 2; 2 -> 3, 4; 1, 3 -> 5
    split(0, 1, 2, Decimal::percent(40));
    split(2, 3, 4, Decimal::percent(25));
    merge({1, 3}, 5);

    auto const res = get_current_lock_composition(locks, 0);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value(),
        (Composition{{4, Decimal::percent(10)}, {5, Decimal::percent(90)}}));

    Decimal total;
    for (auto const &[lock_id, fraction] : res.value()) {
        total = total.checked_add(fraction).value();
    }
    EXPECT_EQ(total, Decimal::one());

    EXPECT_EQ(
        get_current_lock_composition(locks, 2).value(),
        (Composition{{4, Decimal::percent(25)}, {5, Decimal::percent(75)}}));
}

TEST_F(LockCompositionTest, diamond_is_counted_once_per_path)
{
    split(0, 1, 2, Decimal::percent(50));
    merge({1, 2}, 3);

    EXPECT_EQ(
        get_current_lock_composition(locks, 0).value(),
        (Composition{{3, Decimal::one()}}));
}

TEST_F(LockCompositionTest, uneven_split_rounds_down)
{
    split(0, 1, 2, Decimal::from_ratio(1, 3).value());

    auto const composition = get_current_lock_composition(locks, 0).value();
    ASSERT_EQ(composition.size(), 2);
    EXPECT_EQ(composition[0].second.to_string(), "0.666666666666666667");
    EXPECT_EQ(composition[1].second.to_string(), "0.333333333333333333");
}

TEST_F(LockCompositionTest, cycle_is_rejected)
{
    merge({0}, 1);
    merge({1}, 2);
    merge({2}, 0);

    EXPECT_EQ(
        get_current_lock_composition(locks, 0).assume_error(),
        HydroError::InvalidInput);
    EXPECT_EQ(
        get_current_lock_composition(locks, 1).assume_error(),
        HydroError::InvalidInput);
}
