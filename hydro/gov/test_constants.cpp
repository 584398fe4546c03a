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
#include <hydro/core/int.hpp>
#include <hydro/gov/constants.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/state/storage_error.hpp>
#include <hydro/test/contract_fixture.hpp>

#include <gtest/gtest.h>

using namespace hydro;
using namespace hydro::gov;
using namespace intx::literals;

TEST(RoundLockPowerSchedule, scales_by_remaining_duration)
{
    RoundLockPowerSchedule const schedule{
        {{3, Decimal::permille(1500)},
         {1, Decimal::one()},
         {2, Decimal::permille(1250)},
         {2, Decimal::permille(2000)}}};

    ASSERT_EQ(schedule.entries().size(), 3);
    EXPECT_EQ(schedule.entries()[1].power_scaling_factor, Decimal::permille(1250));
    EXPECT_EQ(schedule.max_locked_rounds(), 3);

    EXPECT_EQ(schedule.scale_lockup_power(10, 0, 1001).value(), 1001_u128);
    EXPECT_EQ(schedule.scale_lockup_power(10, 10, 1001).value(), 1001_u128);
    EXPECT_EQ(schedule.scale_lockup_power(10, 11, 1001).value(), 1251_u128);
    EXPECT_EQ(schedule.scale_lockup_power(10, 30, 1001).value(), 1501_u128);
    EXPECT_EQ(schedule.scale_lockup_power(10, 45, 1001).value(), 1501_u128);

    EXPECT_EQ(
        RoundLockPowerSchedule{}.scale_lockup_power(10, 30, 1001).value(),
        1001_u128);
}

TEST(Constants, active_at_timestamp)
{
    Storage storage;
    ConstantsMap constants{storage};

    auto first = test::make_constants();
    auto second = first;
    second.paused = true;
    constants.store(100, first);
    constants.store(200, second);

    EXPECT_EQ(
        load_constants_active_at(constants, 99).assume_error(),
        HydroError::ConstantsNotFound);
    EXPECT_FALSE(load_constants_active_at(constants, 100).value().paused);
    EXPECT_FALSE(load_constants_active_at(constants, 199).value().paused);
    EXPECT_TRUE(load_constants_active_at(constants, 200).value().paused);
}

TEST(Round, round_ids)
{
    auto const constants = test::make_constants();
    auto const start = constants.first_round_start;

    EXPECT_EQ(
        compute_round_id(constants, start - 1).assume_error(),
        HydroError::RoundNotStarted);
    EXPECT_EQ(compute_round_id(constants, start).value(), 0);
    EXPECT_EQ(
        compute_round_id(constants, start + test::ONE_MONTH - 1).value(), 0);
    EXPECT_EQ(compute_round_id(constants, start + test::ONE_MONTH).value(), 1);
    EXPECT_EQ(compute_round_end(constants, 1), start + 2 * test::ONE_MONTH);
}

TEST(Round, height_maps)
{
    Storage storage;
    Variables vars{storage};

    EXPECT_EQ(
        get_highest_known_height_for_round_id(vars, 0).assume_error(),
        StorageError::NotFound);

    update_round_height_maps(vars, 0, 10);
    update_round_height_maps(vars, 0, 15);
    update_round_height_maps(vars, 1, 20);

    EXPECT_EQ(get_highest_known_height_for_round_id(vars, 0).value(), 15);
    EXPECT_EQ(get_highest_known_height_for_round_id(vars, 1).value(), 20);
    EXPECT_EQ(vars.round_to_height_range.load(0).lowest, 10);
    EXPECT_EQ(vars.height_to_round.load(15), 0);
    EXPECT_EQ(vars.height_to_round.load(20), 1);
}
