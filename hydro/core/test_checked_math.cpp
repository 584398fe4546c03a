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

#include <hydro/core/checked_math.hpp>
#include <hydro/core/int.hpp>

#include <gtest/gtest.h>

using namespace hydro;
using namespace intx::literals;

TEST(CheckedMath, add_sub)
{
    EXPECT_EQ(checked_add(1_u256, 2_u256).value(), 3_u256);
    EXPECT_EQ(checked_add(UINT256_MAX, 1_u256).assume_error(), MathError::Overflow);

    EXPECT_EQ(checked_sub(5_u256, 2_u256).value(), 3_u256);
    EXPECT_EQ(checked_sub(2_u256, 5_u256).assume_error(), MathError::Underflow);

    EXPECT_EQ(
        checked_add(UINT128_MAX, uint128_t{1}).assume_error(),
        MathError::Overflow);
    EXPECT_EQ(
        checked_sub(uint128_t{0}, uint128_t{1}).assume_error(),
        MathError::Underflow);
}

TEST(CheckedMath, mul_div)
{
    EXPECT_EQ(checked_mul(7_u256, 6_u256).value(), 42_u256);
    EXPECT_EQ(checked_mul(UINT256_MAX, 2_u256).assume_error(), MathError::Overflow);

    EXPECT_EQ(checked_div(42_u256, 5_u256).value(), 8_u256);
    EXPECT_EQ(checked_div(1_u256, 0_u256).assume_error(), MathError::DivisionByZero);
}

TEST(CheckedMath, mul_div_wide_intermediate)
{
    // the product overflows 256 bits but the quotient fits
    auto const res = checked_mul_div(UINT256_MAX, 4_u256, 8_u256);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), UINT256_MAX / 2);

    EXPECT_EQ(
        checked_mul_div(UINT256_MAX, 3_u256, 2_u256).assume_error(),
        MathError::Overflow);
    EXPECT_EQ(
        checked_mul_div(1_u256, 1_u256, 0_u256).assume_error(),
        MathError::DivisionByZero);
}

TEST(CheckedMath, narrow)
{
    EXPECT_EQ(checked_narrow(uint256_t{UINT128_MAX}).value(), UINT128_MAX);
    EXPECT_EQ(
        checked_narrow(uint256_t{UINT128_MAX} + 1).assume_error(),
        MathError::Overflow);
}
