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
#include <hydro/core/checked_math.hpp>
#include <hydro/core/int.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace hydro;
using namespace intx::literals;

namespace
{
    Decimal dec(char const *const s)
    {
        return Decimal::from_string(s).value();
    }
}

TEST(Decimal, from_string)
{
    EXPECT_EQ(dec("0.375").atomics(), 375'000'000'000'000'000_u256);
    EXPECT_EQ(dec("1"), Decimal::one());
    EXPECT_EQ(dec("0.5"), Decimal::percent(50));
    EXPECT_EQ(dec("1.25"), Decimal::permille(1250));
    EXPECT_EQ(dec("0.000000000000000001").atomics(), 1_u256);

    EXPECT_EQ(Decimal::from_string("").assume_error(), DecimalError::InvalidFormat);
    EXPECT_EQ(Decimal::from_string("1.").assume_error(), DecimalError::InvalidFormat);
    EXPECT_EQ(Decimal::from_string(".5").assume_error(), DecimalError::InvalidFormat);
    EXPECT_EQ(Decimal::from_string("1.2.3").assume_error(), DecimalError::InvalidFormat);
    EXPECT_EQ(Decimal::from_string("-1").assume_error(), DecimalError::InvalidFormat);
    EXPECT_EQ(
        Decimal::from_string("0.0000000000000000001").assume_error(),
        DecimalError::TooManyFractionalDigits);
}

TEST(Decimal, to_string)
{
    EXPECT_EQ(Decimal::zero().to_string(), "0");
    EXPECT_EQ(Decimal::from_integer(90000).to_string(), "90000");
    EXPECT_EQ(Decimal::percent(60).to_string(), "0.6");
    EXPECT_EQ(dec("1.000000000000000001").to_string(), "1.000000000000000001");
    EXPECT_EQ(Decimal::from_ratio(1, 3).value().to_string(), "0.333333333333333333");
}

TEST(Decimal, arithmetic)
{
    EXPECT_EQ(dec("0.11").checked_add(dec("0.375")).value(), dec("0.485"));
    EXPECT_EQ(dec("1").checked_sub(dec("0.25")).value(), dec("0.75"));
    EXPECT_EQ(dec("0.1").checked_sub(dec("0.2")).assume_error(), MathError::Underflow);

    EXPECT_EQ(
        Decimal::from_integer(1000).checked_mul(dec("0.11")).value(),
        Decimal::from_integer(110));
    EXPECT_EQ(dec("1.3").checked_mul(dec("1.3")).value(), dec("1.69"));
    EXPECT_EQ(
        Decimal::from_integer(650).checked_div(dec("1.3")).value(),
        Decimal::from_integer(500));
    EXPECT_EQ(
        Decimal::one().checked_div(Decimal::zero()).assume_error(),
        MathError::DivisionByZero);
    EXPECT_EQ(
        Decimal::from_atomics(UINT256_MAX)
            .checked_mul(Decimal::from_integer(2))
            .assume_error(),
        MathError::Overflow);
}

TEST(Decimal, rounding)
{
    Decimal const third = Decimal::from_ratio(1000, 3).value();
    EXPECT_EQ(third.to_uint_floor().value(), 333);
    EXPECT_EQ(third.to_uint_ceil().value(), 334);
    EXPECT_EQ(Decimal::from_integer(7).to_uint_ceil().value(), 7);
    EXPECT_EQ(
        Decimal::from_ratio(9000 * 10000_u256, 40000).value().to_uint_floor().value(),
        2250);
    EXPECT_EQ(
        Decimal::from_atomics(UINT256_MAX).to_uint_floor().assume_error(),
        MathError::Overflow);
}

TEST(Decimal, ordering)
{
    EXPECT_LT(dec("0.485"), Decimal::percent(50));
    EXPECT_GE(dec("0.505"), Decimal::percent(50));
    EXPECT_GT(Decimal::one(), Decimal::zero());
    EXPECT_LE(Decimal::percent(50), dec("0.5"));
    EXPECT_TRUE(Decimal::zero().is_zero());
}
