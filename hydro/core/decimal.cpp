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
#include <hydro/core/decimal.hpp>
#include <hydro/core/likely.h>

#include <boost/outcome/try.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <string>
#include <string_view>

HYDRO_NAMESPACE_BEGIN

Decimal Decimal::from_integer(uint128_t const &x)
{
    // 2^128 * 10^18 < 2^256
    return Decimal{uint256_t{x} * FRACTIONAL};
}

Result<Decimal> Decimal::from_ratio(uint256_t const &num, uint256_t const &den)
{
    BOOST_OUTCOME_TRY(auto const raw, checked_mul_div(num, FRACTIONAL, den));
    return Decimal{raw};
}

Result<Decimal> Decimal::from_string(std::string_view const input)
{
    auto const dot = input.find('.');
    std::string_view const whole = input.substr(0, dot);
    std::string_view const fraction =
        dot == std::string_view::npos ? std::string_view{}
                                      : input.substr(dot + 1);

    if (HYDRO_UNLIKELY(
            whole.empty() ||
            (dot != std::string_view::npos && fraction.empty()))) {
        return DecimalError::InvalidFormat;
    }
    if (HYDRO_UNLIKELY(fraction.size() > DECIMAL_PLACES)) {
        return DecimalError::TooManyFractionalDigits;
    }

    uint256_t raw{0};
    auto const push_digit = [&raw](char const c) -> Result<void> {
        if (HYDRO_UNLIKELY(c < '0' || c > '9')) {
            return DecimalError::InvalidFormat;
        }
        BOOST_OUTCOME_TRY(raw, hydro::checked_mul(raw, 10));
        BOOST_OUTCOME_TRY(
            raw, hydro::checked_add(raw, uint256_t{unsigned(c - '0')}));
        return outcome::success();
    };

    for (char const c : whole) {
        BOOST_OUTCOME_TRY(push_digit(c));
    }
    for (char const c : fraction) {
        BOOST_OUTCOME_TRY(push_digit(c));
    }
    for (auto i = fraction.size(); i < DECIMAL_PLACES; ++i) {
        BOOST_OUTCOME_TRY(raw, hydro::checked_mul(raw, 10));
    }
    return Decimal{raw};
}

Result<Decimal> Decimal::checked_add(Decimal const &other) const
{
    BOOST_OUTCOME_TRY(auto const raw, hydro::checked_add(raw_, other.raw_));
    return Decimal{raw};
}

Result<Decimal> Decimal::checked_sub(Decimal const &other) const
{
    BOOST_OUTCOME_TRY(auto const raw, hydro::checked_sub(raw_, other.raw_));
    return Decimal{raw};
}

Result<Decimal> Decimal::checked_mul(Decimal const &other) const
{
    BOOST_OUTCOME_TRY(
        auto const raw, checked_mul_div(raw_, other.raw_, FRACTIONAL));
    return Decimal{raw};
}

Result<Decimal> Decimal::checked_div(Decimal const &other) const
{
    BOOST_OUTCOME_TRY(
        auto const raw, checked_mul_div(raw_, FRACTIONAL, other.raw_));
    return Decimal{raw};
}

Result<uint128_t> Decimal::to_uint_floor() const
{
    return checked_narrow(raw_ / FRACTIONAL);
}

Result<uint128_t> Decimal::to_uint_ceil() const
{
    uint256_t q = raw_ / FRACTIONAL;
    if (raw_ % FRACTIONAL != 0) {
        ++q;
    }
    return checked_narrow(q);
}

std::string Decimal::to_string() const
{
    std::string res = intx::to_string(raw_ / FRACTIONAL);
    uint256_t const remainder = raw_ % FRACTIONAL;
    if (remainder == 0) {
        return res;
    }

    std::string fraction = intx::to_string(remainder);
    fraction.insert(0, DECIMAL_PLACES - fraction.size(), '0');
    fraction.erase(fraction.find_last_not_of('0') + 1);

    res += '.';
    res += fraction;
    return res;
}

HYDRO_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<hydro::DecimalError>::mapping> const &
quick_status_code_from_enum<hydro::DecimalError>::value_mappings()
{
    using hydro::DecimalError;

    static std::initializer_list<mapping> const v = {
        {DecimalError::Success, "success", {errc::success}},
        {DecimalError::InvalidFormat, "invalid decimal format", {}},
        {DecimalError::TooManyFractionalDigits,
         "too many fractional digits",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
