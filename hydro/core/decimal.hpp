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

#include <hydro/core/config.hpp>
#include <hydro/core/int.hpp>
#include <hydro/core/result.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

HYDRO_NAMESPACE_BEGIN

enum class DecimalError
{
    Success = 0,
    InvalidFormat,
    TooManyFractionalDigits,
};

/// Unsigned fixed point number with 18 fractional digits. All arithmetic is
/// checked and every operation that drops precision rounds towards zero
/// unless its name says otherwise.
class Decimal
{
    uint256_t raw_{0};

    constexpr explicit Decimal(uint256_t const &raw)
        : raw_{raw}
    {
    }

public:
    static constexpr unsigned DECIMAL_PLACES = 18;
    static constexpr uint256_t FRACTIONAL{1'000'000'000'000'000'000};

    constexpr Decimal() = default;

    static constexpr Decimal from_atomics(uint256_t const &raw)
    {
        return Decimal{raw};
    }

    static constexpr Decimal zero()
    {
        return Decimal{};
    }

    static constexpr Decimal one()
    {
        return Decimal{FRACTIONAL};
    }

    static constexpr Decimal percent(uint64_t const x)
    {
        return Decimal{uint256_t{x} * 10'000'000'000'000'000};
    }

    static constexpr Decimal permille(uint64_t const x)
    {
        return Decimal{uint256_t{x} * 1'000'000'000'000'000};
    }

    static Decimal from_integer(uint128_t const &);

    // num / den, rounded towards zero
    static Result<Decimal>
    from_ratio(uint256_t const &num, uint256_t const &den);

    static Result<Decimal> from_string(std::string_view);

    constexpr uint256_t const &atomics() const noexcept
    {
        return raw_;
    }

    constexpr bool is_zero() const noexcept
    {
        return raw_ == 0;
    }

    Result<Decimal> checked_add(Decimal const &) const;
    Result<Decimal> checked_sub(Decimal const &) const;
    Result<Decimal> checked_mul(Decimal const &) const;
    Result<Decimal> checked_div(Decimal const &) const;

    Result<uint128_t> to_uint_floor() const;
    Result<uint128_t> to_uint_ceil() const;

    std::string to_string() const;

    friend constexpr bool operator==(Decimal const &a, Decimal const &b)
    {
        return a.raw_ == b.raw_;
    }

    friend constexpr bool operator<(Decimal const &a, Decimal const &b)
    {
        return a.raw_ < b.raw_;
    }

    friend constexpr bool operator>(Decimal const &a, Decimal const &b)
    {
        return b.raw_ < a.raw_;
    }

    friend constexpr bool operator<=(Decimal const &a, Decimal const &b)
    {
        return !(b.raw_ < a.raw_);
    }

    friend constexpr bool operator>=(Decimal const &a, Decimal const &b)
    {
        return !(a.raw_ < b.raw_);
    }
};

HYDRO_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<hydro::DecimalError>
    : quick_status_code_from_enum_defaults<hydro::DecimalError>
{
    static constexpr auto const domain_name = "Decimal Error";
    static constexpr auto const domain_uuid =
        "a3f6c0d1-27e9-4b58-8c41-e05b6d3f9a17";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
