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

#include <intx/intx.hpp>

#include <limits>

HYDRO_NAMESPACE_BEGIN

// token amounts
using uint128_t = ::intx::uint128;

// Decimal atomics, 18 fractional digits
using uint256_t = ::intx::uint256;

// full width products of two uint256_t
using uint512_t = ::intx::uint512;

static_assert(sizeof(uint128_t) == 16);
static_assert(sizeof(uint256_t) == 32);

inline constexpr uint128_t UINT128_MAX = std::numeric_limits<uint128_t>::max();

inline constexpr uint256_t UINT256_MAX = std::numeric_limits<uint256_t>::max();

HYDRO_NAMESPACE_END
