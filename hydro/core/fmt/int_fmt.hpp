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

#include <hydro/core/basic_formatter.hpp>
#include <hydro/core/int.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<hydro::uint128_t> : std::true_type
{
};

template <>
struct quill::copy_loggable<hydro::uint256_t> : std::true_type
{
};

// Amounts print in base 10 without separators, matching the strings used
// in response attributes.
template <unsigned N>
    requires(N == 128 || N == 256)
struct fmt::formatter<intx::uint<N>> : public hydro::BasicFormatter
{
    template <typename FormatContext>
    auto format(intx::uint<N> const &value, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", intx::to_string(value));
    }
};
