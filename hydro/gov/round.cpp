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

#include <hydro/core/likely.h>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/state/storage_error.hpp>

HYDRO_GOV_NAMESPACE_BEGIN

Result<uint64_t>
compute_round_id(Constants const &constants, Timestamp const ts)
{
    if (HYDRO_UNLIKELY(ts < constants.first_round_start)) {
        return HydroError::RoundNotStarted;
    }
    if (HYDRO_UNLIKELY(constants.round_length == 0)) {
        return HydroError::InvalidConfig;
    }
    return (ts - constants.first_round_start) / constants.round_length;
}

Timestamp compute_round_end(Constants const &constants, uint64_t const round_id)
{
    return constants.first_round_start +
           constants.round_length * (round_id + 1);
}

void update_round_height_maps(
    Variables &vars, uint64_t const round_id, uint64_t const height)
{
    auto range = vars.round_to_height_range.load_checked(round_id).value_or(
        HeightRange{.lowest = height, .highest = height});
    range.highest = height;
    vars.round_to_height_range.store(round_id, range);
    vars.height_to_round.store(height, round_id);
}

Result<uint64_t> get_highest_known_height_for_round_id(
    Variables const &vars, uint64_t const round_id)
{
    auto const range = vars.round_to_height_range.load_checked(round_id);
    if (HYDRO_UNLIKELY(!range.has_value())) {
        return StorageError::NotFound;
    }
    return range->highest;
}

HYDRO_GOV_NAMESPACE_END
