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

#include <hydro/core/result.hpp>
#include <hydro/gov/config.hpp>
#include <hydro/gov/constants.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/gov/types.hpp>

#include <cstdint>

HYDRO_GOV_NAMESPACE_BEGIN

Result<uint64_t> compute_round_id(Constants const &, Timestamp);

Timestamp compute_round_end(Constants const &, uint64_t round_id);

// records that `height` belongs to `round_id`
void update_round_height_maps(
    Variables &, uint64_t round_id, uint64_t height);

Result<uint64_t>
get_highest_known_height_for_round_id(Variables const &, uint64_t round_id);

HYDRO_GOV_NAMESPACE_END
