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

#include <hydro/core/decimal.hpp>
#include <hydro/core/result.hpp>
#include <hydro/gov/config.hpp>
#include <hydro/gov/lock_store.hpp>

#include <cstdint>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

/// Flattens the lineage of `lock_id` into the locks that hold its value today
/// and the fraction of the original value each of them holds, ascending by
/// lock id. A lock that was never split or merged is its own composition.
Result<std::vector<std::pair<uint64_t, Decimal>>>
get_current_lock_composition(LockStore const &, uint64_t lock_id);

HYDRO_GOV_NAMESPACE_END
