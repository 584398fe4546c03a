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

#include <hydro/core/int.hpp>
#include <hydro/gov/config.hpp>
#include <hydro/gov/state.hpp>

#include <cstdint>

HYDRO_GOV_NAMESPACE_BEGIN

/// Running total of slashes that were too small to apply, per lock, in the
/// denom the lock currently holds.
class PendingSlashes
{
    Variables &vars_;

public:
    explicit PendingSlashes(Variables &);

    // zero when nothing is pending
    uint128_t load(uint64_t lock_id) const;

    // saving zero removes the entry
    void save(uint64_t lock_id, uint128_t const &amount);

    void remove(uint64_t lock_id);
};

HYDRO_GOV_NAMESPACE_END
