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

#include <hydro/gov/pending_slash.hpp>

HYDRO_GOV_NAMESPACE_BEGIN

PendingSlashes::PendingSlashes(Variables &vars)
    : vars_{vars}
{
}

uint128_t PendingSlashes::load(uint64_t const lock_id) const
{
    return vars_.pending_slashes.load_checked(lock_id).value_or(0);
}

void PendingSlashes::save(uint64_t const lock_id, uint128_t const &amount)
{
    if (amount == 0) {
        vars_.pending_slashes.clear(lock_id);
    }
    else {
        vars_.pending_slashes.store(lock_id, amount);
    }
}

void PendingSlashes::remove(uint64_t const lock_id)
{
    vars_.pending_slashes.clear(lock_id);
}

HYDRO_GOV_NAMESPACE_END
