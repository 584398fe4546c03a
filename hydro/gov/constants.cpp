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
#include <hydro/gov/constants.hpp>
#include <hydro/gov/hydro_error.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

RoundLockPowerSchedule::RoundLockPowerSchedule(
    std::vector<LockPowerEntry> entries)
    : entries_{std::move(entries)}
{
    std::stable_sort(
        entries_.begin(),
        entries_.end(),
        [](LockPowerEntry const &a, LockPowerEntry const &b) {
            return a.locked_rounds < b.locked_rounds;
        });
    auto const last = std::unique(
        entries_.begin(),
        entries_.end(),
        [](LockPowerEntry const &a, LockPowerEntry const &b) {
            return a.locked_rounds == b.locked_rounds;
        });
    entries_.erase(last, entries_.end());
}

uint64_t RoundLockPowerSchedule::max_locked_rounds() const noexcept
{
    return entries_.empty() ? 0 : entries_.back().locked_rounds;
}

Result<uint128_t> RoundLockPowerSchedule::scale_lockup_power(
    uint64_t const lock_epoch_length, uint64_t const lockup_length,
    uint128_t const &amount) const
{
    if (HYDRO_UNLIKELY(entries_.empty())) {
        return amount;
    }

    Decimal factor = entries_.back().power_scaling_factor;
    for (auto const &entry : entries_) {
        if (uint128_t{entry.locked_rounds} * lock_epoch_length >=
            lockup_length) {
            factor = entry.power_scaling_factor;
            break;
        }
    }

    BOOST_OUTCOME_TRY(
        auto const scaled, Decimal::from_integer(amount).checked_mul(factor));
    return scaled.to_uint_floor();
}

Result<Constants>
load_constants_active_at(ConstantsMap const &constants, Timestamp const ts)
{
    auto const active = constants.range(0, ts);
    if (HYDRO_UNLIKELY(active.empty())) {
        return HydroError::ConstantsNotFound;
    }
    return active.back().second;
}

Result<void> validate_lock_duration(
    Constants const &constants, uint64_t const lock_duration)
{
    uint64_t const max_duration =
        constants.round_lock_power_schedule.max_locked_rounds() *
        constants.lock_epoch_length;
    if (HYDRO_UNLIKELY(
            lock_duration == 0 ||
            lock_duration % constants.lock_epoch_length != 0 ||
            lock_duration > max_duration)) {
        return HydroError::InvalidLockDuration;
    }
    return outcome::success();
}

HYDRO_GOV_NAMESPACE_END
