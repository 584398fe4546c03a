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
#include <hydro/core/int.hpp>
#include <hydro/core/result.hpp>
#include <hydro/gov/config.hpp>
#include <hydro/gov/types.hpp>
#include <hydro/state/map.hpp>

#include <cstdint>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

struct LockPowerEntry
{
    uint64_t locked_rounds;
    Decimal power_scaling_factor;
};

/// Voting power multipliers by remaining lock duration, ascending in
/// `locked_rounds` with at most one entry per round count.
class RoundLockPowerSchedule
{
    std::vector<LockPowerEntry> entries_{};

public:
    RoundLockPowerSchedule() = default;
    explicit RoundLockPowerSchedule(std::vector<LockPowerEntry>);

    std::vector<LockPowerEntry> const &entries() const noexcept
    {
        return entries_;
    }

    uint64_t max_locked_rounds() const noexcept;

    // floor(amount * factor) where factor belongs to the first entry long
    // enough to cover `lockup_length`, or to the last entry
    Result<uint128_t> scale_lockup_power(
        uint64_t lock_epoch_length, uint64_t lockup_length,
        uint128_t const &amount) const;
};

struct Constants
{
    uint64_t round_length;
    uint64_t lock_epoch_length;
    Timestamp first_round_start;
    uint128_t max_locked_tokens;
    RoundLockPowerSchedule round_lock_power_schedule;
    uint64_t max_deployment_duration;
    Decimal slash_percentage_threshold;
    Address slash_tokens_receiver_addr;
    bool paused;
};

// constants keyed by activation timestamp
using ConstantsMap = Map<Timestamp, Constants>;

Result<Constants>
load_constants_active_at(ConstantsMap const &, Timestamp);

// a whole number of lock epochs, covered by the power schedule
Result<void> validate_lock_duration(Constants const &, uint64_t lock_duration);

HYDRO_GOV_NAMESPACE_END
