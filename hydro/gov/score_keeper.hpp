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
#include <hydro/gov/constants.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

struct SharesChange
{
    Decimal added;
    Decimal removed;
};

// (proposal_id, token_group_id) => change
using ProposalPowerChanges = std::map<TokenGroupKey, SharesChange>;

struct TokenGroupRatioChange
{
    std::string token_group_id;
    Decimal old_ratio;
    Decimal new_ratio;
};

/// Keeps proposal power and round power in step with the scaled shares of
/// the locks backing them. Shares are tracked per token group and converted
/// into power with the group's ratio to the base token.
class ScoreKeeper
{
    Variables &vars_;

    Result<void> update_lock_power(
        Constants const &, TokenManager const &, uint64_t current_round_id,
        LockEntry const &, bool add, uint64_t height);

public:
    explicit ScoreKeeper(Variables &);

    ////////////////
    // Proposals  //
    ////////////////

    Decimal proposal_token_group_shares(
        uint64_t proposal_id, std::string const &token_group_id) const;

    Decimal proposal_total_power(uint64_t proposal_id) const;

    // Applies vote and unvote share changes to the proposals of one round
    // and tranche. The proposal power is the ceiling of its total.
    Result<void> apply_proposal_changes(
        uint64_t round_id, uint64_t tranche_id, ProposalPowerChanges const &,
        TokenManager const &);

    ////////////
    // Rounds //
    ////////////

    Decimal round_token_group_shares(
        uint64_t round_id, std::string const &token_group_id) const;

    void save_round_token_group_shares(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &shares);

    uint128_t round_total_power(uint64_t round_id) const;

    Result<uint128_t>
    round_total_power_at_height(uint64_t round_id, uint64_t height) const;

    void save_round_total_power(
        uint64_t round_id, uint128_t const &power, uint64_t height);

    // Reprices the shares already recorded for the changed token groups:
    // every proposal of the current round in every tranche, and the total
    // power of the current round and each later round that has one.
    Result<void> apply_token_groups_ratio_changes(
        uint64_t current_round_id, uint64_t height,
        std::vector<TokenGroupRatioChange> const &);

    // Adds the scaled power of a lock to every round it is alive at the end
    // of, from the current round to the end of the lock power schedule.
    Result<void> add_lock_power(
        Constants const &, TokenManager const &, uint64_t current_round_id,
        LockEntry const &, uint64_t height);

    // Inverse of add_lock_power, clamped at zero.
    Result<void> remove_lock_power(
        Constants const &, TokenManager const &, uint64_t current_round_id,
        LockEntry const &, uint64_t height);
};

HYDRO_GOV_NAMESPACE_END
