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
#include <hydro/gov/lock_store.hpp>
#include <hydro/gov/msg.hpp>
#include <hydro/gov/pending_slash.hpp>
#include <hydro/gov/score_keeper.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>
#include <hydro/gov/vote_ledger.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

struct SlashedLock
{
    // the lock after the slash was applied
    LockEntry lock;
    uint128_t amount;
};

struct SlashAmount
{
    // in the denom of the slashed lock
    uint128_t amount;
    Decimal slash_token_ratio;
};

struct SlashingContext
{
    std::map<uint64_t, SlashedLock> slashed_lockups;
    std::vector<uint64_t> skipped_lockups;
    std::vector<uint64_t> pending_slashes_added;
    std::map<std::string, uint128_t> slashed_amounts;
    std::map<Address, std::vector<uint64_t>> users_removed_locks;
};

class SlashingEngine
{
    Variables &vars_;
    LockStore &locks_;
    VoteLedger &votes_;
    ScoreKeeper &scores_;
    PendingSlashes &pending_;
    TokenManager const &tokens_;

    // Unvotes every slashed lock in every tranche of the current round and
    // votes again for the same proposal with the reduced lock.
    Result<void> update_current_round_votes(
        Constants const &, uint64_t current_round_id,
        std::map<uint64_t, SlashedLock> const &);

    Result<void> update_rounds_powers_and_scaled_shares(
        Constants const &, uint64_t current_round_id, uint64_t height,
        std::map<uint64_t, SlashedLock> const &);

    // Voted locks of the proposal within the pagination window.
    std::vector<std::pair<uint64_t, Vote>> voted_locks(
        uint64_t round_id, uint64_t tranche_id, uint64_t proposal_id,
        uint64_t start_from, uint64_t limit) const;

public:
    SlashingEngine(
        Variables &, LockStore &, VoteLedger &, ScoreKeeper &,
        PendingSlashes &, TokenManager const &);

    Result<Response> slash_proposal_voters(
        BlockEnv const &, MessageInfo const &, Constants const &,
        SlashProposalVoters const &);

    // Amount to slash from `lock_to_slash` for the part of `voted_lock`
    // it inherited through `fraction`. Zero when either denom has no ratio.
    Result<SlashAmount> into_amount_to_slash(
        LockEntry const &voted_lock, LockEntry const &lock_to_slash,
        Decimal const &fraction, Decimal const &slash_percent,
        uint64_t voting_round_id, uint64_t slashing_round_id) const;

    // Base token amount a full slash of the proposal voters would seize.
    Result<uint128_t> query_slashable_token_num_for_voting_on_proposal(
        BlockEnv const &, Constants const &, uint64_t round_id,
        uint64_t tranche_id, uint64_t proposal_id) const;
};

HYDRO_GOV_NAMESPACE_END
