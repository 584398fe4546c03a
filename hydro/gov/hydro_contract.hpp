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
#include <hydro/gov/slashing.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>
#include <hydro/gov/vote_ledger.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

class HydroContract
{
    Storage &storage_;
    Variables vars_;
    TokenManager tokens_;
    LockStore locks_;
    ScoreKeeper scores_;
    VoteLedger votes_;
    PendingSlashes pending_;
    SlashingEngine slashing_;

    Result<Constants> load_current_constants(BlockEnv const &) const;

    Result<Response>
    dispatch(BlockEnv const &, MessageInfo const &, ExecuteMsg const &);

    ///////////////
    //  Handlers //
    ///////////////

    Result<Response> execute_add_tranche(
        BlockEnv const &, MessageInfo const &, Constants const &,
        AddTranche const &);
    Result<Response> execute_update_constants(
        BlockEnv const &, MessageInfo const &, Constants const &,
        UpdateConstants const &);
    Result<Response> execute_create_proposal(
        BlockEnv const &, MessageInfo const &, Constants const &,
        CreateProposal const &);
    Result<Response> execute_lock_tokens(
        BlockEnv const &, MessageInfo const &, Constants const &,
        LockTokens const &);
    Result<Response> execute_unlock_tokens(
        BlockEnv const &, MessageInfo const &, Constants const &,
        UnlockTokens const &);
    Result<Response> execute_refresh_lock_duration(
        BlockEnv const &, MessageInfo const &, Constants const &,
        RefreshLockDuration const &);
    Result<Response> execute_vote(
        BlockEnv const &, MessageInfo const &, Constants const &,
        VoteMsg const &);
    Result<Response> execute_split_lock(
        BlockEnv const &, MessageInfo const &, Constants const &,
        SplitLock const &);
    Result<Response> execute_merge_locks(
        BlockEnv const &, MessageInfo const &, Constants const &,
        MergeLocks const &);
    Result<Response> execute_slash_proposal_voters(
        BlockEnv const &, MessageInfo const &, Constants const &,
        SlashProposalVoters const &);
    Result<Response> execute_buyout_pending_slash(
        BlockEnv const &, MessageInfo const &, Constants const &,
        BuyoutPendingSlash const &);
    Result<Response> execute_convert_lockup(
        BlockEnv const &, MessageInfo const &, Constants const &,
        ConvertLockup const &);
    Result<Response> execute_update_token_group_ratio(
        BlockEnv const &, MessageInfo const &, Constants const &,
        UpdateTokenGroupRatio const &);

    ///////////////
    //  Lineage  //
    ///////////////

    // owned and not expired
    Result<LockEntry> load_own_active_lock(
        BlockEnv const &, MessageInfo const &, uint64_t lock_id) const;

    // Moves the current round votes of the parents to the children. The
    // children vote for a proposal only when every parent voted for it.
    Result<void> transfer_current_round_votes(
        Constants const &, uint64_t current_round_id,
        std::vector<uint64_t> const &parent_ids,
        std::vector<LockEntry> const &children);

    // Zero power votes for the children in every earlier round a parent
    // voted in, so the history of the lineage stays queryable.
    void insert_placeholder_votes(
        uint64_t current_round_id, std::vector<uint64_t> const &parent_ids,
        std::vector<LockEntry> const &children);

    Result<void> replace_lock_power(
        Constants const &, uint64_t current_round_id, uint64_t height,
        std::vector<LockEntry> const &parents,
        std::vector<LockEntry> const &children);

public:
    explicit HydroContract(Storage &);

    HydroContract(HydroContract const &) = delete;
    HydroContract &operator=(HydroContract const &) = delete;

    Variables &vars() noexcept
    {
        return vars_;
    }

    TokenManager &token_manager() noexcept
    {
        return tokens_;
    }

    // Each call runs in its own storage frame which is discarded on error.
    Result<Response>
    instantiate(BlockEnv const &, MessageInfo const &, InstantiateMsg);

    Result<Response>
    execute(BlockEnv const &, MessageInfo const &, ExecuteMsg const &);

    /////////////
    // Queries //
    /////////////

    Result<LockEntry> query_lock(uint64_t lock_id) const;

    std::vector<LockEntry> query_user_locks(Address const &) const;

    uint128_t query_pending_slash(uint64_t lock_id) const;

    Result<Proposal> query_proposal(
        uint64_t round_id, uint64_t tranche_id, uint64_t proposal_id) const;

    std::optional<Vote> query_vote(
        uint64_t round_id, uint64_t tranche_id, uint64_t lock_id) const;

    std::optional<uint64_t>
    query_voting_allowed_round(uint64_t tranche_id, uint64_t lock_id) const;

    uint128_t query_round_total_power(uint64_t round_id) const;

    Result<uint128_t> query_round_total_power_at_height(
        uint64_t round_id, uint64_t height) const;

    Decimal query_round_token_group_shares(
        uint64_t round_id, std::string const &token_group_id) const;

    uint128_t query_total_locked_tokens() const;

    Result<std::vector<std::pair<uint64_t, Decimal>>>
    query_current_lock_composition(uint64_t lock_id) const;

    Result<uint128_t> query_slashable_token_num_for_voting_on_proposal(
        BlockEnv const &, uint64_t round_id, uint64_t tranche_id,
        uint64_t proposal_id) const;
};

HYDRO_GOV_NAMESPACE_END
