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
#include <hydro/gov/score_keeper.hpp>
#include <hydro/gov/state.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

struct UnvoteResult
{
    // lock_id => vote that was removed
    std::map<uint64_t, Vote> removed_votes;

    // locks that already vote for their target proposal and keep that vote
    std::set<uint64_t> locks_skipped;

    ProposalPowerChanges power_changes;
};

struct VoteResult
{
    std::vector<uint64_t> locks_voted;
    std::vector<uint64_t> locks_skipped;
    ProposalPowerChanges power_changes;
};

/// Votes of locks per round and tranche and the rounds in which each lock is
/// allowed to vote again.
class VoteLedger
{
    Variables &vars_;
    ScoreKeeper &scores_;
    TokenManager const &tokens_;

public:
    VoteLedger(Variables &, ScoreKeeper &, TokenManager const &);

    std::optional<Vote>
    load(uint64_t round_id, uint64_t tranche_id, uint64_t lock_id) const;

    // all votes of a round and tranche, ascending by lock id
    std::vector<std::pair<uint64_t, Vote>>
    votes_in(uint64_t round_id, uint64_t tranche_id) const;

    // votes_in without its first `start_from` votes, at most `limit` of them
    std::vector<std::pair<uint64_t, Vote>> votes_in(
        uint64_t round_id, uint64_t tranche_id, uint64_t start_from,
        uint64_t limit) const;

    void save(
        uint64_t round_id, uint64_t tranche_id, uint64_t lock_id,
        Vote const &);

    std::optional<uint64_t>
    voting_allowed_round(uint64_t tranche_id, uint64_t lock_id) const;

    void set_voting_allowed_round(
        uint64_t tranche_id, uint64_t lock_id, uint64_t round_id);

    void clear_voting_allowed_round(uint64_t tranche_id, uint64_t lock_id);

    // Removes the current votes of the given locks unless they already vote
    // for their target proposal. Removing a vote also clears the lock's
    // voting allowed round in the tranche.
    Result<UnvoteResult> process_unvotes(
        uint64_t round_id, uint64_t tranche_id,
        std::map<uint64_t, std::optional<uint64_t>> const &targets);

    // Records votes with the lock's scaled power at the round end. Locks that
    // resolve to no token group or to zero power are skipped.
    Result<VoteResult> process_votes(
        Constants const &, uint64_t round_id, uint64_t tranche_id,
        std::vector<ProposalToLockups> const &,
        std::map<uint64_t, LockEntry> const &lock_entries,
        UnvoteResult const &);

    Result<VoteResult> process_votes_and_apply_proposal_changes(
        Constants const &, uint64_t round_id, uint64_t tranche_id,
        std::vector<ProposalToLockups> const &,
        std::map<uint64_t, LockEntry> const &lock_entries,
        UnvoteResult const &);
};

HYDRO_GOV_NAMESPACE_END
