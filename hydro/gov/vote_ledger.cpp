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
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/gov/vote_ledger.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <limits>

HYDRO_GOV_NAMESPACE_BEGIN

VoteLedger::VoteLedger(
    Variables &vars, ScoreKeeper &scores, TokenManager const &tokens)
    : vars_{vars}
    , scores_{scores}
    , tokens_{tokens}
{
}

std::optional<Vote> VoteLedger::load(
    uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const lock_id) const
{
    return vars_.votes.load_checked({round_id, tranche_id, lock_id});
}

std::vector<std::pair<uint64_t, Vote>>
VoteLedger::votes_in(uint64_t const round_id, uint64_t const tranche_id) const
{
    std::vector<std::pair<uint64_t, Vote>> res;
    for (auto const &[key, vote] : vars_.votes.range(
             {round_id, tranche_id, 0},
             {round_id, tranche_id, std::numeric_limits<uint64_t>::max()})) {
        res.emplace_back(std::get<2>(key), vote);
    }
    return res;
}

std::vector<std::pair<uint64_t, Vote>> VoteLedger::votes_in(
    uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const start_from, uint64_t const limit) const
{
    std::vector<std::pair<uint64_t, Vote>> res;
    for (auto const &[key, vote] : vars_.votes.range(
             {round_id, tranche_id, 0},
             {round_id, tranche_id, std::numeric_limits<uint64_t>::max()},
             start_from,
             limit)) {
        res.emplace_back(std::get<2>(key), vote);
    }
    return res;
}

void VoteLedger::save(
    uint64_t const round_id, uint64_t const tranche_id, uint64_t const lock_id,
    Vote const &vote)
{
    vars_.votes.store({round_id, tranche_id, lock_id}, vote);
}

std::optional<uint64_t> VoteLedger::voting_allowed_round(
    uint64_t const tranche_id, uint64_t const lock_id) const
{
    return vars_.voting_allowed_round.load_checked({tranche_id, lock_id});
}

void VoteLedger::set_voting_allowed_round(
    uint64_t const tranche_id, uint64_t const lock_id, uint64_t const round_id)
{
    vars_.voting_allowed_round.store({tranche_id, lock_id}, round_id);
}

void VoteLedger::clear_voting_allowed_round(
    uint64_t const tranche_id, uint64_t const lock_id)
{
    vars_.voting_allowed_round.clear({tranche_id, lock_id});
}

Result<UnvoteResult> VoteLedger::process_unvotes(
    uint64_t const round_id, uint64_t const tranche_id,
    std::map<uint64_t, std::optional<uint64_t>> const &targets)
{
    UnvoteResult res;

    for (auto const &[lock_id, target] : targets) {
        auto const existing = load(round_id, tranche_id, lock_id);
        if (!existing.has_value()) {
            continue;
        }
        if (target.has_value() && existing->prop_id == target.value()) {
            res.locks_skipped.insert(lock_id);
            continue;
        }

        auto const &shares = existing->time_weighted_shares;
        auto &change =
            res.power_changes[{existing->prop_id, shares.token_group_id}];
        BOOST_OUTCOME_TRY(
            change.removed, change.removed.checked_add(shares.shares));

        res.removed_votes.emplace(lock_id, existing.value());

        vars_.votes.clear({round_id, tranche_id, lock_id});
        clear_voting_allowed_round(tranche_id, lock_id);
    }

    return res;
}

Result<VoteResult> VoteLedger::process_votes(
    Constants const &constants, uint64_t const round_id,
    uint64_t const tranche_id, std::vector<ProposalToLockups> const &votes,
    std::map<uint64_t, LockEntry> const &lock_entries,
    UnvoteResult const &unvotes)
{
    VoteResult res;
    res.power_changes = unvotes.power_changes;

    Timestamp const round_end = compute_round_end(constants, round_id);

    for (auto const &proposal_to_lockups : votes) {
        uint64_t const proposal_id = proposal_to_lockups.proposal_id;
        auto const proposal =
            vars_.proposals.load_checked({round_id, tranche_id, proposal_id});
        if (HYDRO_UNLIKELY(!proposal.has_value())) {
            return HydroError::ProposalNotFound;
        }

        for (uint64_t const lock_id : proposal_to_lockups.lock_ids) {
            if (unvotes.locks_skipped.contains(lock_id)) {
                continue;
            }

            auto const entry = lock_entries.find(lock_id);
            if (HYDRO_UNLIKELY(entry == lock_entries.end())) {
                return HydroError::LockNotFound;
            }
            LockEntry const &lock = entry->second;

            auto const allowed_round =
                voting_allowed_round(tranche_id, lock_id);
            if (allowed_round.has_value() && allowed_round.value() > round_id) {
                LOG_INFO(
                    "Lock {} can not vote in tranche {} until round {}",
                    lock_id,
                    tranche_id,
                    allowed_round.value());
                return HydroError::VotingNotAllowed;
            }

            auto const group =
                tokens_.validate_denom(round_id, lock.funds.denom);
            if (group.has_error()) {
                LOG_DEBUG(
                    "Denom {} of lock {} is not lockable in round {}",
                    lock.funds.denom,
                    lock_id,
                    round_id);
                res.locks_skipped.push_back(lock_id);
                continue;
            }

            uint128_t scaled = 0;
            if (lock.lock_end >= round_end) {
                BOOST_OUTCOME_TRY(
                    scaled,
                    constants.round_lock_power_schedule.scale_lockup_power(
                        constants.lock_epoch_length,
                        lock.lock_end - round_end,
                        lock.funds.amount));
            }
            if (scaled == 0) {
                res.locks_skipped.push_back(lock_id);
                continue;
            }

            Decimal const shares = Decimal::from_integer(scaled);
            save(
                round_id,
                tranche_id,
                lock_id,
                Vote{
                    .prop_id = proposal_id,
                    .time_weighted_shares = {group.value(), shares}});
            set_voting_allowed_round(
                tranche_id, lock_id, round_id + proposal->deployment_duration);

            auto &change = res.power_changes[{proposal_id, group.value()}];
            BOOST_OUTCOME_TRY(change.added, change.added.checked_add(shares));

            res.locks_voted.push_back(lock_id);
        }
    }

    return res;
}

Result<VoteResult> VoteLedger::process_votes_and_apply_proposal_changes(
    Constants const &constants, uint64_t const round_id,
    uint64_t const tranche_id, std::vector<ProposalToLockups> const &votes,
    std::map<uint64_t, LockEntry> const &lock_entries,
    UnvoteResult const &unvotes)
{
    BOOST_OUTCOME_TRY(
        auto res,
        process_votes(
            constants, round_id, tranche_id, votes, lock_entries, unvotes));
    BOOST_OUTCOME_TRY(scores_.apply_proposal_changes(
        round_id, tranche_id, res.power_changes, tokens_));
    return res;
}

HYDRO_GOV_NAMESPACE_END
