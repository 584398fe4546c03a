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

#include <hydro/core/checked_math.hpp>
#include <hydro/core/decimal.hpp>
#include <hydro/core/fmt/int_fmt.hpp>
#include <hydro/core/likely.h>
#include <hydro/gov/attributes.hpp>
#include <hydro/gov/hydro_contract.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <set>
#include <string>

HYDRO_GOV_NAMESPACE_BEGIN

Result<LockEntry> HydroContract::load_own_active_lock(
    BlockEnv const &env, MessageInfo const &info, uint64_t const lock_id) const
{
    auto lock = locks_.load(lock_id);
    if (HYDRO_UNLIKELY(!lock.has_value())) {
        return HydroError::LockNotFound;
    }
    if (HYDRO_UNLIKELY(lock->owner != info.sender)) {
        return HydroError::NotLockOwner;
    }
    if (HYDRO_UNLIKELY(env.time > lock->lock_end)) {
        return HydroError::LockExpired;
    }
    return std::move(lock).value();
}

Result<void> HydroContract::transfer_current_round_votes(
    Constants const &constants, uint64_t const current_round_id,
    std::vector<uint64_t> const &parent_ids,
    std::vector<LockEntry> const &children)
{
    std::map<uint64_t, std::optional<uint64_t>> targets;
    for (uint64_t const parent_id : parent_ids) {
        targets.emplace(parent_id, std::nullopt);
    }

    std::vector<uint64_t> child_ids;
    std::map<uint64_t, LockEntry> child_entries;
    for (auto const &child : children) {
        child_ids.push_back(child.lock_id);
        child_entries.emplace(child.lock_id, child);
    }

    for (auto const tranche_id : vars_.tranches.keys()) {
        std::optional<uint64_t> allowed_round;
        std::optional<uint64_t> common_proposal;
        bool all_voted_alike = true;

        for (uint64_t const parent_id : parent_ids) {
            auto const parent_allowed =
                votes_.voting_allowed_round(tranche_id, parent_id);
            if (parent_allowed.has_value()) {
                allowed_round = std::max(
                    allowed_round.value_or(0), parent_allowed.value());
            }

            auto const vote =
                votes_.load(current_round_id, tranche_id, parent_id);
            if (!vote.has_value() ||
                (common_proposal.has_value() &&
                 common_proposal.value() != vote->prop_id)) {
                all_voted_alike = false;
            }
            else {
                common_proposal = vote->prop_id;
            }
        }

        BOOST_OUTCOME_TRY(
            auto const unvotes,
            votes_.process_unvotes(current_round_id, tranche_id, targets));
        for (uint64_t const parent_id : parent_ids) {
            votes_.clear_voting_allowed_round(tranche_id, parent_id);
        }

        std::vector<ProposalToLockups> proposals_votes;
        if (all_voted_alike && common_proposal.has_value()) {
            proposals_votes.push_back(ProposalToLockups{
                .proposal_id = common_proposal.value(),
                .lock_ids = child_ids});
        }
        BOOST_OUTCOME_TRY(votes_.process_votes_and_apply_proposal_changes(
            constants,
            current_round_id,
            tranche_id,
            proposals_votes,
            child_entries,
            unvotes));

        if (!allowed_round.has_value()) {
            continue;
        }
        for (uint64_t const child_id : child_ids) {
            uint64_t const child_allowed =
                votes_.voting_allowed_round(tranche_id, child_id).value_or(0);
            votes_.set_voting_allowed_round(
                tranche_id,
                child_id,
                std::max(child_allowed, allowed_round.value()));
        }
    }

    return outcome::success();
}

void HydroContract::insert_placeholder_votes(
    uint64_t const current_round_id, std::vector<uint64_t> const &parent_ids,
    std::vector<LockEntry> const &children)
{
    auto const tranche_ids = vars_.tranches.keys();

    for (auto const round_id : vars_.round_to_height_range.keys()) {
        if (round_id >= current_round_id) {
            break;
        }
        for (auto const tranche_id : tranche_ids) {
            std::optional<Vote> parent_vote;
            for (uint64_t const parent_id : parent_ids) {
                parent_vote = votes_.load(round_id, tranche_id, parent_id);
                if (parent_vote.has_value()) {
                    break;
                }
            }
            if (!parent_vote.has_value()) {
                continue;
            }

            Vote const placeholder{
                .prop_id = parent_vote->prop_id,
                .time_weighted_shares = {
                    parent_vote->time_weighted_shares.token_group_id,
                    Decimal::zero()}};
            for (auto const &child : children) {
                votes_.save(round_id, tranche_id, child.lock_id, placeholder);
            }
        }
    }
}

Result<void> HydroContract::replace_lock_power(
    Constants const &constants, uint64_t const current_round_id,
    uint64_t const height, std::vector<LockEntry> const &parents,
    std::vector<LockEntry> const &children)
{
    for (auto const &parent : parents) {
        BOOST_OUTCOME_TRY(scores_.remove_lock_power(
            constants, tokens_, current_round_id, parent, height));
    }
    for (auto const &child : children) {
        BOOST_OUTCOME_TRY(scores_.add_lock_power(
            constants, tokens_, current_round_id, child, height));
    }
    return outcome::success();
}

Result<Response> HydroContract::execute_split_lock(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    SplitLock const &msg)
{
    BOOST_OUTCOME_TRY(
        auto const parent, load_own_active_lock(env, info, msg.lock_id));
    if (HYDRO_UNLIKELY(
            msg.amount == 0 || msg.amount >= parent.funds.amount)) {
        return HydroError::InvalidSplitAmount;
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));

    LockEntry first = parent;
    first.lock_id = locks_.next_lock_id();
    first.funds.amount = parent.funds.amount - msg.amount;

    LockEntry second = parent;
    second.lock_id = locks_.next_lock_id();
    second.funds.amount = msg.amount;

    std::vector<LockEntry> const children{first, second};

    BOOST_OUTCOME_TRY(
        auto const second_fraction,
        Decimal::from_ratio(msg.amount, parent.funds.amount));
    BOOST_OUTCOME_TRY(
        auto const first_fraction, Decimal::one().checked_sub(second_fraction));
    locks_.add_successors(
        parent.lock_id,
        {LockSuccessor{.lock_id = first.lock_id, .fraction = first_fraction},
         LockSuccessor{
             .lock_id = second.lock_id, .fraction = second_fraction}});

    uint128_t const pending = pending_.load(parent.lock_id);
    if (pending > 0) {
        BOOST_OUTCOME_TRY(
            auto const second_pending_wide,
            checked_mul_div(pending, msg.amount, parent.funds.amount));
        BOOST_OUTCOME_TRY(
            auto const second_pending, checked_narrow(second_pending_wide));
        pending_.save(second.lock_id, second_pending);
        pending_.save(first.lock_id, pending - second_pending);
        pending_.remove(parent.lock_id);
    }

    BOOST_OUTCOME_TRY(transfer_current_round_votes(
        constants, current_round_id, {parent.lock_id}, children));
    insert_placeholder_votes(current_round_id, {parent.lock_id}, children);
    BOOST_OUTCOME_TRY(replace_lock_power(
        constants, current_round_id, env.height, {parent}, children));

    locks_.remove(parent.lock_id, env.height);
    locks_.save(first, env.height);
    locks_.save(second, env.height);
    locks_.update_user_locks(
        parent.owner, {first.lock_id, second.lock_id}, {parent.lock_id});

    LOG_DEBUG(
        "Lock {} split into {} ({}) and {} ({})",
        parent.lock_id,
        first.lock_id,
        first.funds.amount,
        second.lock_id,
        second.funds.amount);

    Response response;
    response.add_attribute("action", "split_lock")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_id", std::to_string(parent.lock_id))
        .add_attribute(
            "new_lock_ids",
            join_attribute(std::vector<uint64_t>{
                first.lock_id, second.lock_id}));
    return response;
}

Result<Response> HydroContract::execute_merge_locks(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    MergeLocks const &msg)
{
    if (HYDRO_UNLIKELY(msg.lock_ids.size() < 2)) {
        return HydroError::InvalidInput;
    }

    std::set<uint64_t> seen;
    std::vector<LockEntry> parents;
    for (uint64_t const lock_id : msg.lock_ids) {
        if (HYDRO_UNLIKELY(!seen.insert(lock_id).second)) {
            return HydroError::DuplicateLockId;
        }
        BOOST_OUTCOME_TRY(
            auto const lock, load_own_active_lock(env, info, lock_id));
        if (HYDRO_UNLIKELY(
                !parents.empty() &&
                lock.funds.denom != parents.front().funds.denom)) {
            return HydroError::DenomMismatch;
        }
        parents.push_back(lock);
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));

    LockEntry child{
        .lock_id = locks_.next_lock_id(),
        .owner = info.sender,
        .funds = Coin{.denom = parents.front().funds.denom, .amount = 0},
        .lock_start = env.time,
        .lock_end = 0};
    uint128_t pending = 0;
    for (auto const &parent : parents) {
        BOOST_OUTCOME_TRY(
            child.funds.amount,
            checked_add(child.funds.amount, parent.funds.amount));
        child.lock_end = std::max(child.lock_end, parent.lock_end);
        BOOST_OUTCOME_TRY(
            pending, checked_add(pending, pending_.load(parent.lock_id)));

        locks_.add_successors(
            parent.lock_id,
            {LockSuccessor{
                .lock_id = child.lock_id, .fraction = Decimal::one()}});
        pending_.remove(parent.lock_id);
    }
    pending_.save(child.lock_id, std::min(pending, child.funds.amount));

    std::vector<uint64_t> const parent_ids(seen.begin(), seen.end());
    std::vector<LockEntry> const children{child};

    BOOST_OUTCOME_TRY(transfer_current_round_votes(
        constants, current_round_id, parent_ids, children));
    insert_placeholder_votes(current_round_id, parent_ids, children);
    BOOST_OUTCOME_TRY(replace_lock_power(
        constants, current_round_id, env.height, parents, children));

    for (uint64_t const parent_id : parent_ids) {
        locks_.remove(parent_id, env.height);
    }
    locks_.save(child, env.height);
    locks_.update_user_locks(info.sender, {child.lock_id}, parent_ids);

    LOG_DEBUG(
        "Locks {} merged into {} ({})",
        join_attribute(parent_ids),
        child.lock_id,
        child.funds.amount);

    Response response;
    response.add_attribute("action", "merge_locks")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_ids", join_attribute(parent_ids))
        .add_attribute("new_lock_id", std::to_string(child.lock_id));
    return response;
}

HYDRO_GOV_NAMESPACE_END
