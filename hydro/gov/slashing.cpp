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
#include <hydro/core/fmt/decimal_fmt.hpp>
#include <hydro/core/fmt/int_fmt.hpp>
#include <hydro/core/likely.h>
#include <hydro/gov/attributes.hpp>
#include <hydro/gov/fmt/coin_fmt.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/lock_composition.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/gov/slashing.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <optional>

HYDRO_GOV_NAMESPACE_BEGIN

SlashingEngine::SlashingEngine(
    Variables &vars, LockStore &locks, VoteLedger &votes, ScoreKeeper &scores,
    PendingSlashes &pending, TokenManager const &tokens)
    : vars_{vars}
    , locks_{locks}
    , votes_{votes}
    , scores_{scores}
    , pending_{pending}
    , tokens_{tokens}
{
}

std::vector<std::pair<uint64_t, Vote>> SlashingEngine::voted_locks(
    uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const proposal_id, uint64_t const start_from,
    uint64_t const limit) const
{
    auto res = votes_.votes_in(round_id, tranche_id, start_from, limit);
    std::erase_if(res, [proposal_id](auto const &entry) {
        return entry.second.prop_id != proposal_id;
    });
    return res;
}

Result<SlashAmount> SlashingEngine::into_amount_to_slash(
    LockEntry const &voted_lock, LockEntry const &lock_to_slash,
    Decimal const &fraction, Decimal const &slash_percent,
    uint64_t const voting_round_id, uint64_t const slashing_round_id) const
{
    // the vote carried no power, nothing to take back
    Decimal const vote_token_ratio =
        tokens_.get_token_denom_ratio(voting_round_id, voted_lock.funds.denom);
    if (vote_token_ratio.is_zero()) {
        return SlashAmount{.amount = 0, .slash_token_ratio = Decimal::zero()};
    }

    Decimal const slash_token_ratio = tokens_.get_token_denom_ratio(
        slashing_round_id, lock_to_slash.funds.denom);
    if (slash_token_ratio.is_zero()) {
        return SlashAmount{.amount = 0, .slash_token_ratio = Decimal::zero()};
    }

    BOOST_OUTCOME_TRY(
        auto slashed,
        Decimal::from_integer(voted_lock.funds.amount).checked_mul(fraction));
    BOOST_OUTCOME_TRY(slashed, slashed.checked_mul(slash_percent));

    // a different denom is converted through base tokens
    if (voted_lock.funds.denom != lock_to_slash.funds.denom) {
        BOOST_OUTCOME_TRY(slashed, slashed.checked_mul(vote_token_ratio));
        BOOST_OUTCOME_TRY(slashed, slashed.checked_div(slash_token_ratio));
    }

    BOOST_OUTCOME_TRY(auto const amount, slashed.to_uint_floor());
    return SlashAmount{
        .amount = std::min(amount, lock_to_slash.funds.amount),
        .slash_token_ratio = slash_token_ratio};
}

Result<Response> SlashingEngine::slash_proposal_voters(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    SlashProposalVoters const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.is_whitelist_admin(info.sender))) {
        return HydroError::Unauthorized;
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    BOOST_OUTCOME_TRY(
        auto const highest_height,
        get_highest_known_height_for_round_id(vars_, msg.round_id));
    // includes locks created by a split or merge in the round's last block
    uint64_t const voting_round_latest_height = highest_height + 1;

    auto const tranche_ids = vars_.tranches.keys();

    SlashingContext ctx;

    for (auto const &[voted_lock_id, vote] : voted_locks(
             msg.round_id,
             msg.tranche_id,
             msg.proposal_id,
             msg.start_from,
             msg.limit)) {
        // placeholder votes of split and merge children
        if (vote.time_weighted_shares.shares.is_zero()) {
            continue;
        }

        BOOST_OUTCOME_TRY(
            auto const voted_lock,
            locks_.load_at_height(voted_lock_id, voting_round_latest_height));
        if (HYDRO_UNLIKELY(!voted_lock.has_value())) {
            LOG_DEBUG(
                "Voted lock {} not found at height {}",
                voted_lock_id,
                voting_round_latest_height);
            ctx.skipped_lockups.push_back(voted_lock_id);
            continue;
        }

        BOOST_OUTCOME_TRY(
            auto const composition,
            get_current_lock_composition(locks_, voted_lock_id));

        for (auto const &[lock_id, fraction] : composition) {
            auto lock = locks_.load(lock_id);
            if (!lock.has_value()) {
                LOG_DEBUG(
                    "Lock {} inherited from {} no longer exists",
                    lock_id,
                    voted_lock_id);
                ctx.skipped_lockups.push_back(lock_id);
                continue;
            }

            BOOST_OUTCOME_TRY(
                auto const slash,
                into_amount_to_slash(
                    voted_lock.value(),
                    lock.value(),
                    fraction,
                    msg.slash_percent,
                    msg.round_id,
                    current_round_id));
            if (slash.amount == 0) {
                LOG_DEBUG("Nothing to slash from lock {}", lock_id);
                ctx.skipped_lockups.push_back(lock_id);
                continue;
            }

            BOOST_OUTCOME_TRY(
                auto amount_to_slash,
                checked_add(pending_.load(lock_id), slash.amount));
            amount_to_slash = std::min(amount_to_slash, lock->funds.amount);

            BOOST_OUTCOME_TRY(
                auto const slashed_ratio,
                Decimal::from_ratio(amount_to_slash, lock->funds.amount));
            if (slashed_ratio < constants.slash_percentage_threshold) {
                pending_.save(lock_id, amount_to_slash);
                ctx.pending_slashes_added.push_back(lock_id);
                continue;
            }

            BOOST_OUTCOME_TRY(
                lock->funds.amount,
                checked_sub(lock->funds.amount, amount_to_slash));
            if (lock->funds.amount == 0) {
                locks_.remove(lock_id, env.height);
                ctx.users_removed_locks[lock->owner].push_back(lock_id);
                for (auto const tranche_id : tranche_ids) {
                    votes_.clear_voting_allowed_round(tranche_id, lock_id);
                }
            }
            else {
                locks_.save(lock.value(), env.height);
            }
            pending_.remove(lock_id);

            // a lock inherited from several voters is slashed once per voter
            auto const [it, inserted] = ctx.slashed_lockups.try_emplace(
                lock_id,
                SlashedLock{.lock = lock.value(), .amount = amount_to_slash});
            if (!inserted) {
                it->second.lock = lock.value();
                BOOST_OUTCOME_TRY(
                    it->second.amount,
                    checked_add(it->second.amount, amount_to_slash));
            }

            uint128_t &denom_total =
                ctx.slashed_amounts[lock->funds.denom];
            BOOST_OUTCOME_TRY(
                denom_total, checked_add(denom_total, amount_to_slash));
        }
    }

    std::vector<uint64_t> slashed_ids;
    for (auto const &[lock_id, slashed] : ctx.slashed_lockups) {
        slashed_ids.push_back(lock_id);
    }

    Response response;
    response.add_attribute("action", "slash_proposal_voters")
        .add_attribute("sender", info.sender)
        .add_attribute("round_id", std::to_string(msg.round_id))
        .add_attribute("tranche_id", std::to_string(msg.tranche_id))
        .add_attribute("proposal_id", std::to_string(msg.proposal_id))
        .add_attribute("slash_percent", msg.slash_percent.to_string())
        .add_attribute("slashed_lockups", join_attribute(slashed_ids))
        .add_attribute(
            "skipped_lockups", join_attribute(ctx.skipped_lockups))
        .add_attribute(
            "pending_slashes_added",
            join_attribute(ctx.pending_slashes_added));

    LOG_INFO(
        "Slash of proposal {} in round {} tranche {} at {}: {} slashed, {} "
        "skipped, {} pending",
        msg.proposal_id,
        msg.round_id,
        msg.tranche_id,
        msg.slash_percent,
        ctx.slashed_lockups.size(),
        ctx.skipped_lockups.size(),
        ctx.pending_slashes_added.size());

    if (ctx.slashed_lockups.empty()) {
        return response;
    }

    BOOST_OUTCOME_TRY(update_current_round_votes(
        constants, current_round_id, ctx.slashed_lockups));

    for (auto const &[owner, removed] : ctx.users_removed_locks) {
        locks_.update_user_locks(owner, {}, removed);
    }

    BOOST_OUTCOME_TRY(update_rounds_powers_and_scaled_shares(
        constants, current_round_id, env.height, ctx.slashed_lockups));

    uint128_t total_slashed = 0;
    std::vector<Coin> slashed_coins;
    for (auto const &[denom, amount] : ctx.slashed_amounts) {
        BOOST_OUTCOME_TRY(total_slashed, checked_add(total_slashed, amount));
        slashed_coins.push_back(Coin{.denom = denom, .amount = amount});
    }

    uint128_t const locked_tokens = vars_.locked_tokens.load();
    vars_.locked_tokens.store(
        locked_tokens > total_slashed ? locked_tokens - total_slashed
                                      : uint128_t{0});

    response.add_attribute("slashed_amounts", join_attribute(slashed_coins))
        .add_attribute("total_tokens_slashed", intx::to_string(total_slashed))
        .add_message(BankSend{
            .to_address = constants.slash_tokens_receiver_addr,
            .amount = std::move(slashed_coins)});

    return response;
}

Result<void> SlashingEngine::update_current_round_votes(
    Constants const &constants, uint64_t const current_round_id,
    std::map<uint64_t, SlashedLock> const &slashed_lockups)
{
    std::map<uint64_t, std::optional<uint64_t>> targets;
    std::map<uint64_t, LockEntry> lock_entries;
    for (auto const &[lock_id, slashed] : slashed_lockups) {
        targets.emplace(lock_id, std::nullopt);
        if (slashed.lock.funds.amount > 0) {
            lock_entries.emplace(lock_id, slashed.lock);
        }
    }

    for (auto const tranche_id : vars_.tranches.keys()) {
        BOOST_OUTCOME_TRY(
            auto const unvotes,
            votes_.process_unvotes(current_round_id, tranche_id, targets));

        // proposal => partially slashed locks that voted for it
        std::map<uint64_t, std::vector<uint64_t>> revotes;
        for (auto const &[lock_id, removed_vote] : unvotes.removed_votes) {
            if (lock_entries.contains(lock_id)) {
                revotes[removed_vote.prop_id].push_back(lock_id);
            }
        }

        std::vector<ProposalToLockups> proposals_votes;
        for (auto &[proposal_id, lock_ids] : revotes) {
            proposals_votes.push_back(ProposalToLockups{
                .proposal_id = proposal_id, .lock_ids = std::move(lock_ids)});
        }

        BOOST_OUTCOME_TRY(votes_.process_votes_and_apply_proposal_changes(
            constants,
            current_round_id,
            tranche_id,
            proposals_votes,
            lock_entries,
            unvotes));
    }

    return outcome::success();
}

Result<void> SlashingEngine::update_rounds_powers_and_scaled_shares(
    Constants const &constants, uint64_t const current_round_id,
    uint64_t const height,
    std::map<uint64_t, SlashedLock> const &slashed_lockups)
{
    auto const &schedule = constants.round_lock_power_schedule;
    uint64_t const last_round_id =
        current_round_id + schedule.max_locked_rounds();

    // round_id => token_group_id => scaled shares removed
    std::map<uint64_t, std::map<std::string, Decimal>> changes;

    for (auto const &[lock_id, slashed] : slashed_lockups) {
        LockEntry const &lock = slashed.lock;
        BOOST_OUTCOME_TRY(
            auto const old_amount,
            checked_add(lock.funds.amount, slashed.amount));

        for (uint64_t round_id = current_round_id; round_id <= last_round_id;
             ++round_id) {
            Timestamp const round_end = compute_round_end(constants, round_id);
            if (lock.lock_end < round_end) {
                break;
            }

            uint64_t const lockup_length = lock.lock_end - round_end;
            BOOST_OUTCOME_TRY(
                auto const old_power,
                schedule.scale_lockup_power(
                    constants.lock_epoch_length, lockup_length, old_amount));
            BOOST_OUTCOME_TRY(
                auto const new_power,
                schedule.scale_lockup_power(
                    constants.lock_epoch_length,
                    lockup_length,
                    lock.funds.amount));
            BOOST_OUTCOME_TRY(
                auto const removed, checked_sub(old_power, new_power));

            auto const group =
                tokens_.validate_denom(current_round_id, lock.funds.denom);
            if (group.has_error()) {
                LOG_DEBUG(
                    "Lock {} holds {} which has no token group in round {}",
                    lock_id,
                    lock.funds.denom,
                    current_round_id);
                break;
            }

            Decimal &change = changes[round_id][group.value()];
            BOOST_OUTCOME_TRY(
                change, change.checked_add(Decimal::from_integer(removed)));
        }
    }

    for (auto const &[round_id, group_changes] : changes) {
        Decimal total_change;

        for (auto const &[token_group_id, removed] : group_changes) {
            Decimal const old_shares =
                scores_.round_token_group_shares(round_id, token_group_id);
            Decimal new_shares;
            if (old_shares > removed) {
                BOOST_OUTCOME_TRY(new_shares, old_shares.checked_sub(removed));
            }
            scores_.save_round_token_group_shares(
                round_id, token_group_id, new_shares);

            // ratios are known up to the current round only
            Decimal const ratio =
                tokens_.get_token_group_ratio(current_round_id, token_group_id);
            if (ratio.is_zero()) {
                continue;
            }

            BOOST_OUTCOME_TRY(
                auto const old_power, old_shares.checked_mul(ratio));
            BOOST_OUTCOME_TRY(
                auto const new_power, new_shares.checked_mul(ratio));
            BOOST_OUTCOME_TRY(
                auto const power_change, old_power.checked_sub(new_power));
            BOOST_OUTCOME_TRY(
                total_change, total_change.checked_add(power_change));
        }

        Decimal const old_total =
            Decimal::from_integer(scores_.round_total_power(round_id));
        Decimal new_total;
        if (old_total > total_change) {
            BOOST_OUTCOME_TRY(new_total, old_total.checked_sub(total_change));
        }
        BOOST_OUTCOME_TRY(auto const total_power, new_total.to_uint_ceil());
        scores_.save_round_total_power(round_id, total_power, height);
    }

    return outcome::success();
}

Result<uint128_t>
SlashingEngine::query_slashable_token_num_for_voting_on_proposal(
    BlockEnv const &env, Constants const &constants, uint64_t const round_id,
    uint64_t const tranche_id, uint64_t const proposal_id) const
{
    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    if (HYDRO_UNLIKELY(round_id > current_round_id)) {
        return HydroError::FutureRound;
    }
    if (HYDRO_UNLIKELY(!vars_.proposals.contains(
            ProposalKey{round_id, tranche_id, proposal_id}))) {
        return HydroError::ProposalNotFound;
    }

    BOOST_OUTCOME_TRY(
        auto const highest_height,
        get_highest_known_height_for_round_id(vars_, round_id));
    uint64_t const voting_round_latest_height = highest_height + 1;

    uint128_t total = 0;

    for (auto const &[voted_lock_id, vote] :
         votes_.votes_in(round_id, tranche_id)) {
        if (vote.prop_id != proposal_id ||
            vote.time_weighted_shares.shares.is_zero()) {
            continue;
        }

        BOOST_OUTCOME_TRY(
            auto const voted_lock,
            locks_.load_at_height(voted_lock_id, voting_round_latest_height));
        if (!voted_lock.has_value()) {
            continue;
        }

        BOOST_OUTCOME_TRY(
            auto const composition,
            get_current_lock_composition(locks_, voted_lock_id));

        for (auto const &[lock_id, fraction] : composition) {
            auto const lock = locks_.load(lock_id);
            if (!lock.has_value()) {
                continue;
            }

            BOOST_OUTCOME_TRY(
                auto const slash,
                into_amount_to_slash(
                    voted_lock.value(),
                    lock.value(),
                    fraction,
                    Decimal::percent(100),
                    round_id,
                    current_round_id));
            if (slash.amount == 0) {
                continue;
            }

            BOOST_OUTCOME_TRY(
                auto const base,
                Decimal::from_integer(slash.amount)
                    .checked_mul(slash.slash_token_ratio));
            BOOST_OUTCOME_TRY(auto const base_amount, base.to_uint_floor());
            BOOST_OUTCOME_TRY(total, checked_add(total, base_amount));
        }
    }

    return total;
}

HYDRO_GOV_NAMESPACE_END
