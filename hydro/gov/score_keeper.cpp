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

#include <hydro/core/fmt/decimal_fmt.hpp>
#include <hydro/core/likely.h>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/gov/score_keeper.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <limits>
#include <utility>

HYDRO_GOV_NAMESPACE_BEGIN

ScoreKeeper::ScoreKeeper(Variables &vars)
    : vars_{vars}
{
}

Decimal ScoreKeeper::proposal_token_group_shares(
    uint64_t const proposal_id, std::string const &token_group_id) const
{
    return vars_.proposal_token_group_shares.load(
        {proposal_id, token_group_id});
}

Decimal ScoreKeeper::proposal_total_power(uint64_t const proposal_id) const
{
    return vars_.proposal_total_power.load(proposal_id);
}

Result<void> ScoreKeeper::apply_proposal_changes(
    uint64_t const round_id, uint64_t const tranche_id,
    ProposalPowerChanges const &changes, TokenManager const &tokens)
{
    std::map<uint64_t, Decimal> totals;

    for (auto const &[key, change] : changes) {
        auto const &[proposal_id, token_group_id] = key;

        BOOST_OUTCOME_TRY(
            auto shares,
            vars_.proposal_token_group_shares.load(key).checked_add(
                change.added));
        if (HYDRO_UNLIKELY(shares < change.removed)) {
            return HydroError::InsufficientShares;
        }
        BOOST_OUTCOME_TRY(shares, shares.checked_sub(change.removed));
        if (shares.is_zero()) {
            vars_.proposal_token_group_shares.clear(key);
        }
        else {
            vars_.proposal_token_group_shares.store(key, shares);
        }

        if (!totals.contains(proposal_id)) {
            totals[proposal_id] = vars_.proposal_total_power.load(proposal_id);
        }
        Decimal &total = totals[proposal_id];

        Decimal const ratio =
            tokens.get_token_group_ratio(round_id, token_group_id);
        BOOST_OUTCOME_TRY(auto const added, change.added.checked_mul(ratio));
        BOOST_OUTCOME_TRY(
            auto const removed, change.removed.checked_mul(ratio));
        BOOST_OUTCOME_TRY(total, total.checked_add(added));
        if (HYDRO_UNLIKELY(total < removed)) {
            return HydroError::InsufficientShares;
        }
        BOOST_OUTCOME_TRY(total, total.checked_sub(removed));
    }

    for (auto const &[proposal_id, total] : totals) {
        ProposalKey const key{round_id, tranche_id, proposal_id};
        auto proposal = vars_.proposals.load_checked(key);
        if (HYDRO_UNLIKELY(!proposal.has_value())) {
            return HydroError::ProposalNotFound;
        }
        BOOST_OUTCOME_TRY(proposal->power, total.to_uint_ceil());
        vars_.proposals.store(key, proposal.value());
        vars_.proposal_total_power.store(proposal_id, total);
    }

    return outcome::success();
}

Decimal ScoreKeeper::round_token_group_shares(
    uint64_t const round_id, std::string const &token_group_id) const
{
    return vars_.scaled_round_power_shares.load({round_id, token_group_id});
}

void ScoreKeeper::save_round_token_group_shares(
    uint64_t const round_id, std::string const &token_group_id,
    Decimal const &shares)
{
    vars_.scaled_round_power_shares.store({round_id, token_group_id}, shares);
}

uint128_t ScoreKeeper::round_total_power(uint64_t const round_id) const
{
    return vars_.total_voting_power_per_round.load_checked(round_id).value_or(
        0);
}

Result<uint128_t> ScoreKeeper::round_total_power_at_height(
    uint64_t const round_id, uint64_t const height) const
{
    BOOST_OUTCOME_TRY(
        auto const power,
        vars_.total_voting_power_per_round.load_checked_at_height(
            round_id, height));
    return power.value_or(0);
}

void ScoreKeeper::save_round_total_power(
    uint64_t const round_id, uint128_t const &power, uint64_t const height)
{
    vars_.total_voting_power_per_round.store(round_id, power, height);
}

Result<void> ScoreKeeper::apply_token_groups_ratio_changes(
    uint64_t const current_round_id, uint64_t const height,
    std::vector<TokenGroupRatioChange> const &changes)
{
    constexpr uint64_t max_id = std::numeric_limits<uint64_t>::max();

    for (auto [key, proposal] : vars_.proposals.range(
             {current_round_id, 0, 0},
             {current_round_id, max_id, max_id})) {
        Decimal total = proposal_total_power(proposal.proposal_id);
        bool changed = false;
        for (auto const &change : changes) {
            Decimal const shares = proposal_token_group_shares(
                proposal.proposal_id, change.token_group_id);
            if (shares.is_zero()) {
                continue;
            }
            BOOST_OUTCOME_TRY(
                auto const old_power, shares.checked_mul(change.old_ratio));
            BOOST_OUTCOME_TRY(
                auto const new_power, shares.checked_mul(change.new_ratio));
            if (HYDRO_UNLIKELY(total < old_power)) {
                return HydroError::InsufficientShares;
            }
            BOOST_OUTCOME_TRY(total, total.checked_sub(old_power));
            BOOST_OUTCOME_TRY(total, total.checked_add(new_power));
            changed = true;
        }
        if (!changed) {
            continue;
        }
        vars_.proposal_total_power.store(proposal.proposal_id, total);
        BOOST_OUTCOME_TRY(proposal.power, total.to_uint_ceil());
        vars_.proposals.store(key, proposal);
    }

    // a group without shares in a round has none in the later rounds
    std::vector<TokenGroupRatioChange> pending = changes;
    for (uint64_t round_id = current_round_id; !pending.empty(); ++round_id) {
        auto const stored =
            vars_.total_voting_power_per_round.load_checked(round_id);
        if (!stored.has_value()) {
            break;
        }

        Decimal total = Decimal::from_integer(stored.value());
        std::vector<TokenGroupRatioChange> next;
        for (auto const &change : pending) {
            Decimal const shares =
                round_token_group_shares(round_id, change.token_group_id);
            if (shares.is_zero()) {
                continue;
            }
            BOOST_OUTCOME_TRY(
                auto const old_power, shares.checked_mul(change.old_ratio));
            BOOST_OUTCOME_TRY(
                auto const new_power, shares.checked_mul(change.new_ratio));
            BOOST_OUTCOME_TRY(total, total.checked_add(new_power));
            if (total > old_power) {
                BOOST_OUTCOME_TRY(total, total.checked_sub(old_power));
            }
            else {
                total = Decimal::zero();
            }
            next.push_back(change);
        }

        BOOST_OUTCOME_TRY(auto const power, total.to_uint_ceil());
        if (power != stored.value()) {
            save_round_total_power(round_id, power, height);
        }
        pending = std::move(next);
    }

    for (auto const &change : changes) {
        LOG_INFO(
            "Token group {} repriced from {} to {} in round {}",
            change.token_group_id,
            change.old_ratio,
            change.new_ratio,
            current_round_id);
    }
    return outcome::success();
}

Result<void> ScoreKeeper::add_lock_power(
    Constants const &constants, TokenManager const &tokens,
    uint64_t const current_round_id, LockEntry const &lock,
    uint64_t const height)
{
    return update_lock_power(
        constants, tokens, current_round_id, lock, true, height);
}

Result<void> ScoreKeeper::remove_lock_power(
    Constants const &constants, TokenManager const &tokens,
    uint64_t const current_round_id, LockEntry const &lock,
    uint64_t const height)
{
    return update_lock_power(
        constants, tokens, current_round_id, lock, false, height);
}

Result<void> ScoreKeeper::update_lock_power(
    Constants const &constants, TokenManager const &tokens,
    uint64_t const current_round_id, LockEntry const &lock, bool const add,
    uint64_t const height)
{
    auto const group =
        tokens.validate_denom(current_round_id, lock.funds.denom);
    if (group.has_error()) {
        LOG_WARNING(
            "Lock {} holds {} which has no token group in round {}, round "
            "power left unchanged",
            lock.lock_id,
            lock.funds.denom,
            current_round_id);
        return outcome::success();
    }
    auto const &token_group_id = group.value();
    Decimal const ratio =
        tokens.get_token_group_ratio(current_round_id, token_group_id);

    auto const &schedule = constants.round_lock_power_schedule;
    uint64_t const last_round_id =
        current_round_id + schedule.max_locked_rounds();

    for (uint64_t round_id = current_round_id; round_id <= last_round_id;
         ++round_id) {
        Timestamp const round_end = compute_round_end(constants, round_id);
        if (lock.lock_end < round_end) {
            break;
        }

        BOOST_OUTCOME_TRY(
            auto const scaled,
            schedule.scale_lockup_power(
                constants.lock_epoch_length,
                lock.lock_end - round_end,
                lock.funds.amount));
        Decimal const shares = Decimal::from_integer(scaled);
        BOOST_OUTCOME_TRY(auto const power, shares.checked_mul(ratio));

        Decimal old_shares = round_token_group_shares(round_id, token_group_id);
        Decimal const old_total =
            Decimal::from_integer(round_total_power(round_id));

        Decimal new_shares;
        Decimal new_total;
        if (add) {
            BOOST_OUTCOME_TRY(new_shares, old_shares.checked_add(shares));
            BOOST_OUTCOME_TRY(new_total, old_total.checked_add(power));
        }
        else {
            if (old_shares > shares) {
                BOOST_OUTCOME_TRY(new_shares, old_shares.checked_sub(shares));
            }
            if (old_total > power) {
                BOOST_OUTCOME_TRY(new_total, old_total.checked_sub(power));
            }
        }

        save_round_token_group_shares(round_id, token_group_id, new_shares);
        BOOST_OUTCOME_TRY(auto const total_power, new_total.to_uint_ceil());
        save_round_total_power(round_id, total_power, height);
    }

    return outcome::success();
}

HYDRO_GOV_NAMESPACE_END
