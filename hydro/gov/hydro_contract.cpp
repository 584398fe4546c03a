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
#include <hydro/gov/buyout.hpp>
#include <hydro/gov/fmt/coin_fmt.hpp>
#include <hydro/gov/fmt/lock_entry_fmt.hpp>
#include <hydro/gov/hydro_contract.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/lock_composition.hpp>
#include <hydro/gov/round.hpp>
#include <hydro/state/storage.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <variant>

HYDRO_GOV_NAMESPACE_BEGIN

namespace
{
    template <class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    Result<void> validate_constants(Constants const &constants)
    {
        if (HYDRO_UNLIKELY(
                constants.round_length == 0 ||
                constants.lock_epoch_length == 0)) {
            return HydroError::InvalidConfig;
        }
        if (HYDRO_UNLIKELY(constants.slash_percentage_threshold.is_zero())) {
            return HydroError::InvalidConfig;
        }
        return outcome::success();
    }

    uint128_t saturating_sub(uint128_t const &x, uint128_t const &y)
    {
        return x > y ? x - y : uint128_t{0};
    }
}

HydroContract::HydroContract(Storage &storage)
    : storage_{storage}
    , vars_{storage}
    , locks_{vars_}
    , scores_{vars_}
    , votes_{vars_, scores_, tokens_}
    , pending_{vars_}
    , slashing_{vars_, locks_, votes_, scores_, pending_, tokens_}
{
}

Result<Constants>
HydroContract::load_current_constants(BlockEnv const &env) const
{
    return load_constants_active_at(vars_.constants, env.time);
}

Result<Response> HydroContract::instantiate(
    BlockEnv const &env, MessageInfo const &info, InstantiateMsg msg)
{
    BOOST_OUTCOME_TRY(validate_constants(msg.constants));

    storage_.push();

    vars_.constants.store(msg.constants.first_round_start, msg.constants);
    vars_.whitelist_admins.store(msg.whitelist_admins);
    for (auto const &tranche : msg.tranches) {
        uint64_t const id = vars_.tranche_id.load();
        vars_.tranche_id.store(id + 1);
        vars_.tranches.store(
            id,
            Tranche{
                .id = id,
                .name = tranche.name,
                .metadata = tranche.metadata});
    }

    // nothing before instantiation can be queried
    vars_.locks.set_retention_boundary(env.height);
    vars_.total_voting_power_per_round.set_retention_boundary(env.height);

    storage_.pop_accept();

    for (auto &provider : msg.token_info_providers) {
        tokens_.add_provider(std::move(provider));
    }

    LOG_INFO(
        "Instantiated by {} with {} tranches and {} token info providers",
        info.sender,
        msg.tranches.size(),
        tokens_.provider_count());

    Response response;
    response.add_attribute("action", "initialisation")
        .add_attribute("sender", info.sender);
    return response;
}

Result<Response> HydroContract::execute(
    BlockEnv const &env, MessageInfo const &info, ExecuteMsg const &msg)
{
    storage_.push();
    auto res = dispatch(env, info, msg);
    if (res.has_value()) {
        storage_.pop_accept();
    }
    else {
        LOG_INFO(
            "Message {} from {} at height {} rejected: {}",
            msg.index(),
            info.sender,
            env.height,
            res.error().message().c_str());
        storage_.pop_reject();
    }
    return res;
}

Result<Response> HydroContract::dispatch(
    BlockEnv const &env, MessageInfo const &info, ExecuteMsg const &msg)
{
    BOOST_OUTCOME_TRY(auto const constants, load_current_constants(env));
    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    update_round_height_maps(vars_, current_round_id, env.height);

    if (HYDRO_UNLIKELY(
            constants.paused &&
            !std::holds_alternative<UpdateConstants>(msg))) {
        return HydroError::Paused;
    }

    return std::visit(
        overloaded{
            [&](AddTranche const &m) {
                return execute_add_tranche(env, info, constants, m);
            },
            [&](UpdateConstants const &m) {
                return execute_update_constants(env, info, constants, m);
            },
            [&](CreateProposal const &m) {
                return execute_create_proposal(env, info, constants, m);
            },
            [&](LockTokens const &m) {
                return execute_lock_tokens(env, info, constants, m);
            },
            [&](UnlockTokens const &m) {
                return execute_unlock_tokens(env, info, constants, m);
            },
            [&](RefreshLockDuration const &m) {
                return execute_refresh_lock_duration(env, info, constants, m);
            },
            [&](VoteMsg const &m) {
                return execute_vote(env, info, constants, m);
            },
            [&](SplitLock const &m) {
                return execute_split_lock(env, info, constants, m);
            },
            [&](MergeLocks const &m) {
                return execute_merge_locks(env, info, constants, m);
            },
            [&](SlashProposalVoters const &m) {
                return execute_slash_proposal_voters(env, info, constants, m);
            },
            [&](BuyoutPendingSlash const &m) {
                return execute_buyout_pending_slash(env, info, constants, m);
            },
            [&](ConvertLockup const &m) {
                return execute_convert_lockup(env, info, constants, m);
            },
            [&](UpdateTokenGroupRatio const &m) {
                return execute_update_token_group_ratio(
                    env, info, constants, m);
            }},
        msg);
}

Result<Response> HydroContract::execute_add_tranche(
    BlockEnv const &, MessageInfo const &info, Constants const &,
    AddTranche const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.is_whitelist_admin(info.sender))) {
        return HydroError::Unauthorized;
    }
    if (HYDRO_UNLIKELY(msg.tranche.name.empty())) {
        return HydroError::InvalidInput;
    }

    uint64_t const id = vars_.tranche_id.load();
    vars_.tranche_id.store(id + 1);
    vars_.tranches.store(
        id,
        Tranche{
            .id = id,
            .name = msg.tranche.name,
            .metadata = msg.tranche.metadata});

    Response response;
    response.add_attribute("action", "add_tranche")
        .add_attribute("sender", info.sender)
        .add_attribute("tranche_id", std::to_string(id))
        .add_attribute("tranche_name", msg.tranche.name);
    return response;
}

Result<Response> HydroContract::execute_update_constants(
    BlockEnv const &env, MessageInfo const &info, Constants const &,
    UpdateConstants const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.is_whitelist_admin(info.sender))) {
        return HydroError::Unauthorized;
    }
    if (HYDRO_UNLIKELY(msg.activate_at < env.time)) {
        return HydroError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(validate_constants(msg.constants));

    vars_.constants.store(msg.activate_at, msg.constants);

    LOG_INFO(
        "Constants updated by {}, active from {}",
        info.sender,
        msg.activate_at);

    Response response;
    response.add_attribute("action", "update_constants")
        .add_attribute("sender", info.sender)
        .add_attribute("activate_at", std::to_string(msg.activate_at));
    return response;
}

Result<Response> HydroContract::execute_create_proposal(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    CreateProposal const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.is_whitelist_admin(info.sender))) {
        return HydroError::Unauthorized;
    }
    if (HYDRO_UNLIKELY(!vars_.tranches.contains(msg.tranche_id))) {
        return HydroError::TrancheNotFound;
    }
    if (HYDRO_UNLIKELY(
            msg.deployment_duration == 0 ||
            msg.deployment_duration > constants.max_deployment_duration)) {
        return HydroError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(
        auto const round_id, compute_round_id(constants, env.time));
    uint64_t const proposal_id = vars_.proposal_id.load();
    vars_.proposal_id.store(proposal_id + 1);

    vars_.proposals.store(
        {round_id, msg.tranche_id, proposal_id},
        Proposal{
            .round_id = round_id,
            .tranche_id = msg.tranche_id,
            .proposal_id = proposal_id,
            .title = msg.title,
            .description = msg.description,
            .deployment_duration = msg.deployment_duration,
            .power = 0});

    Response response;
    response.add_attribute("action", "create_proposal")
        .add_attribute("sender", info.sender)
        .add_attribute("round_id", std::to_string(round_id))
        .add_attribute("tranche_id", std::to_string(msg.tranche_id))
        .add_attribute("proposal_id", std::to_string(proposal_id));
    return response;
}

Result<Response> HydroContract::execute_lock_tokens(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    LockTokens const &msg)
{
    if (HYDRO_UNLIKELY(info.funds.size() != 1 || info.funds[0].amount == 0)) {
        return HydroError::InvalidInput;
    }
    Coin const &funds = info.funds[0];

    BOOST_OUTCOME_TRY(validate_lock_duration(constants, msg.lock_duration));

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    BOOST_OUTCOME_TRY(tokens_.validate_denom(current_round_id, funds.denom));

    BOOST_OUTCOME_TRY(
        auto const locked_tokens,
        checked_add(vars_.locked_tokens.load(), funds.amount));
    if (HYDRO_UNLIKELY(locked_tokens > constants.max_locked_tokens)) {
        return HydroError::LockLimitReached;
    }
    vars_.locked_tokens.store(locked_tokens);

    LockEntry const lock{
        .lock_id = locks_.next_lock_id(),
        .owner = info.sender,
        .funds = funds,
        .lock_start = env.time,
        .lock_end = env.time + msg.lock_duration};
    locks_.save(lock, env.height);
    locks_.update_user_locks(info.sender, {lock.lock_id}, {});

    BOOST_OUTCOME_TRY(scores_.add_lock_power(
        constants, tokens_, current_round_id, lock, env.height));

    LOG_DEBUG("Lock created: {}", lock);

    Response response;
    response.add_attribute("action", "lock_tokens")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_id", std::to_string(lock.lock_id))
        .add_attribute("locked_tokens", fmt::format("{}", funds));
    return response;
}

Result<Response> HydroContract::execute_unlock_tokens(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    UnlockTokens const &msg)
{
    std::vector<uint64_t> candidates;
    if (msg.lock_ids.has_value()) {
        candidates = msg.lock_ids.value();
        for (uint64_t const lock_id : candidates) {
            auto const lock = locks_.load(lock_id);
            if (HYDRO_UNLIKELY(!lock.has_value())) {
                return HydroError::LockNotFound;
            }
            if (HYDRO_UNLIKELY(lock->owner != info.sender)) {
                return HydroError::NotLockOwner;
            }
        }
    }
    else {
        candidates = locks_.user_locks(info.sender);
    }

    std::map<std::string, uint128_t> returned;
    std::map<std::string, uint128_t> slashed;
    std::vector<uint64_t> unlocked;
    uint128_t total_unlocked = 0;

    for (uint64_t const lock_id : candidates) {
        auto const lock = locks_.load(lock_id);
        if (!lock.has_value() || env.time <= lock->lock_end) {
            continue;
        }

        uint128_t const pending =
            std::min(pending_.load(lock_id), lock->funds.amount);
        uint128_t const released = lock->funds.amount - pending;

        if (released > 0) {
            uint128_t &sum = returned[lock->funds.denom];
            BOOST_OUTCOME_TRY(sum, checked_add(sum, released));
        }
        if (pending > 0) {
            uint128_t &sum = slashed[lock->funds.denom];
            BOOST_OUTCOME_TRY(sum, checked_add(sum, pending));
        }
        BOOST_OUTCOME_TRY(
            total_unlocked, checked_add(total_unlocked, lock->funds.amount));

        locks_.remove(lock_id, env.height);
        pending_.remove(lock_id);
        for (auto const tranche_id : vars_.tranches.keys()) {
            votes_.clear_voting_allowed_round(tranche_id, lock_id);
        }
        unlocked.push_back(lock_id);
    }

    locks_.update_user_locks(info.sender, {}, unlocked);
    vars_.locked_tokens.store(
        saturating_sub(vars_.locked_tokens.load(), total_unlocked));

    Response response;
    response.add_attribute("action", "unlock_tokens")
        .add_attribute("sender", info.sender)
        .add_attribute("unlocked_lock_ids", join_attribute(unlocked));

    std::vector<Coin> returned_coins;
    for (auto const &[denom, amount] : returned) {
        returned_coins.push_back(Coin{.denom = denom, .amount = amount});
    }
    response.add_attribute("unlocked_tokens", join_attribute(returned_coins));
    if (!returned_coins.empty()) {
        response.add_message(BankSend{
            .to_address = info.sender, .amount = std::move(returned_coins)});
    }

    std::vector<Coin> slashed_coins;
    for (auto const &[denom, amount] : slashed) {
        slashed_coins.push_back(Coin{.denom = denom, .amount = amount});
    }
    if (!slashed_coins.empty()) {
        response.add_attribute(
            "pending_slashes_applied", join_attribute(slashed_coins));
        response.add_message(BankSend{
            .to_address = constants.slash_tokens_receiver_addr,
            .amount = std::move(slashed_coins)});
    }

    return response;
}

Result<Response> HydroContract::execute_vote(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    VoteMsg const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.tranches.contains(msg.tranche_id))) {
        return HydroError::TrancheNotFound;
    }
    if (HYDRO_UNLIKELY(msg.proposals_votes.empty())) {
        return HydroError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(
        auto const round_id, compute_round_id(constants, env.time));

    std::set<uint64_t> proposal_ids;
    std::map<uint64_t, std::optional<uint64_t>> targets;
    std::map<uint64_t, LockEntry> lock_entries;

    for (auto const &proposal_votes : msg.proposals_votes) {
        if (HYDRO_UNLIKELY(
                !proposal_ids.insert(proposal_votes.proposal_id).second ||
                proposal_votes.lock_ids.empty())) {
            return HydroError::InvalidInput;
        }
        for (uint64_t const lock_id : proposal_votes.lock_ids) {
            if (HYDRO_UNLIKELY(targets.contains(lock_id))) {
                return HydroError::DuplicateLockId;
            }
            auto const lock = locks_.load(lock_id);
            if (HYDRO_UNLIKELY(!lock.has_value())) {
                return HydroError::LockNotFound;
            }
            if (HYDRO_UNLIKELY(lock->owner != info.sender)) {
                return HydroError::NotLockOwner;
            }
            targets.emplace(lock_id, proposal_votes.proposal_id);
            lock_entries.emplace(lock_id, lock.value());
        }
    }

    BOOST_OUTCOME_TRY(
        auto const unvotes,
        votes_.process_unvotes(round_id, msg.tranche_id, targets));
    BOOST_OUTCOME_TRY(
        auto const votes,
        votes_.process_votes_and_apply_proposal_changes(
            constants,
            round_id,
            msg.tranche_id,
            msg.proposals_votes,
            lock_entries,
            unvotes));

    Response response;
    response.add_attribute("action", "vote")
        .add_attribute("sender", info.sender)
        .add_attribute("round_id", std::to_string(round_id))
        .add_attribute("tranche_id", std::to_string(msg.tranche_id))
        .add_attribute("locks_voted", join_attribute(votes.locks_voted))
        .add_attribute("locks_skipped", join_attribute(votes.locks_skipped));
    return response;
}

Result<Response> HydroContract::execute_slash_proposal_voters(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    SlashProposalVoters const &msg)
{
    return slashing_.slash_proposal_voters(env, info, constants, msg);
}

Result<Response> HydroContract::execute_buyout_pending_slash(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    BuyoutPendingSlash const &msg)
{
    return buyout_pending_slash(
        locks_, pending_, tokens_, env, info, constants, msg);
}

Result<Response> HydroContract::execute_update_token_group_ratio(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    UpdateTokenGroupRatio const &msg)
{
    if (HYDRO_UNLIKELY(!vars_.is_whitelist_admin(info.sender))) {
        return HydroError::Unauthorized;
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    BOOST_OUTCOME_TRY(
        auto const old_ratio,
        tokens_.update_token_group_ratio(
            current_round_id, msg.token_group_id, msg.new_ratio));
    if (old_ratio != msg.new_ratio) {
        BOOST_OUTCOME_TRY(scores_.apply_token_groups_ratio_changes(
            current_round_id,
            env.height,
            {TokenGroupRatioChange{
                .token_group_id = msg.token_group_id,
                .old_ratio = old_ratio,
                .new_ratio = msg.new_ratio}}));
    }

    Response response;
    response.add_attribute("action", "update_token_group_ratio")
        .add_attribute("sender", info.sender)
        .add_attribute("token_group_id", msg.token_group_id)
        .add_attribute("old_ratio", old_ratio.to_string())
        .add_attribute("new_ratio", msg.new_ratio.to_string());
    return response;
}

/////////////
// Queries //
/////////////

Result<LockEntry> HydroContract::query_lock(uint64_t const lock_id) const
{
    auto lock = locks_.load(lock_id);
    if (HYDRO_UNLIKELY(!lock.has_value())) {
        return HydroError::LockNotFound;
    }
    return std::move(lock).value();
}

std::vector<LockEntry>
HydroContract::query_user_locks(Address const &owner) const
{
    std::vector<LockEntry> res;
    for (uint64_t const lock_id : locks_.user_locks(owner)) {
        if (auto lock = locks_.load(lock_id); lock.has_value()) {
            res.push_back(std::move(lock).value());
        }
    }
    return res;
}

uint128_t HydroContract::query_pending_slash(uint64_t const lock_id) const
{
    return pending_.load(lock_id);
}

Result<Proposal> HydroContract::query_proposal(
    uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const proposal_id) const
{
    auto proposal =
        vars_.proposals.load_checked({round_id, tranche_id, proposal_id});
    if (HYDRO_UNLIKELY(!proposal.has_value())) {
        return HydroError::ProposalNotFound;
    }
    return std::move(proposal).value();
}

std::optional<Vote> HydroContract::query_vote(
    uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const lock_id) const
{
    return votes_.load(round_id, tranche_id, lock_id);
}

std::optional<uint64_t> HydroContract::query_voting_allowed_round(
    uint64_t const tranche_id, uint64_t const lock_id) const
{
    return votes_.voting_allowed_round(tranche_id, lock_id);
}

uint128_t HydroContract::query_round_total_power(uint64_t const round_id) const
{
    return scores_.round_total_power(round_id);
}

Result<uint128_t> HydroContract::query_round_total_power_at_height(
    uint64_t const round_id, uint64_t const height) const
{
    return scores_.round_total_power_at_height(round_id, height);
}

Decimal HydroContract::query_round_token_group_shares(
    uint64_t const round_id, std::string const &token_group_id) const
{
    return scores_.round_token_group_shares(round_id, token_group_id);
}

uint128_t HydroContract::query_total_locked_tokens() const
{
    return vars_.locked_tokens.load();
}

Result<std::vector<std::pair<uint64_t, Decimal>>>
HydroContract::query_current_lock_composition(uint64_t const lock_id) const
{
    return get_current_lock_composition(locks_, lock_id);
}

Result<uint128_t>
HydroContract::query_slashable_token_num_for_voting_on_proposal(
    BlockEnv const &env, uint64_t const round_id, uint64_t const tranche_id,
    uint64_t const proposal_id) const
{
    BOOST_OUTCOME_TRY(auto const constants, load_current_constants(env));
    return slashing_.query_slashable_token_num_for_voting_on_proposal(
        env, constants, round_id, tranche_id, proposal_id);
}

HYDRO_GOV_NAMESPACE_END
