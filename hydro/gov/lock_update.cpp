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
#include <hydro/gov/hydro_contract.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <string>
#include <utility>

HYDRO_GOV_NAMESPACE_BEGIN

Result<Response> HydroContract::execute_refresh_lock_duration(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    RefreshLockDuration const &msg)
{
    BOOST_OUTCOME_TRY(validate_lock_duration(constants, msg.lock_duration));

    auto const lock = locks_.load(msg.lock_id);
    if (HYDRO_UNLIKELY(!lock.has_value())) {
        return HydroError::LockNotFound;
    }
    if (HYDRO_UNLIKELY(lock->owner != info.sender)) {
        return HydroError::NotLockOwner;
    }
    Timestamp const lock_end = env.time + msg.lock_duration;
    if (HYDRO_UNLIKELY(lock_end <= lock->lock_end)) {
        return HydroError::LockNotExtended;
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));

    LockEntry refreshed = lock.value();
    refreshed.lock_end = lock_end;

    BOOST_OUTCOME_TRY(transfer_current_round_votes(
        constants, current_round_id, {refreshed.lock_id}, {refreshed}));
    BOOST_OUTCOME_TRY(replace_lock_power(
        constants, current_round_id, env.height, {lock.value()}, {refreshed}));
    locks_.save(refreshed, env.height);

    LOG_DEBUG(
        "Lock {} extended from {} to {}",
        refreshed.lock_id,
        lock->lock_end,
        refreshed.lock_end);

    Response response;
    response.add_attribute("action", "refresh_lock_duration")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_id", std::to_string(refreshed.lock_id))
        .add_attribute("lock_end", std::to_string(refreshed.lock_end));
    return response;
}

Result<Response> HydroContract::execute_convert_lockup(
    BlockEnv const &env, MessageInfo const &info, Constants const &constants,
    ConvertLockup const &msg)
{
    BOOST_OUTCOME_TRY(
        auto const lock, load_own_active_lock(env, info, msg.lock_id));
    if (HYDRO_UNLIKELY(lock.funds.denom == msg.target_denom)) {
        return HydroError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));
    Decimal const source_ratio =
        tokens_.get_token_denom_ratio(current_round_id, lock.funds.denom);
    Decimal const target_ratio =
        tokens_.get_token_denom_ratio(current_round_id, msg.target_denom);
    if (HYDRO_UNLIKELY(source_ratio.is_zero() || target_ratio.is_zero())) {
        return HydroError::InvalidDenom;
    }

    // floor(amount * source_ratio / target_ratio)
    BOOST_OUTCOME_TRY(
        auto const value,
        Decimal::from_integer(lock.funds.amount).checked_mul(source_ratio));
    BOOST_OUTCOME_TRY(auto const target, value.checked_div(target_ratio));
    BOOST_OUTCOME_TRY(auto const target_amount, target.to_uint_floor());

    if (HYDRO_UNLIKELY(
            target_amount == 0 || info.funds.size() != 1 ||
            info.funds[0].denom != msg.target_denom ||
            info.funds[0].amount != target_amount)) {
        LOG_INFO(
            "Conversion of lock {} into {} requires exactly {}",
            lock.lock_id,
            msg.target_denom,
            target_amount);
        return HydroError::InvalidConversion;
    }

    LockEntry converted = lock;
    converted.funds = info.funds[0];

    uint128_t const pending = pending_.load(lock.lock_id);
    if (pending > 0) {
        BOOST_OUTCOME_TRY(
            auto const scaled_wide,
            checked_mul_div(pending, target_amount, lock.funds.amount));
        BOOST_OUTCOME_TRY(auto const scaled, checked_narrow(scaled_wide));
        pending_.save(lock.lock_id, scaled);
    }

    BOOST_OUTCOME_TRY(transfer_current_round_votes(
        constants, current_round_id, {lock.lock_id}, {converted}));
    BOOST_OUTCOME_TRY(replace_lock_power(
        constants, current_round_id, env.height, {lock}, {converted}));
    locks_.save(converted, env.height);

    uint128_t locked_tokens = vars_.locked_tokens.load();
    locked_tokens = locked_tokens > lock.funds.amount
                        ? locked_tokens - lock.funds.amount
                        : uint128_t{0};
    BOOST_OUTCOME_TRY(locked_tokens, checked_add(locked_tokens, target_amount));
    vars_.locked_tokens.store(locked_tokens);

    LOG_DEBUG(
        "Lock {} converted from {} {} to {} {}",
        lock.lock_id,
        lock.funds.amount,
        lock.funds.denom,
        converted.funds.amount,
        converted.funds.denom);

    Response response;
    response.add_attribute("action", "convert_lockup")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_id", std::to_string(lock.lock_id))
        .add_attribute("source_denom", lock.funds.denom)
        .add_attribute("target_denom", msg.target_denom)
        .add_attribute("target_amount", intx::to_string(target_amount))
        .add_message(
            BankSend{.to_address = info.sender, .amount = {lock.funds}});
    return response;
}

HYDRO_GOV_NAMESPACE_END
