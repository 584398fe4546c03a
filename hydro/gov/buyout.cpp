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
#include <hydro/gov/buyout.hpp>
#include <hydro/gov/fmt/coin_fmt.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/round.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

Result<Response> buyout_pending_slash(
    LockStore const &locks, PendingSlashes &pending_slashes,
    TokenManager const &tokens, BlockEnv const &env, MessageInfo const &info,
    Constants const &constants, BuyoutPendingSlash const &msg)
{
    BOOST_OUTCOME_TRY(
        auto const current_round_id, compute_round_id(constants, env.time));

    auto const lock = locks.load(msg.lock_id);
    if (HYDRO_UNLIKELY(!lock.has_value())) {
        return HydroError::LockNotFound;
    }
    if (HYDRO_UNLIKELY(lock->owner != info.sender)) {
        return HydroError::NotLockOwner;
    }

    uint128_t pending = pending_slashes.load(msg.lock_id);
    if (HYDRO_UNLIKELY(pending == 0)) {
        return HydroError::NoPendingSlash;
    }
    if (HYDRO_UNLIKELY(info.funds.empty())) {
        return HydroError::InvalidInput;
    }

    Decimal const lock_ratio =
        tokens.get_token_denom_ratio(current_round_id, lock->funds.denom);
    if (HYDRO_UNLIKELY(lock_ratio.is_zero())) {
        return HydroError::InvalidDenom;
    }

    BOOST_OUTCOME_TRY(
        auto remaining_base,
        Decimal::from_integer(pending).checked_mul(lock_ratio));

    std::vector<Coin> used;
    std::vector<Coin> refund;

    for (auto const &coin : info.funds) {
        if (remaining_base.is_zero()) {
            refund.push_back(coin);
            continue;
        }
        if (coin.amount == 0) {
            continue;
        }

        Decimal const coin_ratio =
            tokens.get_token_denom_ratio(current_round_id, coin.denom);
        if (HYDRO_UNLIKELY(coin_ratio.is_zero())) {
            LOG_INFO(
                "Buyout of lock {} rejected, {} has no ratio in round {}",
                msg.lock_id,
                coin.denom,
                current_round_id);
            return HydroError::InvalidDenom;
        }

        BOOST_OUTCOME_TRY(
            auto const coin_base,
            Decimal::from_integer(coin.amount).checked_mul(coin_ratio));

        if (coin_base >= remaining_base) {
            BOOST_OUTCOME_TRY(
                auto const needed, remaining_base.checked_div(coin_ratio));
            BOOST_OUTCOME_TRY(auto const needed_amount, needed.to_uint_ceil());
            uint128_t const used_amount = std::min(coin.amount, needed_amount);

            used.push_back(Coin{.denom = coin.denom, .amount = used_amount});
            if (coin.amount > used_amount) {
                refund.push_back(Coin{
                    .denom = coin.denom, .amount = coin.amount - used_amount});
            }
            remaining_base = Decimal::zero();
            pending = 0;
            continue;
        }

        used.push_back(coin);
        BOOST_OUTCOME_TRY(
            remaining_base, remaining_base.checked_sub(coin_base));
        BOOST_OUTCOME_TRY(auto const paid, coin_base.checked_div(lock_ratio));
        BOOST_OUTCOME_TRY(auto const paid_amount, paid.to_uint_floor());
        pending = pending > paid_amount ? pending - paid_amount : uint128_t{0};
    }

    pending_slashes.save(msg.lock_id, pending);

    LOG_INFO(
        "Lock {} bought out with {}, pending slash left {}",
        msg.lock_id,
        join_attribute(used),
        pending);

    Response response;
    response.add_attribute("action", "buyout_pending_slash")
        .add_attribute("sender", info.sender)
        .add_attribute("lock_id", std::to_string(msg.lock_id))
        .add_attribute("used_funds", join_attribute(used))
        .add_attribute("remaining_pending_slash", intx::to_string(pending));

    if (!used.empty()) {
        response.add_message(BankSend{
            .to_address = constants.slash_tokens_receiver_addr,
            .amount = std::move(used)});
    }
    if (!refund.empty()) {
        response.add_message(
            BankSend{.to_address = info.sender, .amount = std::move(refund)});
    }

    return response;
}

HYDRO_GOV_NAMESPACE_END
