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

#include <hydro/core/decimal.hpp>
#include <hydro/core/int.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/test/contract_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace hydro;
using namespace hydro::gov;
using namespace hydro::test;
using namespace intx::literals;

struct LockUpdate : public ContractFixture
{
    Result<Response> convert(
        uint64_t const lock_id, std::string const &target_denom,
        std::vector<Coin> funds, Address const &sender = USER1)
    {
        return execute(
            sender,
            ConvertLockup{.lock_id = lock_id, .target_denom = target_denom},
            std::move(funds));
    }

    Result<Response> refresh(
        uint64_t const lock_id, uint64_t const rounds,
        Address const &sender = USER1)
    {
        return execute(
            sender,
            RefreshLockDuration{
                .lock_id = lock_id, .lock_duration = rounds * ONE_MONTH});
    }
};

TEST_F(LockUpdate, convert_moves_vote_and_pending_slash)
{
    advance(ONE_DAY);
    auto const p0 = create_proposal(0).value();
    auto const lock_id = lock(USER1, STATOM, 1000, 3).value();
    ASSERT_FALSE(vote(USER1, 0, p0, {lock_id}).has_error());
    ASSERT_FALSE(slash(0, 0, p0, Decimal::percent(10)).has_error());
    ASSERT_EQ(contract.query_pending_slash(lock_id), 100_u128);
    EXPECT_EQ(contract.query_proposal(0, 0, p0).value().power, 1950_u128);

    auto const res = convert(
        lock_id,
        VALIDATOR2_DENOM,
        {Coin{.denom = VALIDATOR2_DENOM, .amount = 1300}});
    ASSERT_FALSE(res.has_error());
    auto const &response = res.value();
    EXPECT_EQ(response.attribute("target_amount"), "1300");
    ASSERT_EQ(response.messages.size(), 1);
    EXPECT_EQ(response.messages[0].to_address, USER1);
    EXPECT_EQ(
        response.messages[0].amount,
        (std::vector<Coin>{{.denom = STATOM, .amount = 1000}}));

    auto const converted = contract.query_lock(lock_id).value();
    EXPECT_EQ(converted.funds.denom, VALIDATOR2_DENOM);
    EXPECT_EQ(converted.funds.amount, 1300_u128);
    EXPECT_EQ(contract.query_total_locked_tokens(), 1300_u128);

    // the pending slash is carried over in the new denom
    EXPECT_EQ(contract.query_pending_slash(lock_id), 130_u128);

    auto const vote = contract.query_vote(0, 0, lock_id);
    ASSERT_TRUE(vote.has_value());
    EXPECT_EQ(vote->prop_id, p0);
    EXPECT_EQ(vote->time_weighted_shares.token_group_id, VALIDATOR2);
    EXPECT_EQ(vote->time_weighted_shares.shares, Decimal::from_integer(1950));
    EXPECT_EQ(contract.query_voting_allowed_round(0, lock_id), 1);

    // an exact conversion keeps the power
    EXPECT_EQ(contract.query_proposal(0, 0, p0).value().power, 1950_u128);
    EXPECT_EQ(contract.query_round_total_power(0), 1950_u128);
    EXPECT_EQ(contract.query_round_total_power(1), 1625_u128);
    EXPECT_EQ(contract.query_round_total_power(2), 1300_u128);
    EXPECT_EQ(
        contract.query_round_token_group_shares(0, "stATOM-group"),
        Decimal::zero());
    EXPECT_EQ(
        contract.query_round_token_group_shares(0, VALIDATOR2),
        Decimal::from_integer(1950));
}

TEST_F(LockUpdate, convert_rejected)
{
    advance(ONE_DAY);
    auto const lock_id = lock(USER1, STATOM, 1000, 3).value();
    auto const short_lock = lock(USER1, VALIDATOR2_DENOM, 1000, 1).value();
    std::vector<Coin> const exact{
        Coin{.denom = VALIDATOR2_DENOM, .amount = 1300}};

    EXPECT_EQ(
        convert(lock_id, VALIDATOR2_DENOM, exact, USER2).assume_error(),
        HydroError::NotLockOwner);
    EXPECT_EQ(
        convert(99, VALIDATOR2_DENOM, exact).assume_error(),
        HydroError::LockNotFound);
    EXPECT_EQ(
        convert(lock_id, STATOM, {}).assume_error(), HydroError::InvalidInput);
    EXPECT_EQ(
        convert(lock_id, "unknown", {}).assume_error(),
        HydroError::InvalidDenom);

    EXPECT_EQ(
        convert(lock_id, VALIDATOR2_DENOM, {}).assume_error(),
        HydroError::InvalidConversion);
    EXPECT_EQ(
        convert(
            lock_id,
            VALIDATOR2_DENOM,
            {Coin{.denom = VALIDATOR1_DENOM, .amount = 1300}})
            .assume_error(),
        HydroError::InvalidConversion);
    for (uint128_t const amount : {1299_u128, 1301_u128}) {
        EXPECT_EQ(
            convert(
                lock_id,
                VALIDATOR2_DENOM,
                {Coin{.denom = VALIDATOR2_DENOM, .amount = amount}})
                .assume_error(),
            HydroError::InvalidConversion);
    }

    EXPECT_EQ(contract.query_lock(lock_id).value().funds.denom, STATOM);
    EXPECT_EQ(lock_amount(lock_id), 1000_u128);
    EXPECT_EQ(contract.query_total_locked_tokens(), 2000_u128);

    advance(ONE_MONTH + ONE_DAY);
    EXPECT_EQ(
        convert(
            short_lock, STATOM, {Coin{.denom = STATOM, .amount = 769}})
            .assume_error(),
        HydroError::LockExpired);
}

TEST_F(LockUpdate, refresh_extends_power)
{
    advance(ONE_DAY);
    auto const p0 = create_proposal(0).value();
    auto const lock_id = lock(USER1, VALIDATOR2_DENOM, 1000, 1).value();
    ASSERT_FALSE(vote(USER1, 0, p0, {lock_id}).has_error());
    EXPECT_EQ(contract.query_proposal(0, 0, p0).value().power, 1000_u128);
    EXPECT_EQ(contract.query_round_total_power(1), 0_u128);

    auto const res = refresh(lock_id, 3);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        contract.query_lock(lock_id).value().lock_end,
        env.time + 3 * ONE_MONTH);

    auto const vote = contract.query_vote(0, 0, lock_id);
    ASSERT_TRUE(vote.has_value());
    EXPECT_EQ(vote->time_weighted_shares.shares, Decimal::from_integer(1500));
    EXPECT_EQ(contract.query_proposal(0, 0, p0).value().power, 1500_u128);
    EXPECT_EQ(contract.query_round_total_power(0), 1500_u128);
    EXPECT_EQ(contract.query_round_total_power(1), 1250_u128);
    EXPECT_EQ(contract.query_round_total_power(2), 1000_u128);
    EXPECT_EQ(contract.query_total_locked_tokens(), 1000_u128);
}

TEST_F(LockUpdate, refresh_rejected)
{
    advance(ONE_DAY);
    auto const lock_id = lock(USER1, VALIDATOR2_DENOM, 1000, 2).value();

    EXPECT_EQ(refresh(lock_id, 1).assume_error(), HydroError::LockNotExtended);
    EXPECT_EQ(refresh(lock_id, 2).assume_error(), HydroError::LockNotExtended);
    EXPECT_EQ(
        refresh(lock_id, 4).assume_error(), HydroError::InvalidLockDuration);
    EXPECT_EQ(
        refresh(lock_id, 3, USER2).assume_error(), HydroError::NotLockOwner);
    EXPECT_EQ(refresh(99, 3).assume_error(), HydroError::LockNotFound);

    // a day later the same duration ends later
    advance(ONE_DAY);
    EXPECT_FALSE(refresh(lock_id, 2).has_error());
    EXPECT_EQ(
        contract.query_lock(lock_id).value().lock_end,
        env.time + 2 * ONE_MONTH);
}
