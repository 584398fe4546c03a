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
#include <vector>

using namespace hydro;
using namespace hydro::gov;
using namespace hydro::test;
using namespace intx::literals;

namespace
{
    constexpr uint64_t VALIDATOR2_LOCK = 0;
    constexpr uint64_t STATOM_LOCK = 1;
}

// both locks carry a pending slash of 400
struct Buyout : public ContractFixture
{
    void SetUp() override
    {
        ContractFixture::SetUp();

        advance(ONE_DAY);
        auto const p0 = create_proposal(0).value();
        ASSERT_EQ(
            lock(USER1, VALIDATOR2_DENOM, 1000, 3).value(), VALIDATOR2_LOCK);
        ASSERT_EQ(lock(USER1, STATOM, 1000, 3).value(), STATOM_LOCK);
        ASSERT_FALSE(
            vote(USER1, 0, p0, {VALIDATOR2_LOCK, STATOM_LOCK}).has_error());
        ASSERT_FALSE(slash(0, 0, p0, Decimal::percent(40)).has_error());
        ASSERT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 400_u128);
        ASSERT_EQ(contract.query_pending_slash(STATOM_LOCK), 400_u128);
        advance(ONE_DAY);
    }

    Result<Response> buyout(
        uint64_t const lock_id, std::vector<Coin> funds,
        Address const &sender = USER1)
    {
        return execute(
            sender, BuyoutPendingSlash{.lock_id = lock_id}, std::move(funds));
    }
};

TEST_F(Buyout, exact_payment)
{
    auto const res = buyout(
        VALIDATOR2_LOCK, {{.denom = VALIDATOR2_DENOM, .amount = 400}});
    ASSERT_FALSE(res.has_error());
    auto const &response = res.value();
    EXPECT_EQ(response.attribute("remaining_pending_slash"), "0");
    ASSERT_EQ(response.messages.size(), 1);
    EXPECT_EQ(response.messages[0].to_address, SLASH_RECEIVER);
    EXPECT_EQ(
        response.messages[0].amount,
        (std::vector<Coin>{{.denom = VALIDATOR2_DENOM, .amount = 400}}));

    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 0_u128);
    EXPECT_EQ(lock_amount(VALIDATOR2_LOCK), 1000_u128);

    EXPECT_EQ(
        buyout(VALIDATOR2_LOCK, {{.denom = VALIDATOR2_DENOM, .amount = 1}})
            .assume_error(),
        HydroError::NoPendingSlash);
}

TEST_F(Buyout, partial_payment)
{
    auto const res = buyout(
        VALIDATOR2_LOCK, {{.denom = VALIDATOR2_DENOM, .amount = 100}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().attribute("remaining_pending_slash"), "300");
    EXPECT_EQ(res.value().messages.size(), 1);
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 300_u128);
}

TEST_F(Buyout, overpayment_is_refunded)
{
    auto const res = buyout(
        VALIDATOR2_LOCK, {{.denom = VALIDATOR2_DENOM, .amount = 1000}});
    ASSERT_FALSE(res.has_error());
    auto const &messages = res.value().messages;
    ASSERT_EQ(messages.size(), 2);
    EXPECT_EQ(messages[0].to_address, SLASH_RECEIVER);
    EXPECT_EQ(
        messages[0].amount,
        (std::vector<Coin>{{.denom = VALIDATOR2_DENOM, .amount = 400}}));
    EXPECT_EQ(messages[1].to_address, USER1);
    EXPECT_EQ(
        messages[1].amount,
        (std::vector<Coin>{{.denom = VALIDATOR2_DENOM, .amount = 600}}));
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 0_u128);
}

TEST_F(Buyout, paid_with_cheaper_token)
{
    // 400 at 0.95 covers 380 of 400
    auto const res = buyout(
        VALIDATOR2_LOCK, {{.denom = VALIDATOR1_DENOM, .amount = 400}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().messages.size(), 1);
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 20_u128);
}

TEST_F(Buyout, paid_with_several_tokens)
{
    // the stATOM part needs ceil(20 / 1.3) = 16
    auto const res = buyout(
        VALIDATOR2_LOCK,
        {{.denom = VALIDATOR1_DENOM, .amount = 400},
         {.denom = STATOM, .amount = 100}});
    ASSERT_FALSE(res.has_error());
    auto const &messages = res.value().messages;
    ASSERT_EQ(messages.size(), 2);
    EXPECT_EQ(
        messages[0].amount,
        (std::vector<Coin>{
            {.denom = VALIDATOR1_DENOM, .amount = 400},
            {.denom = STATOM, .amount = 16}}));
    EXPECT_EQ(
        messages[1].amount,
        (std::vector<Coin>{{.denom = STATOM, .amount = 84}}));
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 0_u128);
}

TEST_F(Buyout, pricier_lock_token)
{
    // 400 * 1.3 = 520 owed in base tokens, 400 paid covers floor(400 / 1.3)
    auto const res =
        buyout(STATOM_LOCK, {{.denom = VALIDATOR2_DENOM, .amount = 400}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().messages.size(), 1);
    EXPECT_EQ(contract.query_pending_slash(STATOM_LOCK), 93_u128);
}

TEST_F(Buyout, paid_with_base_token)
{
    auto const res =
        buyout(VALIDATOR2_LOCK, {{.denom = UATOM, .amount = 400}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().messages.size(), 1);
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 0_u128);
}

TEST_F(Buyout, rejected)
{
    EXPECT_EQ(
        buyout(99, {{.denom = VALIDATOR2_DENOM, .amount = 400}})
            .assume_error(),
        HydroError::LockNotFound);
    EXPECT_EQ(
        buyout(
            VALIDATOR2_LOCK,
            {{.denom = VALIDATOR2_DENOM, .amount = 400}},
            USER2)
            .assume_error(),
        HydroError::NotLockOwner);
    EXPECT_EQ(
        buyout(VALIDATOR2_LOCK, {}).assume_error(), HydroError::InvalidInput);

    // the first coin is accepted before the unknown one fails the message
    EXPECT_EQ(
        buyout(
            VALIDATOR2_LOCK,
            {{.denom = VALIDATOR2_DENOM, .amount = 100},
             {.denom = "foo", .amount = 100}})
            .assume_error(),
        HydroError::InvalidDenom);
    EXPECT_EQ(contract.query_pending_slash(VALIDATOR2_LOCK), 400_u128);
}
