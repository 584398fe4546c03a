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
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/token_manager.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using namespace hydro;
using namespace hydro::gov;

TEST(LsmTokenInfoProvider, resolves_active_validators)
{
    LsmTokenInfoProvider lsm;
    lsm.set_validator_ratio(0, "val1", Decimal::percent(95));
    lsm.set_validator_ratio(1, "val1", Decimal::percent(90));

    EXPECT_EQ(lsm.resolve_denom(0, "val1/12").value(), "val1");
    EXPECT_EQ(lsm.resolve_denom(1, "val1/13").value(), "val1");
    EXPECT_EQ(lsm.get_token_group_ratio(1, "val1").value(), Decimal::percent(90));

    // not in the active set in round 2
    EXPECT_EQ(
        lsm.resolve_denom(2, "val1/12").assume_error(),
        HydroError::InvalidDenom);
    EXPECT_EQ(
        lsm.get_token_group_ratio(2, "val1").assume_error(),
        HydroError::InvalidDenom);

    EXPECT_TRUE(lsm.resolve_denom(0, "val1").has_error());
    EXPECT_TRUE(lsm.resolve_denom(0, "/12").has_error());
    EXPECT_TRUE(lsm.resolve_denom(0, "val1/").has_error());

    lsm.remove_validator(0, "val1");
    EXPECT_TRUE(lsm.resolve_denom(0, "val1/12").has_error());
}

TEST(DerivativeTokenInfoProvider, zero_ratio_is_not_lockable)
{
    DerivativeTokenInfoProvider provider{"stATOM", "stride"};
    provider.set_ratio(0, Decimal::permille(1300));
    provider.set_ratio(1, Decimal::zero());

    EXPECT_EQ(provider.resolve_denom(0, "stATOM").value(), "stride");
    EXPECT_TRUE(provider.resolve_denom(0, "dATOM").has_error());
    EXPECT_TRUE(provider.resolve_denom(1, "stATOM").has_error());
    EXPECT_TRUE(provider.resolve_denom(2, "stATOM").has_error());
    EXPECT_EQ(
        provider.get_token_group_ratio(0, "stride").value(),
        Decimal::permille(1300));
    EXPECT_TRUE(provider.get_token_group_ratio(0, "other").has_error());
}

TEST(TokenManager, first_matching_provider_wins)
{
    TokenManager tokens;
    auto lsm = std::make_unique<LsmTokenInfoProvider>();
    lsm->set_validator_ratio(3, "val1", Decimal::percent(95));
    tokens.add_provider(std::move(lsm));
    tokens.add_provider(
        std::make_unique<BaseTokenInfoProvider>("uatom", "atom"));
    EXPECT_EQ(tokens.provider_count(), 2);

    EXPECT_EQ(tokens.validate_denom(3, "val1/1").value(), "val1");
    EXPECT_EQ(tokens.validate_denom(3, "uatom").value(), "atom");
    EXPECT_EQ(
        tokens.validate_denom(3, "val2/1").assume_error(),
        HydroError::InvalidDenom);

    EXPECT_EQ(tokens.get_token_denom_ratio(3, "val1/1"), Decimal::percent(95));
    EXPECT_EQ(tokens.get_token_denom_ratio(3, "uatom"), Decimal::one());
    EXPECT_EQ(tokens.get_token_denom_ratio(4, "val1/1"), Decimal::zero());
    EXPECT_EQ(tokens.get_token_group_ratio(3, "unknown"), Decimal::zero());
}

TEST(TokenManager, without_providers_nothing_is_lockable)
{
    TokenManager tokens;
    EXPECT_TRUE(tokens.validate_denom(0, "uatom").has_error());
    EXPECT_EQ(tokens.get_token_denom_ratio(0, "uatom"), Decimal::zero());
}

TEST(TokenManager, ratio_update_reaches_owning_provider)
{
    TokenManager tokens;
    auto lsm = std::make_unique<LsmTokenInfoProvider>();
    auto derivative =
        std::make_unique<DerivativeTokenInfoProvider>("stATOM", "stride");
    for (uint64_t round_id = 0; round_id < 4; ++round_id) {
        lsm->set_validator_ratio(round_id, "val1", Decimal::percent(95));
        derivative->set_ratio(round_id, Decimal::permille(1300));
    }
    tokens.add_provider(std::move(lsm));
    tokens.add_provider(std::move(derivative));
    tokens.add_provider(
        std::make_unique<BaseTokenInfoProvider>("uatom", "atom"));

    EXPECT_EQ(
        tokens.update_token_group_ratio(2, "stride", Decimal::permille(1400))
            .value(),
        Decimal::permille(1300));
    EXPECT_EQ(tokens.get_token_group_ratio(1, "stride"), Decimal::permille(1300));
    EXPECT_EQ(tokens.get_token_group_ratio(3, "stride"), Decimal::permille(1400));

    // a validator entering the active set
    EXPECT_EQ(
        tokens.update_token_group_ratio(2, "val2", Decimal::percent(90))
            .value(),
        Decimal::zero());
    EXPECT_EQ(tokens.validate_denom(2, "val2/3").value(), "val2");
    EXPECT_TRUE(tokens.validate_denom(1, "val2/3").has_error());

    // and one leaving it
    EXPECT_EQ(
        tokens.update_token_group_ratio(3, "val1", Decimal::zero()).value(),
        Decimal::percent(95));
    EXPECT_EQ(tokens.validate_denom(2, "val1/1").value(), "val1");
    EXPECT_TRUE(tokens.validate_denom(3, "val1/1").has_error());

    EXPECT_EQ(
        tokens.update_token_group_ratio(0, "atom", Decimal::percent(50))
            .assume_error(),
        HydroError::InvalidInput);
    EXPECT_EQ(
        tokens.update_token_group_ratio(0, "val1/1", Decimal::one())
            .assume_error(),
        HydroError::InvalidDenom);
}
