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

#pragma once

#include <hydro/core/decimal.hpp>
#include <hydro/core/int.hpp>
#include <hydro/core/result.hpp>
#include <hydro/gov/constants.hpp>
#include <hydro/gov/hydro_contract.hpp>
#include <hydro/gov/msg.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/test/config.hpp>

#include <boost/outcome/try.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

HYDRO_TEST_NAMESPACE_BEGIN

inline constexpr gov::Timestamp ONE_DAY = 86'400'000'000'000;
inline constexpr gov::Timestamp ONE_MONTH = 30 * ONE_DAY;
inline constexpr gov::Timestamp FIRST_ROUND_START =
    1'730'851'140'000'000'000;

inline constexpr char ADMIN[] = "admin";
inline constexpr char USER1[] = "user1";
inline constexpr char USER2[] = "user2";
inline constexpr char SLASH_RECEIVER[] = "slash_receiver";

inline constexpr char VALIDATOR1[] = "validator1";
inline constexpr char VALIDATOR2[] = "validator2";
inline constexpr char VALIDATOR1_DENOM[] = "validator1/1";
inline constexpr char VALIDATOR2_DENOM[] = "validator2/7";
inline constexpr char STATOM[] = "stATOM";
inline constexpr char UATOM[] = "uatom";
inline constexpr char UATOM_GROUP[] = "atom";

inline constexpr uint64_t MAX_RATIO_ROUND = 12;

inline gov::Constants make_constants()
{
    return gov::Constants{
        .round_length = ONE_MONTH,
        .lock_epoch_length = ONE_MONTH,
        .first_round_start = FIRST_ROUND_START,
        .max_locked_tokens = 1'000'000'000,
        .round_lock_power_schedule =
            gov::RoundLockPowerSchedule{
                {{1, Decimal::one()},
                 {2, Decimal::permille(1250)},
                 {3, Decimal::permille(1500)}}},
        .max_deployment_duration = 3,
        .slash_percentage_threshold = Decimal::percent(50),
        .slash_tokens_receiver_addr = SLASH_RECEIVER,
        .paused = false};
}

/// A contract instantiated at the first round start with two tranches and
/// three token families: validator1 LSM shares at 0.95, validator2 LSM
/// shares at 1, stATOM at 1.3 and the uatom base token. Every ratio is known
/// up to MAX_RATIO_ROUND.
struct ContractFixture : public ::testing::Test
{
    Storage storage;
    gov::HydroContract contract{storage};
    gov::LsmTokenInfoProvider *lsm{nullptr};
    gov::DerivativeTokenInfoProvider *statom{nullptr};
    gov::BlockEnv env{.height = 1, .time = FIRST_ROUND_START};

    void SetUp() override
    {
        auto lsm_provider = std::make_unique<gov::LsmTokenInfoProvider>();
        auto statom_provider =
            std::make_unique<gov::DerivativeTokenInfoProvider>(
                STATOM, "stATOM-group");
        for (uint64_t round_id = 0; round_id <= MAX_RATIO_ROUND;
             ++round_id) {
            lsm_provider->set_validator_ratio(
                round_id, VALIDATOR1, Decimal::percent(95));
            lsm_provider->set_validator_ratio(
                round_id, VALIDATOR2, Decimal::one());
            statom_provider->set_ratio(round_id, Decimal::permille(1300));
        }
        lsm = lsm_provider.get();
        statom = statom_provider.get();

        gov::InstantiateMsg msg{
            .constants = make_constants(),
            .whitelist_admins = {ADMIN},
            .tranches = {{"tranche 1", "first"}, {"tranche 2", "second"}},
            .token_info_providers = {}};
        msg.token_info_providers.push_back(std::move(lsm_provider));
        msg.token_info_providers.push_back(std::move(statom_provider));
        msg.token_info_providers.push_back(
            std::make_unique<gov::BaseTokenInfoProvider>(
                UATOM, UATOM_GROUP));

        auto const res = contract.instantiate(
            env, gov::MessageInfo{.sender = ADMIN, .funds = {}}, std::move(msg));
        ASSERT_FALSE(res.has_error());
    }

    void advance(gov::Timestamp const duration, uint64_t const blocks = 100)
    {
        env.time += duration;
        env.height += blocks;
    }

    Result<gov::Response> execute(
        gov::Address const &sender, gov::ExecuteMsg const &msg,
        std::vector<gov::Coin> funds = {})
    {
        return contract.execute(
            env,
            gov::MessageInfo{.sender = sender, .funds = std::move(funds)},
            msg);
    }

    Result<uint64_t> create_proposal(
        uint64_t const tranche_id, uint64_t const deployment_duration = 1)
    {
        BOOST_OUTCOME_TRY(
            auto const res,
            execute(
                ADMIN,
                gov::CreateProposal{
                    .tranche_id = tranche_id,
                    .title = "proposal",
                    .description = "",
                    .deployment_duration = deployment_duration}));
        return std::stoull(res.attribute("proposal_id").value());
    }

    Result<uint64_t> lock(
        gov::Address const &owner, std::string const &denom,
        uint128_t const &amount, uint64_t const rounds)
    {
        BOOST_OUTCOME_TRY(
            auto const res,
            execute(
                owner,
                gov::LockTokens{.lock_duration = rounds * ONE_MONTH},
                {gov::Coin{.denom = denom, .amount = amount}}));
        return std::stoull(res.attribute("lock_id").value());
    }

    Result<gov::Response> vote(
        gov::Address const &owner, uint64_t const tranche_id,
        uint64_t const proposal_id, std::vector<uint64_t> lock_ids)
    {
        return execute(
            owner,
            gov::VoteMsg{
                .tranche_id = tranche_id,
                .proposals_votes = {
                    {.proposal_id = proposal_id,
                     .lock_ids = std::move(lock_ids)}}});
    }

    Result<gov::Response> slash(
        uint64_t const round_id, uint64_t const tranche_id,
        uint64_t const proposal_id, Decimal const &slash_percent,
        uint64_t const start_from = 0, uint64_t const limit = 100)
    {
        return execute(
            ADMIN,
            gov::SlashProposalVoters{
                .round_id = round_id,
                .tranche_id = tranche_id,
                .proposal_id = proposal_id,
                .slash_percent = slash_percent,
                .start_from = start_from,
                .limit = limit});
    }

    uint128_t lock_amount(uint64_t const lock_id) const
    {
        auto const res = contract.query_lock(lock_id);
        return res.has_value() ? res.value().funds.amount : uint128_t{0};
    }
};

HYDRO_TEST_NAMESPACE_END
