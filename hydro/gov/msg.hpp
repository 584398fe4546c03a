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
#include <hydro/gov/config.hpp>
#include <hydro/gov/constants.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

struct TrancheInfo
{
    std::string name;
    std::string metadata;
};

struct InstantiateMsg
{
    Constants constants;
    std::vector<Address> whitelist_admins;
    std::vector<TrancheInfo> tranches;
    std::vector<std::unique_ptr<TokenInfoProvider>> token_info_providers;
};

struct AddTranche
{
    TrancheInfo tranche;
};

struct UpdateConstants
{
    Timestamp activate_at;
    Constants constants;
};

struct CreateProposal
{
    uint64_t tranche_id;
    std::string title;
    std::string description;
    uint64_t deployment_duration;
};

struct LockTokens
{
    uint64_t lock_duration;
};

struct UnlockTokens
{
    // all expired locks of the sender when empty
    std::optional<std::vector<uint64_t>> lock_ids;
};

struct RefreshLockDuration
{
    uint64_t lock_id;
    uint64_t lock_duration;
};

struct VoteMsg
{
    uint64_t tranche_id;
    std::vector<ProposalToLockups> proposals_votes;
};

struct SplitLock
{
    uint64_t lock_id;
    uint128_t amount;
};

struct MergeLocks
{
    std::vector<uint64_t> lock_ids;
};

struct SlashProposalVoters
{
    uint64_t round_id;
    uint64_t tranche_id;
    uint64_t proposal_id;
    Decimal slash_percent;
    uint64_t start_from;
    uint64_t limit;
};

struct BuyoutPendingSlash
{
    uint64_t lock_id;
};

// The owner sends the exact amount of target_denom worth the locked tokens
// and gets the locked tokens back.
struct ConvertLockup
{
    uint64_t lock_id;
    std::string target_denom;
};

// Publishes a token group ratio for the current round on.
struct UpdateTokenGroupRatio
{
    std::string token_group_id;
    Decimal new_ratio;
};

using ExecuteMsg = std::variant<
    AddTranche, UpdateConstants, CreateProposal, LockTokens, UnlockTokens,
    RefreshLockDuration, VoteMsg, SplitLock, MergeLocks, SlashProposalVoters,
    BuyoutPendingSlash, ConvertLockup, UpdateTokenGroupRatio>;

HYDRO_GOV_NAMESPACE_END
