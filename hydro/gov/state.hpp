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
#include <hydro/gov/types.hpp>
#include <hydro/state/map.hpp>
#include <hydro/state/snapshot_map.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/state/storage_variable.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

// (round_id, tranche_id, lock_id)
using VoteKey = std::tuple<uint64_t, uint64_t, uint64_t>;

// (round_id, tranche_id, proposal_id)
using ProposalKey = std::tuple<uint64_t, uint64_t, uint64_t>;

// (round_id or proposal_id, token_group_id)
using TokenGroupKey = std::pair<uint64_t, std::string>;

/////////////////////////
// Ledger Storage Tables
/////////////////////////
class Variables
{
    Storage &storage_;

public:
    explicit Variables(Storage &storage)
        : storage_{storage}
    {
    }

    Variables(Variables const &) = delete;
    Variables &operator=(Variables const &) = delete;

    Storage &storage() noexcept
    {
        return storage_;
    }

    ////////////////
    //  Settings  //
    ////////////////

    // activation timestamp => constants
    ConstantsMap constants{storage_};

    StorageVariable<std::vector<Address>> whitelist_admins{storage_};

    Map<uint64_t, Tranche> tranches{storage_};

    ////////////////
    //  Counters  //
    ////////////////

    // next id handed out on lock creation, split and merge
    StorageVariable<uint64_t> lock_id{storage_};

    StorageVariable<uint64_t> proposal_id{storage_};

    StorageVariable<uint64_t> tranche_id{storage_};

    // total amount held by all locks, bounded by max_locked_tokens
    StorageVariable<uint128_t> locked_tokens{storage_};

    ///////////
    // Locks //
    ///////////

    // lock_id => lock, readable as of past heights
    SnapshotMap<uint64_t, LockEntry> locks{storage_};

    // owner => lock ids
    Map<Address, std::vector<uint64_t>> user_locks{storage_};

    // lock_id => locks it was split or merged into
    Map<uint64_t, std::vector<LockSuccessor>> lock_successors{storage_};

    // lock_id => slash amount not yet applied, in the lock's denom
    Map<uint64_t, uint128_t> pending_slashes{storage_};

    ////////////////////////
    // Votes and proposals //
    ////////////////////////

    Map<ProposalKey, Proposal> proposals{storage_};

    Map<VoteKey, Vote> votes{storage_};

    // (tranche_id, lock_id) => first round the lock may vote again
    Map<std::pair<uint64_t, uint64_t>, uint64_t> voting_allowed_round{
        storage_};

    /////////////////
    // Score keeper //
    /////////////////

    // (proposal_id, token_group_id) => scaled shares
    Map<TokenGroupKey, Decimal> proposal_token_group_shares{storage_};

    // proposal_id => sum of shares weighted by token group ratio
    Map<uint64_t, Decimal> proposal_total_power{storage_};

    // (round_id, token_group_id) => scaled shares of every lock alive at
    // the round end
    Map<TokenGroupKey, Decimal> scaled_round_power_shares{storage_};

    // round_id => total voting power, readable as of past heights
    SnapshotMap<uint64_t, uint128_t> total_voting_power_per_round{storage_};

    //////////////////////
    // Round bookkeeping //
    //////////////////////

    Map<uint64_t, HeightRange> round_to_height_range{storage_};

    Map<uint64_t, uint64_t> height_to_round{storage_};

    bool is_whitelist_admin(Address const &address) const
    {
        auto const admins = whitelist_admins.load();
        return std::find(admins.begin(), admins.end(), address) !=
               admins.end();
    }
};

HYDRO_GOV_NAMESPACE_END
