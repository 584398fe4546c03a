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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

using Address = std::string;

// nanoseconds since the epoch
using Timestamp = uint64_t;

struct Coin
{
    std::string denom;
    uint128_t amount;

    friend bool operator==(Coin const &, Coin const &) = default;
};

struct LockEntry
{
    uint64_t lock_id;
    Address owner;
    Coin funds;
    Timestamp lock_start;
    Timestamp lock_end;

    friend bool operator==(LockEntry const &, LockEntry const &) = default;
};

// lineage edge from a split or merged lock to one of its successors
struct LockSuccessor
{
    uint64_t lock_id;
    Decimal fraction;

    friend bool operator==(LockSuccessor const &, LockSuccessor const &) =
        default;
};

struct TimeWeightedShares
{
    std::string token_group_id;
    Decimal shares;

    friend bool
    operator==(TimeWeightedShares const &, TimeWeightedShares const &) =
        default;
};

struct Vote
{
    uint64_t prop_id;
    TimeWeightedShares time_weighted_shares;

    friend bool operator==(Vote const &, Vote const &) = default;
};

struct Proposal
{
    uint64_t round_id;
    uint64_t tranche_id;
    uint64_t proposal_id;
    std::string title;
    std::string description;
    uint64_t deployment_duration;
    uint128_t power;
};

struct Tranche
{
    uint64_t id;
    std::string name;
    std::string metadata;
};

struct HeightRange
{
    uint64_t lowest;
    uint64_t highest;
};

struct ProposalToLockups
{
    uint64_t proposal_id;
    std::vector<uint64_t> lock_ids;
};

struct BlockEnv
{
    uint64_t height;
    Timestamp time;
};

struct MessageInfo
{
    Address sender;
    std::vector<Coin> funds;
};

struct BankSend
{
    Address to_address;
    std::vector<Coin> amount;
};

struct Attribute
{
    std::string key;
    std::string value;
};

struct Response
{
    std::vector<Attribute> attributes;
    std::vector<BankSend> messages;

    Response &add_attribute(std::string key, std::string value)
    {
        attributes.push_back({std::move(key), std::move(value)});
        return *this;
    }

    Response &add_message(BankSend msg)
    {
        messages.push_back(std::move(msg));
        return *this;
    }

    std::optional<std::string> attribute(std::string_view const key) const
    {
        for (auto const &attr : attributes) {
            if (attr.key == key) {
                return attr.value;
            }
        }
        return std::nullopt;
    }
};

HYDRO_GOV_NAMESPACE_END
