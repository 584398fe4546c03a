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
#include <hydro/core/result.hpp>
#include <hydro/gov/config.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

/// Source of truth for a family of lockable denoms. Resolves a denom to the
/// token group it belongs to and reports that group's ratio to the base
/// token for a given round. Ratios are round scoped and only known up to the
/// current round.
class TokenInfoProvider
{
public:
    virtual ~TokenInfoProvider() = default;

    virtual Result<std::string>
    resolve_denom(uint64_t round_id, std::string const &denom) const = 0;

    virtual Result<Decimal> get_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id) const = 0;

    // Publishes a new ratio for the group from round_id on, overwriting the
    // later rounds that are already published. InvalidDenom when the group
    // does not belong to this provider.
    virtual Result<void> update_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &) = 0;
};

/// Liquid staking module shares. A denom has the form
/// `<validator>/<record id>` and belongs to the group of its validator for
/// the rounds in which that validator is in the active set.
class LsmTokenInfoProvider final : public TokenInfoProvider
{
    // (round, validator) -> power ratio
    std::map<std::pair<uint64_t, std::string>, Decimal> ratios_{};

public:
    void set_validator_ratio(
        uint64_t round_id, std::string const &validator, Decimal const &);
    void remove_validator(uint64_t round_id, std::string const &validator);

    Result<std::string> resolve_denom(
        uint64_t round_id, std::string const &denom) const override;
    Result<Decimal> get_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id) const override;
    Result<void> update_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &) override;
};

/// A single liquid staking derivative whose ratio is published per round.
class DerivativeTokenInfoProvider final : public TokenInfoProvider
{
    std::string denom_;
    std::string token_group_id_;
    std::map<uint64_t, Decimal> ratios_{};

public:
    DerivativeTokenInfoProvider(std::string denom, std::string token_group_id);

    void set_ratio(uint64_t round_id, Decimal const &);

    Result<std::string> resolve_denom(
        uint64_t round_id, std::string const &denom) const override;
    Result<Decimal> get_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id) const override;
    Result<void> update_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &) override;
};

/// The base token itself, always at ratio one.
class BaseTokenInfoProvider final : public TokenInfoProvider
{
    std::string denom_;
    std::string token_group_id_;

public:
    BaseTokenInfoProvider(std::string denom, std::string token_group_id);

    Result<std::string> resolve_denom(
        uint64_t round_id, std::string const &denom) const override;
    Result<Decimal> get_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id) const override;
    Result<void> update_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &) override;
};

class TokenManager
{
    std::vector<std::unique_ptr<TokenInfoProvider>> providers_{};

public:
    TokenInfoProvider &add_provider(std::unique_ptr<TokenInfoProvider>);

    size_t provider_count() const noexcept
    {
        return providers_.size();
    }

    // token group of the first provider that accepts the denom
    Result<std::string>
    validate_denom(uint64_t round_id, std::string const &denom) const;

    // zero when no provider knows the group
    Decimal get_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id) const;

    // zero when the denom does not validate
    Decimal
    get_token_denom_ratio(uint64_t round_id, std::string const &denom) const;

    // Routes the update to the provider that already knows the group, or
    // else to the first one that accepts it. Returns the previous ratio.
    Result<Decimal> update_token_group_ratio(
        uint64_t round_id, std::string const &token_group_id,
        Decimal const &);
};

HYDRO_GOV_NAMESPACE_END
