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

#include <hydro/core/assert.h>
#include <hydro/core/fmt/decimal_fmt.hpp>
#include <hydro/core/likely.h>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/token_manager.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <string>
#include <utility>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

void LsmTokenInfoProvider::set_validator_ratio(
    uint64_t const round_id, std::string const &validator,
    Decimal const &ratio)
{
    ratios_[{round_id, validator}] = ratio;
}

void LsmTokenInfoProvider::remove_validator(
    uint64_t const round_id, std::string const &validator)
{
    ratios_.erase({round_id, validator});
}

Result<std::string> LsmTokenInfoProvider::resolve_denom(
    uint64_t const round_id, std::string const &denom) const
{
    auto const slash = denom.find('/');
    if (HYDRO_UNLIKELY(
            slash == std::string::npos || slash == 0 ||
            slash + 1 == denom.size())) {
        return HydroError::InvalidDenom;
    }
    std::string validator = denom.substr(0, slash);
    if (HYDRO_UNLIKELY(!ratios_.contains({round_id, validator}))) {
        return HydroError::InvalidDenom;
    }
    return validator;
}

Result<Decimal> LsmTokenInfoProvider::get_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id) const
{
    auto const it = ratios_.find({round_id, token_group_id});
    if (HYDRO_UNLIKELY(it == ratios_.end())) {
        return HydroError::InvalidDenom;
    }
    return it->second;
}

Result<void> LsmTokenInfoProvider::update_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id,
    Decimal const &ratio)
{
    if (HYDRO_UNLIKELY(
            token_group_id.empty() ||
            token_group_id.find('/') != std::string::npos)) {
        return HydroError::InvalidDenom;
    }

    std::vector<uint64_t> rounds{round_id};
    for (auto const &[key, _] : ratios_) {
        if (key.first > round_id && key.second == token_group_id) {
            rounds.push_back(key.first);
        }
    }
    // a zero ratio takes the validator out of the active set
    for (uint64_t const id : rounds) {
        if (ratio.is_zero()) {
            remove_validator(id, token_group_id);
        }
        else {
            set_validator_ratio(id, token_group_id, ratio);
        }
    }
    return outcome::success();
}

DerivativeTokenInfoProvider::DerivativeTokenInfoProvider(
    std::string denom, std::string token_group_id)
    : denom_{std::move(denom)}
    , token_group_id_{std::move(token_group_id)}
{
}

void DerivativeTokenInfoProvider::set_ratio(
    uint64_t const round_id, Decimal const &ratio)
{
    ratios_[round_id] = ratio;
}

Result<std::string> DerivativeTokenInfoProvider::resolve_denom(
    uint64_t const round_id, std::string const &denom) const
{
    if (denom != denom_) {
        return HydroError::InvalidDenom;
    }
    auto const it = ratios_.find(round_id);
    if (HYDRO_UNLIKELY(it == ratios_.end() || it->second.is_zero())) {
        return HydroError::InvalidDenom;
    }
    return token_group_id_;
}

Result<Decimal> DerivativeTokenInfoProvider::get_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id) const
{
    if (token_group_id != token_group_id_) {
        return HydroError::InvalidDenom;
    }
    auto const it = ratios_.find(round_id);
    if (HYDRO_UNLIKELY(it == ratios_.end())) {
        return HydroError::InvalidDenom;
    }
    return it->second;
}

Result<void> DerivativeTokenInfoProvider::update_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id,
    Decimal const &ratio)
{
    if (token_group_id != token_group_id_) {
        return HydroError::InvalidDenom;
    }
    ratios_[round_id] = ratio;
    for (auto it = ratios_.upper_bound(round_id); it != ratios_.end(); ++it) {
        it->second = ratio;
    }
    return outcome::success();
}

BaseTokenInfoProvider::BaseTokenInfoProvider(
    std::string denom, std::string token_group_id)
    : denom_{std::move(denom)}
    , token_group_id_{std::move(token_group_id)}
{
}

Result<std::string>
BaseTokenInfoProvider::resolve_denom(uint64_t, std::string const &denom) const
{
    if (denom != denom_) {
        return HydroError::InvalidDenom;
    }
    return token_group_id_;
}

Result<Decimal> BaseTokenInfoProvider::get_token_group_ratio(
    uint64_t, std::string const &token_group_id) const
{
    if (token_group_id != token_group_id_) {
        return HydroError::InvalidDenom;
    }
    return Decimal::one();
}

Result<void> BaseTokenInfoProvider::update_token_group_ratio(
    uint64_t, std::string const &token_group_id, Decimal const &)
{
    if (token_group_id != token_group_id_) {
        return HydroError::InvalidDenom;
    }
    // the base token is the unit of power
    return HydroError::InvalidInput;
}

TokenInfoProvider &
TokenManager::add_provider(std::unique_ptr<TokenInfoProvider> provider)
{
    HYDRO_ASSERT(provider);
    providers_.push_back(std::move(provider));
    return *providers_.back();
}

Result<std::string> TokenManager::validate_denom(
    uint64_t const round_id, std::string const &denom) const
{
    for (auto const &provider : providers_) {
        auto res = provider->resolve_denom(round_id, denom);
        if (!res.has_error()) {
            return res;
        }
    }
    LOG_DEBUG(
        "Token with denom {} can not be locked in round {}", denom, round_id);
    return HydroError::InvalidDenom;
}

Decimal TokenManager::get_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id) const
{
    for (auto const &provider : providers_) {
        auto const res =
            provider->get_token_group_ratio(round_id, token_group_id);
        if (!res.has_error()) {
            return res.value();
        }
    }
    return Decimal::zero();
}

Decimal TokenManager::get_token_denom_ratio(
    uint64_t const round_id, std::string const &denom) const
{
    auto const group = validate_denom(round_id, denom);
    if (group.has_error()) {
        return Decimal::zero();
    }
    return get_token_group_ratio(round_id, group.value());
}

Result<Decimal> TokenManager::update_token_group_ratio(
    uint64_t const round_id, std::string const &token_group_id,
    Decimal const &ratio)
{
    for (auto const &provider : providers_) {
        auto const old_ratio =
            provider->get_token_group_ratio(round_id, token_group_id);
        if (!old_ratio.has_error()) {
            BOOST_OUTCOME_TRY(provider->update_token_group_ratio(
                round_id, token_group_id, ratio));
            return old_ratio.value();
        }
    }
    for (auto const &provider : providers_) {
        auto const res =
            provider->update_token_group_ratio(round_id, token_group_id, ratio);
        if (!res.has_error()) {
            return Decimal::zero();
        }
    }
    return HydroError::InvalidDenom;
}

HYDRO_GOV_NAMESPACE_END
