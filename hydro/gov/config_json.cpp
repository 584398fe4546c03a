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
#include <hydro/core/likely.h>
#include <hydro/gov/config_json.hpp>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/token_manager.hpp>

#include <boost/outcome/try.hpp>

#include <nlohmann/adl_serializer.hpp>
#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nlohmann
{
    template <>
    struct adl_serializer<hydro::uint128_t>
    {
        static void from_json(nlohmann::json const &json, hydro::uint128_t &o)
        {
            o = intx::from_string<hydro::uint128_t>(json.get<std::string>());
        }
    };
}

HYDRO_GOV_NAMESPACE_BEGIN

namespace
{
    Result<Decimal> decimal_from_json(nlohmann::json const &j)
    {
        auto const str = j.get<std::string>();
        auto res = Decimal::from_string(str);
        if (HYDRO_UNLIKELY(res.has_error())) {
            LOG_WARNING(
                "Malformed decimal \"{}\": {}",
                str,
                res.error().message().c_str());
            return HydroError::InvalidConfig;
        }
        return res;
    }

    Result<Constants> constants_from_json(nlohmann::json const &j)
    {
        std::vector<LockPowerEntry> schedule;
        for (auto const &entry : j.at("round_lock_power_schedule")) {
            BOOST_OUTCOME_TRY(
                auto const factor,
                decimal_from_json(entry.at("power_scaling_factor")));
            schedule.push_back(LockPowerEntry{
                .locked_rounds = entry.at("locked_rounds").get<uint64_t>(),
                .power_scaling_factor = factor});
        }

        BOOST_OUTCOME_TRY(
            auto const threshold,
            decimal_from_json(j.at("slash_percentage_threshold")));

        return Constants{
            .round_length = j.at("round_length").get<uint64_t>(),
            .lock_epoch_length = j.at("lock_epoch_length").get<uint64_t>(),
            .first_round_start = j.at("first_round_start").get<Timestamp>(),
            .max_locked_tokens = j.at("max_locked_tokens").get<uint128_t>(),
            .round_lock_power_schedule =
                RoundLockPowerSchedule{std::move(schedule)},
            .max_deployment_duration =
                j.at("max_deployment_duration").get<uint64_t>(),
            .slash_percentage_threshold = threshold,
            .slash_tokens_receiver_addr =
                j.at("slash_tokens_receiver_addr").get<Address>(),
            .paused = j.value("paused", false)};
    }

    Result<std::unique_ptr<TokenInfoProvider>>
    provider_from_json(nlohmann::json const &j)
    {
        if (j.contains("lsm")) {
            auto provider = std::make_unique<LsmTokenInfoProvider>();
            for (auto const &entry : j.at("lsm").value(
                     "ratios", nlohmann::json::array())) {
                BOOST_OUTCOME_TRY(
                    auto const ratio, decimal_from_json(entry.at("ratio")));
                provider->set_validator_ratio(
                    entry.at("round_id").get<uint64_t>(),
                    entry.at("validator").get<std::string>(),
                    ratio);
            }
            return std::unique_ptr<TokenInfoProvider>{std::move(provider)};
        }
        if (j.contains("derivative")) {
            auto const &info = j.at("derivative");
            auto provider = std::make_unique<DerivativeTokenInfoProvider>(
                info.at("denom").get<std::string>(),
                info.at("token_group_id").get<std::string>());
            for (auto const &entry :
                 info.value("ratios", nlohmann::json::array())) {
                BOOST_OUTCOME_TRY(
                    auto const ratio, decimal_from_json(entry.at("ratio")));
                provider->set_ratio(
                    entry.at("round_id").get<uint64_t>(), ratio);
            }
            return std::unique_ptr<TokenInfoProvider>{std::move(provider)};
        }
        if (j.contains("base")) {
            auto const &info = j.at("base");
            return std::unique_ptr<TokenInfoProvider>{
                std::make_unique<BaseTokenInfoProvider>(
                    info.at("denom").get<std::string>(),
                    info.at("token_group_id").get<std::string>())};
        }
        return HydroError::InvalidConfig;
    }

    Result<InstantiateMsg> instantiate_msg_from_json(nlohmann::json const &j)
    {
        InstantiateMsg msg;
        BOOST_OUTCOME_TRY(
            msg.constants, constants_from_json(j.at("constants")));
        msg.whitelist_admins =
            j.value("whitelist_admins", std::vector<Address>{});
        for (auto const &tranche :
             j.value("tranches", nlohmann::json::array())) {
            msg.tranches.push_back(TrancheInfo{
                .name = tranche.at("name").get<std::string>(),
                .metadata = tranche.value("metadata", std::string{})});
        }
        for (auto const &provider :
             j.value("token_info_providers", nlohmann::json::array())) {
            BOOST_OUTCOME_TRY(auto p, provider_from_json(provider));
            msg.token_info_providers.push_back(std::move(p));
        }
        return msg;
    }

    template <class T, class F>
    Result<T> guarded(nlohmann::json const &j, F &&parse)
    {
        try {
            return parse(j);
        }
        catch (nlohmann::json::exception const &e) {
            LOG_WARNING("Malformed config: {}", e.what());
        }
        catch (std::invalid_argument const &e) {
            LOG_WARNING("Malformed config value: {}", e.what());
        }
        catch (std::out_of_range const &e) {
            LOG_WARNING("Config value out of range: {}", e.what());
        }
        return HydroError::InvalidConfig;
    }
}

Result<Constants> parse_constants(nlohmann::json const &j)
{
    return guarded<Constants>(j, constants_from_json);
}

Result<InstantiateMsg> parse_instantiate_msg(nlohmann::json const &j)
{
    return guarded<InstantiateMsg>(j, instantiate_msg_from_json);
}

Result<InstantiateMsg>
load_instantiate_msg(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (HYDRO_UNLIKELY(!in)) {
        LOG_WARNING("Cannot open config file {}", path.string());
        return HydroError::InvalidConfig;
    }
    auto const j = nlohmann::json::parse(in, nullptr, false);
    if (HYDRO_UNLIKELY(j.is_discarded())) {
        LOG_WARNING("Config file {} is not valid json", path.string());
        return HydroError::InvalidConfig;
    }
    return parse_instantiate_msg(j);
}

HYDRO_GOV_NAMESPACE_END
