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

#include <hydro/gov/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

HYDRO_GOV_NAMESPACE_BEGIN

enum class HydroError
{
    Success = 0,
    Unauthorized,
    Paused,
    InvalidInput,
    InvalidDenom,
    RoundNotStarted,
    ConstantsNotFound,
    FutureRound,
    ProposalNotFound,
    TrancheNotFound,
    LockNotFound,
    NotLockOwner,
    InvalidLockDuration,
    LockLimitReached,
    LockNotExpired,
    NoPendingSlash,
    InsufficientShares,
    VotingNotAllowed,
    DuplicateLockId,
    InvalidSplitAmount,
    DenomMismatch,
    LockExpired,
    InvalidConfig,
    LockNotExtended,
    InvalidConversion,
};

HYDRO_GOV_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<hydro::gov::HydroError>
    : quick_status_code_from_enum_defaults<hydro::gov::HydroError>
{
    static constexpr auto const domain_name = "Hydro Error";
    static constexpr auto const domain_uuid =
        "7b2e94f0-58c3-4d1a-a0e6-3f81d2c95b6e";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
