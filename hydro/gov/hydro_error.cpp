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

#include <hydro/gov/hydro_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<hydro::gov::HydroError>::mapping> const &
quick_status_code_from_enum<hydro::gov::HydroError>::value_mappings()
{
    using hydro::gov::HydroError;

    static std::initializer_list<mapping> const v = {
        {HydroError::Success, "success", {errc::success}},
        {HydroError::Unauthorized, "unauthorized", {}},
        {HydroError::Paused, "paused", {}},
        {HydroError::InvalidInput, "invalid input", {}},
        {HydroError::InvalidDenom,
         "token with this denom can not be locked",
         {}},
        {HydroError::RoundNotStarted, "round has not started yet", {}},
        {HydroError::ConstantsNotFound,
         "no constants active at this timestamp",
         {}},
        {HydroError::FutureRound,
         "cannot query slashable tokens number for the future round",
         {}},
        {HydroError::ProposalNotFound, "proposal does not exist", {}},
        {HydroError::TrancheNotFound, "tranche does not exist", {}},
        {HydroError::LockNotFound, "lock does not exist", {}},
        {HydroError::NotLockOwner, "sender does not own the lock", {}},
        {HydroError::InvalidLockDuration, "invalid lock duration", {}},
        {HydroError::LockLimitReached,
         "the maximum amount of locked tokens is reached",
         {}},
        {HydroError::LockNotExpired, "lock has not expired", {}},
        {HydroError::NoPendingSlash, "lock has no pending slash", {}},
        {HydroError::InsufficientShares, "insufficient shares", {}},
        {HydroError::VotingNotAllowed,
         "voting with this lock is not allowed in this round",
         {}},
        {HydroError::DuplicateLockId, "duplicate lock id", {}},
        {HydroError::InvalidSplitAmount, "invalid split amount", {}},
        {HydroError::DenomMismatch, "locks hold different denoms", {}},
        {HydroError::LockExpired, "lock has expired", {}},
        {HydroError::InvalidConfig, "invalid configuration", {}},
        {HydroError::LockNotExtended,
         "new lock end must be after the old lock end",
         {}},
        {HydroError::InvalidConversion,
         "funds must match the amount required for the conversion",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
