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

#include <hydro/core/result.hpp>
#include <hydro/gov/config.hpp>
#include <hydro/gov/constants.hpp>
#include <hydro/gov/lock_store.hpp>
#include <hydro/gov/msg.hpp>
#include <hydro/gov/pending_slash.hpp>
#include <hydro/gov/token_manager.hpp>
#include <hydro/gov/types.hpp>

HYDRO_GOV_NAMESPACE_BEGIN

// Pays off the pending slash of a lock with the attached funds. Coins are
// valued in base tokens at the current round ratios and consumed in order;
// whatever is not needed is refunded to the sender.
Result<Response> buyout_pending_slash(
    LockStore const &, PendingSlashes &, TokenManager const &,
    BlockEnv const &, MessageInfo const &, Constants const &,
    BuyoutPendingSlash const &);

HYDRO_GOV_NAMESPACE_END
