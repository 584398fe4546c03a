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

#include <hydro/core/likely.h>
#include <hydro/gov/hydro_error.hpp>
#include <hydro/gov/lock_composition.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <map>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

namespace
{
    struct Frame
    {
        uint64_t lock_id;
        Decimal fraction;
        size_t depth;
    };
}

Result<std::vector<std::pair<uint64_t, Decimal>>>
get_current_lock_composition(LockStore const &store, uint64_t const lock_id)
{
    std::map<uint64_t, Decimal> leaves;

    // locks on the path from the root to the frame being expanded
    std::vector<uint64_t> path;

    std::vector<Frame> stack{{lock_id, Decimal::one(), 0}};
    while (!stack.empty()) {
        Frame const frame = stack.back();
        stack.pop_back();

        path.resize(frame.depth);
        if (HYDRO_UNLIKELY(
                std::find(path.begin(), path.end(), frame.lock_id) !=
                path.end())) {
            LOG_WARNING(
                "Lock {} is reachable from itself through lineage of lock {}",
                frame.lock_id,
                lock_id);
            return HydroError::InvalidInput;
        }

        auto const successors = store.successors(frame.lock_id);
        if (successors.empty()) {
            Decimal &leaf = leaves[frame.lock_id];
            BOOST_OUTCOME_TRY(leaf, leaf.checked_add(frame.fraction));
            continue;
        }

        path.push_back(frame.lock_id);
        for (auto it = successors.rbegin(); it != successors.rend(); ++it) {
            BOOST_OUTCOME_TRY(
                auto const fraction, frame.fraction.checked_mul(it->fraction));
            stack.push_back({it->lock_id, fraction, frame.depth + 1});
        }
    }

    return std::vector<std::pair<uint64_t, Decimal>>{
        leaves.begin(), leaves.end()};
}

HYDRO_GOV_NAMESPACE_END
