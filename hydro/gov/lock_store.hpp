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
#include <hydro/gov/state.hpp>
#include <hydro/gov/types.hpp>

#include <cstdint>
#include <optional>
#include <vector>

HYDRO_GOV_NAMESPACE_BEGIN

/// Lock entries indexed by id and owner, plus the lineage edges recorded when
/// locks are split or merged. All writes are stamped with the height of the
/// block performing them so that past states remain readable.
class LockStore
{
    Variables &vars_;

public:
    explicit LockStore(Variables &);

    std::optional<LockEntry> load(uint64_t lock_id) const;

    // the lock as of the beginning of block `height`
    Result<std::optional<LockEntry>>
    load_at_height(uint64_t lock_id, uint64_t height) const;

    void save(LockEntry const &, uint64_t height);
    void remove(uint64_t lock_id, uint64_t height);

    uint64_t next_lock_id();

    std::vector<uint64_t> user_locks(Address const &) const;
    void update_user_locks(
        Address const &, std::vector<uint64_t> const &added,
        std::vector<uint64_t> const &removed);

    void add_successors(uint64_t lock_id, std::vector<LockSuccessor> const &);
    std::vector<LockSuccessor> successors(uint64_t lock_id) const;
};

HYDRO_GOV_NAMESPACE_END
