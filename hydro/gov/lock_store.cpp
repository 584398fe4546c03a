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

#include <hydro/gov/lock_store.hpp>

#include <algorithm>

HYDRO_GOV_NAMESPACE_BEGIN

LockStore::LockStore(Variables &vars)
    : vars_{vars}
{
}

std::optional<LockEntry> LockStore::load(uint64_t const lock_id) const
{
    return vars_.locks.load_checked(lock_id);
}

Result<std::optional<LockEntry>>
LockStore::load_at_height(uint64_t const lock_id, uint64_t const height) const
{
    return vars_.locks.load_checked_at_height(lock_id, height);
}

void LockStore::save(LockEntry const &lock, uint64_t const height)
{
    vars_.locks.store(lock.lock_id, lock, height);
}

void LockStore::remove(uint64_t const lock_id, uint64_t const height)
{
    vars_.locks.clear(lock_id, height);
}

uint64_t LockStore::next_lock_id()
{
    uint64_t const id = vars_.lock_id.load();
    vars_.lock_id.store(id + 1);
    return id;
}

std::vector<uint64_t> LockStore::user_locks(Address const &owner) const
{
    return vars_.user_locks.load(owner);
}

void LockStore::update_user_locks(
    Address const &owner, std::vector<uint64_t> const &added,
    std::vector<uint64_t> const &removed)
{
    auto locks = vars_.user_locks.load(owner);
    std::erase_if(locks, [&removed](uint64_t const id) {
        return std::find(removed.begin(), removed.end(), id) != removed.end();
    });
    for (uint64_t const id : added) {
        if (std::find(locks.begin(), locks.end(), id) == locks.end()) {
            locks.push_back(id);
        }
    }
    std::sort(locks.begin(), locks.end());

    if (locks.empty()) {
        vars_.user_locks.clear(owner);
    }
    else {
        vars_.user_locks.store(owner, locks);
    }
}

void LockStore::add_successors(
    uint64_t const lock_id, std::vector<LockSuccessor> const &successors)
{
    auto edges = vars_.lock_successors.load(lock_id);
    edges.insert(edges.end(), successors.begin(), successors.end());
    vars_.lock_successors.store(lock_id, edges);
}

std::vector<LockSuccessor> LockStore::successors(uint64_t const lock_id) const
{
    return vars_.lock_successors.load(lock_id);
}

HYDRO_GOV_NAMESPACE_END
