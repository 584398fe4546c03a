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

#include <hydro/core/assert.h>
#include <hydro/core/config.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/state/versioned_slot.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

HYDRO_NAMESPACE_BEGIN

/// Ordered key/value table whose writes are scoped to the open version of its
/// Storage. A cleared key is kept as an empty layer until the version that
/// cleared it is folded into committed state.
template <class K, class V, class Compare = std::less<K>>
class Map final : public Table
{
    using Entry = VersionedSlot<V>;

    Storage &storage_;
    std::map<K, Entry, Compare> entries_{};

    // keys written in each open version
    std::map<unsigned, std::set<K, Compare>> touched_{};

    void touch(K const &key)
    {
        if (auto const version = storage_.version(); version > 0) {
            touched_[version].insert(key);
        }
    }

    void write(K const &key, std::optional<V> value)
    {
        auto const it = entries_.try_emplace(key).first;
        it->second.set(storage_.version(), std::move(value));
        touch(key);
        if (storage_.version() == 0) {
            erase_if_absent(it);
        }
    }

    void erase_if_absent(typename std::map<K, Entry, Compare>::iterator it)
    {
        if (it->second.is_vacant()) {
            entries_.erase(it);
        }
    }

public:
    explicit Map(Storage &storage)
        : storage_{storage}
    {
        storage_.attach(*this);
    }

    ~Map() override
    {
        storage_.detach(*this);
    }

    Map(Map const &) = delete;
    Map &operator=(Map const &) = delete;

    std::optional<V> load_checked(K const &key) const
    {
        auto const it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.get();
    }

    V load(K const &key) const
    {
        return load_checked(key).value_or(V{});
    }

    bool contains(K const &key) const
    {
        auto const it = entries_.find(key);
        return it != entries_.end() && it->second.get().has_value();
    }

    void store(K const &key, V const &value)
    {
        write(key, value);
    }

    void clear(K const &key)
    {
        if (entries_.contains(key)) {
            write(key, std::nullopt);
        }
    }

    // all present entries with lo <= key <= hi, ascending
    std::vector<std::pair<K, V>> range(K const &lo, K const &hi) const
    {
        std::vector<std::pair<K, V>> res;
        for (auto it = entries_.lower_bound(lo);
             it != entries_.end() && !entries_.key_comp()(hi, it->first);
             ++it) {
            if (auto const &value = it->second.get(); value.has_value()) {
                res.emplace_back(it->first, value.value());
            }
        }
        return res;
    }

    // the window of range(lo, hi) that skips `offset` entries and holds at
    // most `limit`
    std::vector<std::pair<K, V>> range(
        K const &lo, K const &hi, size_t offset, size_t const limit) const
    {
        std::vector<std::pair<K, V>> res;
        for (auto it = entries_.lower_bound(lo);
             it != entries_.end() && !entries_.key_comp()(hi, it->first) &&
             res.size() < limit;
             ++it) {
            auto const &value = it->second.get();
            if (!value.has_value()) {
                continue;
            }
            if (offset > 0) {
                --offset;
                continue;
            }
            res.emplace_back(it->first, value.value());
        }
        return res;
    }

    std::optional<std::pair<K, V>> first_in(K const &lo, K const &hi) const
    {
        for (auto it = entries_.lower_bound(lo);
             it != entries_.end() && !entries_.key_comp()(hi, it->first);
             ++it) {
            if (auto const &value = it->second.get(); value.has_value()) {
                return std::make_pair(it->first, value.value());
            }
        }
        return std::nullopt;
    }

    std::vector<K> keys() const
    {
        std::vector<K> res;
        for (auto const &[key, entry] : entries_) {
            if (entry.get().has_value()) {
                res.push_back(key);
            }
        }
        return res;
    }

    void pop_accept(unsigned const version) override
    {
        HYDRO_ASSERT(version);

        auto const node = touched_.extract(version);
        if (node.empty()) {
            return;
        }
        for (K const &key : node.mapped()) {
            auto const it = entries_.find(key);
            HYDRO_ASSERT(it != entries_.end());
            it->second.fold(version);
            if (version > 1) {
                touched_[version - 1].insert(key);
            }
            else {
                erase_if_absent(it);
            }
        }
    }

    void pop_reject(unsigned const version) override
    {
        HYDRO_ASSERT(version);

        auto const node = touched_.extract(version);
        if (node.empty()) {
            return;
        }
        for (K const &key : node.mapped()) {
            auto const it = entries_.find(key);
            HYDRO_ASSERT(it != entries_.end());
            it->second.drop(version);
            erase_if_absent(it);
        }
    }
};

HYDRO_NAMESPACE_END
