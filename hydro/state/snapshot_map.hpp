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

#include <hydro/core/config.hpp>
#include <hydro/core/likely.h>
#include <hydro/core/result.hpp>
#include <hydro/state/map.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/state/storage_error.hpp>
#include <hydro/state/storage_variable.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

HYDRO_NAMESPACE_BEGIN

/// A Map that can be read as of the beginning of any retained block height.
///
/// The latest values live in a primary table. The first time a key changes
/// at height `h` its previous value is recorded in a changelog under
/// `(key, h)`. Reading at height `h` returns the pre-image of the first
/// change at or after `h`, or the latest value when the key has not changed
/// since. Heights below the retention boundary are not answerable because
/// changes made before it were never recorded.
template <class K, class V>
class SnapshotMap
{
    struct ChangeSet
    {
        std::optional<V> old;
    };

    using ChangeKey = std::pair<K, uint64_t>;

    Map<K, V> primary_;
    Map<ChangeKey, ChangeSet> changelog_;
    StorageVariable<uint64_t> retained_from_;

    void record(K const &key, uint64_t const height)
    {
        ChangeKey const change{key, height};
        if (!changelog_.contains(change)) {
            changelog_.store(change, ChangeSet{primary_.load_checked(key)});
        }
    }

public:
    explicit SnapshotMap(Storage &storage)
        : primary_{storage}
        , changelog_{storage}
        , retained_from_{storage}
    {
    }

    void set_retention_boundary(uint64_t const height)
    {
        retained_from_.store(height);
    }

    uint64_t retention_boundary() const
    {
        return retained_from_.load();
    }

    std::optional<V> load_checked(K const &key) const
    {
        return primary_.load_checked(key);
    }

    bool contains(K const &key) const
    {
        return primary_.contains(key);
    }

    Result<std::optional<V>>
    load_checked_at_height(K const &key, uint64_t const height) const
    {
        if (HYDRO_UNLIKELY(height < retained_from_.load())) {
            return StorageError::HeightNotRetained;
        }
        auto const change = changelog_.first_in(
            ChangeKey{key, height},
            ChangeKey{key, std::numeric_limits<uint64_t>::max()});
        if (change.has_value()) {
            return change->second.old;
        }
        return primary_.load_checked(key);
    }

    void store(K const &key, V const &value, uint64_t const height)
    {
        record(key, height);
        primary_.store(key, value);
    }

    void clear(K const &key, uint64_t const height)
    {
        if (!primary_.contains(key)) {
            return;
        }
        record(key, height);
        primary_.clear(key);
    }

    std::vector<std::pair<K, V>> range(K const &lo, K const &hi) const
    {
        return primary_.range(lo, hi);
    }

    std::vector<K> keys() const
    {
        return primary_.keys();
    }
};

HYDRO_NAMESPACE_END
