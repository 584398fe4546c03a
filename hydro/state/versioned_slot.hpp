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

#include <deque>
#include <optional>
#include <utility>

HYDRO_NAMESPACE_BEGIN

/// A possibly absent value with one layer per open storage version that
/// wrote it. Layer 0 is committed state and always exists.
template <class V>
class VersionedSlot
{
    struct Layer
    {
        unsigned version;
        std::optional<V> value;
    };

    std::deque<Layer> layers_{Layer{.version = 0, .value = std::nullopt}};

public:
    std::optional<V> const &get() const
    {
        return layers_.back().value;
    }

    // the first write in a newer version copies the layer below
    void set(unsigned const version, std::optional<V> value)
    {
        HYDRO_ASSERT(version >= layers_.back().version);

        if (version > layers_.back().version) {
            layers_.push_back(Layer{.version = version, .value = {}});
        }
        layers_.back().value = std::move(value);
    }

    // folds the layer written in `version` into its parent version
    void fold(unsigned const version)
    {
        HYDRO_ASSERT(version);

        if (layers_.back().version != version) {
            return;
        }
        auto const size = layers_.size();
        if (size > 1 && layers_[size - 2].version + 1 == version) {
            layers_[size - 2].value = std::move(layers_.back().value);
            layers_.pop_back();
        }
        else {
            layers_.back().version = version - 1;
        }
    }

    void drop(unsigned const version)
    {
        HYDRO_ASSERT(version);

        if (layers_.back().version == version) {
            layers_.pop_back();
        }
        HYDRO_ASSERT(!layers_.empty());
    }

    // nothing committed and nothing pending
    bool is_vacant() const
    {
        return layers_.size() == 1 && !layers_.front().value.has_value();
    }
};

HYDRO_NAMESPACE_END
