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
#include <hydro/state/storage.hpp>
#include <hydro/state/versioned_slot.hpp>

#include <optional>

HYDRO_NAMESPACE_BEGIN

template <typename T>
class StorageVariable final : public Table
{
    Storage &storage_;
    VersionedSlot<T> value_{};

public:
    explicit StorageVariable(Storage &storage)
        : storage_{storage}
    {
        storage_.attach(*this);
    }

    ~StorageVariable() override
    {
        storage_.detach(*this);
    }

    StorageVariable(StorageVariable const &) = delete;
    StorageVariable &operator=(StorageVariable const &) = delete;

    T load() const
    {
        return value_.get().value_or(T{});
    }

    std::optional<T> load_checked() const
    {
        return value_.get();
    }

    void store(T const &value)
    {
        value_.set(storage_.version(), value);
    }

    void clear()
    {
        value_.set(storage_.version(), std::nullopt);
    }

    void pop_accept(unsigned const version) override
    {
        value_.fold(version);
    }

    void pop_reject(unsigned const version) override
    {
        value_.drop(version);
    }
};

HYDRO_NAMESPACE_END
