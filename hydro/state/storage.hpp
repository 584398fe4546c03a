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

#include <vector>

HYDRO_NAMESPACE_BEGIN

/// A versioned table owned by a Storage. Every write made while a version is
/// open must be folded into the enclosing version or discarded when the
/// Storage pops it.
class Table
{
public:
    virtual ~Table() = default;

    virtual void pop_accept(unsigned version) = 0;
    virtual void pop_reject(unsigned version) = 0;
};

/// Owns the transaction version counter of all attached tables. A
/// transaction is `push()`ed before it runs and either `pop_accept()`ed or
/// `pop_reject()`ed once it completes. Version 0 holds committed state.
class Storage
{
    unsigned version_{0};
    std::vector<Table *> tables_{};

public:
    Storage() = default;
    Storage(Storage const &) = delete;
    Storage &operator=(Storage const &) = delete;

    unsigned version() const noexcept
    {
        return version_;
    }

    void attach(Table &);
    void detach(Table &);

    void push();
    void pop_accept();
    void pop_reject();
};

HYDRO_NAMESPACE_END
