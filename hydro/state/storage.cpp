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

#include <hydro/core/assert.h>
#include <hydro/state/storage.hpp>

#include <algorithm>

HYDRO_NAMESPACE_BEGIN

void Storage::attach(Table &table)
{
    tables_.push_back(&table);
}

void Storage::detach(Table &table)
{
    auto const it = std::find(tables_.begin(), tables_.end(), &table);
    HYDRO_ASSERT(it != tables_.end());
    tables_.erase(it);
}

void Storage::push()
{
    ++version_;
}

void Storage::pop_accept()
{
    HYDRO_ASSERT(version_, "pop without push");

    for (Table *const table : tables_) {
        table->pop_accept(version_);
    }
    --version_;
}

void Storage::pop_reject()
{
    HYDRO_ASSERT(version_, "pop without push");

    for (Table *const table : tables_) {
        table->pop_reject(version_);
    }
    --version_;
}

HYDRO_NAMESPACE_END
