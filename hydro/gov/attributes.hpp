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

#include <hydro/core/basic_formatter.hpp>
#include <hydro/gov/config.hpp>

#include <quill/bundled/fmt/format.h>

#include <string>

HYDRO_GOV_NAMESPACE_BEGIN

// ", " separated response attribute value
template <class Range>
std::string join_attribute(Range const &values)
{
    std::string res;
    for (auto const &value : values) {
        if (!res.empty()) {
            res += ", ";
        }
        res += fmt::format("{}", value);
    }
    return res;
}

HYDRO_GOV_NAMESPACE_END
