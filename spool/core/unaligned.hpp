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

#include <spool/core/config.hpp>

#include <cstring>
#include <type_traits>

SPOOL_NAMESPACE_BEGIN

template <class T>
    requires std::is_trivially_copyable_v<T>
T unaligned_load(unsigned char const *const buf)
{
    T value;
    std::memcpy(&value, buf, sizeof(T));
    return value;
}

template <class T>
    requires std::is_trivially_copyable_v<T>
void unaligned_store(unsigned char *const buf, T const &value)
{
    std::memcpy(buf, &value, sizeof(T));
}

SPOOL_NAMESPACE_END
