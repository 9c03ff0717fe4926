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

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <type_traits>

SPOOL_NAMESPACE_BEGIN

// LittleEndian is a strongly typed little endian wrapper. Account layouts are
// packed structs of these so they can be read from and written to account
// data without alignment or byte order concerns.
template <typename T>
    requires(std::unsigned_integral<T>)
struct LittleEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    LittleEndian() = default;

    constexpr LittleEndian(T const x) noexcept
    {
        store(x);
    }

    constexpr bool operator==(LittleEndian<T> const &other) const noexcept
    {
        return std::ranges::equal(bytes, other.bytes);
    }

    [[nodiscard]] constexpr native_type native() const noexcept
    {
        auto const x = std::bit_cast<native_type>(bytes);
        if constexpr (std::endian::native == std::endian::big) {
            return std::byteswap(x);
        }
        return x;
    }

    constexpr LittleEndian<T> &operator=(T const x) noexcept
    {
        store(x);
        return *this;
    }

private:
    constexpr void store(T x) noexcept
    {
        if constexpr (std::endian::native == std::endian::big) {
            x = std::byteswap(x);
        }
        auto const a = std::bit_cast<std::array<unsigned char, sizeof(T)>>(x);
        std::ranges::copy(a, bytes);
    }
};

using u16_le = LittleEndian<uint16_t>;
using u32_le = LittleEndian<uint32_t>;
using u64_le = LittleEndian<uint64_t>;
static_assert(sizeof(u16_le) == sizeof(uint16_t));
static_assert(alignof(u16_le) == 1);
static_assert(sizeof(u32_le) == sizeof(uint32_t));
static_assert(alignof(u32_le) == 1);
static_assert(sizeof(u64_le) == sizeof(uint64_t));
static_assert(alignof(u64_le) == 1);
static_assert(std::is_trivially_copyable_v<u64_le>);

template <typename T>
struct is_little_endian_wrapper : std::false_type
{
};

template <typename U>
struct is_little_endian_wrapper<LittleEndian<U>> : std::true_type
{
};

template <typename T>
concept LittleEndianType = is_little_endian_wrapper<T>::value;

SPOOL_NAMESPACE_END
