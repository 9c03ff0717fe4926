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

#include <spool/core/byte_string.hpp>
#include <spool/core/config.hpp>
#include <spool/runtime/program_ids.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>

SPOOL_NAMESPACE_BEGIN

inline constexpr uint64_t LAMPORTS_PER_SOL = 1'000'000'000;

struct Account
{
    uint64_t lamports{0};
    byte_string data{};
    Pubkey owner{SYSTEM_PROGRAM_ID};
    bool executable{false};

    bool operator==(Account const &) const = default;
};

struct Rent
{
    // storage overhead charged for every account regardless of data size
    static constexpr uint64_t ACCOUNT_STORAGE_OVERHEAD = 128;

    uint64_t lamports_per_byte_year{3480};
    uint64_t exemption_threshold_years{2};

    constexpr uint64_t minimum_balance(size_t const data_len) const noexcept
    {
        return (ACCOUNT_STORAGE_OVERHEAD + data_len) * lamports_per_byte_year *
               exemption_threshold_years;
    }

    constexpr bool
    is_exempt(uint64_t const lamports, size_t const data_len) const noexcept
    {
        return lamports >= minimum_balance(data_len);
    }
};

struct Clock
{
    uint64_t slot{0};
    uint64_t epoch{0};
    int64_t unix_timestamp{0};
};

SPOOL_NAMESPACE_END
