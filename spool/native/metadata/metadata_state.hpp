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
#include <spool/core/result.hpp>
#include <spool/native/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

SPOOL_METADATA_NAMESPACE_BEGIN

inline constexpr size_t MAX_NAME_LENGTH = 32;
inline constexpr size_t MAX_SYMBOL_LENGTH = 10;
inline constexpr size_t MAX_URI_LENGTH = 200;

inline constexpr uint8_t METADATA_V1_KEY = 4;

// key, update authority, mint, three padded strings, fee, two flags
inline constexpr size_t METADATA_SIZE = 1 + 32 + 32 + (4 + MAX_NAME_LENGTH) +
                                        (4 + MAX_SYMBOL_LENGTH) +
                                        (4 + MAX_URI_LENGTH) + 2 + 1 + 1;

struct DataV2
{
    std::string name;
    std::string symbol;
    std::string uri;
    uint16_t seller_fee_basis_points{0};

    bool operator==(DataV2 const &) const = default;
};

struct Metadata
{
    Pubkey update_authority;
    Pubkey mint;
    DataV2 data;
    bool primary_sale_happened{false};
    bool is_mutable{true};
};

/// ["metadata", metadata program, mint] under the metadata program
Pubkey find_metadata_address(Pubkey const &mint);

Result<void> validate_data(DataV2 const &);

Result<Metadata> decode_metadata(byte_string_view);
byte_string encode_metadata(Metadata const &);

/// Metadata-program-owned and decodable
Result<Metadata> load_metadata(Account const &);

SPOOL_METADATA_NAMESPACE_END
