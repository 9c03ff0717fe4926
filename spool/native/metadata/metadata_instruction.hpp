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

#include <spool/core/result.hpp>
#include <spool/native/config.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <optional>
#include <variant>

SPOOL_METADATA_NAMESPACE_BEGIN

enum class MetadataInstructionKind : uint8_t
{
    UpdateMetadataAccountV2 = 15,
    CreateMetadataAccountV3 = 33,
};

struct CreateMetadataAccountV3
{
    DataV2 data;
    bool is_mutable;
};

struct UpdateMetadataAccountV2
{
    std::optional<DataV2> data;
    std::optional<Pubkey> update_authority;
    std::optional<bool> primary_sale_happened;
    std::optional<bool> is_mutable;
};

using MetadataInstruction =
    std::variant<CreateMetadataAccountV3, UpdateMetadataAccountV2>;

/// Creators, collection, uses and collection details must be absent
Result<MetadataInstruction> decode_metadata_instruction(byte_string_view);

Instruction create_metadata_accounts_v3(
    Pubkey const &metadata, Pubkey const &mint, Pubkey const &mint_authority,
    Pubkey const &payer, Pubkey const &update_authority, DataV2 const &,
    bool is_mutable);

Instruction update_metadata_accounts_v2(
    Pubkey const &metadata, Pubkey const &update_authority,
    UpdateMetadataAccountV2 const &);

SPOOL_METADATA_NAMESPACE_END
