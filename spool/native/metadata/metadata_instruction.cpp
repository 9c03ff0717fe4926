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

#include <spool/core/little_endian.hpp>
#include <spool/native/metadata/metadata_error.hpp>
#include <spool/native/metadata/metadata_instruction.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::metadata;

// borsh Option: a u8 presence tag followed by the value
Result<bool> decode_option_tag(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const tag, decode_fixed<uint8_t>(enc));
    if (SPOOL_UNLIKELY(tag > 1)) {
        return InstructionError::InvalidInstructionData;
    }
    return tag == 1;
}

Result<void> decode_absent(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const present, decode_option_tag(enc));
    if (SPOOL_UNLIKELY(present)) {
        return MetadataError::UnsupportedData;
    }
    return outcome::success();
}

Result<bool> decode_bool(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const value, decode_fixed<uint8_t>(enc));
    if (SPOOL_UNLIKELY(value > 1)) {
        return InstructionError::InvalidInstructionData;
    }
    return value == 1;
}

Result<DataV2> decode_data(byte_string_view &enc)
{
    DataV2 data;
    BOOST_OUTCOME_TRY(data.name, decode_string(enc));
    BOOST_OUTCOME_TRY(data.symbol, decode_string(enc));
    BOOST_OUTCOME_TRY(data.uri, decode_string(enc));
    BOOST_OUTCOME_TRY(auto const fee, decode_fixed<u16_le>(enc));
    data.seller_fee_basis_points = fee.native();
    // creators, collection, uses
    BOOST_OUTCOME_TRY(decode_absent(enc));
    BOOST_OUTCOME_TRY(decode_absent(enc));
    BOOST_OUTCOME_TRY(decode_absent(enc));
    return data;
}

void encode_data(byte_string &out, DataV2 const &data)
{
    encode_string(out, data.name);
    encode_string(out, data.symbol);
    encode_string(out, data.uri);
    encode_fixed(out, u16_le{data.seller_fee_basis_points});
    encode_fixed(out, uint8_t{0});
    encode_fixed(out, uint8_t{0});
    encode_fixed(out, uint8_t{0});
}

template <typename T, typename F>
void encode_option(byte_string &out, std::optional<T> const &value, F &&encode)
{
    encode_fixed(out, static_cast<uint8_t>(value.has_value()));
    if (value.has_value()) {
        encode(*value);
    }
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_METADATA_NAMESPACE_BEGIN

Result<MetadataInstruction> decode_metadata_instruction(byte_string_view enc)
{
    auto decoded = [&]() -> Result<MetadataInstruction> {
        BOOST_OUTCOME_TRY(auto const tag, decode_fixed<uint8_t>(enc));
        switch (static_cast<MetadataInstructionKind>(tag)) {
        case MetadataInstructionKind::CreateMetadataAccountV3: {
            BOOST_OUTCOME_TRY(auto data, decode_data(enc));
            BOOST_OUTCOME_TRY(auto const is_mutable, decode_bool(enc));
            // collection details
            BOOST_OUTCOME_TRY(decode_absent(enc));
            return CreateMetadataAccountV3{std::move(data), is_mutable};
        }
        case MetadataInstructionKind::UpdateMetadataAccountV2: {
            UpdateMetadataAccountV2 update;
            BOOST_OUTCOME_TRY(auto const has_data, decode_option_tag(enc));
            if (has_data) {
                BOOST_OUTCOME_TRY(update.data, decode_data(enc));
            }
            BOOST_OUTCOME_TRY(auto const has_authority, decode_option_tag(enc));
            if (has_authority) {
                BOOST_OUTCOME_TRY(
                    update.update_authority, decode_fixed<Pubkey>(enc));
            }
            BOOST_OUTCOME_TRY(auto const has_sale, decode_option_tag(enc));
            if (has_sale) {
                BOOST_OUTCOME_TRY(
                    update.primary_sale_happened, decode_bool(enc));
            }
            BOOST_OUTCOME_TRY(auto const has_mutable, decode_option_tag(enc));
            if (has_mutable) {
                BOOST_OUTCOME_TRY(update.is_mutable, decode_bool(enc));
            }
            return update;
        }
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (decoded.has_error()) {
        if (decoded.error() == MetadataError::UnsupportedData) {
            return decoded;
        }
        return InstructionError::InvalidInstructionData;
    }
    if (SPOOL_UNLIKELY(decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

Instruction create_metadata_accounts_v3(
    Pubkey const &metadata, Pubkey const &mint, Pubkey const &mint_authority,
    Pubkey const &payer, Pubkey const &update_authority, DataV2 const &data,
    bool const is_mutable)
{
    byte_string out;
    encode_fixed(
        out,
        static_cast<uint8_t>(MetadataInstructionKind::CreateMetadataAccountV3));
    encode_data(out, data);
    encode_fixed(out, static_cast<uint8_t>(is_mutable));
    encode_fixed(out, uint8_t{0});
    return {
        METADATA_PROGRAM_ID,
        {AccountMeta::writable(metadata),
         AccountMeta::readonly(mint),
         AccountMeta::readonly(mint_authority, true),
         AccountMeta::writable(payer, true),
         AccountMeta::readonly(update_authority, true),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID)},
        std::move(out)};
}

Instruction update_metadata_accounts_v2(
    Pubkey const &metadata, Pubkey const &update_authority,
    UpdateMetadataAccountV2 const &update)
{
    byte_string out;
    encode_fixed(
        out,
        static_cast<uint8_t>(MetadataInstructionKind::UpdateMetadataAccountV2));
    encode_option(
        out, update.data, [&](DataV2 const &d) { encode_data(out, d); });
    encode_option(out, update.update_authority, [&](Pubkey const &key) {
        encode_fixed(out, key);
    });
    encode_option(out, update.primary_sale_happened, [&](bool const v) {
        encode_fixed(out, static_cast<uint8_t>(v));
    });
    encode_option(out, update.is_mutable, [&](bool const v) {
        encode_fixed(out, static_cast<uint8_t>(v));
    });
    return {
        METADATA_PROGRAM_ID,
        {AccountMeta::writable(metadata),
         AccountMeta::readonly(update_authority, true)},
        std::move(out)};
}

SPOOL_METADATA_NAMESPACE_END
