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

#include <spool/core/assert.h>
#include <spool/core/likely.h>
#include <spool/core/little_endian.hpp>
#include <spool/native/metadata/metadata_error.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

#include <array>
#include <string_view>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view METADATA_PREFIX{"metadata"};

// strings are written with their real length and zero padded to capacity
void encode_padded(
    byte_string &out, std::string_view const value, size_t const capacity)
{
    SPOOL_ASSERT(value.size() <= capacity);
    encode_string(out, value);
    out.append(capacity - value.size(), 0);
}

Result<std::string>
decode_padded(byte_string_view &enc, size_t const capacity)
{
    auto const before = enc.size();
    BOOST_OUTCOME_TRY(auto value, decode_string(enc));
    auto const consumed = before - enc.size() - 4;
    if (SPOOL_UNLIKELY(
            consumed > capacity || enc.size() < capacity - consumed)) {
        return InstructionError::InvalidAccountData;
    }
    enc.remove_prefix(capacity - consumed);
    return value;
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_METADATA_NAMESPACE_BEGIN

Pubkey find_metadata_address(Pubkey const &mint)
{
    std::array<byte_string_view, 3> const seeds{
        to_byte_string_view(METADATA_PREFIX),
        to_byte_string_view(METADATA_PROGRAM_ID.bytes),
        to_byte_string_view(mint.bytes)};
    auto const address = try_find_program_address(seeds, METADATA_PROGRAM_ID);
    SPOOL_ASSERT(address.has_value());
    return address.value().first;
}

Result<void> validate_data(DataV2 const &data)
{
    if (SPOOL_UNLIKELY(data.name.size() > MAX_NAME_LENGTH)) {
        return MetadataError::NameTooLong;
    }
    if (SPOOL_UNLIKELY(data.symbol.size() > MAX_SYMBOL_LENGTH)) {
        return MetadataError::SymbolTooLong;
    }
    if (SPOOL_UNLIKELY(data.uri.size() > MAX_URI_LENGTH)) {
        return MetadataError::UriTooLong;
    }
    return outcome::success();
}

byte_string encode_metadata(Metadata const &metadata)
{
    byte_string out;
    out.reserve(METADATA_SIZE);
    encode_fixed(out, METADATA_V1_KEY);
    encode_fixed(out, metadata.update_authority);
    encode_fixed(out, metadata.mint);
    encode_padded(out, metadata.data.name, MAX_NAME_LENGTH);
    encode_padded(out, metadata.data.symbol, MAX_SYMBOL_LENGTH);
    encode_padded(out, metadata.data.uri, MAX_URI_LENGTH);
    encode_fixed(out, u16_le{metadata.data.seller_fee_basis_points});
    encode_fixed(out, static_cast<uint8_t>(metadata.primary_sale_happened));
    encode_fixed(out, static_cast<uint8_t>(metadata.is_mutable));
    SPOOL_ASSERT(out.size() == METADATA_SIZE);
    return out;
}

Result<Metadata> decode_metadata(byte_string_view enc)
{
    if (SPOOL_UNLIKELY(enc.size() != METADATA_SIZE)) {
        return InstructionError::InvalidAccountData;
    }
    BOOST_OUTCOME_TRY(auto const key, decode_fixed<uint8_t>(enc));
    if (SPOOL_UNLIKELY(key != METADATA_V1_KEY)) {
        return MetadataError::InvalidMetadataKey;
    }
    Metadata metadata;
    BOOST_OUTCOME_TRY(metadata.update_authority, decode_fixed<Pubkey>(enc));
    BOOST_OUTCOME_TRY(metadata.mint, decode_fixed<Pubkey>(enc));
    BOOST_OUTCOME_TRY(metadata.data.name, decode_padded(enc, MAX_NAME_LENGTH));
    BOOST_OUTCOME_TRY(
        metadata.data.symbol, decode_padded(enc, MAX_SYMBOL_LENGTH));
    BOOST_OUTCOME_TRY(metadata.data.uri, decode_padded(enc, MAX_URI_LENGTH));
    BOOST_OUTCOME_TRY(auto const fee, decode_fixed<u16_le>(enc));
    BOOST_OUTCOME_TRY(auto const primary_sale, decode_fixed<uint8_t>(enc));
    BOOST_OUTCOME_TRY(auto const is_mutable, decode_fixed<uint8_t>(enc));
    metadata.data.seller_fee_basis_points = fee.native();
    metadata.primary_sale_happened = primary_sale != 0;
    metadata.is_mutable = is_mutable != 0;
    return metadata;
}

Result<Metadata> load_metadata(Account const &account)
{
    if (SPOOL_UNLIKELY(account.owner != METADATA_PROGRAM_ID)) {
        return InstructionError::InvalidAccountOwner;
    }
    return decode_metadata(account.data);
}

SPOOL_METADATA_NAMESPACE_END
