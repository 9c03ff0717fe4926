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

#include <spool/core/likely.h>
#include <spool/native/metadata/metadata_error.hpp>
#include <spool/native/metadata/metadata_instruction.hpp>
#include <spool/native/metadata/metadata_program.hpp>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <array>
#include <concepts>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::metadata;

Result<void> create_metadata(
    InvokeContext &ctx, AccountInfos const accounts,
    CreateMetadataAccountV3 const &ix)
{
    BOOST_OUTCOME_TRY(check_account_count(accounts, 6));
    auto const &metadata = accounts[0];
    auto const &mint_info = accounts[1];
    auto const &mint_authority = accounts[2];
    auto const &payer = accounts[3];
    auto const &update_authority = accounts[4];

    constexpr std::string_view prefix{"metadata"};
    std::array<byte_string_view, 3> const seeds{
        to_byte_string_view(prefix),
        to_byte_string_view(METADATA_PROGRAM_ID.bytes),
        to_byte_string_view(mint_info.key().bytes)};
    BOOST_OUTCOME_TRY(
        auto const derived, try_find_program_address(seeds, ctx.program_id()));
    auto const &[address, bump] = derived;
    if (SPOOL_UNLIKELY(address != metadata.key())) {
        return MetadataError::DerivedKeyInvalid;
    }
    if (SPOOL_UNLIKELY(
            !metadata.data_is_empty() ||
            metadata.owner() != SYSTEM_PROGRAM_ID)) {
        return MetadataError::AlreadyInitialized;
    }

    BOOST_OUTCOME_TRY(auto const mint, token::load_mint(mint_info));
    auto const authority = mint.mint_authority.get();
    if (SPOOL_UNLIKELY(
            !authority.has_value() || *authority != mint_authority.key())) {
        return MetadataError::InvalidMintAuthority;
    }
    if (SPOOL_UNLIKELY(!mint_authority.is_signer())) {
        return InstructionError::MissingRequiredSignature;
    }
    BOOST_OUTCOME_TRY(validate_data(ix.data));

    uint8_t const bump_seed[1] = {bump};
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        {seeds[0], seeds[1], seeds[2], byte_string_view{bump_seed, 1}}};

    auto const required = ctx.rent().minimum_balance(METADATA_SIZE);
    if (metadata.lamports() < required) {
        BOOST_OUTCOME_TRY(ctx.invoke(
            system::transfer(
                payer.key(), metadata.key(), required - metadata.lamports()),
            accounts));
    }
    BOOST_OUTCOME_TRY(ctx.invoke_signed(
        system::allocate(metadata.key(), METADATA_SIZE),
        accounts,
        signer_seeds));
    BOOST_OUTCOME_TRY(ctx.invoke_signed(
        system::assign(metadata.key(), METADATA_PROGRAM_ID),
        accounts,
        signer_seeds));

    metadata.data_mut() = encode_metadata(Metadata{
        .update_authority = update_authority.key(),
        .mint = mint_info.key(),
        .data = ix.data,
        .primary_sale_happened = false,
        .is_mutable = ix.is_mutable});
    return outcome::success();
}

Result<void>
update_metadata(AccountInfos const accounts, UpdateMetadataAccountV2 const &ix)
{
    BOOST_OUTCOME_TRY(check_account_count(accounts, 2));
    auto const &metadata_info = accounts[0];
    auto const &update_authority = accounts[1];

    BOOST_OUTCOME_TRY(auto metadata, load_metadata(metadata_info.account()));
    if (SPOOL_UNLIKELY(metadata.update_authority != update_authority.key())) {
        return MetadataError::UpdateAuthorityIncorrect;
    }
    if (SPOOL_UNLIKELY(!update_authority.is_signer())) {
        return InstructionError::MissingRequiredSignature;
    }

    if (ix.data.has_value()) {
        if (SPOOL_UNLIKELY(!metadata.is_mutable)) {
            return MetadataError::DataIsImmutable;
        }
        BOOST_OUTCOME_TRY(validate_data(*ix.data));
        metadata.data = *ix.data;
    }
    if (ix.update_authority.has_value()) {
        metadata.update_authority = *ix.update_authority;
    }
    if (ix.primary_sale_happened.has_value()) {
        // one way: a sale cannot be undone
        if (*ix.primary_sale_happened) {
            metadata.primary_sale_happened = true;
        }
    }
    if (ix.is_mutable.has_value()) {
        if (SPOOL_UNLIKELY(*ix.is_mutable && !metadata.is_mutable)) {
            return MetadataError::DataIsImmutable;
        }
        metadata.is_mutable = *ix.is_mutable;
    }
    metadata_info.data_mut() = encode_metadata(metadata);
    return outcome::success();
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_METADATA_NAMESPACE_BEGIN

Result<void> MetadataProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    BOOST_OUTCOME_TRY(
        auto const instruction, decode_metadata_instruction(data));
    return std::visit(
        [&](auto const &ix) -> Result<void> {
            using T = std::decay_t<decltype(ix)>;
            if constexpr (std::same_as<T, CreateMetadataAccountV3>) {
                return create_metadata(ctx, accounts, ix);
            }
            else {
                static_assert(std::same_as<T, UpdateMetadataAccountV2>);
                return update_metadata(accounts, ix);
            }
        },
        instruction);
}

SPOOL_METADATA_NAMESPACE_END
