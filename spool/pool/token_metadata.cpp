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

#include <spool/native/metadata/metadata_instruction.hpp>
#include <spool/pool/address.hpp>
#include <spool/pool/token_metadata.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <cstddef>
#include <optional>
#include <vector>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

std::string vote_prefix(Pubkey const &vote, size_t const length)
{
    return to_string(vote).substr(0, length);
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_POOL_NAMESPACE_BEGIN

std::string default_token_name(Pubkey const &vote)
{
    return "SPL Single Pool " + vote_prefix(vote, 15);
}

std::string default_token_symbol(Pubkey const &vote)
{
    return "st" + vote_prefix(vote, 7);
}

Result<void> create_pool_metadata(
    InvokeContext &ctx, AccountInfos const accounts, SinglePool const &pool,
    PoolMetadataAccounts const &keys, Pubkey const &payer)
{
    metadata::DataV2 const data{
        .name = default_token_name(pool.vote_account_address),
        .symbol = default_token_symbol(pool.vote_account_address),
        .uri = {},
        .seller_fee_basis_points = 0};

    PoolSignerSeeds const mint_authority{
        keys.pool,
        PoolAddress::MintAuthority,
        pool.bump(PoolAddress::MintAuthority)};
    PoolSignerSeeds const mpl_authority{
        keys.pool,
        PoolAddress::MplAuthority,
        pool.bump(PoolAddress::MplAuthority)};
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        mint_authority.seeds(), mpl_authority.seeds()};

    return ctx.invoke_signed(
        metadata::create_metadata_accounts_v3(
            keys.metadata,
            keys.mint,
            keys.mint_authority,
            payer,
            keys.mpl_authority,
            data,
            true),
        accounts,
        signer_seeds);
}

Result<void> update_pool_metadata(
    InvokeContext &ctx, AccountInfos const accounts, SinglePool const &pool,
    Pubkey const &pool_key, Pubkey const &metadata_key,
    Pubkey const &mpl_authority, metadata::DataV2 const &data)
{
    PoolSignerSeeds const signer{
        pool_key,
        PoolAddress::MplAuthority,
        pool.bump(PoolAddress::MplAuthority)};
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        signer.seeds()};

    return ctx.invoke_signed(
        metadata::update_metadata_accounts_v2(
            metadata_key,
            mpl_authority,
            metadata::UpdateMetadataAccountV2{
                .data = data,
                .update_authority = std::nullopt,
                .primary_sale_happened = std::nullopt,
                .is_mutable = std::nullopt}),
        accounts,
        signer_seeds);
}

SPOOL_POOL_NAMESPACE_END
