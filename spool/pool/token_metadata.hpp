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
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/pool/config.hpp>
#include <spool/pool/state.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <string>

SPOOL_POOL_NAMESPACE_BEGIN

/// "SPL Single Pool " and the first 15 characters of the base58 vote account
std::string default_token_name(Pubkey const &vote);

/// "st" and the first 7 characters of the base58 vote account
std::string default_token_symbol(Pubkey const &vote);

struct PoolMetadataAccounts
{
    Pubkey const &pool;
    Pubkey const &mint;
    Pubkey const &mint_authority;
    Pubkey const &mpl_authority;
    Pubkey const &metadata;
};

/// Creates the mint's metadata with the default name and symbol. The mint
/// authority signs as mint authority, the mpl authority becomes the update
/// authority and `payer` funds the account.
Result<void> create_pool_metadata(
    InvokeContext &, AccountInfos, SinglePool const &,
    PoolMetadataAccounts const &, Pubkey const &payer);

/// Replaces name, symbol and uri, signed by the mpl authority
Result<void> update_pool_metadata(
    InvokeContext &, AccountInfos, SinglePool const &, Pubkey const &pool,
    Pubkey const &metadata, Pubkey const &mpl_authority,
    metadata::DataV2 const &);

SPOOL_POOL_NAMESPACE_END
