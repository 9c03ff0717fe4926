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
#include <spool/pool/config.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

SPOOL_POOL_NAMESPACE_BEGIN

// Every pool account is a program derived address: the pool from its vote
// account, the rest from the pool
enum class PoolAddress : uint8_t
{
    Pool,
    Stake,
    Mint,
    OnRamp,
    StakeAuthority,
    MintAuthority,
    MplAuthority,
};

std::string_view seed_prefix(PoolAddress);

/// `base` is the vote account for `PoolAddress::Pool`, the pool otherwise
std::pair<Pubkey, uint8_t> find_pool_address_and_bump(
    Pubkey const &program_id, Pubkey const &base, PoolAddress);

/// Derivation with a known bump, fails if the bump yields an on-curve point
Result<Pubkey> create_pool_address(
    Pubkey const &program_id, Pubkey const &base, PoolAddress, uint8_t bump);

Pubkey find_pool_address(Pubkey const &program_id, Pubkey const &vote);
Pubkey find_pool_stake_address(Pubkey const &program_id, Pubkey const &pool);
Pubkey find_pool_mint_address(Pubkey const &program_id, Pubkey const &pool);
Pubkey find_pool_onramp_address(Pubkey const &program_id, Pubkey const &pool);
Pubkey find_pool_stake_authority_address(
    Pubkey const &program_id, Pubkey const &pool);
Pubkey find_pool_mint_authority_address(
    Pubkey const &program_id, Pubkey const &pool);
Pubkey find_pool_mpl_authority_address(
    Pubkey const &program_id, Pubkey const &pool);

/// Stake account created with seed "svsp" + the first 28 characters of the
/// base58 pool address, based on the user wallet
std::pair<Pubkey, std::string>
find_default_deposit_account_address_and_seed(
    Pubkey const &pool, Pubkey const &user_wallet);
Pubkey find_default_deposit_account_address(
    Pubkey const &pool, Pubkey const &user_wallet);

/// Signer seeds of a pool address. The views returned by `seeds` point into
/// this object.
class PoolSignerSeeds
{
    std::string_view prefix_;
    Pubkey base_;
    uint8_t bump_[1];

public:
    PoolSignerSeeds(Pubkey const &base, PoolAddress, uint8_t bump);

    std::vector<byte_string_view> seeds() const;
};

SPOOL_POOL_NAMESPACE_END
