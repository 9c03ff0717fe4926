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
#include <spool/pool/address.hpp>
#include <spool/pool/config.hpp>
#include <spool/runtime/account_info.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>

SPOOL_POOL_NAMESPACE_BEGIN

inline constexpr uint8_t POOL_MINT_DECIMALS = 9;

/// Token program calls made by the pool mint authority, which is the only
/// authority of the pool mint and the delegate of every withdrawal
class PoolMintAuthority
{
    InvokeContext &ctx_;
    AccountInfos accounts_;
    Pubkey key_;
    PoolSignerSeeds signer_;

    Result<void> invoke(Instruction const &) const;

public:
    PoolMintAuthority(
        InvokeContext &, AccountInfos, Pubkey const &pool,
        Pubkey const &mint_authority, uint8_t bump);

    Pubkey const &key() const noexcept
    {
        return key_;
    }

    /// Initializes `mint` with no freeze authority
    Result<void> initialize_mint(Pubkey const &mint) const;

    Result<void> mint_to(
        Pubkey const &mint, Pubkey const &destination,
        uint64_t amount) const;

    /// Burns as the account's approved delegate
    Result<void>
    burn(Pubkey const &account, Pubkey const &mint, uint64_t amount) const;
};

Result<uint64_t> token_supply(AccountInfo const &mint);

SPOOL_POOL_NAMESPACE_END
