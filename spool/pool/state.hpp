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
#include <spool/pool/address.hpp>
#include <spool/pool/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/account_info.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>

SPOOL_POOL_NAMESPACE_BEGIN

enum class SinglePoolAccountType : uint8_t
{
    Uninitialized = 0,
    Pool = 1,
};

// Current on-chain image: type, vote account, the bump seed of every pool
// address and the metadata flag
struct PoolRecord
{
    uint8_t account_type;
    Pubkey vote_account_address;
    uint8_t pool_bump;
    uint8_t stake_bump;
    uint8_t mint_bump;
    uint8_t onramp_bump;
    uint8_t stake_authority_bump;
    uint8_t mint_authority_bump;
    uint8_t mpl_authority_bump;
    uint8_t has_metadata;
};

// Image written before bumps were stored
struct LegacyPoolRecord
{
    uint8_t account_type;
    Pubkey vote_account_address;
};

static_assert(sizeof(PoolRecord) == 41);
static_assert(alignof(PoolRecord) == 1);
static_assert(sizeof(LegacyPoolRecord) == 33);
static_assert(alignof(LegacyPoolRecord) == 1);

inline constexpr size_t POOL_SIZE = sizeof(PoolRecord);
inline constexpr size_t LEGACY_POOL_SIZE = sizeof(LegacyPoolRecord);

struct SinglePool
{
    Pubkey vote_account_address;
    uint8_t bumps[7];
    bool has_metadata;
    bool legacy;

    uint8_t bump(PoolAddress const kind) const noexcept
    {
        return bumps[static_cast<uint8_t>(kind)];
    }

    /// Derives every bump from the vote account and the pool program
    static SinglePool
    derive(Pubkey const &program_id, Pubkey const &vote_account_address);
};

/// Either layout, distinguished by size. A legacy record has its bumps
/// derived again.
Result<SinglePool>
decode_pool(Pubkey const &program_id, byte_string_view data);

byte_string encode_pool(SinglePool const &);

/// Owned by the pool program, well typed, and at the address its vote
/// account derives
Result<SinglePool>
load_pool(Pubkey const &program_id, AccountInfo const &pool_info);

SPOOL_POOL_NAMESPACE_END
