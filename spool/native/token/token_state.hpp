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
#include <spool/core/little_endian.hpp>
#include <spool/core/result.hpp>
#include <spool/native/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/account_info.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

SPOOL_TOKEN_NAMESPACE_BEGIN

// Packed account images, C-style optional fields carry a u32 tag
struct COptionPubkey
{
    u32_le tag;
    Pubkey value;

    static COptionPubkey from(std::optional<Pubkey> const &key)
    {
        COptionPubkey out{};
        if (key.has_value()) {
            out.tag = 1u;
            out.value = *key;
        }
        return out;
    }

    std::optional<Pubkey> get() const
    {
        if (tag.native() == 0) {
            return std::nullopt;
        }
        return value;
    }
};

struct COptionU64
{
    u32_le tag;
    u64_le value;
};

struct Mint
{
    COptionPubkey mint_authority;
    u64_le supply;
    uint8_t decimals;
    uint8_t is_initialized;
    COptionPubkey freeze_authority;
};

enum class AccountState : uint8_t
{
    Uninitialized = 0,
    Initialized = 1,
    Frozen = 2,
};

struct TokenAccount
{
    Pubkey mint;
    Pubkey owner;
    u64_le amount;
    COptionPubkey delegate;
    uint8_t state;
    COptionU64 is_native;
    u64_le delegated_amount;
    COptionPubkey close_authority;

    AccountState account_state() const noexcept
    {
        return static_cast<AccountState>(state);
    }
};

static_assert(sizeof(COptionPubkey) == 36);
static_assert(sizeof(Mint) == 82);
static_assert(alignof(Mint) == 1);
static_assert(sizeof(TokenAccount) == 165);
static_assert(alignof(TokenAccount) == 1);

inline constexpr size_t MINT_SIZE = sizeof(Mint);
inline constexpr size_t TOKEN_ACCOUNT_SIZE = sizeof(TokenAccount);

/// Token-program-owned, correctly sized and initialized
Result<Mint> load_mint(Account const &);
Result<Mint> load_mint(AccountInfo const &);
Result<TokenAccount> load_token_account(Account const &);
Result<TokenAccount> load_token_account(AccountInfo const &);

void store_mint(AccountInfo const &, Mint const &);
void store_token_account(AccountInfo const &, TokenAccount const &);

SPOOL_TOKEN_NAMESPACE_END
