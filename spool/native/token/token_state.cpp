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
#include <spool/native/token/token_error.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

SPOOL_TOKEN_NAMESPACE_BEGIN

Result<Mint> load_mint(Account const &account)
{
    if (SPOOL_UNLIKELY(account.owner != TOKEN_PROGRAM_ID)) {
        return InstructionError::IncorrectProgramId;
    }
    if (SPOOL_UNLIKELY(account.data.size() != MINT_SIZE)) {
        return TokenError::InvalidMint;
    }
    auto const mint = decode_layout<Mint>(account.data);
    if (SPOOL_UNLIKELY(mint.has_error() || mint.value().is_initialized == 0)) {
        return TokenError::UninitializedState;
    }
    return mint.value();
}

Result<Mint> load_mint(AccountInfo const &info)
{
    return load_mint(info.account());
}

Result<TokenAccount> load_token_account(Account const &account)
{
    if (SPOOL_UNLIKELY(account.owner != TOKEN_PROGRAM_ID)) {
        return InstructionError::IncorrectProgramId;
    }
    if (SPOOL_UNLIKELY(account.data.size() != TOKEN_ACCOUNT_SIZE)) {
        return InstructionError::InvalidAccountData;
    }
    auto const token_account = decode_layout<TokenAccount>(account.data);
    if (SPOOL_UNLIKELY(
            token_account.has_error() ||
            token_account.value().account_state() ==
                AccountState::Uninitialized)) {
        return TokenError::UninitializedState;
    }
    return token_account.value();
}

Result<TokenAccount> load_token_account(AccountInfo const &info)
{
    return load_token_account(info.account());
}

void store_mint(AccountInfo const &info, Mint const &mint)
{
    encode_layout(info.data_mut(), mint);
}

void store_token_account(
    AccountInfo const &info, TokenAccount const &token_account)
{
    encode_layout(info.data_mut(), token_account);
}

SPOOL_TOKEN_NAMESPACE_END
