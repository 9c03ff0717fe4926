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

#include <spool/native/token/token_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/pool/token_supply.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <optional>
#include <vector>

SPOOL_POOL_NAMESPACE_BEGIN

PoolMintAuthority::PoolMintAuthority(
    InvokeContext &ctx, AccountInfos const accounts, Pubkey const &pool,
    Pubkey const &mint_authority, uint8_t const bump)
    : ctx_{ctx}
    , accounts_{accounts}
    , key_{mint_authority}
    , signer_{pool, PoolAddress::MintAuthority, bump}
{
}

Result<void> PoolMintAuthority::invoke(Instruction const &instruction) const
{
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        signer_.seeds()};
    return ctx_.invoke_signed(instruction, accounts_, signer_seeds);
}

Result<void> PoolMintAuthority::initialize_mint(Pubkey const &mint) const
{
    return ctx_.invoke(
        token::initialize_mint2(mint, key_, std::nullopt, POOL_MINT_DECIMALS),
        accounts_);
}

Result<void> PoolMintAuthority::mint_to(
    Pubkey const &mint, Pubkey const &destination,
    uint64_t const amount) const
{
    return invoke(token::mint_to(mint, destination, key_, amount));
}

Result<void> PoolMintAuthority::burn(
    Pubkey const &account, Pubkey const &mint, uint64_t const amount) const
{
    return invoke(token::burn(account, mint, key_, amount));
}

Result<uint64_t> token_supply(AccountInfo const &mint)
{
    BOOST_OUTCOME_TRY(auto const state, token::load_mint(mint));
    return state.supply.native();
}

SPOOL_POOL_NAMESPACE_END
