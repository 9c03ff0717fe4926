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
#include <spool/pool/address.hpp>
#include <spool/runtime/program_ids.hpp>

#include <array>

SPOOL_POOL_NAMESPACE_BEGIN

std::string_view seed_prefix(PoolAddress const kind)
{
    switch (kind) {
    case PoolAddress::Pool:
        return "pool";
    case PoolAddress::Stake:
        return "stake";
    case PoolAddress::Mint:
        return "mint";
    case PoolAddress::OnRamp:
        return "onramp";
    case PoolAddress::StakeAuthority:
        return "stake_authority";
    case PoolAddress::MintAuthority:
        return "mint_authority";
    case PoolAddress::MplAuthority:
        return "mpl_authority";
    }
    SPOOL_ABORT("invalid pool address kind");
}

std::pair<Pubkey, uint8_t> find_pool_address_and_bump(
    Pubkey const &program_id, Pubkey const &base, PoolAddress const kind)
{
    std::array<byte_string_view, 2> const seeds{
        to_byte_string_view(seed_prefix(kind)),
        to_byte_string_view(base.bytes)};
    auto const res = try_find_program_address(seeds, program_id);
    SPOOL_ASSERT(res.has_value());
    return res.value();
}

Result<Pubkey> create_pool_address(
    Pubkey const &program_id, Pubkey const &base, PoolAddress const kind,
    uint8_t const bump)
{
    PoolSignerSeeds const signer{base, kind, bump};
    return create_program_address(signer.seeds(), program_id);
}

Pubkey find_pool_address(Pubkey const &program_id, Pubkey const &vote)
{
    return find_pool_address_and_bump(program_id, vote, PoolAddress::Pool)
        .first;
}

Pubkey find_pool_stake_address(Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(program_id, pool, PoolAddress::Stake)
        .first;
}

Pubkey find_pool_mint_address(Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(program_id, pool, PoolAddress::Mint)
        .first;
}

Pubkey find_pool_onramp_address(Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(program_id, pool, PoolAddress::OnRamp)
        .first;
}

Pubkey find_pool_stake_authority_address(
    Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(
               program_id, pool, PoolAddress::StakeAuthority)
        .first;
}

Pubkey find_pool_mint_authority_address(
    Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(
               program_id, pool, PoolAddress::MintAuthority)
        .first;
}

Pubkey find_pool_mpl_authority_address(
    Pubkey const &program_id, Pubkey const &pool)
{
    return find_pool_address_and_bump(
               program_id, pool, PoolAddress::MplAuthority)
        .first;
}

std::pair<Pubkey, std::string> find_default_deposit_account_address_and_seed(
    Pubkey const &pool, Pubkey const &user_wallet)
{
    std::string seed{"svsp"};
    seed += to_string(pool).substr(0, 28);
    auto const address = create_with_seed(user_wallet, seed, STAKE_PROGRAM_ID);
    SPOOL_ASSERT(address.has_value());
    return {address.value(), std::move(seed)};
}

Pubkey find_default_deposit_account_address(
    Pubkey const &pool, Pubkey const &user_wallet)
{
    return find_default_deposit_account_address_and_seed(pool, user_wallet)
        .first;
}

PoolSignerSeeds::PoolSignerSeeds(
    Pubkey const &base, PoolAddress const kind, uint8_t const bump)
    : prefix_{seed_prefix(kind)}
    , base_{base}
    , bump_{bump}
{
}

std::vector<byte_string_view> PoolSignerSeeds::seeds() const
{
    return {
        to_byte_string_view(prefix_),
        to_byte_string_view(base_.bytes),
        byte_string_view{bump_, 1}};
}

SPOOL_POOL_NAMESPACE_END
