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
#include <spool/pool/error.hpp>
#include <spool/pool/state.hpp>
#include <spool/runtime/codec.hpp>

#include <boost/outcome/try.hpp>

SPOOL_POOL_NAMESPACE_BEGIN

SinglePool SinglePool::derive(
    Pubkey const &program_id, Pubkey const &vote_account_address)
{
    SinglePool pool{};
    pool.vote_account_address = vote_account_address;
    auto const [pool_address, pool_bump] = find_pool_address_and_bump(
        program_id, vote_account_address, PoolAddress::Pool);
    pool.bumps[static_cast<uint8_t>(PoolAddress::Pool)] = pool_bump;
    for (auto const kind :
         {PoolAddress::Stake,
          PoolAddress::Mint,
          PoolAddress::OnRamp,
          PoolAddress::StakeAuthority,
          PoolAddress::MintAuthority,
          PoolAddress::MplAuthority}) {
        pool.bumps[static_cast<uint8_t>(kind)] =
            find_pool_address_and_bump(program_id, pool_address, kind).second;
    }
    return pool;
}

Result<SinglePool>
decode_pool(Pubkey const &program_id, byte_string_view const data)
{
    if (data.size() == LEGACY_POOL_SIZE) {
        BOOST_OUTCOME_TRY(
            auto const record, decode_layout<LegacyPoolRecord>(data));
        if (SPOOL_UNLIKELY(
                record.account_type !=
                static_cast<uint8_t>(SinglePoolAccountType::Pool))) {
            return SinglePoolError::InvalidPoolAccount;
        }
        auto pool = SinglePool::derive(program_id, record.vote_account_address);
        pool.legacy = true;
        return pool;
    }
    if (SPOOL_UNLIKELY(data.size() != POOL_SIZE)) {
        return SinglePoolError::InvalidPoolAccount;
    }
    BOOST_OUTCOME_TRY(auto const record, decode_layout<PoolRecord>(data));
    if (SPOOL_UNLIKELY(
            record.account_type !=
            static_cast<uint8_t>(SinglePoolAccountType::Pool))) {
        return SinglePoolError::InvalidPoolAccount;
    }
    return SinglePool{
        .vote_account_address = record.vote_account_address,
        .bumps =
            {record.pool_bump,
             record.stake_bump,
             record.mint_bump,
             record.onramp_bump,
             record.stake_authority_bump,
             record.mint_authority_bump,
             record.mpl_authority_bump},
        .has_metadata = record.has_metadata != 0,
        .legacy = false};
}

byte_string encode_pool(SinglePool const &pool)
{
    PoolRecord const record{
        .account_type = static_cast<uint8_t>(SinglePoolAccountType::Pool),
        .vote_account_address = pool.vote_account_address,
        .pool_bump = pool.bump(PoolAddress::Pool),
        .stake_bump = pool.bump(PoolAddress::Stake),
        .mint_bump = pool.bump(PoolAddress::Mint),
        .onramp_bump = pool.bump(PoolAddress::OnRamp),
        .stake_authority_bump = pool.bump(PoolAddress::StakeAuthority),
        .mint_authority_bump = pool.bump(PoolAddress::MintAuthority),
        .mpl_authority_bump = pool.bump(PoolAddress::MplAuthority),
        .has_metadata = static_cast<uint8_t>(pool.has_metadata)};
    byte_string data(POOL_SIZE, 0);
    encode_layout(data, record);
    return data;
}

Result<SinglePool>
load_pool(Pubkey const &program_id, AccountInfo const &pool_info)
{
    if (SPOOL_UNLIKELY(
            pool_info.data_is_empty() || pool_info.owner() != program_id)) {
        return SinglePoolError::InvalidPoolAccount;
    }
    auto const pool = decode_pool(program_id, pool_info.data());
    if (SPOOL_UNLIKELY(pool.has_error())) {
        return SinglePoolError::InvalidPoolAccount;
    }
    auto const address = create_pool_address(
        program_id,
        pool.value().vote_account_address,
        PoolAddress::Pool,
        pool.value().bump(PoolAddress::Pool));
    if (SPOOL_UNLIKELY(
            address.has_error() || address.value() != pool_info.key())) {
        return SinglePoolError::InvalidPoolAccount;
    }
    return pool.value();
}

SPOOL_POOL_NAMESPACE_END
