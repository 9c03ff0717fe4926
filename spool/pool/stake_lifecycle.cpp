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
#include <spool/core/little_endian.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/pool/stake_lifecycle.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

#include <vector>

SPOOL_POOL_NAMESPACE_BEGIN

PoolStakeAuthority::PoolStakeAuthority(
    InvokeContext &ctx, AccountInfos const accounts, Pubkey const &pool,
    Pubkey const &stake_authority, uint8_t const bump)
    : ctx_{ctx}
    , accounts_{accounts}
    , key_{stake_authority}
    , signer_{pool, PoolAddress::StakeAuthority, bump}
{
}

Result<void> PoolStakeAuthority::invoke(Instruction const &instruction) const
{
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        signer_.seeds()};
    return ctx_.invoke_signed(instruction, accounts_, signer_seeds);
}

Result<void> PoolStakeAuthority::initialize(Pubkey const &stake) const
{
    return ctx_.invoke(
        stake::initialize(stake, stake::Authorized::both(key_)), accounts_);
}

Result<void>
PoolStakeAuthority::delegate(Pubkey const &stake, Pubkey const &vote) const
{
    return invoke(stake::delegate_stake(stake, key_, vote));
}

Result<void> PoolStakeAuthority::merge(
    Pubkey const &destination, Pubkey const &source) const
{
    return invoke(stake::merge(destination, source, key_));
}

Result<void> PoolStakeAuthority::split(
    Pubkey const &stake, uint64_t const lamports,
    Pubkey const &destination) const
{
    return invoke(stake::split(stake, key_, lamports, destination));
}

Result<void> PoolStakeAuthority::authorize(
    Pubkey const &stake, Pubkey const &new_authority) const
{
    BOOST_OUTCOME_TRY(invoke(stake::authorize(
        stake, key_, new_authority, stake::StakeAuthorize::Staker)));
    return invoke(stake::authorize(
        stake, key_, new_authority, stake::StakeAuthorize::Withdrawer));
}

Result<void> PoolStakeAuthority::withdraw(
    Pubkey const &stake, Pubkey const &to, uint64_t const lamports) const
{
    return invoke(stake::withdraw(stake, key_, to, lamports));
}

Result<void> PoolStakeAuthority::move_lamports(
    Pubkey const &source, Pubkey const &destination,
    uint64_t const lamports) const
{
    return invoke(stake::move_lamports(source, destination, key_, lamports));
}

Result<uint64_t>
get_minimum_delegation(InvokeContext &ctx, AccountInfos const accounts)
{
    BOOST_OUTCOME_TRY(ctx.invoke(stake::get_minimum_delegation(), accounts));
    auto const &return_data = ctx.return_data();
    if (SPOOL_UNLIKELY(
            !return_data.has_value() ||
            return_data->program_id != STAKE_PROGRAM_ID)) {
        return InstructionError::InvalidInstructionData;
    }
    byte_string_view data{return_data->data};
    BOOST_OUTCOME_TRY(auto const minimum, decode_fixed<u64_le>(data));
    return minimum.native();
}

SPOOL_POOL_NAMESPACE_END
