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
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>

SPOOL_POOL_NAMESPACE_BEGIN

/// Stake program calls made on behalf of one pool. The pool stake account
/// and onramp both name the pool stake authority as staker and withdrawer;
/// every call is signed with its seeds.
class PoolStakeAuthority
{
    InvokeContext &ctx_;
    AccountInfos accounts_;
    Pubkey key_;
    PoolSignerSeeds signer_;

    Result<void> invoke(Instruction const &) const;

public:
    PoolStakeAuthority(
        InvokeContext &, AccountInfos, Pubkey const &pool,
        Pubkey const &stake_authority, uint8_t bump);

    Pubkey const &key() const noexcept
    {
        return key_;
    }

    /// Initializes a stake account with this authority in both roles
    Result<void> initialize(Pubkey const &stake) const;

    Result<void> delegate(Pubkey const &stake, Pubkey const &vote) const;

    Result<void>
    merge(Pubkey const &destination, Pubkey const &source) const;

    Result<void> split(
        Pubkey const &stake, uint64_t lamports,
        Pubkey const &destination) const;

    /// Hands both roles over to `new_authority`, staker first
    Result<void>
    authorize(Pubkey const &stake, Pubkey const &new_authority) const;

    Result<void> withdraw(
        Pubkey const &stake, Pubkey const &to, uint64_t lamports) const;

    Result<void> move_lamports(
        Pubkey const &source, Pubkey const &destination,
        uint64_t lamports) const;
};

/// Asks the stake program, reading its return data
Result<uint64_t> get_minimum_delegation(InvokeContext &, AccountInfos);

SPOOL_POOL_NAMESPACE_END
