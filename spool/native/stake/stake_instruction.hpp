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
#include <spool/native/config.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

SPOOL_STAKE_NAMESPACE_BEGIN

enum class StakeInstructionKind : uint32_t
{
    Initialize = 0,
    Authorize = 1,
    DelegateStake = 2,
    Split = 3,
    Withdraw = 4,
    Deactivate = 5,
    Merge = 7,
    GetMinimumDelegation = 13,
    MoveLamports = 17,
};

struct Initialize
{
    Authorized authorized;
    Lockup lockup;
};

struct Authorize
{
    Pubkey new_authority;
    StakeAuthorize role;
};

struct DelegateStake
{
};

struct Split
{
    uint64_t lamports;
};

struct Withdraw
{
    uint64_t lamports;
};

struct Deactivate
{
};

struct Merge
{
};

struct GetMinimumDelegation
{
};

struct MoveLamports
{
    uint64_t lamports;
};

using StakeInstruction = std::variant<
    Initialize, Authorize, DelegateStake, Split, Withdraw, Deactivate, Merge,
    GetMinimumDelegation, MoveLamports>;

Result<StakeInstruction> decode_stake_instruction(byte_string_view);

Instruction initialize(
    Pubkey const &stake, Authorized const &, Lockup const & = {});
Instruction authorize(
    Pubkey const &stake, Pubkey const &authority, Pubkey const &new_authority,
    StakeAuthorize, std::optional<Pubkey> const &custodian = std::nullopt);
Instruction
delegate_stake(Pubkey const &stake, Pubkey const &staker, Pubkey const &vote);
Instruction split(
    Pubkey const &stake, Pubkey const &staker, uint64_t lamports,
    Pubkey const &split_stake);
Instruction withdraw(
    Pubkey const &stake, Pubkey const &withdrawer, Pubkey const &to,
    uint64_t lamports, std::optional<Pubkey> const &custodian = std::nullopt);
Instruction deactivate_stake(Pubkey const &stake, Pubkey const &staker);
Instruction merge(
    Pubkey const &destination, Pubkey const &source, Pubkey const &staker);
Instruction get_minimum_delegation();
Instruction move_lamports(
    Pubkey const &source, Pubkey const &destination, Pubkey const &staker,
    uint64_t lamports);

/// System account creation sized for stake state, then Initialize
std::vector<Instruction> create_account(
    Pubkey const &from, Pubkey const &stake, Authorized const &,
    Lockup const &, uint64_t lamports);
std::vector<Instruction> create_account_with_seed(
    Pubkey const &from, Pubkey const &stake, Pubkey const &base,
    std::string_view seed, Authorized const &, Lockup const &,
    uint64_t lamports);

SPOOL_STAKE_NAMESPACE_END
