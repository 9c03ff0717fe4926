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
#include <spool/pool/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

SPOOL_POOL_NAMESPACE_BEGIN

enum class SinglePoolInstructionKind : uint8_t
{
    InitializePool = 0,
    ReplenishPool = 1,
    DepositStake = 2,
    WithdrawStake = 3,
    CreateTokenMetadata = 4,
    UpdateTokenMetadata = 5,
    InitializePoolOnRamp = 6,
};

//  0. [] vote account       1. [w] pool            2. [w] pool stake
//  3. [w] pool mint         4. [] stake authority  5. [] mint authority
//  6. [] system program     7. [] token program    8. [] stake program
struct InitializePool
{
};

//  0. [] vote account       1. [] pool             2. [w] pool stake
//  3. [w] pool onramp       4. [] stake authority  5. [] stake program
struct ReplenishPool
{
};

//  0. [] pool               1. [w] pool stake      2. [w] pool mint
//  3. [] stake authority    4. [] mint authority   5. [w] user stake
//  6. [w] user token        7. [w] user lamports   8. [] token program
//  9. [] stake program
struct DepositStake
{
};

//  0. [] pool               1. [w] pool stake      2. [w] pool mint
//  3. [] stake authority    4. [] mint authority   5. [w] user stake
//  6. [w] user token        7. [] token program    8. [] stake program
struct WithdrawStake
{
    Pubkey user_stake_authority;
    uint64_t token_amount;
};

//  0. [w] pool              1. [] pool mint        2. [] mint authority
//  3. [] mpl authority      4. [s, w] payer        5. [w] metadata
//  6. [] metadata program   7. [] system program
struct CreateTokenMetadata
{
};

//  0. [] vote account       1. [] pool             2. [] mpl authority
//  3. [s] vote withdrawer   4. [w] metadata        5. [] metadata program
struct UpdateTokenMetadata
{
    std::string name;
    std::string symbol;
    std::string uri;
};

//  0. [] pool               1. [w] pool onramp     2. [] stake authority
//  3. [] system program     4. [] stake program
struct InitializePoolOnRamp
{
};

using SinglePoolInstruction = std::variant<
    InitializePool, ReplenishPool, DepositStake, WithdrawStake,
    CreateTokenMetadata, UpdateTokenMetadata, InitializePoolOnRamp>;

Result<SinglePoolInstruction> decode_instruction(byte_string_view);
byte_string encode_instruction(SinglePoolInstruction const &);

/// Funds the pool, its stake account and mint from `payer`, initializes
/// the pool, funds and initializes the onramp, and attaches metadata unless
/// skipped
std::vector<Instruction> initialize(
    Pubkey const &program_id, Pubkey const &vote, Pubkey const &payer,
    Rent const &, uint64_t minimum_pool_balance, bool skip_metadata = false);

Instruction initialize_pool(Pubkey const &program_id, Pubkey const &vote);

Instruction replenish_pool(Pubkey const &program_id, Pubkey const &vote);

/// Hands both stake authorities to the pool, then deposits
std::vector<Instruction> deposit(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_token, Pubkey const &user_lamports,
    Pubkey const &user_withdraw_authority);

Instruction deposit_stake(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_token, Pubkey const &user_lamports);

/// Delegates the tokens to the pool mint authority and withdraws. When a
/// payer is given the destination stake account is created first, funded
/// with its rent reserve.
std::vector<Instruction> withdraw(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_stake_authority, Pubkey const &user_token,
    Pubkey const &user_token_authority, uint64_t token_amount,
    std::optional<Pubkey> const &payer = std::nullopt, Rent const & = {});

Instruction withdraw_stake(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &user_stake,
    Pubkey const &user_stake_authority, Pubkey const &user_token,
    uint64_t token_amount);

/// Creates the wallet's default deposit account for the pool of `vote` and
/// delegates `stake_amount` lamports of it to `vote`
std::vector<Instruction> create_and_delegate_user_stake(
    Pubkey const &program_id, Pubkey const &vote, Pubkey const &user_wallet,
    Rent const &, uint64_t stake_amount);

Instruction create_token_metadata(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &payer);

Instruction update_token_metadata(
    Pubkey const &program_id, Pubkey const &vote,
    Pubkey const &authorized_withdrawer, std::string name, std::string symbol,
    std::string uri);

Instruction
initialize_pool_onramp(Pubkey const &program_id, Pubkey const &pool);

/// Funding transfer plus InitializePoolOnRamp, for pools created before
/// the onramp existed
std::vector<Instruction> create_pool_onramp(
    Pubkey const &program_id, Pubkey const &pool, Pubkey const &payer,
    Rent const &);

SPOOL_POOL_NAMESPACE_END
