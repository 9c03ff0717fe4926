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
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <optional>
#include <variant>

SPOOL_TOKEN_NAMESPACE_BEGIN

enum class TokenInstructionKind : uint8_t
{
    Transfer = 3,
    Approve = 4,
    MintTo = 7,
    Burn = 8,
    InitializeAccount3 = 18,
    InitializeMint2 = 20,
};

struct InitializeMint2
{
    uint8_t decimals;
    Pubkey mint_authority;
    std::optional<Pubkey> freeze_authority;
};

struct InitializeAccount3
{
    Pubkey owner;
};

struct Transfer
{
    uint64_t amount;
};

struct Approve
{
    uint64_t amount;
};

struct MintTo
{
    uint64_t amount;
};

struct Burn
{
    uint64_t amount;
};

using TokenInstruction = std::variant<
    InitializeMint2, InitializeAccount3, Transfer, Approve, MintTo, Burn>;

Result<TokenInstruction> decode_token_instruction(byte_string_view);

Instruction initialize_mint2(
    Pubkey const &mint, Pubkey const &mint_authority,
    std::optional<Pubkey> const &freeze_authority, uint8_t decimals);
Instruction initialize_account3(
    Pubkey const &account, Pubkey const &mint, Pubkey const &owner);
Instruction transfer(
    Pubkey const &source, Pubkey const &destination, Pubkey const &authority,
    uint64_t amount);
Instruction approve(
    Pubkey const &source, Pubkey const &delegate, Pubkey const &owner,
    uint64_t amount);
Instruction mint_to(
    Pubkey const &mint, Pubkey const &destination, Pubkey const &authority,
    uint64_t amount);
Instruction burn(
    Pubkey const &account, Pubkey const &mint, Pubkey const &authority,
    uint64_t amount);

SPOOL_TOKEN_NAMESPACE_END
