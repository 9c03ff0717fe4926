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

#include <spool/core/config.hpp>
#include <spool/core/result.hpp>
#include <spool/native/config.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

SPOOL_SYSTEM_NAMESPACE_BEGIN

inline constexpr uint64_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

enum class SystemInstructionKind : uint32_t
{
    CreateAccount = 0,
    Assign = 1,
    Transfer = 2,
    CreateAccountWithSeed = 3,
    Allocate = 8,
};

struct CreateAccount
{
    uint64_t lamports;
    uint64_t space;
    Pubkey owner;
};

struct Assign
{
    Pubkey owner;
};

struct Transfer
{
    uint64_t lamports;
};

struct CreateAccountWithSeed
{
    Pubkey base;
    std::string seed;
    uint64_t lamports;
    uint64_t space;
    Pubkey owner;
};

struct Allocate
{
    uint64_t space;
};

using SystemInstruction = std::variant<
    CreateAccount, Assign, Transfer, CreateAccountWithSeed, Allocate>;

Result<SystemInstruction> decode_system_instruction(byte_string_view);

Instruction create_account(
    Pubkey const &from, Pubkey const &to, uint64_t lamports, uint64_t space,
    Pubkey const &owner);
Instruction assign(Pubkey const &account, Pubkey const &owner);
Instruction transfer(Pubkey const &from, Pubkey const &to, uint64_t lamports);
Instruction create_account_with_seed(
    Pubkey const &from, Pubkey const &to, Pubkey const &base,
    std::string_view seed, uint64_t lamports, uint64_t space,
    Pubkey const &owner);
Instruction allocate(Pubkey const &account, uint64_t space);

SPOOL_SYSTEM_NAMESPACE_END
