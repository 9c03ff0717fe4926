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
#include <spool/native/vote/vote_state.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstdint>
#include <variant>
#include <vector>

SPOOL_VOTE_NAMESPACE_BEGIN

enum class VoteInstructionKind : uint32_t
{
    InitializeAccount = 0,
    Authorize = 1,
};

enum class VoteAuthorize : uint32_t
{
    Voter = 0,
    Withdrawer = 1,
};

struct InitializeAccount
{
    VoteInit init;
};

struct Authorize
{
    Pubkey new_authority;
    VoteAuthorize role;
};

using VoteInstruction = std::variant<InitializeAccount, Authorize>;

Result<VoteInstruction> decode_vote_instruction(byte_string_view);

Instruction initialize_account(Pubkey const &vote, VoteInit const &);
Instruction authorize(
    Pubkey const &vote, Pubkey const &authority, Pubkey const &new_authority,
    VoteAuthorize);

/// System account creation sized for vote state, then InitializeAccount
std::vector<Instruction> create_account(
    Pubkey const &from, Pubkey const &vote, VoteInit const &,
    uint64_t lamports);

SPOOL_VOTE_NAMESPACE_END
