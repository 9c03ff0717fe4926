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

#include <spool/native/config.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/program_ids.hpp>

#include <cstdint>

SPOOL_TOKEN_NAMESPACE_BEGIN

enum class AssociatedTokenInstructionKind : uint8_t
{
    Create = 0,
    CreateIdempotent = 1,
};

/// Program derived address of ["wallet", token program, mint]
Pubkey get_associated_token_address(Pubkey const &wallet, Pubkey const &mint);

Instruction create_associated_token_account(
    Pubkey const &payer, Pubkey const &wallet, Pubkey const &mint);
Instruction create_associated_token_account_idempotent(
    Pubkey const &payer, Pubkey const &wallet, Pubkey const &mint);

class AssociatedTokenProgram final : public Program
{
public:
    Pubkey const &id() const noexcept override
    {
        return ASSOCIATED_TOKEN_PROGRAM_ID;
    }

    Result<void> process_instruction(
        InvokeContext &, AccountInfos, byte_string_view data) override;
};

SPOOL_TOKEN_NAMESPACE_END
