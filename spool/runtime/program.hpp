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

#include <spool/core/byte_string.hpp>
#include <spool/core/config.hpp>
#include <spool/core/likely.h>
#include <spool/core/result.hpp>
#include <spool/runtime/account_info.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <unordered_map>

SPOOL_NAMESPACE_BEGIN

class InvokeContext;

using AccountInfos = std::span<AccountInfo const>;

class Program
{
public:
    virtual ~Program() = default;

    virtual Pubkey const &id() const noexcept = 0;

    virtual Result<void> process_instruction(
        InvokeContext &, AccountInfos, byte_string_view data) = 0;
};

using ProgramMap = std::unordered_map<Pubkey, std::unique_ptr<Program>>;

inline Result<void>
check_account_count(AccountInfos const accounts, size_t const expected)
{
    if (SPOOL_UNLIKELY(accounts.size() < expected)) {
        return InstructionError::NotEnoughAccountKeys;
    }
    return outcome::success();
}

SPOOL_NAMESPACE_END
