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
#include <spool/runtime/pubkey.hpp>

#include <vector>

SPOOL_NAMESPACE_BEGIN

struct AccountMeta
{
    Pubkey pubkey;
    bool is_signer;
    bool is_writable;

    static AccountMeta writable(Pubkey const &key, bool const signer = false)
    {
        return {key, signer, true};
    }

    static AccountMeta readonly(Pubkey const &key, bool const signer = false)
    {
        return {key, signer, false};
    }

    bool operator==(AccountMeta const &) const = default;
};

struct Instruction
{
    Pubkey program_id;
    std::vector<AccountMeta> accounts;
    byte_string data;

    bool operator==(Instruction const &) const = default;
};

SPOOL_NAMESPACE_END
