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
#include <spool/runtime/program.hpp>
#include <spool/runtime/program_ids.hpp>

SPOOL_METADATA_NAMESPACE_BEGIN

class MetadataProgram final : public Program
{
public:
    Pubkey const &id() const noexcept override
    {
        return METADATA_PROGRAM_ID;
    }

    Result<void> process_instruction(
        InvokeContext &, AccountInfos, byte_string_view data) override;
};

SPOOL_METADATA_NAMESPACE_END
