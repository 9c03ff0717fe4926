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
#include <spool/core/result.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/ledger.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

SPOOL_NAMESPACE_BEGIN

struct ReturnData
{
    Pubkey program_id;
    byte_string data;
};

/// Executes one top-level instruction and the cross-program invocations it
/// makes. Every frame is checked when it returns, and before it calls out:
/// lamports are conserved, read-only and executable accounts are untouched,
/// only the owning program debits an account or changes its data, and only
/// the owning program reassigns an account whose data is zeroed.
class InvokeContext
{
    struct Frame
    {
        Pubkey program_id;
        std::vector<AccountInfo> accounts;
        std::unordered_map<Pubkey, Account> pre;
    };

    Ledger &ledger_;
    ProgramMap const &programs_;
    Clock const &clock_;
    Rent const &rent_;
    size_t max_invoke_depth_;
    std::vector<Frame> frames_;
    std::optional<ReturnData> return_data_;

    Result<void> execute(
        Instruction const &,
        std::vector<std::pair<bool, bool>> const &privileges);
    Result<void> verify(Frame const &) const;
    void refresh(Frame &);

public:
    InvokeContext(
        Ledger &, ProgramMap const &, Clock const &, Rent const &,
        size_t max_invoke_depth);

    Clock const &clock() const noexcept
    {
        return clock_;
    }

    Rent const &rent() const noexcept
    {
        return rent_;
    }

    /// Program id of the innermost executing frame
    Pubkey const &program_id() const;

    size_t depth() const noexcept
    {
        return frames_.size();
    }

    Result<void> process_instruction(
        Instruction const &, std::span<Pubkey const> signers);

    Result<void> invoke(Instruction const &, AccountInfos);

    /// Each entry of `signer_seeds` derives an address of the calling
    /// program, which then signs the inner instruction
    Result<void> invoke_signed(
        Instruction const &, AccountInfos,
        std::span<std::vector<byte_string_view> const> signer_seeds);

    void set_return_data(byte_string_view);

    std::optional<ReturnData> const &return_data() const noexcept
    {
        return return_data_;
    }
};

SPOOL_NAMESPACE_END
