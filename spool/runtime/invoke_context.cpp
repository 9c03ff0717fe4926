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

#include <spool/core/assert.h>
#include <spool/core/int.hpp>
#include <spool/core/likely.h>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

bool is_zeroed(byte_string_view const data)
{
    return std::ranges::all_of(data, [](auto const b) { return b == 0; });
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_NAMESPACE_BEGIN

InvokeContext::InvokeContext(
    Ledger &ledger, ProgramMap const &programs, Clock const &clock,
    Rent const &rent, size_t const max_invoke_depth)
    : ledger_{ledger}
    , programs_{programs}
    , clock_{clock}
    , rent_{rent}
    , max_invoke_depth_{max_invoke_depth}
{
    frames_.reserve(max_invoke_depth_ + 1);
}

Pubkey const &InvokeContext::program_id() const
{
    SPOOL_ASSERT(!frames_.empty());
    return frames_.back().program_id;
}

Result<void> InvokeContext::process_instruction(
    Instruction const &instruction, std::span<Pubkey const> const signers)
{
    SPOOL_ASSERT(frames_.empty());

    std::vector<std::pair<bool, bool>> privileges;
    privileges.reserve(instruction.accounts.size());
    for (auto const &meta : instruction.accounts) {
        if (meta.is_signer &&
            std::ranges::find(signers, meta.pubkey) == signers.end()) {
            return InstructionError::MissingRequiredSignature;
        }
        privileges.emplace_back(meta.is_signer, meta.is_writable);
    }
    return execute(instruction, privileges);
}

Result<void> InvokeContext::invoke(
    Instruction const &instruction, AccountInfos const accounts)
{
    return invoke_signed(instruction, accounts, {});
}

Result<void> InvokeContext::invoke_signed(
    Instruction const &instruction, AccountInfos const accounts,
    std::span<std::vector<byte_string_view> const> const signer_seeds)
{
    SPOOL_ASSERT(!frames_.empty());
    auto const caller = frames_.size() - 1;

    std::vector<Pubkey> derived_signers;
    derived_signers.reserve(signer_seeds.size());
    for (auto const &seeds : signer_seeds) {
        auto const address =
            create_program_address(seeds, frames_[caller].program_id);
        if (SPOOL_UNLIKELY(address.has_error())) {
            return InstructionError::InvalidSeeds;
        }
        derived_signers.push_back(address.value());
    }

    std::vector<std::pair<bool, bool>> privileges;
    privileges.reserve(instruction.accounts.size());
    for (auto const &meta : instruction.accounts) {
        auto const info = std::ranges::find_if(
            accounts, [&](auto const &a) { return a.key() == meta.pubkey; });
        if (SPOOL_UNLIKELY(info == accounts.end())) {
            return InstructionError::MissingAccount;
        }
        if (SPOOL_UNLIKELY(meta.is_writable && !info->is_writable())) {
            return InstructionError::PrivilegeEscalation;
        }
        bool const signed_by_caller =
            info->is_signer() ||
            std::ranges::find(derived_signers, meta.pubkey) !=
                derived_signers.end();
        if (SPOOL_UNLIKELY(meta.is_signer && !signed_by_caller)) {
            return InstructionError::PrivilegeEscalation;
        }
        privileges.emplace_back(meta.is_signer, meta.is_writable);
    }

    BOOST_OUTCOME_TRY(verify(frames_[caller]));
    BOOST_OUTCOME_TRY(execute(instruction, privileges));
    refresh(frames_[caller]);
    return outcome::success();
}

void InvokeContext::set_return_data(byte_string_view const data)
{
    return_data_ = ReturnData{program_id(), byte_string{data}};
}

Result<void> InvokeContext::execute(
    Instruction const &instruction,
    std::vector<std::pair<bool, bool>> const &privileges)
{
    SPOOL_ASSERT(privileges.size() == instruction.accounts.size());

    if (SPOOL_UNLIKELY(frames_.size() > max_invoke_depth_)) {
        return InstructionError::CallDepth;
    }
    auto const program = programs_.find(instruction.program_id);
    if (SPOOL_UNLIKELY(program == programs_.end())) {
        return InstructionError::UnsupportedProgramId;
    }
    // a program may call itself but not re-enter from further down the stack
    if (!frames_.empty() &&
        frames_.back().program_id != instruction.program_id &&
        std::ranges::any_of(frames_, [&](auto const &f) {
            return f.program_id == instruction.program_id;
        })) {
        return InstructionError::ReentrancyNotAllowed;
    }

    // a key passed more than once gets the union of its privileges
    std::unordered_map<Pubkey, std::pair<bool, bool>> merged;
    for (size_t i = 0; i < instruction.accounts.size(); ++i) {
        auto &[signer, writable] = merged[instruction.accounts[i].pubkey];
        signer |= privileges[i].first;
        writable |= privileges[i].second;
    }

    Frame frame{
        .program_id = instruction.program_id, .accounts = {}, .pre = {}};
    frame.accounts.reserve(instruction.accounts.size());
    for (auto const &meta : instruction.accounts) {
        auto const &[signer, writable] = merged.at(meta.pubkey);
        Account &account = ledger_.touch(meta.pubkey);
        frame.pre.try_emplace(meta.pubkey, account);
        frame.accounts.emplace_back(meta.pubkey, signer, writable, account);
    }

    return_data_.reset();
    ledger_.push();
    frames_.push_back(std::move(frame));
    auto const index = frames_.size() - 1;

    auto res = program->second->process_instruction(
        *this, frames_[index].accounts, instruction.data);
    if (res.has_value()) {
        res = verify(frames_[index]);
    }
    frames_.pop_back();

    if (res.has_error()) {
        ledger_.pop_reject();
        return res;
    }
    ledger_.pop_accept();
    return outcome::success();
}

Result<void> InvokeContext::verify(Frame const &frame) const
{
    uint128_t pre_sum = 0;
    uint128_t post_sum = 0;
    for (auto const &[key, pre] : frame.pre) {
        auto const info = std::ranges::find_if(
            frame.accounts, [&](auto const &a) { return a.key() == key; });
        SPOOL_ASSERT(info != frame.accounts.end());
        Account const &post = info->account();
        bool const writable = info->is_writable();
        bool const owned = pre.owner == frame.program_id;

        if (SPOOL_UNLIKELY(pre.executable && post != pre)) {
            return InstructionError::ExecutableModified;
        }
        if (post.owner != pre.owner &&
            SPOOL_UNLIKELY(!writable || !owned || !is_zeroed(post.data))) {
            return InstructionError::ModifiedProgramId;
        }
        if (post.lamports != pre.lamports) {
            if (SPOOL_UNLIKELY(!writable)) {
                return InstructionError::ReadonlyLamportChange;
            }
            if (SPOOL_UNLIKELY(post.lamports < pre.lamports && !owned)) {
                return InstructionError::ExternalAccountLamportSpend;
            }
        }
        if (post.data != pre.data) {
            if (SPOOL_UNLIKELY(!writable)) {
                return InstructionError::ReadonlyDataModified;
            }
            if (SPOOL_UNLIKELY(!owned)) {
                return InstructionError::ExternalAccountDataModified;
            }
        }
        pre_sum += pre.lamports;
        post_sum += post.lamports;
    }
    if (SPOOL_UNLIKELY(pre_sum != post_sum)) {
        return InstructionError::UnbalancedInstruction;
    }
    return outcome::success();
}

void InvokeContext::refresh(Frame &frame)
{
    for (auto &[key, pre] : frame.pre) {
        auto const info = std::ranges::find_if(
            frame.accounts, [&](auto const &a) { return a.key() == key; });
        pre = info->account();
    }
}

SPOOL_NAMESPACE_END
