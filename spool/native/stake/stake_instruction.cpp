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

#include <spool/core/little_endian.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using stake::StakeInstructionKind;

byte_string encode_tag(StakeInstructionKind const kind)
{
    byte_string data;
    encode_fixed(data, u32_le{static_cast<uint32_t>(kind)});
    return data;
}

Instruction stake_instruction(
    std::vector<AccountMeta> accounts, byte_string data)
{
    return {STAKE_PROGRAM_ID, std::move(accounts), std::move(data)};
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_STAKE_NAMESPACE_BEGIN

Result<StakeInstruction> decode_stake_instruction(byte_string_view enc)
{
    auto const tag = decode_fixed<u32_le>(enc);
    if (SPOOL_UNLIKELY(tag.has_error())) {
        return InstructionError::InvalidInstructionData;
    }

    auto decoded = [&]() -> Result<StakeInstruction> {
        switch (static_cast<StakeInstructionKind>(tag.value().native())) {
        case StakeInstructionKind::Initialize: {
            BOOST_OUTCOME_TRY(auto const staker, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const withdrawer, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const timestamp, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const epoch, decode_fixed<u64_le>(enc));
            BOOST_OUTCOME_TRY(auto const custodian, decode_fixed<Pubkey>(enc));
            return Initialize{
                {staker, withdrawer}, {timestamp, epoch, custodian}};
        }
        case StakeInstructionKind::Authorize: {
            BOOST_OUTCOME_TRY(auto const authority, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const role, decode_fixed<u32_le>(enc));
            if (role.native() >
                static_cast<uint32_t>(StakeAuthorize::Withdrawer)) {
                return InstructionError::InvalidInstructionData;
            }
            return Authorize{
                authority, static_cast<StakeAuthorize>(role.native())};
        }
        case StakeInstructionKind::DelegateStake:
            return DelegateStake{};
        case StakeInstructionKind::Split: {
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            return Split{lamports.native()};
        }
        case StakeInstructionKind::Withdraw: {
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            return Withdraw{lamports.native()};
        }
        case StakeInstructionKind::Deactivate:
            return Deactivate{};
        case StakeInstructionKind::Merge:
            return Merge{};
        case StakeInstructionKind::GetMinimumDelegation:
            return GetMinimumDelegation{};
        case StakeInstructionKind::MoveLamports: {
            BOOST_OUTCOME_TRY(auto const lamports, decode_fixed<u64_le>(enc));
            return MoveLamports{lamports.native()};
        }
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (SPOOL_UNLIKELY(decoded.has_error() || decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

Instruction initialize(
    Pubkey const &stake, Authorized const &authorized, Lockup const &lockup)
{
    auto data = encode_tag(StakeInstructionKind::Initialize);
    encode_fixed(data, authorized.staker);
    encode_fixed(data, authorized.withdrawer);
    encode_fixed(data, lockup.unix_timestamp);
    encode_fixed(data, lockup.epoch);
    encode_fixed(data, lockup.custodian);
    return stake_instruction({AccountMeta::writable(stake)}, std::move(data));
}

Instruction authorize(
    Pubkey const &stake, Pubkey const &authority, Pubkey const &new_authority,
    StakeAuthorize const role, std::optional<Pubkey> const &custodian)
{
    auto data = encode_tag(StakeInstructionKind::Authorize);
    encode_fixed(data, new_authority);
    encode_fixed(data, u32_le{static_cast<uint32_t>(role)});
    std::vector<AccountMeta> accounts{
        AccountMeta::writable(stake), AccountMeta::readonly(authority, true)};
    if (custodian.has_value()) {
        accounts.push_back(AccountMeta::readonly(*custodian, true));
    }
    return stake_instruction(std::move(accounts), std::move(data));
}

Instruction delegate_stake(
    Pubkey const &stake, Pubkey const &staker, Pubkey const &vote)
{
    return stake_instruction(
        {AccountMeta::writable(stake),
         AccountMeta::readonly(vote),
         AccountMeta::readonly(staker, true)},
        encode_tag(StakeInstructionKind::DelegateStake));
}

Instruction split(
    Pubkey const &stake, Pubkey const &staker, uint64_t const lamports,
    Pubkey const &split_stake)
{
    auto data = encode_tag(StakeInstructionKind::Split);
    encode_fixed(data, u64_le{lamports});
    return stake_instruction(
        {AccountMeta::writable(stake),
         AccountMeta::writable(split_stake),
         AccountMeta::readonly(staker, true)},
        std::move(data));
}

Instruction withdraw(
    Pubkey const &stake, Pubkey const &withdrawer, Pubkey const &to,
    uint64_t const lamports, std::optional<Pubkey> const &custodian)
{
    auto data = encode_tag(StakeInstructionKind::Withdraw);
    encode_fixed(data, u64_le{lamports});
    std::vector<AccountMeta> accounts{
        AccountMeta::writable(stake),
        AccountMeta::writable(to),
        AccountMeta::readonly(withdrawer, true)};
    if (custodian.has_value()) {
        accounts.push_back(AccountMeta::readonly(*custodian, true));
    }
    return stake_instruction(std::move(accounts), std::move(data));
}

Instruction deactivate_stake(Pubkey const &stake, Pubkey const &staker)
{
    return stake_instruction(
        {AccountMeta::writable(stake), AccountMeta::readonly(staker, true)},
        encode_tag(StakeInstructionKind::Deactivate));
}

Instruction merge(
    Pubkey const &destination, Pubkey const &source, Pubkey const &staker)
{
    return stake_instruction(
        {AccountMeta::writable(destination),
         AccountMeta::writable(source),
         AccountMeta::readonly(staker, true)},
        encode_tag(StakeInstructionKind::Merge));
}

Instruction get_minimum_delegation()
{
    return stake_instruction(
        {}, encode_tag(StakeInstructionKind::GetMinimumDelegation));
}

Instruction move_lamports(
    Pubkey const &source, Pubkey const &destination, Pubkey const &staker,
    uint64_t const lamports)
{
    auto data = encode_tag(StakeInstructionKind::MoveLamports);
    encode_fixed(data, u64_le{lamports});
    return stake_instruction(
        {AccountMeta::writable(source),
         AccountMeta::writable(destination),
         AccountMeta::readonly(staker, true)},
        std::move(data));
}

std::vector<Instruction> create_account(
    Pubkey const &from, Pubkey const &stake, Authorized const &authorized,
    Lockup const &lockup, uint64_t const lamports)
{
    return {
        system::create_account(
            from, stake, lamports, STAKE_STATE_SIZE, STAKE_PROGRAM_ID),
        initialize(stake, authorized, lockup)};
}

std::vector<Instruction> create_account_with_seed(
    Pubkey const &from, Pubkey const &stake, Pubkey const &base,
    std::string_view const seed, Authorized const &authorized,
    Lockup const &lockup, uint64_t const lamports)
{
    return {
        system::create_account_with_seed(
            from,
            stake,
            base,
            seed,
            lamports,
            STAKE_STATE_SIZE,
            STAKE_PROGRAM_ID),
        initialize(stake, authorized, lockup)};
}

SPOOL_STAKE_NAMESPACE_END
