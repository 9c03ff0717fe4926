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
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/vote/vote_instruction.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_VOTE_NAMESPACE_BEGIN

Result<VoteInstruction> decode_vote_instruction(byte_string_view enc)
{
    auto decoded = [&]() -> Result<VoteInstruction> {
        BOOST_OUTCOME_TRY(auto const tag, decode_fixed<u32_le>(enc));
        switch (static_cast<VoteInstructionKind>(tag.native())) {
        case VoteInstructionKind::InitializeAccount: {
            BOOST_OUTCOME_TRY(auto const node, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const voter, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const withdrawer, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(
                auto const commission, decode_fixed<uint8_t>(enc));
            return InitializeAccount{{node, voter, withdrawer, commission}};
        }
        case VoteInstructionKind::Authorize: {
            BOOST_OUTCOME_TRY(auto const authority, decode_fixed<Pubkey>(enc));
            BOOST_OUTCOME_TRY(auto const role, decode_fixed<u32_le>(enc));
            if (role.native() >
                static_cast<uint32_t>(VoteAuthorize::Withdrawer)) {
                return InstructionError::InvalidInstructionData;
            }
            return Authorize{
                authority, static_cast<VoteAuthorize>(role.native())};
        }
        }
        return InstructionError::InvalidInstructionData;
    }();

    if (SPOOL_UNLIKELY(decoded.has_error() || decode_end(enc).has_error())) {
        return InstructionError::InvalidInstructionData;
    }
    return decoded;
}

Instruction initialize_account(Pubkey const &vote, VoteInit const &init)
{
    byte_string data;
    encode_fixed(
        data,
        u32_le{static_cast<uint32_t>(VoteInstructionKind::InitializeAccount)});
    encode_fixed(data, init.node_pubkey);
    encode_fixed(data, init.authorized_voter);
    encode_fixed(data, init.authorized_withdrawer);
    encode_fixed(data, init.commission);
    return {
        VOTE_PROGRAM_ID,
        {AccountMeta::writable(vote),
         AccountMeta::readonly(init.node_pubkey, true)},
        std::move(data)};
}

Instruction authorize(
    Pubkey const &vote, Pubkey const &authority, Pubkey const &new_authority,
    VoteAuthorize const role)
{
    byte_string data;
    encode_fixed(
        data, u32_le{static_cast<uint32_t>(VoteInstructionKind::Authorize)});
    encode_fixed(data, new_authority);
    encode_fixed(data, u32_le{static_cast<uint32_t>(role)});
    return {
        VOTE_PROGRAM_ID,
        {AccountMeta::writable(vote), AccountMeta::readonly(authority, true)},
        std::move(data)};
}

std::vector<Instruction> create_account(
    Pubkey const &from, Pubkey const &vote, VoteInit const &init,
    uint64_t const lamports)
{
    return {
        system::create_account(
            from, vote, lamports, VOTE_STATE_SIZE, VOTE_PROGRAM_ID),
        initialize_account(vote, init)};
}

SPOOL_VOTE_NAMESPACE_END
