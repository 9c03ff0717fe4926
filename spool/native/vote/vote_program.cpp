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

#include <spool/core/likely.h>
#include <spool/native/vote/vote_instruction.hpp>
#include <spool/native/vote/vote_program.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <type_traits>
#include <variant>

SPOOL_VOTE_NAMESPACE_BEGIN

Result<void> VoteProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    BOOST_OUTCOME_TRY(auto const instruction, decode_vote_instruction(data));
    BOOST_OUTCOME_TRY(check_account_count(accounts, 2));
    auto const &vote = accounts[0];
    auto const &signer = accounts[1];
    if (SPOOL_UNLIKELY(vote.owner() != VOTE_PROGRAM_ID)) {
        return InstructionError::InvalidAccountOwner;
    }
    if (SPOOL_UNLIKELY(!signer.is_signer())) {
        return InstructionError::MissingRequiredSignature;
    }

    return std::visit(
        [&](auto const &ix) -> Result<void> {
            using T = std::decay_t<decltype(ix)>;
            if constexpr (std::same_as<T, InitializeAccount>) {
                if (SPOOL_UNLIKELY(vote.data().size() != VOTE_STATE_SIZE)) {
                    return InstructionError::InvalidAccountData;
                }
                if (SPOOL_UNLIKELY(
                        load_vote_state(vote.account()).has_value())) {
                    return InstructionError::AccountAlreadyInitialized;
                }
                if (SPOOL_UNLIKELY(!ctx.rent().is_exempt(
                        vote.lamports(), vote.data().size()))) {
                    return InstructionError::InsufficientFunds;
                }
                if (SPOOL_UNLIKELY(signer.key() != ix.init.node_pubkey)) {
                    return InstructionError::MissingRequiredSignature;
                }
                VoteStateHeader const header{
                    VOTE_STATE_CURRENT_VERSION,
                    ix.init.node_pubkey,
                    ix.init.authorized_withdrawer,
                    ix.init.commission,
                    ix.init.authorized_voter};
                encode_layout(vote.data_mut(), header);
                return outcome::success();
            }
            else {
                static_assert(std::same_as<T, Authorize>);
                BOOST_OUTCOME_TRY(auto header, load_vote_state(vote.account()));
                auto const &authority = signer.key();
                if (ix.role == VoteAuthorize::Voter) {
                    if (SPOOL_UNLIKELY(
                            authority != header.authorized_voter &&
                            authority != header.authorized_withdrawer)) {
                        return InstructionError::MissingRequiredSignature;
                    }
                    header.authorized_voter = ix.new_authority;
                }
                else {
                    if (SPOOL_UNLIKELY(
                            authority != header.authorized_withdrawer)) {
                        return InstructionError::MissingRequiredSignature;
                    }
                    header.authorized_withdrawer = ix.new_authority;
                }
                encode_layout(vote.data_mut(), header);
                return outcome::success();
            }
        },
        instruction);
}

SPOOL_VOTE_NAMESPACE_END
