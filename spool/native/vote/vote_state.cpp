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
#include <spool/native/vote/vote_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

SPOOL_VOTE_NAMESPACE_BEGIN

Result<VoteStateHeader> load_vote_state(Account const &account)
{
    if (SPOOL_UNLIKELY(account.owner != VOTE_PROGRAM_ID)) {
        return InstructionError::IncorrectProgramId;
    }
    auto const header = decode_layout<VoteStateHeader>(account.data);
    if (SPOOL_UNLIKELY(
            header.has_error() || header.value().version.native() == 0)) {
        return InstructionError::UninitializedAccount;
    }
    return header.value();
}

Result<Pubkey> authorized_withdrawer(Account const &account)
{
    BOOST_OUTCOME_TRY(auto const header, load_vote_state(account));
    return header.authorized_withdrawer;
}

SPOOL_VOTE_NAMESPACE_END
