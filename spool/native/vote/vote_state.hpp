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
#include <spool/core/little_endian.hpp>
#include <spool/core/result.hpp>
#include <spool/native/config.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>

SPOOL_VOTE_NAMESPACE_BEGIN

inline constexpr size_t VOTE_STATE_SIZE = 3762;

// Only the leading fields of the vote account are modelled. The withdrawer
// sits at the same offset in every vote state version.
struct VoteStateHeader
{
    u32_le version;
    Pubkey node_pubkey;
    Pubkey authorized_withdrawer;
    uint8_t commission;
    Pubkey authorized_voter;
};

static_assert(sizeof(VoteStateHeader) == 101);
static_assert(alignof(VoteStateHeader) == 1);

inline constexpr uint32_t VOTE_STATE_CURRENT_VERSION = 2;

struct VoteInit
{
    Pubkey node_pubkey;
    Pubkey authorized_voter;
    Pubkey authorized_withdrawer;
    uint8_t commission;
};

/// Vote-program-owned and initialized
Result<VoteStateHeader> load_vote_state(Account const &);

Result<Pubkey> authorized_withdrawer(Account const &);

SPOOL_VOTE_NAMESPACE_END
