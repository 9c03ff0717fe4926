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

#include <spool/core/config.hpp>
#include <spool/runtime/pubkey.hpp>

SPOOL_NAMESPACE_BEGIN

// 11111111111111111111111111111111
inline constexpr Pubkey SYSTEM_PROGRAM_ID{};

// NativeLoader1111111111111111111111111111111
inline constexpr Pubkey NATIVE_LOADER_ID{
    0x058784bf148ba4282fb012574888a9f153a07dadf765c0455c9a970380000000_bytes32};

// Stake11111111111111111111111111111111111111
inline constexpr Pubkey STAKE_PROGRAM_ID{
    0x06a1d8179137542a983437bdfe2a7ab2557f535c8a78722b68a49dc000000000_bytes32};

// Vote111111111111111111111111111111111111111
inline constexpr Pubkey VOTE_PROGRAM_ID{
    0x0761481d357474bb7c4d7624ebd3bdb3d8355e73d11043fc0da3538000000000_bytes32};

// TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA
inline constexpr Pubkey TOKEN_PROGRAM_ID{
    0x06ddf6e1d765a193d9cbe146ceeb79ac1cb485ed5f5b37913a8cf5857eff00a9_bytes32};

// ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL
inline constexpr Pubkey ASSOCIATED_TOKEN_PROGRAM_ID{
    0x8c97258f4e2489f1bb3d1029148e0d830b5a1399daff1084048e7bd8dbe9f859_bytes32};

// metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s
inline constexpr Pubkey METADATA_PROGRAM_ID{
    0x0b7065b1e3d17c45389d527f6b04c3cd58b86c731aa0fdb549b6d1bc03f82946_bytes32};

SPOOL_NAMESPACE_END
