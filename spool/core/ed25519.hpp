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

#include <spool/core/bytes.hpp>
#include <spool/core/config.hpp>

#include <array>

SPOOL_NAMESPACE_BEGIN

struct Keypair
{
    bytes32_t pubkey;
    std::array<unsigned char, 64> secret;
};

void ensure_sodium_initialized();

/// True when the 32 bytes are the compressed encoding of a point on
/// edwards25519, i.e. the y coordinate admits a square root for x. No
/// subgroup check is made.
bool is_on_curve(bytes32_t const &);

Keypair generate_keypair();
Keypair keypair_from_seed(bytes32_t const &seed);

SPOOL_NAMESPACE_END
