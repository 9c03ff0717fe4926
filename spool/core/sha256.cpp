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
#include <spool/core/ed25519.hpp>
#include <spool/core/sha256.hpp>

SPOOL_NAMESPACE_BEGIN

Sha256::Sha256()
{
    ensure_sodium_initialized();
    SPOOL_ASSERT(crypto_hash_sha256_init(&state_) == 0);
}

Sha256 &Sha256::update(byte_string_view const data)
{
    SPOOL_ASSERT(
        crypto_hash_sha256_update(&state_, data.data(), data.size()) == 0);
    return *this;
}

bytes32_t Sha256::finalize()
{
    bytes32_t digest;
    SPOOL_ASSERT(crypto_hash_sha256_final(&state_, digest.bytes) == 0);
    return digest;
}

bytes32_t sha256(byte_string_view const data)
{
    return Sha256{}.update(data).finalize();
}

SPOOL_NAMESPACE_END
