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
#include <spool/core/int.hpp>

#include <sodium.h>

#include <mutex>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint256_t P = (uint256_t{1} << 255) - 19;

// -121665 / 121666 mod p
constexpr uint256_t D = intx::from_string<uint256_t>(
    "0x52036cee2b6ffe738cc740797779e89800700a4d4141d8ab75eb4dca135978a3");

// (p - 1) / 2
constexpr uint256_t LEGENDRE_EXPONENT = (P - 1) >> 1;

uint256_t fe_mul(uint256_t const &x, uint256_t const &y)
{
    return intx::mulmod(x, y, P);
}

uint256_t fe_add(uint256_t const &x, uint256_t const &y)
{
    return intx::addmod(x, y, P);
}

uint256_t fe_sub(uint256_t const &x, uint256_t const &y)
{
    return x >= y ? x - y : P - (y - x);
}

uint256_t fe_pow(uint256_t base, uint256_t exponent)
{
    uint256_t result = 1;
    while (exponent != 0) {
        if ((exponent & 1) != 0) {
            result = fe_mul(result, base);
        }
        base = fe_mul(base, base);
        exponent >>= 1;
    }
    return result;
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_NAMESPACE_BEGIN

void ensure_sodium_initialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (sodium_init() < 0) {
            SPOOL_ABORT("libsodium initialization failed");
        }
    });
}

bool is_on_curve(bytes32_t const &encoded)
{
    // the top bit carries the sign of x and is not part of y
    uint256_t y = intx::le::load<uint256_t>(encoded.bytes);
    y &= ~(uint256_t{1} << 255);
    if (y >= P) {
        y -= P;
    }

    // x^2 = (y^2 - 1) / (d y^2 + 1)
    uint256_t const y2 = fe_mul(y, y);
    uint256_t const u = fe_sub(y2, 1);
    uint256_t const v = fe_add(fe_mul(D, y2), 1);
    if (v == 0) {
        return false;
    }

    // u / v is a square iff u * v is, by Euler's criterion
    uint256_t const w = fe_mul(u, v);
    if (w == 0) {
        return true;
    }
    return fe_pow(w, LEGENDRE_EXPONENT) == 1;
}

Keypair generate_keypair()
{
    ensure_sodium_initialized();
    Keypair kp;
    SPOOL_ASSERT(crypto_sign_keypair(kp.pubkey.bytes, kp.secret.data()) == 0);
    return kp;
}

Keypair keypair_from_seed(bytes32_t const &seed)
{
    ensure_sodium_initialized();
    Keypair kp;
    SPOOL_ASSERT(
        crypto_sign_seed_keypair(
            kp.pubkey.bytes, kp.secret.data(), seed.bytes) == 0);
    return kp;
}

SPOOL_NAMESPACE_END
