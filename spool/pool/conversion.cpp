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

#include <spool/core/checked_math.hpp>
#include <spool/core/likely.h>
#include <spool/pool/conversion.hpp>
#include <spool/pool/error.hpp>
#include <spool/runtime/account.hpp>

#include <algorithm>

SPOOL_POOL_NAMESPACE_BEGIN

uint64_t minimum_pool_balance(uint64_t const minimum_delegation)
{
    return std::max(minimum_delegation, LAMPORTS_PER_SOL);
}

Result<uint64_t> calculate_deposit_amount(
    uint64_t const pool_stake, uint64_t const token_supply,
    uint64_t const deposit)
{
    if (token_supply == 0 || pool_stake == 0) {
        return deposit;
    }
    auto const amount = checked_mul_div(deposit, token_supply, pool_stake);
    if (SPOOL_UNLIKELY(amount.has_error())) {
        return SinglePoolError::UnexpectedMathError;
    }
    return amount.value();
}

Result<uint64_t> calculate_withdraw_amount(
    uint64_t const pool_stake, uint64_t const token_supply,
    uint64_t const tokens)
{
    if (token_supply == 0) {
        return uint64_t{0};
    }
    auto const amount = checked_mul_div(tokens, pool_stake, token_supply);
    if (SPOOL_UNLIKELY(amount.has_error())) {
        return SinglePoolError::UnexpectedMathError;
    }
    return amount.value();
}

SPOOL_POOL_NAMESPACE_END
