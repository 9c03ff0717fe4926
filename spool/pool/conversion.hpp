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

#include <spool/core/result.hpp>
#include <spool/pool/config.hpp>

#include <cstdint>

SPOOL_POOL_NAMESPACE_BEGIN

/// Stake the pool holds beyond what it manages for token holders
uint64_t minimum_pool_balance(uint64_t minimum_delegation);

/// Tokens minted for `deposit` lamports of stake into a pool managing
/// `pool_stake` lamports against `token_supply` tokens. The first deposit,
/// or any deposit into a pool with nothing under management, mints at
/// parity; otherwise floor(deposit * supply / stake).
Result<uint64_t> calculate_deposit_amount(
    uint64_t pool_stake, uint64_t token_supply, uint64_t deposit);

/// Lamports of stake redeemed by burning `tokens`:
/// floor(tokens * stake / supply), zero when there is no supply
Result<uint64_t> calculate_withdraw_amount(
    uint64_t pool_stake, uint64_t token_supply, uint64_t tokens);

SPOOL_POOL_NAMESPACE_END
