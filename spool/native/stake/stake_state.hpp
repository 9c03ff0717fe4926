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
#include <spool/runtime/account_info.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

SPOOL_STAKE_NAMESPACE_BEGIN

inline constexpr uint64_t EPOCH_MAX = std::numeric_limits<uint64_t>::max();

enum class StakeStateKind : uint32_t
{
    Uninitialized = 0,
    Initialized = 1,
    Stake = 2,
    RewardsPool = 3,
};

enum class StakeAuthorize : uint32_t
{
    Staker = 0,
    Withdrawer = 1,
};

struct Authorized
{
    Pubkey staker;
    Pubkey withdrawer;

    static Authorized both(Pubkey const &authority)
    {
        return {authority, authority};
    }

    bool operator==(Authorized const &) const = default;
};

struct Lockup
{
    u64_le unix_timestamp;
    u64_le epoch;
    Pubkey custodian;

    bool operator==(Lockup const &) const = default;
};

struct Meta
{
    u64_le rent_exempt_reserve;
    Authorized authorized;
    Lockup lockup;
};

struct Delegation
{
    Pubkey voter_pubkey;
    u64_le stake;
    u64_le activation_epoch;
    u64_le deactivation_epoch;
    u64_le warmup_cooldown_rate;
};

struct Stake
{
    Delegation delegation;
    u64_le credits_observed;
};

// bincode image of the stake account, padded to its fixed account size
struct StakeStateV2
{
    u32_le kind;
    Meta meta;
    Stake stake;
    uint8_t stake_flags;
    uint8_t padding[3];

    StakeStateKind state() const noexcept
    {
        return static_cast<StakeStateKind>(kind.native());
    }
};

static_assert(sizeof(Authorized) == 64);
static_assert(sizeof(Lockup) == 48);
static_assert(sizeof(Meta) == 120);
static_assert(sizeof(Delegation) == 64);
static_assert(sizeof(Stake) == 72);
static_assert(sizeof(StakeStateV2) == 200);
static_assert(alignof(StakeStateV2) == 1);

inline constexpr size_t STAKE_STATE_SIZE = sizeof(StakeStateV2);

enum class ActivationStatus
{
    Activating,
    Active,
    Deactivating,
    Inactive,
};

/// Derived from the delegation's epochs against `epoch` on every call;
/// activation changes at epoch boundaries without any write to the account
ActivationStatus activation_status(Delegation const &, uint64_t epoch);

/// Activated before `epoch` and not deactivating
bool is_fully_active(Delegation const &, uint64_t epoch);

/// Delegated lamports that are not withdrawable at `epoch`
uint64_t staked_amount(Delegation const &, uint64_t epoch);

bool is_lockup_in_force(
    Lockup const &, Clock const &, Pubkey const *custodian_signer);

StakeStateV2 make_initialized(Meta const &);
StakeStateV2 make_delegated(
    Meta const &, Pubkey const &voter, uint64_t stake, uint64_t epoch);

Result<StakeStateV2> decode_stake_state(byte_string_view);

/// Checks the account is owned by the stake program before decoding
Result<StakeStateV2> load_stake_state(AccountInfo const &);
Result<StakeStateV2> load_stake_state(Account const &);

void store_stake_state(AccountInfo const &, StakeStateV2 const &);

SPOOL_STAKE_NAMESPACE_END
