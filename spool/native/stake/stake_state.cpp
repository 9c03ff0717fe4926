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
#include <spool/native/stake/stake_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

SPOOL_STAKE_NAMESPACE_BEGIN

ActivationStatus
activation_status(Delegation const &delegation, uint64_t const epoch)
{
    auto const activation = delegation.activation_epoch.native();
    auto const deactivation = delegation.deactivation_epoch.native();

    // deactivated in the epoch it was activated, never took effect
    if (activation == deactivation) {
        return ActivationStatus::Inactive;
    }
    if (epoch <= activation) {
        return ActivationStatus::Activating;
    }
    if (deactivation == EPOCH_MAX) {
        return ActivationStatus::Active;
    }
    if (epoch <= deactivation) {
        return ActivationStatus::Deactivating;
    }
    return ActivationStatus::Inactive;
}

bool is_fully_active(Delegation const &delegation, uint64_t const epoch)
{
    return activation_status(delegation, epoch) == ActivationStatus::Active;
}

uint64_t staked_amount(Delegation const &delegation, uint64_t const epoch)
{
    if (activation_status(delegation, epoch) == ActivationStatus::Inactive) {
        return 0;
    }
    return delegation.stake.native();
}

bool is_lockup_in_force(
    Lockup const &lockup, Clock const &clock, Pubkey const *const custodian)
{
    if (custodian != nullptr && *custodian == lockup.custodian) {
        return false;
    }
    return static_cast<int64_t>(lockup.unix_timestamp.native()) >
               clock.unix_timestamp ||
           lockup.epoch.native() > clock.epoch;
}

StakeStateV2 make_initialized(Meta const &meta)
{
    StakeStateV2 state{};
    state.kind = static_cast<uint32_t>(StakeStateKind::Initialized);
    state.meta = meta;
    return state;
}

StakeStateV2 make_delegated(
    Meta const &meta, Pubkey const &voter, uint64_t const stake,
    uint64_t const epoch)
{
    StakeStateV2 state{};
    state.kind = static_cast<uint32_t>(StakeStateKind::Stake);
    state.meta = meta;
    state.stake.delegation.voter_pubkey = voter;
    state.stake.delegation.stake = stake;
    state.stake.delegation.activation_epoch = epoch;
    state.stake.delegation.deactivation_epoch = EPOCH_MAX;
    return state;
}

Result<StakeStateV2> decode_stake_state(byte_string_view const data)
{
    if (SPOOL_UNLIKELY(data.size() != STAKE_STATE_SIZE)) {
        return InstructionError::InvalidAccountData;
    }
    auto state = decode_layout<StakeStateV2>(data);
    if (SPOOL_UNLIKELY(state.has_error())) {
        return InstructionError::InvalidAccountData;
    }
    if (SPOOL_UNLIKELY(
            state.value().kind.native() >
            static_cast<uint32_t>(StakeStateKind::RewardsPool))) {
        return InstructionError::InvalidAccountData;
    }
    return state.value();
}

Result<StakeStateV2> load_stake_state(Account const &account)
{
    if (SPOOL_UNLIKELY(account.owner != STAKE_PROGRAM_ID)) {
        return InstructionError::InvalidAccountOwner;
    }
    return decode_stake_state(account.data);
}

Result<StakeStateV2> load_stake_state(AccountInfo const &info)
{
    return load_stake_state(info.account());
}

void store_stake_state(AccountInfo const &info, StakeStateV2 const &state)
{
    encode_layout(info.data_mut(), state);
}

SPOOL_STAKE_NAMESPACE_END
