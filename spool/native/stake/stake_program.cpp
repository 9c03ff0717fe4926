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
#include <spool/native/stake/stake_error.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/stake/stake_program.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <concepts>
#include <optional>
#include <type_traits>
#include <variant>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::stake;

bool signed_by(AccountInfos const accounts, Pubkey const &key)
{
    return std::ranges::any_of(accounts, [&](AccountInfo const &info) {
        return info.is_signer() && info.key() == key;
    });
}

Result<void> require_signer(AccountInfos const accounts, Pubkey const &key)
{
    if (SPOOL_UNLIKELY(!signed_by(accounts, key))) {
        return InstructionError::MissingRequiredSignature;
    }
    return outcome::success();
}

Result<void> require_initialized(StakeStateV2 const &state)
{
    auto const kind = state.state();
    if (SPOOL_UNLIKELY(
            kind != StakeStateKind::Initialized &&
            kind != StakeStateKind::Stake)) {
        return InstructionError::InvalidAccountData;
    }
    return outcome::success();
}

Result<void> move_lamports_between(
    AccountInfo const &from, AccountInfo const &to, uint64_t const lamports)
{
    if (SPOOL_UNLIKELY(from.lamports() < lamports)) {
        return InstructionError::InsufficientFunds;
    }
    if (SPOOL_UNLIKELY(to.lamports() + lamports < to.lamports())) {
        return InstructionError::ArithmeticOverflow;
    }
    from.set_lamports(from.lamports() - lamports);
    to.set_lamports(to.lamports() + lamports);
    return outcome::success();
}

// Lamports that are neither rent reserve nor delegated at `epoch`
uint64_t free_lamports(
    AccountInfo const &info, StakeStateV2 const &state, uint64_t const epoch)
{
    uint64_t locked = state.meta.rent_exempt_reserve.native();
    if (state.state() == StakeStateKind::Stake) {
        locked += staked_amount(state.stake.delegation, epoch);
    }
    return info.lamports() > locked ? info.lamports() - locked : 0;
}

enum class MergeKind
{
    Inactive,
    ActivationEpoch,
    FullyActive,
};

Result<MergeKind>
merge_kind(StakeStateV2 const &state, uint64_t const epoch)
{
    switch (state.state()) {
    case StakeStateKind::Initialized:
        return MergeKind::Inactive;
    case StakeStateKind::Stake: {
        auto const &delegation = state.stake.delegation;
        switch (activation_status(delegation, epoch)) {
        case ActivationStatus::Inactive:
            return MergeKind::Inactive;
        case ActivationStatus::Active:
            return MergeKind::FullyActive;
        case ActivationStatus::Activating:
            if (delegation.activation_epoch.native() == epoch) {
                return MergeKind::ActivationEpoch;
            }
            return StakeError::MergeTransientStake;
        case ActivationStatus::Deactivating:
            return StakeError::MergeTransientStake;
        }
        break;
    }
    default:
        break;
    }
    return InstructionError::InvalidAccountData;
}

Result<void> metas_can_merge(Meta const &a, Meta const &b)
{
    if (SPOOL_UNLIKELY(
            !(a.authorized == b.authorized) || !(a.lockup == b.lockup))) {
        return StakeError::MergeMismatch;
    }
    return outcome::success();
}

class StakeInstructionHandler
{
    InvokeContext &ctx_;
    AccountInfos accounts_;
    uint64_t minimum_delegation_;

    Clock const &clock() const
    {
        return ctx_.clock();
    }

public:
    StakeInstructionHandler(
        InvokeContext &ctx, AccountInfos const accounts,
        uint64_t const minimum_delegation)
        : ctx_{ctx}
        , accounts_{accounts}
        , minimum_delegation_{minimum_delegation}
    {
    }

    Result<void> operator()(Initialize const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 1));
        auto const &stake = accounts_[0];
        BOOST_OUTCOME_TRY(auto const state, load_stake_state(stake));
        if (SPOOL_UNLIKELY(state.state() != StakeStateKind::Uninitialized)) {
            return InstructionError::InvalidAccountData;
        }
        auto const reserve = ctx_.rent().minimum_balance(stake.data().size());
        if (SPOOL_UNLIKELY(stake.lamports() < reserve)) {
            return InstructionError::InsufficientFunds;
        }
        store_stake_state(
            stake, make_initialized(Meta{reserve, ix.authorized, ix.lockup}));
        return outcome::success();
    }

    Result<void> operator()(Authorize const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &stake = accounts_[0];
        BOOST_OUTCOME_TRY(auto state, load_stake_state(stake));
        BOOST_OUTCOME_TRY(require_initialized(state));

        auto &authorized = state.meta.authorized;
        switch (ix.role) {
        case StakeAuthorize::Staker:
            if (SPOOL_UNLIKELY(
                    !signed_by(accounts_, authorized.staker) &&
                    !signed_by(accounts_, authorized.withdrawer))) {
                return InstructionError::MissingRequiredSignature;
            }
            authorized.staker = ix.new_authority;
            break;
        case StakeAuthorize::Withdrawer: {
            auto const &lockup = state.meta.lockup;
            std::optional<Pubkey> custodian;
            if (accounts_.size() > 2 && accounts_[2].is_signer()) {
                custodian = accounts_[2].key();
            }
            if (is_lockup_in_force(lockup, clock(), nullptr)) {
                if (SPOOL_UNLIKELY(accounts_.size() < 3)) {
                    return StakeError::CustodianMissing;
                }
                if (SPOOL_UNLIKELY(!custodian.has_value())) {
                    return StakeError::CustodianSignatureMissing;
                }
                if (SPOOL_UNLIKELY(is_lockup_in_force(
                        lockup, clock(), &custodian.value()))) {
                    return StakeError::LockupInForce;
                }
            }
            BOOST_OUTCOME_TRY(require_signer(accounts_, authorized.withdrawer));
            authorized.withdrawer = ix.new_authority;
            break;
        }
        }
        store_stake_state(stake, state);
        return outcome::success();
    }

    Result<void> operator()(DelegateStake const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &stake = accounts_[0];
        auto const &vote = accounts_[1];
        if (SPOOL_UNLIKELY(vote.owner() != VOTE_PROGRAM_ID)) {
            return InstructionError::IncorrectProgramId;
        }
        BOOST_OUTCOME_TRY(auto state, load_stake_state(stake));
        BOOST_OUTCOME_TRY(require_initialized(state));
        BOOST_OUTCOME_TRY(
            require_signer(accounts_, state.meta.authorized.staker));

        auto const reserve = state.meta.rent_exempt_reserve.native();
        if (SPOOL_UNLIKELY(stake.lamports() < reserve)) {
            return InstructionError::InsufficientFunds;
        }
        auto const amount = stake.lamports() - reserve;
        if (SPOOL_UNLIKELY(amount < minimum_delegation_)) {
            return StakeError::InsufficientDelegation;
        }

        auto const epoch = clock().epoch;
        if (state.state() == StakeStateKind::Initialized) {
            store_stake_state(
                stake, make_delegated(state.meta, vote.key(), amount, epoch));
            return outcome::success();
        }

        auto &delegation = state.stake.delegation;
        auto const status = activation_status(delegation, epoch);
        if (status == ActivationStatus::Inactive) {
            store_stake_state(
                stake, make_delegated(state.meta, vote.key(), amount, epoch));
            return outcome::success();
        }
        if (SPOOL_UNLIKELY(delegation.voter_pubkey != vote.key())) {
            return StakeError::TooSoonToRedelegate;
        }
        if (status == ActivationStatus::Deactivating) {
            // rescind the pending deactivation
            delegation.deactivation_epoch = EPOCH_MAX;
        }
        else {
            // same validator: excess lamports join the delegation at once
            delegation.stake = amount;
        }
        store_stake_state(stake, state);
        return outcome::success();
    }

    Result<void> operator()(Split const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &source = accounts_[0];
        auto const &destination = accounts_[1];
        if (SPOOL_UNLIKELY(source.key() == destination.key())) {
            return InstructionError::InvalidArgument;
        }
        BOOST_OUTCOME_TRY(auto const dest_state, load_stake_state(destination));
        if (SPOOL_UNLIKELY(
                dest_state.state() != StakeStateKind::Uninitialized)) {
            return InstructionError::InvalidAccountData;
        }
        BOOST_OUTCOME_TRY(auto state, load_stake_state(source));
        BOOST_OUTCOME_TRY(require_initialized(state));
        BOOST_OUTCOME_TRY(
            require_signer(accounts_, state.meta.authorized.staker));

        auto const lamports = ix.lamports;
        if (SPOOL_UNLIKELY(lamports == 0 || lamports > source.lamports())) {
            return InstructionError::InsufficientFunds;
        }
        bool const full = lamports == source.lamports();
        auto const source_reserve = state.meta.rent_exempt_reserve.native();
        auto const dest_reserve =
            ctx_.rent().minimum_balance(destination.data().size());
        auto const dest_shortfall = dest_reserve > destination.lamports()
                                        ? dest_reserve - destination.lamports()
                                        : 0;
        if (SPOOL_UNLIKELY(lamports < dest_shortfall)) {
            return InstructionError::InsufficientFunds;
        }

        Meta dest_meta = state.meta;
        dest_meta.rent_exempt_reserve = dest_reserve;

        if (state.state() == StakeStateKind::Initialized) {
            if (SPOOL_UNLIKELY(
                    !full && source.lamports() - lamports < source_reserve)) {
                return InstructionError::InsufficientFunds;
            }
            store_stake_state(destination, make_initialized(dest_meta));
        }
        else {
            auto &delegation = state.stake.delegation;
            auto const stake = delegation.stake.native();
            uint64_t split_stake = lamports - dest_shortfall;
            if (full) {
                split_stake = std::min(split_stake, stake);
            }
            else {
                if (SPOOL_UNLIKELY(split_stake > stake)) {
                    return StakeError::InsufficientStake;
                }
                auto const remaining = stake - split_stake;
                if (SPOOL_UNLIKELY(remaining < minimum_delegation_)) {
                    return StakeError::InsufficientDelegation;
                }
                if (SPOOL_UNLIKELY(
                        source.lamports() - lamports <
                        source_reserve + remaining)) {
                    return InstructionError::InsufficientFunds;
                }
            }
            if (SPOOL_UNLIKELY(split_stake < minimum_delegation_)) {
                return StakeError::InsufficientDelegation;
            }

            StakeStateV2 split_state = state;
            split_state.meta = dest_meta;
            split_state.stake.delegation.stake = split_stake;
            store_stake_state(destination, split_state);

            delegation.stake = stake - split_stake;
        }

        if (full) {
            store_stake_state(source, StakeStateV2{});
        }
        else {
            store_stake_state(source, state);
        }
        return move_lamports_between(source, destination, lamports);
    }

    Result<void> operator()(Withdraw const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 3));
        auto const &stake = accounts_[0];
        auto const &to = accounts_[1];
        BOOST_OUTCOME_TRY(auto const state, load_stake_state(stake));

        uint64_t locked = 0;
        bool reclaimable = true;
        switch (state.state()) {
        case StakeStateKind::Uninitialized:
            // the account keypair itself is the authority
            BOOST_OUTCOME_TRY(require_signer(accounts_, stake.key()));
            break;
        case StakeStateKind::Initialized:
        case StakeStateKind::Stake: {
            BOOST_OUTCOME_TRY(
                require_signer(accounts_, state.meta.authorized.withdrawer));
            Pubkey const *custodian = nullptr;
            if (accounts_.size() > 3 && accounts_[3].is_signer()) {
                custodian = &accounts_[3].key();
            }
            if (SPOOL_UNLIKELY(is_lockup_in_force(
                    state.meta.lockup, clock(), custodian))) {
                return StakeError::LockupInForce;
            }
            uint64_t staked = 0;
            if (state.state() == StakeStateKind::Stake) {
                staked = staked_amount(state.stake.delegation, clock().epoch);
            }
            locked = staked + state.meta.rent_exempt_reserve.native();
            reclaimable = staked == 0;
            break;
        }
        default:
            return InstructionError::InvalidAccountData;
        }

        if (ix.lamports == stake.lamports()) {
            if (SPOOL_UNLIKELY(!reclaimable)) {
                return InstructionError::InsufficientFunds;
            }
            store_stake_state(stake, StakeStateV2{});
        }
        else if (SPOOL_UNLIKELY(
                     ix.lamports > stake.lamports() ||
                     stake.lamports() - ix.lamports < locked)) {
            return InstructionError::InsufficientFunds;
        }
        return move_lamports_between(stake, to, ix.lamports);
    }

    Result<void> operator()(Deactivate const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 1));
        auto const &stake = accounts_[0];
        BOOST_OUTCOME_TRY(auto state, load_stake_state(stake));
        if (SPOOL_UNLIKELY(state.state() != StakeStateKind::Stake)) {
            return InstructionError::InvalidAccountData;
        }
        BOOST_OUTCOME_TRY(
            require_signer(accounts_, state.meta.authorized.staker));
        auto &delegation = state.stake.delegation;
        if (SPOOL_UNLIKELY(
                delegation.deactivation_epoch.native() != EPOCH_MAX)) {
            return StakeError::AlreadyDeactivated;
        }
        delegation.deactivation_epoch = clock().epoch;
        store_stake_state(stake, state);
        return outcome::success();
    }

    Result<void> operator()(Merge const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &destination = accounts_[0];
        auto const &source = accounts_[1];
        if (SPOOL_UNLIKELY(source.key() == destination.key())) {
            return InstructionError::InvalidArgument;
        }
        BOOST_OUTCOME_TRY(auto dest_state, load_stake_state(destination));
        BOOST_OUTCOME_TRY(auto const source_state, load_stake_state(source));
        BOOST_OUTCOME_TRY(require_initialized(dest_state));
        BOOST_OUTCOME_TRY(
            require_signer(accounts_, dest_state.meta.authorized.staker));

        auto const epoch = clock().epoch;
        BOOST_OUTCOME_TRY(auto const dest_kind, merge_kind(dest_state, epoch));
        BOOST_OUTCOME_TRY(
            auto const source_kind, merge_kind(source_state, epoch));
        BOOST_OUTCOME_TRY(metas_can_merge(dest_state.meta, source_state.meta));

        auto &dest_delegation = dest_state.stake.delegation;
        auto const &source_delegation = source_state.stake.delegation;
        auto const voters_match = [&]() -> Result<void> {
            if (SPOOL_UNLIKELY(
                    dest_delegation.voter_pubkey !=
                    source_delegation.voter_pubkey)) {
                return StakeError::VoteAddressMismatch;
            }
            return outcome::success();
        };

        if (dest_kind == MergeKind::Inactive &&
            (source_kind == MergeKind::Inactive ||
             source_kind == MergeKind::ActivationEpoch)) {
            // lamports only
        }
        else if (
            dest_kind == MergeKind::ActivationEpoch &&
            source_kind == MergeKind::Inactive) {
            dest_delegation.stake =
                dest_delegation.stake.native() + source.lamports();
        }
        else if (
            dest_kind == MergeKind::ActivationEpoch &&
            source_kind == MergeKind::ActivationEpoch) {
            BOOST_OUTCOME_TRY(voters_match());
            dest_delegation.stake =
                dest_delegation.stake.native() + source.lamports();
        }
        else if (
            dest_kind == MergeKind::FullyActive &&
            source_kind == MergeKind::FullyActive) {
            BOOST_OUTCOME_TRY(voters_match());
            dest_delegation.stake = dest_delegation.stake.native() +
                                    source_delegation.stake.native();
        }
        else {
            return StakeError::MergeMismatch;
        }

        store_stake_state(destination, dest_state);
        store_stake_state(source, StakeStateV2{});
        return move_lamports_between(source, destination, source.lamports());
    }

    Result<void> operator()(GetMinimumDelegation const &)
    {
        byte_string data;
        encode_fixed(data, u64_le{minimum_delegation_});
        ctx_.set_return_data(data);
        return outcome::success();
    }

    Result<void> operator()(MoveLamports const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &source = accounts_[0];
        auto const &destination = accounts_[1];
        if (SPOOL_UNLIKELY(source.key() == destination.key())) {
            return InstructionError::InvalidInstructionData;
        }
        if (SPOOL_UNLIKELY(ix.lamports == 0)) {
            return InstructionError::InvalidArgument;
        }
        BOOST_OUTCOME_TRY(auto const source_state, load_stake_state(source));
        BOOST_OUTCOME_TRY(auto const dest_state, load_stake_state(destination));
        BOOST_OUTCOME_TRY(
            require_signer(accounts_, source_state.meta.authorized.staker));

        auto const epoch = clock().epoch;
        BOOST_OUTCOME_TRY(
            auto const source_kind, merge_kind(source_state, epoch));
        BOOST_OUTCOME_TRY(auto const dest_kind, merge_kind(dest_state, epoch));
        if (SPOOL_UNLIKELY(
                source_kind == MergeKind::ActivationEpoch ||
                dest_kind == MergeKind::ActivationEpoch)) {
            return StakeError::MergeTransientStake;
        }
        BOOST_OUTCOME_TRY(metas_can_merge(source_state.meta, dest_state.meta));
        if (source_kind == MergeKind::FullyActive &&
            dest_kind == MergeKind::FullyActive &&
            SPOOL_UNLIKELY(
                source_state.stake.delegation.voter_pubkey !=
                dest_state.stake.delegation.voter_pubkey)) {
            return StakeError::VoteAddressMismatch;
        }
        if (SPOOL_UNLIKELY(
                ix.lamports > free_lamports(source, source_state, epoch))) {
            return InstructionError::InvalidArgument;
        }
        return move_lamports_between(source, destination, ix.lamports);
    }
};

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_STAKE_NAMESPACE_BEGIN

Result<void> StakeProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    BOOST_OUTCOME_TRY(auto const instruction, decode_stake_instruction(data));
    return std::visit(
        StakeInstructionHandler{ctx, accounts, minimum_delegation_},
        instruction);
}

SPOOL_STAKE_NAMESPACE_END
