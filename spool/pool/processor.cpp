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
#include <spool/core/checked_math.hpp>
#include <spool/core/likely.h>
#include <spool/native/metadata/metadata_state.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/pool/address.hpp>
#include <spool/pool/conversion.hpp>
#include <spool/pool/error.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/pool/processor.hpp>
#include <spool/pool/stake_lifecycle.hpp>
#include <spool/pool/state.hpp>
#include <spool/pool/token_metadata.hpp>
#include <spool/pool/token_supply.hpp>
#include <spool/runtime/fmt/pubkey_fmt.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::pool;

constexpr std::array<char const *, 7> instruction_names{
    "InitializePool",
    "ReplenishPool",
    "DepositStake",
    "WithdrawStake",
    "CreateTokenMetadata",
    "UpdateTokenMetadata",
    "InitializePoolOnRamp"};

SinglePoolError address_error(PoolAddress const kind)
{
    switch (kind) {
    case PoolAddress::Pool:
        return SinglePoolError::InvalidPoolAccount;
    case PoolAddress::Stake:
        return SinglePoolError::InvalidPoolStakeAccount;
    case PoolAddress::Mint:
        return SinglePoolError::InvalidPoolMint;
    case PoolAddress::OnRamp:
        return SinglePoolError::InvalidPoolOnRampAccount;
    case PoolAddress::StakeAuthority:
        return SinglePoolError::InvalidPoolStakeAuthority;
    case PoolAddress::MintAuthority:
        return SinglePoolError::InvalidPoolMintAuthority;
    case PoolAddress::MplAuthority:
        return SinglePoolError::InvalidPoolMplAuthority;
    }
    return SinglePoolError::InvalidPoolAccount;
}

Result<void> check_program(AccountInfo const &info, Pubkey const &program_id)
{
    if (SPOOL_UNLIKELY(info.key() != program_id)) {
        return InstructionError::IncorrectProgramId;
    }
    return outcome::success();
}

Result<void> check_vote_account(AccountInfo const &vote)
{
    if (SPOOL_UNLIKELY(vote.owner() != VOTE_PROGRAM_ID)) {
        return SinglePoolError::InvalidValidator;
    }
    return outcome::success();
}

// Stake the pool manages for token holders, excluding the minimum balance
// it keeps for itself
Result<uint64_t> lamports_under_management(
    stake::StakeStateV2 const &pool_stake, uint64_t const minimum_delegation)
{
    auto const res = checked_sub(
        pool_stake.stake.delegation.stake.native(),
        minimum_pool_balance(minimum_delegation));
    if (SPOOL_UNLIKELY(res.has_error())) {
        return SinglePoolError::UnexpectedMathError;
    }
    return res.value();
}

Result<stake::StakeStateV2> load_pool_stake(AccountInfo const &info)
{
    BOOST_OUTCOME_TRY(auto const state, stake::load_stake_state(info));
    if (SPOOL_UNLIKELY(state.state() != stake::StakeStateKind::Stake)) {
        return SinglePoolError::WrongStakeStake;
    }
    return state;
}

class SinglePoolInstructionHandler
{
    InvokeContext &ctx_;
    AccountInfos accounts_;
    Pubkey const &program_id_;

    /// `base` is the vote account when checking the pool itself
    Result<void> check_address(
        Pubkey const &base, SinglePool const &pool, PoolAddress const kind,
        AccountInfo const &info) const
    {
        auto const address =
            create_pool_address(program_id_, base, kind, pool.bump(kind));
        if (SPOOL_UNLIKELY(
                address.has_error() || address.value() != info.key())) {
            return address_error(kind);
        }
        return outcome::success();
    }

    Pubkey sibling(
        Pubkey const &pool_key, SinglePool const &pool,
        PoolAddress const kind) const
    {
        auto const address = create_pool_address(
            program_id_, pool_key, kind, pool.bump(kind));
        SPOOL_ASSERT(address.has_value());
        return address.value();
    }

    // neither the pool stake account nor the onramp may be passed as a user
    // stake account
    Result<void> check_user_stake(
        Pubkey const &pool_key, SinglePool const &pool,
        AccountInfo const &user_stake) const
    {
        if (SPOOL_UNLIKELY(
                user_stake.key() ==
                    sibling(pool_key, pool, PoolAddress::Stake) ||
                user_stake.key() ==
                    sibling(pool_key, pool, PoolAddress::OnRamp))) {
            return SinglePoolError::InvalidPoolStakeAccountUsage;
        }
        return outcome::success();
    }

    PoolStakeAuthority stake_authority(
        Pubkey const &pool_key, SinglePool const &pool,
        AccountInfo const &info) const
    {
        return PoolStakeAuthority{
            ctx_,
            accounts_,
            pool_key,
            info.key(),
            pool.bump(PoolAddress::StakeAuthority)};
    }

    PoolMintAuthority mint_authority(
        Pubkey const &pool_key, SinglePool const &pool,
        AccountInfo const &info) const
    {
        return PoolMintAuthority{
            ctx_,
            accounts_,
            pool_key,
            info.key(),
            pool.bump(PoolAddress::MintAuthority)};
    }

    // Allocates and assigns a funded pool address, which signs for itself
    Result<void> create_pool_account(
        AccountInfo const &info, size_t const space, Pubkey const &owner,
        PoolSignerSeeds const &signer) const
    {
        std::vector<std::vector<byte_string_view>> const signer_seeds{
            signer.seeds()};
        BOOST_OUTCOME_TRY(ctx_.invoke_signed(
            system::allocate(info.key(), space), accounts_, signer_seeds));
        return ctx_.invoke_signed(
            system::assign(info.key(), owner), accounts_, signer_seeds);
    }

public:
    SinglePoolInstructionHandler(
        InvokeContext &ctx, AccountInfos const accounts,
        Pubkey const &program_id)
        : ctx_{ctx}
        , accounts_{accounts}
        , program_id_{program_id}
    {
    }

    Result<void> operator()(InitializePool const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 9));
        auto const &vote = accounts_[0];
        auto const &pool_info = accounts_[1];
        auto const &pool_stake = accounts_[2];
        auto const &pool_mint = accounts_[3];
        auto const &stake_authority_info = accounts_[4];
        auto const &mint_authority_info = accounts_[5];

        BOOST_OUTCOME_TRY(check_vote_account(vote));
        auto const pool = SinglePool::derive(program_id_, vote.key());
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(vote.key(), pool, PoolAddress::Pool, pool_info));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Stake, pool_stake));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Mint, pool_mint));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::StakeAuthority, stake_authority_info));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MintAuthority, mint_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[6], SYSTEM_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[7], TOKEN_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[8], STAKE_PROGRAM_ID));

        if (SPOOL_UNLIKELY(!pool_info.data_is_empty())) {
            return SinglePoolError::AlreadyInitialized;
        }

        auto const &rent = ctx_.rent();
        BOOST_OUTCOME_TRY(
            auto const minimum_delegation,
            get_minimum_delegation(ctx_, accounts_));
        auto const stake_required =
            checked_add(
                rent.minimum_balance(stake::STAKE_STATE_SIZE),
                minimum_pool_balance(minimum_delegation));
        if (SPOOL_UNLIKELY(stake_required.has_error())) {
            return SinglePoolError::ArithmeticOverflow;
        }
        if (SPOOL_UNLIKELY(
                pool_info.lamports() < rent.minimum_balance(POOL_SIZE) ||
                pool_mint.lamports() <
                    rent.minimum_balance(token::MINT_SIZE) ||
                pool_stake.lamports() < stake_required.value())) {
            return SinglePoolError::WrongRentAmount;
        }

        BOOST_OUTCOME_TRY(create_pool_account(
            pool_info,
            POOL_SIZE,
            program_id_,
            PoolSignerSeeds{
                vote.key(), PoolAddress::Pool, pool.bump(PoolAddress::Pool)}));
        pool_info.data_mut() = encode_pool(pool);

        BOOST_OUTCOME_TRY(create_pool_account(
            pool_mint,
            token::MINT_SIZE,
            TOKEN_PROGRAM_ID,
            PoolSignerSeeds{
                pool_key, PoolAddress::Mint, pool.bump(PoolAddress::Mint)}));
        BOOST_OUTCOME_TRY(
            mint_authority(pool_key, pool, mint_authority_info)
                .initialize_mint(pool_mint.key()));

        BOOST_OUTCOME_TRY(create_pool_account(
            pool_stake,
            stake::STAKE_STATE_SIZE,
            STAKE_PROGRAM_ID,
            PoolSignerSeeds{
                pool_key, PoolAddress::Stake, pool.bump(PoolAddress::Stake)}));
        auto const authority =
            stake_authority(pool_key, pool, stake_authority_info);
        BOOST_OUTCOME_TRY(authority.initialize(pool_stake.key()));
        BOOST_OUTCOME_TRY(authority.delegate(pool_stake.key(), vote.key()));

        LOG_INFO(
            "initialized pool {} for vote account {}", pool_key, vote.key());
        return outcome::success();
    }

    Result<void> operator()(ReplenishPool const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 6));
        auto const &vote = accounts_[0];
        auto const &pool_info = accounts_[1];
        auto const &pool_stake = accounts_[2];
        auto const &pool_onramp = accounts_[3];
        auto const &stake_authority_info = accounts_[4];

        BOOST_OUTCOME_TRY(check_vote_account(vote));
        BOOST_OUTCOME_TRY(auto const pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(vote.key(), pool, PoolAddress::Pool, pool_info));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Stake, pool_stake));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::OnRamp, pool_onramp));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::StakeAuthority, stake_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[5], STAKE_PROGRAM_ID));

        if (SPOOL_UNLIKELY(pool_onramp.owner() != STAKE_PROGRAM_ID)) {
            return SinglePoolError::OnRampDoesntExist;
        }

        BOOST_OUTCOME_TRY(auto const state, load_pool_stake(pool_stake));
        auto const &delegation = state.stake.delegation;
        auto const authority =
            stake_authority(pool_key, pool, stake_authority_info);

        switch (stake::activation_status(delegation, ctx_.clock().epoch)) {
        case stake::ActivationStatus::Activating:
            return outcome::success();
        case stake::ActivationStatus::Deactivating:
        case stake::ActivationStatus::Inactive:
            LOG_INFO("reactivating stake of pool {}", pool_key);
            return authority.delegate(pool_stake.key(), vote.key());
        case stake::ActivationStatus::Active:
            break;
        }

        BOOST_OUTCOME_TRY(
            auto const onramp_state, stake::load_stake_state(pool_onramp));
        auto const onramp_reserve =
            onramp_state.meta.rent_exempt_reserve.native();
        if (pool_onramp.lamports() > onramp_reserve) {
            BOOST_OUTCOME_TRY(authority.move_lamports(
                pool_onramp.key(),
                pool_stake.key(),
                pool_onramp.lamports() - onramp_reserve));
        }

        uint64_t const locked = delegation.stake.native() +
                                state.meta.rent_exempt_reserve.native();
        if (pool_stake.lamports() <= locked) {
            return outcome::success();
        }
        LOG_DEBUG(
            "pool {} delegating {} excess lamports",
            pool_key,
            pool_stake.lamports() - locked);
        return authority.delegate(pool_stake.key(), vote.key());
    }

    Result<void> operator()(DepositStake const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 10));
        auto const &pool_info = accounts_[0];
        auto const &pool_stake = accounts_[1];
        auto const &pool_mint = accounts_[2];
        auto const &stake_authority_info = accounts_[3];
        auto const &mint_authority_info = accounts_[4];
        auto const &user_stake = accounts_[5];
        auto const &user_token = accounts_[6];
        auto const &user_lamports = accounts_[7];

        BOOST_OUTCOME_TRY(auto const pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Stake, pool_stake));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Mint, pool_mint));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::StakeAuthority, stake_authority_info));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MintAuthority, mint_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[8], TOKEN_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[9], STAKE_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_user_stake(pool_key, pool, user_stake));

        auto const epoch = ctx_.clock().epoch;
        BOOST_OUTCOME_TRY(auto const pool_state, load_pool_stake(pool_stake));
        if (SPOOL_UNLIKELY(
                !stake::is_fully_active(pool_state.stake.delegation, epoch))) {
            return SinglePoolError::WrongStakeStake;
        }

        BOOST_OUTCOME_TRY(
            auto const user_state, stake::load_stake_state(user_stake));
        if (SPOOL_UNLIKELY(
                user_state.state() != stake::StakeStateKind::Stake)) {
            return SinglePoolError::WrongStakeStake;
        }
        auto const &user_delegation = user_state.stake.delegation;
        if (SPOOL_UNLIKELY(
                user_delegation.voter_pubkey != pool.vote_account_address)) {
            return SinglePoolError::WrongValidator;
        }
        if (SPOOL_UNLIKELY(!stake::is_fully_active(user_delegation, epoch))) {
            return SinglePoolError::StakeNotFullyActive;
        }
        if (SPOOL_UNLIKELY(
                user_state.meta.authorized !=
                    stake::Authorized::both(stake_authority_info.key()) ||
                user_state.meta.lockup != stake::Lockup{})) {
            return SinglePoolError::WrongStakeStake;
        }

        BOOST_OUTCOME_TRY(
            auto const minimum_delegation,
            get_minimum_delegation(ctx_, accounts_));
        BOOST_OUTCOME_TRY(
            auto const pool_lamports,
            lamports_under_management(pool_state, minimum_delegation));
        BOOST_OUTCOME_TRY(auto const supply, token_supply(pool_mint));
        auto const deposit = user_delegation.stake.native();
        BOOST_OUTCOME_TRY(
            auto const tokens,
            calculate_deposit_amount(pool_lamports, supply, deposit));
        if (SPOOL_UNLIKELY(tokens == 0)) {
            return SinglePoolError::DepositTooSmall;
        }

        auto const pre_lamports = pool_stake.lamports();
        auto const pre_stake = pool_state.stake.delegation.stake.native();
        auto const authority =
            stake_authority(pool_key, pool, stake_authority_info);
        BOOST_OUTCOME_TRY(authority.merge(pool_stake.key(), user_stake.key()));

        // whatever the merge added beyond stake is the depositor's reserve
        // and any undelegated lamports, which go back to them
        BOOST_OUTCOME_TRY(auto const merged, load_pool_stake(pool_stake));
        auto const stake_added =
            merged.stake.delegation.stake.native() - pre_stake;
        auto const lamports_added = pool_stake.lamports() - pre_lamports;
        if (SPOOL_UNLIKELY(lamports_added < stake_added)) {
            return SinglePoolError::UnexpectedMathError;
        }
        if (auto const refund = lamports_added - stake_added; refund > 0) {
            BOOST_OUTCOME_TRY(authority.withdraw(
                pool_stake.key(), user_lamports.key(), refund));
        }

        BOOST_OUTCOME_TRY(
            mint_authority(pool_key, pool, mint_authority_info)
                .mint_to(pool_mint.key(), user_token.key(), tokens));

        LOG_DEBUG(
            "pool {} took {} lamports of stake for {} tokens",
            pool_key,
            stake_added,
            tokens);
        return outcome::success();
    }

    Result<void> operator()(WithdrawStake const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 9));
        auto const &pool_info = accounts_[0];
        auto const &pool_stake = accounts_[1];
        auto const &pool_mint = accounts_[2];
        auto const &stake_authority_info = accounts_[3];
        auto const &mint_authority_info = accounts_[4];
        auto const &user_stake = accounts_[5];
        auto const &user_token = accounts_[6];

        BOOST_OUTCOME_TRY(auto const pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Stake, pool_stake));
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Mint, pool_mint));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::StakeAuthority, stake_authority_info));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MintAuthority, mint_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[7], TOKEN_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[8], STAKE_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_user_stake(pool_key, pool, user_stake));

        BOOST_OUTCOME_TRY(auto const pool_state, load_pool_stake(pool_stake));
        BOOST_OUTCOME_TRY(
            auto const minimum_delegation,
            get_minimum_delegation(ctx_, accounts_));
        BOOST_OUTCOME_TRY(
            auto const pool_lamports,
            lamports_under_management(pool_state, minimum_delegation));
        BOOST_OUTCOME_TRY(auto const supply, token_supply(pool_mint));
        BOOST_OUTCOME_TRY(
            auto const withdraw_lamports,
            calculate_withdraw_amount(pool_lamports, supply, ix.token_amount));

        if (SPOOL_UNLIKELY(withdraw_lamports == 0)) {
            return SinglePoolError::WithdrawalTooSmall;
        }
        if (SPOOL_UNLIKELY(withdraw_lamports > pool_lamports)) {
            return SinglePoolError::PoolWouldBeUndersized;
        }
        auto const destination_lamports =
            checked_add(user_stake.lamports(), withdraw_lamports);
        if (SPOOL_UNLIKELY(destination_lamports.has_error())) {
            return SinglePoolError::ArithmeticOverflow;
        }
        if (SPOOL_UNLIKELY(
                destination_lamports.value() <
                ctx_.rent().minimum_balance(stake::STAKE_STATE_SIZE))) {
            return SinglePoolError::InsufficientWithdrawAmount;
        }

        BOOST_OUTCOME_TRY(
            mint_authority(pool_key, pool, mint_authority_info)
                .burn(user_token.key(), pool_mint.key(), ix.token_amount));

        auto const authority =
            stake_authority(pool_key, pool, stake_authority_info);
        BOOST_OUTCOME_TRY(authority.split(
            pool_stake.key(), withdraw_lamports, user_stake.key()));
        BOOST_OUTCOME_TRY(
            authority.authorize(user_stake.key(), ix.user_stake_authority));

        LOG_DEBUG(
            "pool {} burned {} tokens for {} lamports of stake",
            pool_key,
            ix.token_amount,
            withdraw_lamports);
        return outcome::success();
    }

    Result<void> operator()(CreateTokenMetadata const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 8));
        auto const &pool_info = accounts_[0];
        auto const &pool_mint = accounts_[1];
        auto const &mint_authority_info = accounts_[2];
        auto const &mpl_authority_info = accounts_[3];
        auto const &payer = accounts_[4];
        auto const &metadata_info = accounts_[5];

        BOOST_OUTCOME_TRY(auto pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::Mint, pool_mint));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MintAuthority, mint_authority_info));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MplAuthority, mpl_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[6], METADATA_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[7], SYSTEM_PROGRAM_ID));

        if (SPOOL_UNLIKELY(!payer.is_signer())) {
            return SinglePoolError::SignatureMissing;
        }
        if (SPOOL_UNLIKELY(
                metadata_info.key() !=
                metadata::find_metadata_address(pool_mint.key()))) {
            return SinglePoolError::InvalidMetadataAccount;
        }

        BOOST_OUTCOME_TRY(create_pool_metadata(
            ctx_,
            accounts_,
            pool,
            PoolMetadataAccounts{
                .pool = pool_key,
                .mint = pool_mint.key(),
                .mint_authority = mint_authority_info.key(),
                .mpl_authority = mpl_authority_info.key(),
                .metadata = metadata_info.key()},
            payer.key()));

        // the legacy record has no room for the flag
        if (!pool.legacy) {
            pool.has_metadata = true;
            pool_info.data_mut() = encode_pool(pool);
        }
        return outcome::success();
    }

    Result<void> operator()(UpdateTokenMetadata const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 6));
        auto const &vote = accounts_[0];
        auto const &pool_info = accounts_[1];
        auto const &mpl_authority_info = accounts_[2];
        auto const &withdrawer = accounts_[3];
        auto const &metadata_info = accounts_[4];

        BOOST_OUTCOME_TRY(check_vote_account(vote));
        BOOST_OUTCOME_TRY(auto const pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(vote.key(), pool, PoolAddress::Pool, pool_info));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::MplAuthority, mpl_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[5], METADATA_PROGRAM_ID));

        auto const mint = sibling(pool_key, pool, PoolAddress::Mint);
        if (SPOOL_UNLIKELY(
                metadata_info.key() != metadata::find_metadata_address(mint))) {
            return SinglePoolError::InvalidMetadataAccount;
        }
        if (SPOOL_UNLIKELY(!withdrawer.is_signer())) {
            return SinglePoolError::SignatureMissing;
        }
        BOOST_OUTCOME_TRY(
            auto const vote_withdrawer,
            vote::authorized_withdrawer(vote.account()));
        if (SPOOL_UNLIKELY(withdrawer.key() != vote_withdrawer)) {
            return SinglePoolError::InvalidMetadataSigner;
        }

        return update_pool_metadata(
            ctx_,
            accounts_,
            pool,
            pool_key,
            metadata_info.key(),
            mpl_authority_info.key(),
            metadata::DataV2{
                .name = ix.name,
                .symbol = ix.symbol,
                .uri = ix.uri,
                .seller_fee_basis_points = 0});
    }

    Result<void> operator()(InitializePoolOnRamp const &)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 5));
        auto const &pool_info = accounts_[0];
        auto const &pool_onramp = accounts_[1];
        auto const &stake_authority_info = accounts_[2];

        BOOST_OUTCOME_TRY(auto const pool, load_pool(program_id_, pool_info));
        auto const &pool_key = pool_info.key();
        BOOST_OUTCOME_TRY(
            check_address(pool_key, pool, PoolAddress::OnRamp, pool_onramp));
        BOOST_OUTCOME_TRY(check_address(
            pool_key, pool, PoolAddress::StakeAuthority, stake_authority_info));
        BOOST_OUTCOME_TRY(check_program(accounts_[3], SYSTEM_PROGRAM_ID));
        BOOST_OUTCOME_TRY(check_program(accounts_[4], STAKE_PROGRAM_ID));

        if (SPOOL_UNLIKELY(pool_onramp.owner() == STAKE_PROGRAM_ID)) {
            return SinglePoolError::AlreadyInitialized;
        }
        if (SPOOL_UNLIKELY(
                pool_onramp.lamports() <
                ctx_.rent().minimum_balance(stake::STAKE_STATE_SIZE))) {
            return SinglePoolError::WrongRentAmount;
        }

        BOOST_OUTCOME_TRY(create_pool_account(
            pool_onramp,
            stake::STAKE_STATE_SIZE,
            STAKE_PROGRAM_ID,
            PoolSignerSeeds{
                pool_key,
                PoolAddress::OnRamp,
                pool.bump(PoolAddress::OnRamp)}));
        return stake_authority(pool_key, pool, stake_authority_info)
            .initialize(pool_onramp.key());
    }
};

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_POOL_NAMESPACE_BEGIN

Result<void> SinglePoolProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    char const *name = "malformed instruction";
    auto res = [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(auto const instruction, decode_instruction(data));
        name = instruction_names[instruction.index()];
        return std::visit(
            SinglePoolInstructionHandler{ctx, accounts, id()}, instruction);
    }();
    if (res.has_error()) {
        LOG_ERROR(
            "single pool rejected {}: {}",
            name,
            res.assume_error().message().c_str());
    }
    return res;
}

SPOOL_POOL_NAMESPACE_END
