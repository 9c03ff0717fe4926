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

#include <spool/bank/bank.hpp>
#include <spool/native/stake/stake_error.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/vote/vote_instruction.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace spool;
using namespace spool::stake;

namespace
{
    constexpr Pubkey PAYER{0x01_bytes32};
    constexpr Pubkey VOTE{0x02_bytes32};
    constexpr Pubkey NODE{0x03_bytes32};
    constexpr Pubkey OWNER{0x04_bytes32};

    class StakeProgramTest : public ::testing::Test
    {
    protected:
        Bank bank{BankConfig{.minimum_delegation = LAMPORTS_PER_SOL}};

        StakeProgramTest()
        {
            bank.airdrop(PAYER, 1'000 * LAMPORTS_PER_SOL);
            EXPECT_FALSE(process(
                             vote::create_account(
                                 PAYER,
                                 VOTE,
                                 vote::VoteInit{
                                     .node_pubkey = NODE,
                                     .authorized_voter = NODE,
                                     .authorized_withdrawer = NODE,
                                     .commission = 0},
                                 bank.rent().minimum_balance(
                                     vote::VOTE_STATE_SIZE)),
                             {VOTE, NODE})
                             .has_error());
        }

        Result<void> process(
            std::vector<Instruction> instructions,
            std::vector<Pubkey> signers = {})
        {
            signers.push_back(PAYER);
            return bank.process_transaction(
                Transaction{std::move(instructions), std::move(signers)});
        }

        uint64_t reserve() const
        {
            return bank.rent().minimum_balance(STAKE_STATE_SIZE);
        }

        void create_stake(
            Pubkey const &stake, uint64_t const amount,
            Pubkey const &authority = OWNER)
        {
            auto instructions = create_account(
                PAYER,
                stake,
                Authorized::both(authority),
                Lockup{},
                reserve() + amount);
            instructions.push_back(delegate_stake(stake, authority, VOTE));
            auto const res =
                process(std::move(instructions), {stake, authority});
            ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
        }

        // an uninitialized stake-owned account to split into
        void create_split_destination(Pubkey const &stake)
        {
            auto const res = process(
                {system::create_account(
                    PAYER,
                    stake,
                    reserve(),
                    STAKE_STATE_SIZE,
                    STAKE_PROGRAM_ID)},
                {stake});
            ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
        }

        StakeStateV2 state(Pubkey const &stake) const
        {
            auto const *const account = bank.get_account(stake);
            EXPECT_NE(account, nullptr);
            auto const res = load_stake_state(*account);
            EXPECT_TRUE(res.has_value());
            return res.value();
        }

        ActivationStatus status(Pubkey const &stake) const
        {
            return activation_status(
                state(stake).stake.delegation, bank.clock().epoch);
        }
    };
}

TEST(StakeState, activation_status)
{
    Delegation delegation{};
    delegation.activation_epoch = 5u;
    delegation.deactivation_epoch = EPOCH_MAX;
    EXPECT_EQ(activation_status(delegation, 4), ActivationStatus::Activating);
    EXPECT_EQ(activation_status(delegation, 5), ActivationStatus::Activating);
    EXPECT_EQ(activation_status(delegation, 6), ActivationStatus::Active);
    EXPECT_TRUE(is_fully_active(delegation, 6));
    EXPECT_FALSE(is_fully_active(delegation, 5));

    delegation.deactivation_epoch = 8u;
    EXPECT_EQ(activation_status(delegation, 8), ActivationStatus::Deactivating);
    EXPECT_EQ(activation_status(delegation, 9), ActivationStatus::Inactive);
    EXPECT_FALSE(is_fully_active(delegation, 8));

    // deactivated in its activation epoch
    delegation.deactivation_epoch = 5u;
    EXPECT_EQ(activation_status(delegation, 5), ActivationStatus::Inactive);
}

TEST_F(StakeProgramTest, delegate_deactivate_withdraw)
{
    Pubkey const stake{0x10_bytes32};
    create_stake(stake, 5 * LAMPORTS_PER_SOL);
    EXPECT_EQ(state(stake).state(), StakeStateKind::Stake);
    EXPECT_EQ(
        state(stake).stake.delegation.stake.native(), 5 * LAMPORTS_PER_SOL);
    EXPECT_EQ(status(stake), ActivationStatus::Activating);

    bank.advance_epoch();
    EXPECT_EQ(status(stake), ActivationStatus::Active);

    ASSERT_FALSE(
        process({deactivate_stake(stake, OWNER)}, {OWNER}).has_error());
    EXPECT_EQ(status(stake), ActivationStatus::Deactivating);
    EXPECT_EQ(
        process({deactivate_stake(stake, OWNER)}, {OWNER}).error(),
        StakeError::AlreadyDeactivated);

    auto const total = bank.balance(stake);
    auto const early =
        process({withdraw(stake, OWNER, PAYER, total)}, {OWNER});
    EXPECT_EQ(early.error(), InstructionError::InsufficientFunds);

    bank.advance_epoch();
    EXPECT_EQ(status(stake), ActivationStatus::Inactive);
    auto const payer_before = bank.balance(PAYER);
    ASSERT_FALSE(
        process({withdraw(stake, OWNER, PAYER, total)}, {OWNER}).has_error());
    EXPECT_EQ(bank.balance(PAYER), payer_before + total);
    EXPECT_EQ(bank.get_account(stake), nullptr);
}

TEST_F(StakeProgramTest, withdraw_requires_withdrawer)
{
    Pubkey const stake{0x10_bytes32};
    create_stake(stake, 2 * LAMPORTS_PER_SOL);
    auto const res = process({withdraw(stake, PAYER, PAYER, 1)});
    EXPECT_EQ(res.error(), InstructionError::MissingRequiredSignature);
}

TEST_F(StakeProgramTest, delegation_below_minimum)
{
    Pubkey const stake{0x10_bytes32};
    auto instructions = create_account(
        PAYER,
        stake,
        Authorized::both(OWNER),
        Lockup{},
        reserve() + LAMPORTS_PER_SOL - 1);
    instructions.push_back(delegate_stake(stake, OWNER, VOTE));
    auto const res = process(std::move(instructions), {stake, OWNER});
    EXPECT_EQ(res.error(), StakeError::InsufficientDelegation);
    // the whole transaction is rolled back
    EXPECT_EQ(bank.get_account(stake), nullptr);
}

TEST_F(StakeProgramTest, split_keeps_minimum_delegation)
{
    Pubkey const stake{0x10_bytes32};
    Pubkey const split_stake{0x11_bytes32};
    create_stake(stake, 3 * LAMPORTS_PER_SOL);
    bank.advance_epoch();

    create_split_destination(split_stake);
    auto const too_much = process(
        {split(stake, OWNER, 5 * LAMPORTS_PER_SOL / 2, split_stake)}, {OWNER});
    EXPECT_EQ(too_much.error(), StakeError::InsufficientDelegation);

    ASSERT_FALSE(
        process({split(stake, OWNER, LAMPORTS_PER_SOL, split_stake)}, {OWNER})
            .has_error());
    EXPECT_EQ(
        state(stake).stake.delegation.stake.native(), 2 * LAMPORTS_PER_SOL);
    auto const split_state = state(split_stake);
    EXPECT_EQ(split_state.stake.delegation.stake.native(), LAMPORTS_PER_SOL);
    EXPECT_EQ(split_state.meta.authorized, Authorized::both(OWNER));
    EXPECT_EQ(status(split_stake), ActivationStatus::Active);
    EXPECT_EQ(bank.balance(split_stake), reserve() + LAMPORTS_PER_SOL);
}

TEST_F(StakeProgramTest, merge_active_stakes)
{
    Pubkey const destination{0x10_bytes32};
    Pubkey const source{0x11_bytes32};
    Pubkey const stranger{0x12_bytes32};
    create_stake(destination, 2 * LAMPORTS_PER_SOL);
    create_stake(source, 3 * LAMPORTS_PER_SOL);
    create_stake(stranger, 3 * LAMPORTS_PER_SOL, PAYER);
    bank.advance_epoch();

    auto const mismatch =
        process({merge(destination, stranger, OWNER)}, {OWNER});
    EXPECT_EQ(mismatch.error(), StakeError::MergeMismatch);

    auto const lamports = bank.balance(destination) + bank.balance(source);
    ASSERT_FALSE(
        process({merge(destination, source, OWNER)}, {OWNER}).has_error());
    EXPECT_EQ(
        state(destination).stake.delegation.stake.native(),
        5 * LAMPORTS_PER_SOL);
    EXPECT_EQ(bank.balance(destination), lamports);
    EXPECT_EQ(bank.get_account(source), nullptr);
}

TEST_F(StakeProgramTest, merge_rejects_transient_stake)
{
    Pubkey const destination{0x10_bytes32};
    Pubkey const source{0x11_bytes32};
    create_stake(destination, 2 * LAMPORTS_PER_SOL);
    create_stake(source, 2 * LAMPORTS_PER_SOL);
    bank.advance_epoch();
    ASSERT_FALSE(
        process({deactivate_stake(source, OWNER)}, {OWNER}).has_error());

    auto const res = process({merge(destination, source, OWNER)}, {OWNER});
    EXPECT_EQ(res.error(), StakeError::MergeTransientStake);
}

TEST_F(StakeProgramTest, redelegate_tops_up_active_stake)
{
    Pubkey const stake{0x10_bytes32};
    create_stake(stake, 2 * LAMPORTS_PER_SOL);
    bank.advance_epoch();

    ASSERT_FALSE(
        process({system::transfer(PAYER, stake, LAMPORTS_PER_SOL)})
            .has_error());
    ASSERT_FALSE(
        process({delegate_stake(stake, OWNER, VOTE)}, {OWNER}).has_error());
    EXPECT_EQ(
        state(stake).stake.delegation.stake.native(), 3 * LAMPORTS_PER_SOL);
    EXPECT_EQ(status(stake), ActivationStatus::Active);
}

TEST_F(StakeProgramTest, authorize_hands_over_roles)
{
    Pubkey const stake{0x10_bytes32};
    Pubkey const new_authority{0x20_bytes32};
    create_stake(stake, 2 * LAMPORTS_PER_SOL);

    ASSERT_FALSE(process(
                     {authorize(
                          stake, OWNER, new_authority, StakeAuthorize::Staker),
                      authorize(
                          stake,
                          OWNER,
                          new_authority,
                          StakeAuthorize::Withdrawer)},
                     {OWNER})
                     .has_error());
    EXPECT_EQ(state(stake).meta.authorized, Authorized::both(new_authority));

    auto const res = process(
        {authorize(stake, OWNER, OWNER, StakeAuthorize::Withdrawer)}, {OWNER});
    EXPECT_EQ(res.error(), InstructionError::MissingRequiredSignature);
}

TEST_F(StakeProgramTest, move_lamports_between_matching_accounts)
{
    Pubkey const destination{0x10_bytes32};
    Pubkey const source{0x11_bytes32};
    create_stake(destination, 2 * LAMPORTS_PER_SOL);
    create_stake(source, 2 * LAMPORTS_PER_SOL);
    bank.advance_epoch();
    ASSERT_FALSE(
        process({system::transfer(PAYER, source, LAMPORTS_PER_SOL)})
            .has_error());

    // only lamports outside the delegation and reserve move
    auto const too_much = process(
        {move_lamports(source, destination, OWNER, LAMPORTS_PER_SOL + 1)},
        {OWNER});
    EXPECT_EQ(too_much.error(), InstructionError::InvalidArgument);

    auto const before = bank.balance(destination);
    ASSERT_FALSE(
        process(
            {move_lamports(source, destination, OWNER, LAMPORTS_PER_SOL)},
            {OWNER})
            .has_error());
    EXPECT_EQ(bank.balance(destination), before + LAMPORTS_PER_SOL);
    EXPECT_EQ(
        state(destination).stake.delegation.stake.native(),
        2 * LAMPORTS_PER_SOL);
}
