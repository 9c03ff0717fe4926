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
#include <spool/native/system/system_instruction.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/test/pool_fixture.hpp>

#include <gtest/gtest.h>

using namespace spool;

namespace
{
    class BankTest : public test::PoolFixture
    {
    protected:
        Pubkey alice{test::make_address(10)};
        Pubkey bob{test::make_address(11)};
        Pubkey carol{test::make_address(12)};

        BankTest()
        {
            bank.airdrop(alice, 5 * LAMPORTS_PER_SOL);
        }
    };
}

TEST_F(BankTest, transaction_is_atomic)
{
    auto const res = process(
        {system::transfer(alice, bob, LAMPORTS_PER_SOL),
         system::transfer(alice, carol, 10 * LAMPORTS_PER_SOL)},
        {alice});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(bank.balance(alice), 5 * LAMPORTS_PER_SOL);
    EXPECT_EQ(bank.get_account(bob), nullptr);
    EXPECT_EQ(bank.get_account(carol), nullptr);
}

TEST_F(BankTest, requires_signature)
{
    auto const res = process({system::transfer(alice, bob, 1'000)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), InstructionError::MissingRequiredSignature);
}

TEST_F(BankTest, rent_is_checked_after_the_transaction)
{
    auto const minimum = bank.rent().minimum_balance(0);

    auto res = process({system::transfer(alice, bob, minimum - 1)}, {alice});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), InstructionError::InsufficientFundsForRent);
    EXPECT_EQ(bank.balance(bob), 0u);

    // topped up within the same transaction
    res = process(
        {system::transfer(alice, bob, minimum - 1),
         system::transfer(alice, bob, 1)},
        {alice});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(bank.balance(bob), minimum);
}

TEST_F(BankTest, emptied_accounts_are_removed)
{
    auto const res = process(
        {system::transfer(alice, bob, bank.balance(alice))}, {alice, bob});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(bank.get_account(alice), nullptr);
    EXPECT_EQ(bank.balance(bob), 5 * LAMPORTS_PER_SOL);
}

TEST_F(BankTest, advance_epoch_moves_the_clock)
{
    auto const epoch = bank.clock().epoch;
    bank.advance_epoch();
    EXPECT_EQ(bank.clock().epoch, epoch + 1);
    EXPECT_EQ(
        bank.clock().slot, bank.clock().epoch * bank.config().slots_per_epoch);
    EXPECT_GT(bank.clock().unix_timestamp, 0);
}

TEST_F(BankTest, rewards_go_to_active_stake_pro_rata)
{
    auto const first = create_user_stake(
        alice, test::make_address(20), LAMPORTS_PER_SOL, vote);
    auto const second = create_user_stake(
        alice, test::make_address(21), 3 * LAMPORTS_PER_SOL, vote);

    // nothing is active yet, the vote account keeps everything
    auto const vote_balance = bank.balance(vote);
    ASSERT_FALSE(bank.reward_vote_account(vote, 400).has_error());
    EXPECT_EQ(bank.balance(vote), vote_balance + 400);
    EXPECT_EQ(delegated_stake(first), LAMPORTS_PER_SOL);

    activate();
    auto const first_balance = bank.balance(first);
    ASSERT_FALSE(bank.reward_vote_account(vote, 400).has_error());
    EXPECT_EQ(delegated_stake(first), LAMPORTS_PER_SOL + 100);
    EXPECT_EQ(delegated_stake(second), 3 * LAMPORTS_PER_SOL + 300);
    EXPECT_EQ(bank.balance(first), first_balance + 100);
}

TEST_F(BankTest, rewards_need_a_vote_account)
{
    auto const res = bank.reward_vote_account(alice, 400);
    ASSERT_TRUE(res.has_error());
}
