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

#include <spool/native/stake/stake_state.hpp>
#include <spool/pool/id.hpp>
#include <spool/runtime/account.hpp>
#include <spool/test/pool_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace spool;

namespace
{
    constexpr uint64_t ALICE_DEPOSIT = 10 * LAMPORTS_PER_SOL;
    constexpr uint64_t BOB_DEPOSIT = 30 * LAMPORTS_PER_SOL;
    constexpr uint64_t TIP = 1 * LAMPORTS_PER_SOL;

    class PoolLifecycleTest : public test::PoolFixture
    {
    };
}

// Two holders deposit, a tip reaches the onramp and is staked, both exit.
// The tip ends up split between the holders pro rata.
TEST_F(PoolLifecycleTest, deposit_tip_withdraw)
{
    initialize_pool();
    activate();

    auto const alice = test::make_address(10);
    auto const bob = test::make_address(11);
    auto const alice_stake = delegate_user_stake(alice, ALICE_DEPOSIT);
    auto const bob_stake = delegate_user_stake(bob, BOB_DEPOSIT);
    auto const alice_token = create_token_account(alice);
    auto const bob_token = create_token_account(bob);
    activate();

    ASSERT_FALSE(deposit(alice, alice_stake, alice_token).has_error());
    ASSERT_FALSE(deposit(bob, bob_stake, bob_token).has_error());
    EXPECT_EQ(token_balance(alice_token), ALICE_DEPOSIT);
    EXPECT_EQ(token_balance(bob_token), BOB_DEPOSIT);
    EXPECT_EQ(lamports_under_management(), ALICE_DEPOSIT + BOB_DEPOSIT);

    bank.airdrop(pool_onramp, TIP);
    auto const res = replenish();
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(token_supply(), ALICE_DEPOSIT + BOB_DEPOSIT);
    EXPECT_EQ(lamports_under_management(), ALICE_DEPOSIT + BOB_DEPOSIT + TIP);

    auto const alice_out = test::make_address(30);
    auto const bob_out = test::make_address(31);
    ASSERT_FALSE(
        withdraw(alice, alice_token, alice_out, ALICE_DEPOSIT).has_error());
    ASSERT_FALSE(withdraw(bob, bob_token, bob_out, BOB_DEPOSIT).has_error());

    EXPECT_EQ(delegated_stake(alice_out), ALICE_DEPOSIT + TIP / 4);
    EXPECT_EQ(delegated_stake(bob_out), BOB_DEPOSIT + 3 * TIP / 4);
    EXPECT_EQ(
        delegated_stake(alice_out) + delegated_stake(bob_out),
        ALICE_DEPOSIT + BOB_DEPOSIT + TIP);

    EXPECT_EQ(token_supply(), 0u);
    EXPECT_EQ(lamports_under_management(), 0u);
    EXPECT_EQ(delegated_stake(pool_stake), minimum_pool_balance());
}

// With an uneven split the last holder out takes whatever rounding left
TEST_F(PoolLifecycleTest, last_withdrawal_takes_the_remainder)
{
    initialize_pool();
    activate();

    auto const alice = test::make_address(10);
    auto const bob = test::make_address(11);
    auto const alice_stake = delegate_user_stake(alice, ALICE_DEPOSIT);
    auto const bob_stake = delegate_user_stake(bob, ALICE_DEPOSIT);
    auto const alice_token = create_token_account(alice);
    auto const bob_token = create_token_account(bob);
    activate();
    ASSERT_FALSE(deposit(alice, alice_stake, alice_token).has_error());
    ASSERT_FALSE(deposit(bob, bob_stake, bob_token).has_error());

    // an odd tip cannot be halved
    bank.airdrop(pool_onramp, 7);
    ASSERT_FALSE(replenish().has_error());

    auto const alice_out = test::make_address(30);
    auto const bob_out = test::make_address(31);
    ASSERT_FALSE(
        withdraw(alice, alice_token, alice_out, ALICE_DEPOSIT).has_error());
    EXPECT_EQ(delegated_stake(alice_out), ALICE_DEPOSIT + 3);

    auto const remaining = lamports_under_management();
    ASSERT_FALSE(
        withdraw(bob, bob_token, bob_out, ALICE_DEPOSIT).has_error());
    EXPECT_EQ(delegated_stake(bob_out), remaining);
    EXPECT_EQ(remaining, ALICE_DEPOSIT + 4);
    EXPECT_EQ(lamports_under_management(), 0u);
}
