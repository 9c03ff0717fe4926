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

#include <spool/core/int.hpp>
#include <spool/native/stake/stake_instruction.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/vote/vote_instruction.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/pool/error.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/runtime/account.hpp>
#include <spool/test/pool_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace spool;
using namespace spool::pool;

namespace
{
    constexpr uint64_t DEPOSIT = 10 * LAMPORTS_PER_SOL;

    class DepositTest : public test::PoolFixture
    {
    protected:
        Pubkey alice{test::make_address(10)};
        Pubkey bob{test::make_address(11)};

        DepositTest()
        {
            initialize_pool();
        }

        uint64_t reserve() const
        {
            return bank.rent().minimum_balance(stake::STAKE_STATE_SIZE);
        }

        // lamports under management per token, compared without division
        bool price_at_least(
            uint64_t const stake, uint64_t const supply,
            uint64_t const prior_stake, uint64_t const prior_supply) const
        {
            return uint128_t{stake} * prior_supply >=
                   uint128_t{prior_stake} * supply;
        }
    };
}

TEST_F(DepositTest, first_deposit_mints_at_parity)
{
    auto const user_stake = delegate_user_stake(alice, DEPOSIT);
    auto const user_token = create_token_account(alice);
    activate();

    auto const balance = bank.balance(alice);
    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();

    EXPECT_EQ(token_balance(user_token), DEPOSIT);
    EXPECT_EQ(token_supply(), DEPOSIT);
    EXPECT_EQ(lamports_under_management(), DEPOSIT);
    EXPECT_EQ(
        bank.balance(pool_stake),
        reserve() + minimum_pool_balance() + DEPOSIT);

    // the deposit account is drained, its reserve refunded
    EXPECT_EQ(bank.get_account(user_stake), nullptr);
    EXPECT_EQ(bank.balance(alice), balance + reserve());
}

TEST_F(DepositTest, undelegated_lamports_are_refunded)
{
    auto const user_stake = delegate_user_stake(alice, DEPOSIT);
    auto const user_token = create_token_account(alice);
    activate();
    bank.airdrop(user_stake, 12'345);

    auto const balance = bank.balance(alice);
    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(token_balance(user_token), DEPOSIT);
    EXPECT_EQ(bank.balance(alice), balance + reserve() + 12'345);
}

TEST_F(DepositTest, second_deposit_at_parity)
{
    auto const alice_stake = delegate_user_stake(alice, DEPOSIT);
    auto const alice_token = create_token_account(alice);
    auto const bob_stake = delegate_user_stake(bob, 3 * DEPOSIT);
    auto const bob_token = create_token_account(bob);
    activate();

    ASSERT_FALSE(deposit(alice, alice_stake, alice_token).has_error());
    ASSERT_FALSE(deposit(bob, bob_stake, bob_token).has_error());
    EXPECT_EQ(token_balance(alice_token), DEPOSIT);
    EXPECT_EQ(token_balance(bob_token), 3 * DEPOSIT);
    EXPECT_EQ(token_supply(), 4 * DEPOSIT);
    EXPECT_EQ(lamports_under_management(), 4 * DEPOSIT);
}

TEST_F(DepositTest, deposits_never_lower_share_price)
{
    auto const alice_stake = delegate_user_stake(alice, DEPOSIT);
    auto const alice_token = create_token_account(alice);
    activate();
    ASSERT_FALSE(deposit(alice, alice_stake, alice_token).has_error());

    ASSERT_FALSE(
        bank.reward_vote_account(vote, 777'777'777).has_error());
    auto const stake = lamports_under_management();
    auto const supply = token_supply();
    EXPECT_GT(stake, supply);

    auto const bob_stake = delegate_user_stake(bob, DEPOSIT + 3);
    auto const bob_token = create_token_account(bob);
    activate();
    ASSERT_FALSE(deposit(bob, bob_stake, bob_token).has_error());

    auto const minted = token_balance(bob_token);
    EXPECT_LT(minted, DEPOSIT + 3);
    EXPECT_EQ(
        minted,
        static_cast<uint64_t>(
            uint128_t{DEPOSIT + 3} * supply / uint128_t{stake}));
    EXPECT_TRUE(price_at_least(
        lamports_under_management(), token_supply(), stake, supply));
}

TEST_F(DepositTest, requires_active_pool)
{
    // pool stake is still activating in its first epoch
    auto const user_stake = delegate_user_stake(alice, DEPOSIT);
    auto const user_token = create_token_account(alice);

    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongStakeStake);
}

TEST_F(DepositTest, requires_fully_active_stake)
{
    activate();
    auto const user_stake = delegate_user_stake(alice, DEPOSIT);
    auto const user_token = create_token_account(alice);

    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::StakeNotFullyActive);

    // nothing moved, the user still holds the stake
    EXPECT_EQ(
        stake_state(user_stake).meta.authorized,
        stake::Authorized::both(alice));
    EXPECT_EQ(token_supply(), 0u);
}

TEST_F(DepositTest, requires_pool_validator)
{
    auto const other_vote = test::make_address(20);
    auto const other_node = test::make_address(21);
    ASSERT_FALSE(process(
                     vote::create_account(
                         payer,
                         other_vote,
                         vote::VoteInit{
                             .node_pubkey = other_node,
                             .authorized_voter = other_node,
                             .authorized_withdrawer = other_node,
                             .commission = 0},
                         bank.rent().minimum_balance(vote::VOTE_STATE_SIZE)),
                     {other_vote, other_node})
                     .has_error());

    auto const user_stake = create_user_stake(
        alice, test::make_address(22), DEPOSIT, other_vote);
    auto const user_token = create_token_account(alice);
    activate();

    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongValidator);
}

TEST_F(DepositTest, requires_pool_authorities)
{
    auto const user_stake =
        create_user_stake(alice, test::make_address(22), DEPOSIT, vote);
    auto const user_token = create_token_account(alice);
    activate();

    // deposit without first handing over the authorities
    auto const res = process(
        {deposit_stake(
            SINGLE_POOL_PROGRAM_ID, pool, user_stake, user_token, alice)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongStakeStake);
}

TEST_F(DepositTest, rejects_lockup)
{
    auto const user_stake = test::make_address(22);
    bank.airdrop(alice, DEPOSIT + LAMPORTS_PER_SOL);
    // custodian only, the lockup itself has already expired
    stake::Lockup lockup{};
    lockup.custodian = bob;
    auto instructions = stake::create_account(
        alice,
        user_stake,
        stake::Authorized::both(alice),
        lockup,
        reserve() + DEPOSIT);
    instructions.push_back(stake::delegate_stake(user_stake, alice, vote));
    ASSERT_FALSE(
        process(std::move(instructions), {alice, user_stake}).has_error());
    auto const user_token = create_token_account(alice);
    activate();

    auto const res = deposit(alice, user_stake, user_token);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongStakeStake);
}

TEST_F(DepositTest, rejects_pool_accounts_as_source)
{
    activate();
    auto const user_token = create_token_account(alice);

    for (auto const &source : {pool_stake, pool_onramp}) {
        auto const res = process(
            {deposit_stake(
                SINGLE_POOL_PROGRAM_ID, pool, source, user_token, alice)});
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), SinglePoolError::InvalidPoolStakeAccountUsage);
    }
}

TEST_F(DepositTest, rejects_foreign_pool)
{
    auto const user_stake = delegate_user_stake(alice, DEPOSIT);
    auto const user_token = create_token_account(alice);
    activate();

    auto ix = deposit_stake(
        SINGLE_POOL_PROGRAM_ID, pool, user_stake, user_token, alice);
    ix.accounts[0].pubkey = pool_stake;
    auto const res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidPoolAccount);
}

TEST_F(DepositTest, too_small)
{
    auto const alice_stake = delegate_user_stake(alice, DEPOSIT);
    auto const alice_token = create_token_account(alice);
    activate();
    ASSERT_FALSE(deposit(alice, alice_stake, alice_token).has_error());
    // two lamports of stake per token
    ASSERT_FALSE(bank.reward_vote_account(vote, DEPOSIT).has_error());

    auto const bob_stake = delegate_user_stake(bob, 1);
    auto const bob_token = create_token_account(bob);
    activate();

    auto const supply = token_supply();
    auto const res = deposit(bob, bob_stake, bob_token);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::DepositTooSmall);
    EXPECT_EQ(token_supply(), supply);
    EXPECT_EQ(
        stake_state(bob_stake).meta.authorized, stake::Authorized::both(bob));
}
