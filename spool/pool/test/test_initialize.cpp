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
#include <spool/native/token/token_state.hpp>
#include <spool/pool/error.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/pool/state.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/program_ids.hpp>
#include <spool/test/pool_fixture.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace spool;
using namespace spool::pool;

namespace
{
    class InitializeTest : public test::PoolFixture
    {
    protected:
        Result<void> initialize_pool_only()
        {
            auto instructions = initialize(
                SINGLE_POOL_PROGRAM_ID,
                vote,
                payer,
                bank.rent(),
                minimum_pool_balance(),
                true);
            instructions.resize(4);
            return process(std::move(instructions));
        }

        std::vector<Account> snapshot() const
        {
            std::vector<Account> accounts;
            for (auto const &key : {pool, pool_stake, pool_mint, pool_onramp}) {
                auto const *const account = bank.get_account(key);
                accounts.push_back(account ? *account : Account{});
            }
            return accounts;
        }
    };
}

TEST_F(InitializeTest, creates_pool_accounts)
{
    initialize_pool();

    auto const *const pool_account = bank.get_account(pool);
    ASSERT_NE(pool_account, nullptr);
    EXPECT_EQ(pool_account->owner, SINGLE_POOL_PROGRAM_ID);
    EXPECT_EQ(pool_account->lamports, bank.rent().minimum_balance(POOL_SIZE));
    auto const record = decode_pool(SINGLE_POOL_PROGRAM_ID, pool_account->data);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record.value().vote_account_address, vote);
    EXPECT_FALSE(record.value().has_metadata);
    EXPECT_FALSE(record.value().legacy);

    auto const *const mint_account = bank.get_account(pool_mint);
    ASSERT_NE(mint_account, nullptr);
    auto const mint = token::load_mint(*mint_account);
    ASSERT_TRUE(mint.has_value());
    EXPECT_EQ(mint.value().supply.native(), 0u);
    EXPECT_EQ(mint.value().decimals, 9);
    EXPECT_EQ(mint.value().mint_authority.get(), mint_authority);
    EXPECT_FALSE(mint.value().freeze_authority.get().has_value());

    auto const stake = stake_state(pool_stake);
    EXPECT_EQ(stake.state(), stake::StakeStateKind::Stake);
    EXPECT_EQ(stake.meta.authorized, stake::Authorized::both(stake_authority));
    EXPECT_EQ(stake.stake.delegation.voter_pubkey, vote);
    EXPECT_EQ(stake.stake.delegation.stake.native(), minimum_pool_balance());
    EXPECT_EQ(
        bank.balance(pool_stake),
        bank.rent().minimum_balance(stake::STAKE_STATE_SIZE) +
            minimum_pool_balance());

    auto const onramp = stake_state(pool_onramp);
    EXPECT_EQ(onramp.state(), stake::StakeStateKind::Initialized);
    EXPECT_EQ(onramp.meta.authorized, stake::Authorized::both(stake_authority));
    EXPECT_EQ(
        bank.balance(pool_onramp),
        bank.rent().minimum_balance(stake::STAKE_STATE_SIZE));

    EXPECT_EQ(token_supply(), 0u);
    EXPECT_EQ(lamports_under_management(), 0u);
}

TEST_F(InitializeTest, pool_stake_activates_next_epoch)
{
    initialize_pool();
    auto const delegation = stake_state(pool_stake).stake.delegation;
    EXPECT_EQ(
        stake::activation_status(delegation, bank.clock().epoch),
        stake::ActivationStatus::Activating);
    activate();
    EXPECT_TRUE(stake::is_fully_active(delegation, bank.clock().epoch));
}

TEST_F(InitializeTest, second_initialize_changes_nothing)
{
    initialize_pool();
    auto const before = snapshot();

    auto const res =
        process({pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::AlreadyInitialized);
    EXPECT_EQ(snapshot(), before);

    // funding included, the transfers roll back with it
    auto const balance = bank.balance(payer);
    auto const again = process(initialize(
        SINGLE_POOL_PROGRAM_ID,
        vote,
        payer,
        bank.rent(),
        minimum_pool_balance(),
        true));
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), SinglePoolError::AlreadyInitialized);
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(bank.balance(payer), balance);
}

TEST_F(InitializeTest, requires_vote_account)
{
    auto const not_vote = test::make_address(42);
    bank.airdrop(not_vote, LAMPORTS_PER_SOL);

    auto const res = process(initialize(
        SINGLE_POOL_PROGRAM_ID,
        not_vote,
        payer,
        bank.rent(),
        minimum_pool_balance(),
        true));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidValidator);
}

TEST_F(InitializeTest, requires_funding)
{
    auto res = process({pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongRentAmount);

    // stake account short of the minimum pool balance
    auto instructions = initialize(
        SINGLE_POOL_PROGRAM_ID,
        vote,
        payer,
        bank.rent(),
        minimum_pool_balance() - 1,
        true);
    res = process(std::move(instructions));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongRentAmount);
    EXPECT_EQ(bank.balance(pool), 0u);
}

TEST_F(InitializeTest, checks_accounts)
{
    auto ix = pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote);
    ix.accounts.pop_back();
    auto res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), InstructionError::NotEnoughAccountKeys);

    ix = pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote);
    ix.accounts[7].pubkey = SYSTEM_PROGRAM_ID;
    res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), InstructionError::IncorrectProgramId);

    ix = pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote);
    ix.accounts[2].pubkey = pool_onramp;
    res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidPoolStakeAccount);

    ix = pool::initialize_pool(SINGLE_POOL_PROGRAM_ID, vote);
    ix.accounts[5].pubkey = stake_authority;
    res = process({ix});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::InvalidPoolMintAuthority);
}

TEST_F(InitializeTest, onramp_for_existing_pool)
{
    ASSERT_FALSE(initialize_pool_only().has_error());
    EXPECT_EQ(bank.get_account(pool_onramp), nullptr);

    auto res = process(create_pool_onramp(
        SINGLE_POOL_PROGRAM_ID, pool, payer, bank.rent()));
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(
        stake_state(pool_onramp).state(), stake::StakeStateKind::Initialized);

    res = process(create_pool_onramp(
        SINGLE_POOL_PROGRAM_ID, pool, payer, bank.rent()));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::AlreadyInitialized);
}

TEST_F(InitializeTest, onramp_requires_rent)
{
    ASSERT_FALSE(initialize_pool_only().has_error());
    auto const res =
        process({initialize_pool_onramp(SINGLE_POOL_PROGRAM_ID, pool)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SinglePoolError::WrongRentAmount);
}
