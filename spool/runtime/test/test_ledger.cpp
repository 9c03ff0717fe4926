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

#include <spool/runtime/account.hpp>
#include <spool/runtime/ledger.hpp>

#include <gtest/gtest.h>

using namespace spool;

namespace
{
    constexpr Pubkey A{0x01_bytes32};
    constexpr Pubkey B{0x02_bytes32};
}

TEST(Ledger, touch_creates_system_account)
{
    Ledger ledger;
    EXPECT_EQ(ledger.find(A), nullptr);
    Account &account = ledger.touch(A);
    EXPECT_EQ(account, Account{});
    EXPECT_EQ(account.owner, SYSTEM_PROGRAM_ID);
    EXPECT_EQ(ledger.find(A), &account);
}

TEST(Ledger, reject_restores_touched_accounts)
{
    Ledger ledger;
    ledger.store(A, Account{.lamports = 10});

    ledger.push();
    Account &a = ledger.touch(A);
    a.lamports = 3;
    a.data = {1, 2, 3};
    ledger.touch(B).lamports = 7;
    EXPECT_EQ(ledger.touched().size(), 2u);
    ledger.pop_reject();

    ASSERT_NE(ledger.find(A), nullptr);
    EXPECT_EQ(*ledger.find(A), Account{.lamports = 10});
    // restored in place
    EXPECT_EQ(&a, ledger.find(A));
    EXPECT_EQ(ledger.find(B)->lamports, 0u);

    ledger.purge();
    EXPECT_EQ(ledger.find(B), nullptr);
    EXPECT_NE(ledger.find(A), nullptr);
}

TEST(Ledger, nested_checkpoints)
{
    Ledger ledger;
    ledger.store(A, Account{.lamports = 10});

    ledger.push();
    ledger.touch(A).lamports = 20;
    ledger.push();
    ledger.touch(A).lamports = 30;
    ledger.touch(B).lamports = 5;
    EXPECT_EQ(ledger.depth(), 2u);
    ledger.pop_accept();

    // the outer checkpoint keeps the value from before it was pushed
    EXPECT_EQ(ledger.touched().at(A)->lamports, 10u);
    EXPECT_FALSE(ledger.touched().at(B).has_value());
    EXPECT_EQ(ledger.find(A)->lamports, 30u);

    ledger.pop_reject();
    EXPECT_EQ(ledger.depth(), 0u);
    EXPECT_EQ(ledger.find(A)->lamports, 10u);
    EXPECT_EQ(ledger.find(B)->lamports, 0u);
}

TEST(Ledger, accept_keeps_changes)
{
    Ledger ledger;
    ledger.push();
    ledger.touch(A).lamports = 42;
    ledger.push();
    ledger.touch(A).data = {9};
    ledger.pop_accept();
    ledger.pop_accept();
    ledger.purge();
    ASSERT_NE(ledger.find(A), nullptr);
    EXPECT_EQ(*ledger.find(A), (Account{.lamports = 42, .data = {9}}));
}

TEST(Rent, minimum_balance)
{
    Rent const rent;
    EXPECT_EQ(rent.minimum_balance(0), 890'880u);
    EXPECT_EQ(rent.minimum_balance(200), 2'282'880u);
    EXPECT_TRUE(rent.is_exempt(2'282'880, 200));
    EXPECT_FALSE(rent.is_exempt(2'282'879, 200));
}
