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

#include <spool/core/config.hpp>
#include <spool/core/result.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/ledger.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

SPOOL_NAMESPACE_BEGIN

struct BankConfig
{
    Rent rent{};
    uint64_t minimum_delegation{1};
    uint64_t slots_per_epoch{432'000};
    uint64_t ms_per_slot{400};
    size_t max_invoke_depth{4};
};

struct Transaction
{
    std::vector<Instruction> instructions;
    std::vector<Pubkey> signers;
};

/// In-process ledger with the native programs registered. Transactions are
/// atomic: any failing instruction, or any touched account left neither
/// empty nor rent exempt, rolls the whole transaction back.
class Bank
{
    BankConfig config_;
    Ledger ledger_;
    ProgramMap programs_;
    Clock clock_;

    Result<void> check_rent() const;

public:
    explicit Bank(BankConfig const & = {});

    Bank(Bank const &) = delete;
    Bank &operator=(Bank const &) = delete;

    /// Registers a program and stores its executable account
    void add_program(std::unique_ptr<Program>);

    Result<void> process_transaction(Transaction const &);

    /// Moves the clock to the first slot of the next epoch
    void advance_epoch();

    /// Mints `lamports` of rewards for a vote account: its commission share
    /// goes to the vote account, the rest to the fully active stake
    /// delegated to it in proportion to each delegation
    Result<void> reward_vote_account(Pubkey const &vote, uint64_t lamports);

    Account const *get_account(Pubkey const &) const;
    void set_account(Pubkey const &, Account);
    void airdrop(Pubkey const &, uint64_t lamports);

    uint64_t balance(Pubkey const &) const;

    BankConfig const &config() const noexcept
    {
        return config_;
    }

    Clock const &clock() const noexcept
    {
        return clock_;
    }

    Rent const &rent() const noexcept
    {
        return config_.rent;
    }
};

SPOOL_NAMESPACE_END
