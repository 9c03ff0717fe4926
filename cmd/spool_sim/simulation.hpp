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

#include <spool/bank/bank.hpp>
#include <spool/core/config.hpp>
#include <spool/core/result.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/pubkey.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

SPOOL_NAMESPACE_BEGIN

struct SimulationConfig
{
    uint64_t first_stake{10 * LAMPORTS_PER_SOL};
    uint64_t second_stake{30 * LAMPORTS_PER_SOL};
    uint64_t reward_per_epoch{LAMPORTS_PER_SOL / 10};
    uint64_t tip_per_epoch{LAMPORTS_PER_SOL / 100};
    uint64_t epochs{3};
    uint64_t minimum_delegation{1};
    uint8_t commission{10};
};

/// Two stakers sharing one validator's pool: both deposit, the validator
/// earns rewards and tips for a number of epochs, both withdraw. Every step
/// is recorded for the report.
class Simulation
{
    SimulationConfig config_;
    Bank bank_;
    Pubkey payer_;
    Pubkey node_;
    Pubkey vote_;
    Pubkey pool_;
    Pubkey pool_stake_;
    Pubkey pool_mint_;
    Pubkey pool_onramp_;
    nlohmann::json steps_;

    Result<void>
    process(std::vector<Instruction>, std::vector<Pubkey> signers = {});

    Result<void> create_vote_account();
    Result<void> initialize_pool();
    Result<Pubkey> delegate(Pubkey const &staker, uint64_t lamports);
    Result<Pubkey> deposit(Pubkey const &staker, Pubkey const &stake);
    Result<uint64_t> withdraw(
        Pubkey const &staker, Pubkey const &token, Pubkey const &destination);
    Result<void> reward_epoch();

    Result<uint64_t> token_supply() const;
    Result<uint64_t> lamports_under_management() const;
    Result<void> record(std::string_view step);

public:
    explicit Simulation(SimulationConfig const &);

    Result<void> run();

    nlohmann::json report() const;
};

SPOOL_NAMESPACE_END
