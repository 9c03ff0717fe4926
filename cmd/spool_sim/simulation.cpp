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

#include "simulation.hpp"

#include <spool/core/checked_math.hpp>
#include <spool/core/ed25519.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/token/associated_token.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/native/vote/vote_instruction.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/pool/address.hpp>
#include <spool/pool/conversion.hpp>
#include <spool/pool/id.hpp>
#include <spool/pool/instruction.hpp>
#include <spool/pool/processor.hpp>
#include <spool/runtime/fmt/pubkey_fmt.hpp>
#include <spool/runtime/instruction_error.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <memory>
#include <string>
#include <utility>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using pool::SINGLE_POOL_PROGRAM_ID;

Pubkey simulated_address(uint8_t const seed)
{
    bytes32_t secret{};
    secret.bytes[0] = seed;
    secret.bytes[31] = 0xa5;
    return keypair_from_seed(secret).pubkey;
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_NAMESPACE_BEGIN

Simulation::Simulation(SimulationConfig const &config)
    : config_{config}
    , bank_{BankConfig{.minimum_delegation = config.minimum_delegation}}
    , payer_{simulated_address(1)}
    , node_{simulated_address(2)}
    , vote_{simulated_address(3)}
    , pool_{pool::find_pool_address(SINGLE_POOL_PROGRAM_ID, vote_)}
    , pool_stake_{
          pool::find_pool_stake_address(SINGLE_POOL_PROGRAM_ID, pool_)}
    , pool_mint_{pool::find_pool_mint_address(SINGLE_POOL_PROGRAM_ID, pool_)}
    , pool_onramp_{
          pool::find_pool_onramp_address(SINGLE_POOL_PROGRAM_ID, pool_)}
    , steps_(nlohmann::json::array())
{
    bank_.add_program(std::make_unique<pool::SinglePoolProgram>());
    bank_.airdrop(payer_, 1'000 * LAMPORTS_PER_SOL);
}

Result<void> Simulation::process(
    std::vector<Instruction> instructions, std::vector<Pubkey> signers)
{
    signers.push_back(payer_);
    return bank_.process_transaction(
        Transaction{std::move(instructions), std::move(signers)});
}

Result<void> Simulation::create_vote_account()
{
    BOOST_OUTCOME_TRY(process(
        vote::create_account(
            payer_,
            vote_,
            vote::VoteInit{
                .node_pubkey = node_,
                .authorized_voter = node_,
                .authorized_withdrawer = node_,
                .commission = config_.commission},
            bank_.rent().minimum_balance(vote::VOTE_STATE_SIZE)),
        {vote_, node_}));
    LOG_INFO(
        "created vote account {} with {}% commission",
        vote_,
        config_.commission);
    return outcome::success();
}

Result<void> Simulation::initialize_pool()
{
    BOOST_OUTCOME_TRY(process(pool::initialize(
        SINGLE_POOL_PROGRAM_ID,
        vote_,
        payer_,
        bank_.rent(),
        pool::minimum_pool_balance(config_.minimum_delegation))));
    LOG_INFO("pool {} mint {}", pool_, pool_mint_);
    return outcome::success();
}

Result<Pubkey>
Simulation::delegate(Pubkey const &staker, uint64_t const lamports)
{
    bank_.airdrop(staker, lamports + LAMPORTS_PER_SOL);
    BOOST_OUTCOME_TRY(process(
        pool::create_and_delegate_user_stake(
            SINGLE_POOL_PROGRAM_ID, vote_, staker, bank_.rent(), lamports),
        {staker}));
    return pool::find_default_deposit_account_address(pool_, staker);
}

Result<Pubkey> Simulation::deposit(Pubkey const &staker, Pubkey const &stake)
{
    auto const token =
        token::get_associated_token_address(staker, pool_mint_);
    BOOST_OUTCOME_TRY(process(
        {token::create_associated_token_account_idempotent(
            payer_, staker, pool_mint_)}));
    BOOST_OUTCOME_TRY(process(
        pool::deposit(
            SINGLE_POOL_PROGRAM_ID, pool_, stake, token, staker, staker),
        {staker}));

    Account const *const account = bank_.get_account(token);
    if (account == nullptr) {
        return InstructionError::UninitializedAccount;
    }
    BOOST_OUTCOME_TRY(auto const state, token::load_token_account(*account));
    LOG_INFO(
        "{} deposited {}, holds {} tokens",
        staker,
        stake,
        state.amount.native());
    return token;
}

Result<uint64_t> Simulation::withdraw(
    Pubkey const &staker, Pubkey const &token, Pubkey const &destination)
{
    Account const *const account = bank_.get_account(token);
    if (account == nullptr) {
        return InstructionError::UninitializedAccount;
    }
    BOOST_OUTCOME_TRY(auto const state, token::load_token_account(*account));
    uint64_t const tokens = state.amount.native();

    BOOST_OUTCOME_TRY(process(
        pool::withdraw(
            SINGLE_POOL_PROGRAM_ID,
            pool_,
            destination,
            staker,
            token,
            staker,
            tokens,
            payer_,
            bank_.rent()),
        {staker, destination}));

    Account const *const stake_account = bank_.get_account(destination);
    if (stake_account == nullptr) {
        return InstructionError::UninitializedAccount;
    }
    BOOST_OUTCOME_TRY(
        auto const stake, stake::load_stake_state(*stake_account));
    uint64_t const lamports = stake.stake.delegation.stake.native();
    LOG_INFO(
        "{} redeemed {} tokens for {} staked lamports in {}",
        staker,
        tokens,
        lamports,
        destination);
    return lamports;
}

Result<void> Simulation::reward_epoch()
{
    BOOST_OUTCOME_TRY(
        bank_.reward_vote_account(vote_, config_.reward_per_epoch));
    bank_.airdrop(pool_onramp_, config_.tip_per_epoch);
    bank_.advance_epoch();
    // the tip sits in the onramp until it is moved and delegated
    return process({pool::replenish_pool(SINGLE_POOL_PROGRAM_ID, vote_)});
}

Result<uint64_t> Simulation::token_supply() const
{
    Account const *const account = bank_.get_account(pool_mint_);
    if (account == nullptr) {
        return InstructionError::UninitializedAccount;
    }
    BOOST_OUTCOME_TRY(auto const mint, token::load_mint(*account));
    return mint.supply.native();
}

Result<uint64_t> Simulation::lamports_under_management() const
{
    Account const *const account = bank_.get_account(pool_stake_);
    if (account == nullptr) {
        return InstructionError::UninitializedAccount;
    }
    BOOST_OUTCOME_TRY(auto const state, stake::load_stake_state(*account));
    return checked_sub(
        state.stake.delegation.stake.native(),
        pool::minimum_pool_balance(config_.minimum_delegation));
}

Result<void> Simulation::record(std::string_view const step)
{
    BOOST_OUTCOME_TRY(auto const supply, token_supply());
    BOOST_OUTCOME_TRY(auto const lamports, lamports_under_management());

    nlohmann::json entry{
        {"step", step},
        {"epoch", bank_.clock().epoch},
        {"token_supply", supply},
        {"lamports_under_management", lamports},
        {"onramp_lamports", bank_.balance(pool_onramp_)}};
    if (supply == 0) {
        entry["share_price"] = nullptr;
    }
    else {
        entry["share_price"] =
            static_cast<double>(lamports) / static_cast<double>(supply);
    }
    LOG_DEBUG(
        "{}: supply {} under management {}", step, supply, lamports);
    steps_.push_back(std::move(entry));
    return outcome::success();
}

Result<void> Simulation::run()
{
    BOOST_OUTCOME_TRY(create_vote_account());
    BOOST_OUTCOME_TRY(initialize_pool());
    BOOST_OUTCOME_TRY(record("initialize"));
    bank_.advance_epoch();

    auto const first = simulated_address(10);
    auto const second = simulated_address(11);
    BOOST_OUTCOME_TRY(
        auto const first_stake, delegate(first, config_.first_stake));
    BOOST_OUTCOME_TRY(
        auto const second_stake, delegate(second, config_.second_stake));
    bank_.advance_epoch();

    BOOST_OUTCOME_TRY(auto const first_token, deposit(first, first_stake));
    BOOST_OUTCOME_TRY(record("deposit first"));
    BOOST_OUTCOME_TRY(auto const second_token, deposit(second, second_stake));
    BOOST_OUTCOME_TRY(record("deposit second"));

    for (uint64_t i = 0; i < config_.epochs; ++i) {
        BOOST_OUTCOME_TRY(reward_epoch());
        BOOST_OUTCOME_TRY(record("epoch " + std::to_string(i + 1)));
    }

    BOOST_OUTCOME_TRY(
        auto const first_out,
        withdraw(first, first_token, simulated_address(20)));
    BOOST_OUTCOME_TRY(record("withdraw first"));
    BOOST_OUTCOME_TRY(
        auto const second_out,
        withdraw(second, second_token, simulated_address(21)));
    BOOST_OUTCOME_TRY(record("withdraw second"));

    LOG_INFO(
        "deposited {} lamports, withdrew {}",
        config_.first_stake + config_.second_stake,
        first_out + second_out);
    return outcome::success();
}

nlohmann::json Simulation::report() const
{
    return nlohmann::json{
        {"vote_account", to_string(vote_)},
        {"pool", to_string(pool_)},
        {"pool_mint", to_string(pool_mint_)},
        {"steps", steps_}};
}

SPOOL_NAMESPACE_END
