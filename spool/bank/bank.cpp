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
#include <spool/core/assert.h>
#include <spool/core/checked_math.hpp>
#include <spool/core/likely.h>
#include <spool/native/metadata/metadata_program.hpp>
#include <spool/native/stake/stake_program.hpp>
#include <spool/native/stake/stake_state.hpp>
#include <spool/native/system/system_program.hpp>
#include <spool/native/token/associated_token.hpp>
#include <spool/native/token/token_program.hpp>
#include <spool/native/vote/vote_program.hpp>
#include <spool/native/vote/vote_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/fmt/pubkey_fmt.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>
#include <spool/runtime/program_ids.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <utility>

SPOOL_NAMESPACE_BEGIN

Bank::Bank(BankConfig const &config)
    : config_{config}
{
    add_program(std::make_unique<system::SystemProgram>());
    add_program(
        std::make_unique<stake::StakeProgram>(config_.minimum_delegation));
    add_program(std::make_unique<vote::VoteProgram>());
    add_program(std::make_unique<token::TokenProgram>());
    add_program(std::make_unique<token::AssociatedTokenProgram>());
    add_program(std::make_unique<metadata::MetadataProgram>());
}

void Bank::add_program(std::unique_ptr<Program> program)
{
    SPOOL_ASSERT(program);
    Pubkey const id = program->id();
    ledger_.store(
        id,
        Account{
            .lamports = 1,
            .data = {},
            .owner = NATIVE_LOADER_ID,
            .executable = true});
    programs_.insert_or_assign(id, std::move(program));
}

Result<void> Bank::check_rent() const
{
    auto const &rent = config_.rent;
    for (auto const &[key, original] : ledger_.touched()) {
        Account const *const account = ledger_.find(key);
        SPOOL_ASSERT(account != nullptr);
        if (account->lamports == 0 ||
            rent.is_exempt(account->lamports, account->data.size())) {
            continue;
        }
        // an account already short of rent may stay so if it did not shrink
        // its balance or change size
        bool const was_paying =
            original.has_value() && original->lamports > 0 &&
            !rent.is_exempt(original->lamports, original->data.size());
        if (was_paying && account->lamports >= original->lamports &&
            account->data.size() == original->data.size()) {
            continue;
        }
        LOG_WARNING(
            "account {} left with {} lamports, below rent exemption {}",
            key,
            account->lamports,
            rent.minimum_balance(account->data.size()));
        return InstructionError::InsufficientFundsForRent;
    }
    return outcome::success();
}

Result<void> Bank::process_transaction(Transaction const &transaction)
{
    ledger_.push();
    auto res = [&]() -> Result<void> {
        for (auto const &instruction : transaction.instructions) {
            InvokeContext ctx{
                ledger_,
                programs_,
                clock_,
                config_.rent,
                config_.max_invoke_depth};
            BOOST_OUTCOME_TRY(
                ctx.process_instruction(instruction, transaction.signers));
        }
        return check_rent();
    }();

    if (res.has_error()) {
        LOG_WARNING(
            "transaction with {} instructions rolled back: {}",
            transaction.instructions.size(),
            res.assume_error().message().c_str());
        ledger_.pop_reject();
    }
    else {
        ledger_.pop_accept();
    }
    ledger_.purge();
    return res;
}

void Bank::advance_epoch()
{
    clock_.epoch += 1;
    clock_.slot = clock_.epoch * config_.slots_per_epoch;
    clock_.unix_timestamp = static_cast<int64_t>(
        clock_.slot * config_.ms_per_slot / 1000);
    LOG_DEBUG("advanced to epoch {} slot {}", clock_.epoch, clock_.slot);
}

Result<void>
Bank::reward_vote_account(Pubkey const &vote, uint64_t const lamports)
{
    Account const *const vote_account = ledger_.find(vote);
    if (SPOOL_UNLIKELY(vote_account == nullptr)) {
        return InstructionError::InvalidArgument;
    }
    BOOST_OUTCOME_TRY(
        auto const header, vote::load_vote_state(*vote_account));

    std::vector<std::pair<Pubkey, uint64_t>> delegations;
    uint64_t total_stake = 0;
    for (auto const &[key, account] : ledger_.accounts()) {
        auto const state = stake::load_stake_state(account);
        if (state.has_error() ||
            state.value().state() != stake::StakeStateKind::Stake) {
            continue;
        }
        auto const &delegation = state.value().stake.delegation;
        if (delegation.voter_pubkey != vote ||
            !stake::is_fully_active(delegation, clock_.epoch)) {
            continue;
        }
        delegations.emplace_back(key, delegation.stake.native());
        BOOST_OUTCOME_TRY(
            total_stake, checked_add(total_stake, delegation.stake.native()));
    }

    BOOST_OUTCOME_TRY(
        auto const commission,
        checked_mul_div(
            lamports, std::min<uint64_t>(header.commission, 100), 100));
    uint64_t const distributable = total_stake == 0 ? 0 : lamports - commission;
    uint64_t paid = 0;
    for (auto const &[key, stake_amount] : delegations) {
        BOOST_OUTCOME_TRY(
            auto const reward,
            checked_mul_div(distributable, stake_amount, total_stake));
        Account &account = ledger_.touch(key);
        auto state = stake::load_stake_state(account);
        SPOOL_ASSERT(state.has_value());
        auto &delegation = state.value().stake.delegation;
        delegation.stake = delegation.stake.native() + reward;
        account.lamports += reward;
        encode_layout(account.data, state.value());
        paid += reward;
    }

    // commission plus rounding dust
    ledger_.touch(vote).lamports += lamports - paid;
    LOG_INFO(
        "rewarded vote account {} with {} lamports over {} delegations",
        vote,
        lamports,
        delegations.size());
    return outcome::success();
}

Account const *Bank::get_account(Pubkey const &key) const
{
    return ledger_.find(key);
}

void Bank::set_account(Pubkey const &key, Account account)
{
    ledger_.store(key, std::move(account));
}

void Bank::airdrop(Pubkey const &key, uint64_t const lamports)
{
    ledger_.touch(key).lamports += lamports;
}

uint64_t Bank::balance(Pubkey const &key) const
{
    Account const *const account = ledger_.find(key);
    return account == nullptr ? 0 : account->lamports;
}

SPOOL_NAMESPACE_END
