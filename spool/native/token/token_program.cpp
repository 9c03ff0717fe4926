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

#include <spool/core/checked_math.hpp>
#include <spool/core/likely.h>
#include <spool/native/token/token_error.hpp>
#include <spool/native/token/token_instruction.hpp>
#include <spool/native/token/token_program.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/runtime/codec.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <variant>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::token;

Result<void>
validate_owner(Pubkey const &expected, AccountInfo const &authority)
{
    if (SPOOL_UNLIKELY(expected != authority.key())) {
        return TokenError::OwnerMismatch;
    }
    if (SPOOL_UNLIKELY(!authority.is_signer())) {
        return InstructionError::MissingRequiredSignature;
    }
    return outcome::success();
}

Result<void> require_unfrozen(TokenAccount const &account)
{
    if (SPOOL_UNLIKELY(account.account_state() == AccountState::Frozen)) {
        return TokenError::AccountFrozen;
    }
    return outcome::success();
}

// The owner may always spend, a delegate only up to its allowance which
// is consumed by the spend
Result<void> authorize_spend(
    TokenAccount &account, AccountInfo const &authority, uint64_t const amount)
{
    auto const delegate = account.delegate.get();
    if (delegate.has_value() && *delegate == authority.key() &&
        authority.key() != account.owner) {
        BOOST_OUTCOME_TRY(validate_owner(*delegate, authority));
        if (SPOOL_UNLIKELY(account.delegated_amount.native() < amount)) {
            return TokenError::InsufficientFunds;
        }
        auto const remaining = account.delegated_amount.native() - amount;
        account.delegated_amount = remaining;
        if (remaining == 0) {
            account.delegate = COptionPubkey{};
        }
        return outcome::success();
    }
    return validate_owner(account.owner, authority);
}

class TokenInstructionHandler
{
    InvokeContext &ctx_;
    AccountInfos accounts_;

public:
    TokenInstructionHandler(InvokeContext &ctx, AccountInfos const accounts)
        : ctx_{ctx}
        , accounts_{accounts}
    {
    }

    Result<void> operator()(InitializeMint2 const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 1));
        auto const &mint_info = accounts_[0];
        if (SPOOL_UNLIKELY(mint_info.owner() != TOKEN_PROGRAM_ID)) {
            return InstructionError::IncorrectProgramId;
        }
        if (SPOOL_UNLIKELY(mint_info.data().size() != MINT_SIZE)) {
            return TokenError::InvalidMint;
        }
        BOOST_OUTCOME_TRY(auto mint, decode_layout<Mint>(mint_info.data()));
        if (SPOOL_UNLIKELY(mint.is_initialized != 0)) {
            return TokenError::AlreadyInUse;
        }
        if (SPOOL_UNLIKELY(!ctx_.rent().is_exempt(
                mint_info.lamports(), mint_info.data().size()))) {
            return TokenError::NotRentExempt;
        }
        mint.mint_authority = COptionPubkey::from(ix.mint_authority);
        mint.supply = 0u;
        mint.decimals = ix.decimals;
        mint.is_initialized = 1;
        mint.freeze_authority = COptionPubkey::from(ix.freeze_authority);
        store_mint(mint_info, mint);
        return outcome::success();
    }

    Result<void> operator()(InitializeAccount3 const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 2));
        auto const &info = accounts_[0];
        auto const &mint_info = accounts_[1];
        if (SPOOL_UNLIKELY(info.owner() != TOKEN_PROGRAM_ID)) {
            return InstructionError::IncorrectProgramId;
        }
        if (SPOOL_UNLIKELY(info.data().size() != TOKEN_ACCOUNT_SIZE)) {
            return InstructionError::InvalidAccountData;
        }
        BOOST_OUTCOME_TRY(
            auto account, decode_layout<TokenAccount>(info.data()));
        if (SPOOL_UNLIKELY(
                account.account_state() != AccountState::Uninitialized)) {
            return TokenError::AlreadyInUse;
        }
        if (SPOOL_UNLIKELY(
                !ctx_.rent().is_exempt(info.lamports(), info.data().size()))) {
            return TokenError::NotRentExempt;
        }
        if (SPOOL_UNLIKELY(load_mint(mint_info).has_error())) {
            return TokenError::InvalidMint;
        }
        account.mint = mint_info.key();
        account.owner = ix.owner;
        account.state = static_cast<uint8_t>(AccountState::Initialized);
        store_token_account(info, account);
        return outcome::success();
    }

    Result<void> operator()(Transfer const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 3));
        auto const &source_info = accounts_[0];
        auto const &dest_info = accounts_[1];
        BOOST_OUTCOME_TRY(auto source, load_token_account(source_info));
        BOOST_OUTCOME_TRY(auto destination, load_token_account(dest_info));
        BOOST_OUTCOME_TRY(require_unfrozen(source));
        BOOST_OUTCOME_TRY(require_unfrozen(destination));
        if (SPOOL_UNLIKELY(source.mint != destination.mint)) {
            return TokenError::MintMismatch;
        }
        if (SPOOL_UNLIKELY(source.amount.native() < ix.amount)) {
            return TokenError::InsufficientFunds;
        }
        BOOST_OUTCOME_TRY(authorize_spend(source, accounts_[2], ix.amount));
        if (source_info.key() == dest_info.key()) {
            store_token_account(source_info, source);
            return outcome::success();
        }
        source.amount = source.amount.native() - ix.amount;
        auto const credited =
            checked_add(destination.amount.native(), ix.amount);
        if (SPOOL_UNLIKELY(credited.has_error())) {
            return TokenError::Overflow;
        }
        destination.amount = credited.value();
        store_token_account(source_info, source);
        store_token_account(dest_info, destination);
        return outcome::success();
    }

    Result<void> operator()(Approve const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 3));
        auto const &source_info = accounts_[0];
        BOOST_OUTCOME_TRY(auto source, load_token_account(source_info));
        BOOST_OUTCOME_TRY(require_unfrozen(source));
        BOOST_OUTCOME_TRY(validate_owner(source.owner, accounts_[2]));
        source.delegate = COptionPubkey::from(accounts_[1].key());
        source.delegated_amount = ix.amount;
        store_token_account(source_info, source);
        return outcome::success();
    }

    Result<void> operator()(MintTo const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 3));
        auto const &mint_info = accounts_[0];
        auto const &dest_info = accounts_[1];
        BOOST_OUTCOME_TRY(auto destination, load_token_account(dest_info));
        BOOST_OUTCOME_TRY(require_unfrozen(destination));
        if (SPOOL_UNLIKELY(destination.mint != mint_info.key())) {
            return TokenError::MintMismatch;
        }
        BOOST_OUTCOME_TRY(auto mint, load_mint(mint_info));
        auto const authority = mint.mint_authority.get();
        if (SPOOL_UNLIKELY(!authority.has_value())) {
            return TokenError::FixedSupply;
        }
        BOOST_OUTCOME_TRY(validate_owner(*authority, accounts_[2]));

        auto const supply = checked_add(mint.supply.native(), ix.amount);
        auto const amount = checked_add(destination.amount.native(), ix.amount);
        if (SPOOL_UNLIKELY(supply.has_error() || amount.has_error())) {
            return TokenError::Overflow;
        }
        mint.supply = supply.value();
        destination.amount = amount.value();
        store_mint(mint_info, mint);
        store_token_account(dest_info, destination);
        return outcome::success();
    }

    Result<void> operator()(Burn const &ix)
    {
        BOOST_OUTCOME_TRY(check_account_count(accounts_, 3));
        auto const &info = accounts_[0];
        auto const &mint_info = accounts_[1];
        BOOST_OUTCOME_TRY(auto account, load_token_account(info));
        BOOST_OUTCOME_TRY(require_unfrozen(account));
        if (SPOOL_UNLIKELY(account.mint != mint_info.key())) {
            return TokenError::MintMismatch;
        }
        BOOST_OUTCOME_TRY(auto mint, load_mint(mint_info));
        if (SPOOL_UNLIKELY(account.amount.native() < ix.amount)) {
            return TokenError::InsufficientFunds;
        }
        BOOST_OUTCOME_TRY(authorize_spend(account, accounts_[2], ix.amount));
        if (SPOOL_UNLIKELY(mint.supply.native() < ix.amount)) {
            return TokenError::Overflow;
        }
        account.amount = account.amount.native() - ix.amount;
        mint.supply = mint.supply.native() - ix.amount;
        store_token_account(info, account);
        store_mint(mint_info, mint);
        return outcome::success();
    }
};

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_TOKEN_NAMESPACE_BEGIN

Result<void> TokenProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    BOOST_OUTCOME_TRY(auto const instruction, decode_token_instruction(data));
    return std::visit(TokenInstructionHandler{ctx, accounts}, instruction);
}

SPOOL_TOKEN_NAMESPACE_END
