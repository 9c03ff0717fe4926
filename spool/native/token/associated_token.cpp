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

#include <spool/core/assert.h>
#include <spool/core/likely.h>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/token/associated_token.hpp>
#include <spool/native/token/token_error.hpp>
#include <spool/native/token/token_instruction.hpp>
#include <spool/native/token/token_state.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <array>
#include <vector>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

Instruction build_create(
    Pubkey const &payer, Pubkey const &wallet, Pubkey const &mint,
    token::AssociatedTokenInstructionKind const kind)
{
    return {
        ASSOCIATED_TOKEN_PROGRAM_ID,
        {AccountMeta::writable(payer, true),
         AccountMeta::writable(
             token::get_associated_token_address(wallet, mint)),
         AccountMeta::readonly(wallet),
         AccountMeta::readonly(mint),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID),
         AccountMeta::readonly(TOKEN_PROGRAM_ID)},
        byte_string{static_cast<uint8_t>(kind)}};
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_TOKEN_NAMESPACE_BEGIN

Pubkey get_associated_token_address(Pubkey const &wallet, Pubkey const &mint)
{
    std::array<byte_string_view, 3> const seeds{
        to_byte_string_view(wallet.bytes),
        to_byte_string_view(TOKEN_PROGRAM_ID.bytes),
        to_byte_string_view(mint.bytes)};
    auto const address =
        try_find_program_address(seeds, ASSOCIATED_TOKEN_PROGRAM_ID);
    SPOOL_ASSERT(address.has_value());
    return address.value().first;
}

Instruction create_associated_token_account(
    Pubkey const &payer, Pubkey const &wallet, Pubkey const &mint)
{
    return build_create(
        payer, wallet, mint, AssociatedTokenInstructionKind::Create);
}

Instruction create_associated_token_account_idempotent(
    Pubkey const &payer, Pubkey const &wallet, Pubkey const &mint)
{
    return build_create(
        payer, wallet, mint, AssociatedTokenInstructionKind::CreateIdempotent);
}

Result<void> AssociatedTokenProgram::process_instruction(
    InvokeContext &ctx, AccountInfos const accounts,
    byte_string_view const data)
{
    if (SPOOL_UNLIKELY(data.size() > 1)) {
        return InstructionError::InvalidInstructionData;
    }
    auto kind = AssociatedTokenInstructionKind::Create;
    if (!data.empty()) {
        if (SPOOL_UNLIKELY(data[0] > 1)) {
            return InstructionError::InvalidInstructionData;
        }
        kind = static_cast<AssociatedTokenInstructionKind>(data[0]);
    }

    BOOST_OUTCOME_TRY(check_account_count(accounts, 6));
    auto const &payer = accounts[0];
    auto const &associated = accounts[1];
    auto const &wallet = accounts[2];
    auto const &mint = accounts[3];

    std::array<byte_string_view, 3> const seeds{
        to_byte_string_view(wallet.key().bytes),
        to_byte_string_view(TOKEN_PROGRAM_ID.bytes),
        to_byte_string_view(mint.key().bytes)};
    BOOST_OUTCOME_TRY(
        auto const derived, try_find_program_address(seeds, id()));
    auto const &[address, bump] = derived;
    if (SPOOL_UNLIKELY(address != associated.key())) {
        return InstructionError::InvalidSeeds;
    }

    if (associated.owner() == TOKEN_PROGRAM_ID) {
        if (kind == AssociatedTokenInstructionKind::Create) {
            return TokenError::AlreadyInUse;
        }
        BOOST_OUTCOME_TRY(auto const existing, load_token_account(associated));
        if (SPOOL_UNLIKELY(existing.owner != wallet.key())) {
            return TokenError::OwnerMismatch;
        }
        if (SPOOL_UNLIKELY(existing.mint != mint.key())) {
            return TokenError::MintMismatch;
        }
        return outcome::success();
    }

    uint8_t const bump_seed[1] = {bump};
    std::vector<std::vector<byte_string_view>> const signer_seeds{
        {seeds[0], seeds[1], seeds[2], byte_string_view{bump_seed, 1}}};

    auto const required = ctx.rent().minimum_balance(TOKEN_ACCOUNT_SIZE);
    if (associated.lamports() == 0) {
        BOOST_OUTCOME_TRY(ctx.invoke_signed(
            system::create_account(
                payer.key(),
                associated.key(),
                required,
                TOKEN_ACCOUNT_SIZE,
                TOKEN_PROGRAM_ID),
            accounts,
            signer_seeds));
    }
    else {
        // prefunded address: top up, then allocate and assign in place
        if (associated.lamports() < required) {
            BOOST_OUTCOME_TRY(ctx.invoke(
                system::transfer(
                    payer.key(),
                    associated.key(),
                    required - associated.lamports()),
                accounts));
        }
        BOOST_OUTCOME_TRY(ctx.invoke_signed(
            system::allocate(associated.key(), TOKEN_ACCOUNT_SIZE),
            accounts,
            signer_seeds));
        BOOST_OUTCOME_TRY(ctx.invoke_signed(
            system::assign(associated.key(), TOKEN_PROGRAM_ID),
            accounts,
            signer_seeds));
    }

    return ctx.invoke(
        initialize_account3(associated.key(), mint.key(), wallet.key()),
        accounts);
}

SPOOL_TOKEN_NAMESPACE_END
