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

#include <spool/core/likely.h>
#include <spool/native/system/system_error.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/system/system_program.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <type_traits>
#include <variant>

SPOOL_ANONYMOUS_NAMESPACE_BEGIN

using namespace spool::system;

// `authorized` is the account's own signature, or the base signature for an
// address derived with a seed
Result<void> allocate_account(
    AccountInfo const &account, bool const authorized, uint64_t const space)
{
    if (SPOOL_UNLIKELY(!authorized)) {
        return InstructionError::MissingRequiredSignature;
    }
    if (SPOOL_UNLIKELY(
            !account.data_is_empty() || account.owner() != SYSTEM_PROGRAM_ID)) {
        return SystemError::AccountAlreadyInUse;
    }
    if (SPOOL_UNLIKELY(space > MAX_PERMITTED_DATA_LENGTH)) {
        return SystemError::InvalidAccountDataLength;
    }
    account.data_mut().assign(static_cast<size_t>(space), 0);
    return outcome::success();
}

Result<void> assign_account(
    AccountInfo const &account, bool const authorized, Pubkey const &owner)
{
    if (account.owner() == owner) {
        return outcome::success();
    }
    if (SPOOL_UNLIKELY(!authorized)) {
        return InstructionError::MissingRequiredSignature;
    }
    account.assign(owner);
    return outcome::success();
}

Result<void> transfer_lamports(
    AccountInfo const &from, AccountInfo const &to, uint64_t const lamports)
{
    if (SPOOL_UNLIKELY(!from.is_signer())) {
        return InstructionError::MissingRequiredSignature;
    }
    if (SPOOL_UNLIKELY(!from.data_is_empty())) {
        return InstructionError::InvalidArgument;
    }
    if (SPOOL_UNLIKELY(lamports > from.lamports())) {
        return SystemError::ResultWithNegativeLamports;
    }
    if (SPOOL_UNLIKELY(to.lamports() + lamports < to.lamports())) {
        return InstructionError::ArithmeticOverflow;
    }
    from.set_lamports(from.lamports() - lamports);
    to.set_lamports(to.lamports() + lamports);
    return outcome::success();
}

Result<void> create_account_checked(
    AccountInfo const &from, AccountInfo const &to, bool const authorized,
    uint64_t const lamports, uint64_t const space, Pubkey const &owner)
{
    if (SPOOL_UNLIKELY(to.lamports() > 0)) {
        return SystemError::AccountAlreadyInUse;
    }
    BOOST_OUTCOME_TRY(allocate_account(to, authorized, space));
    BOOST_OUTCOME_TRY(assign_account(to, authorized, owner));
    return transfer_lamports(from, to, lamports);
}

SPOOL_ANONYMOUS_NAMESPACE_END

SPOOL_SYSTEM_NAMESPACE_BEGIN

Result<void> SystemProgram::process_instruction(
    InvokeContext &, AccountInfos const accounts, byte_string_view const data)
{
    BOOST_OUTCOME_TRY(auto const instruction, decode_system_instruction(data));

    return std::visit(
        [&](auto const &ix) -> Result<void> {
            using T = std::decay_t<decltype(ix)>;
            if constexpr (std::same_as<T, CreateAccount>) {
                BOOST_OUTCOME_TRY(check_account_count(accounts, 2));
                return create_account_checked(
                    accounts[0],
                    accounts[1],
                    accounts[1].is_signer(),
                    ix.lamports,
                    ix.space,
                    ix.owner);
            }
            else if constexpr (std::same_as<T, Assign>) {
                BOOST_OUTCOME_TRY(check_account_count(accounts, 1));
                return assign_account(
                    accounts[0], accounts[0].is_signer(), ix.owner);
            }
            else if constexpr (std::same_as<T, Transfer>) {
                BOOST_OUTCOME_TRY(check_account_count(accounts, 2));
                return transfer_lamports(accounts[0], accounts[1], ix.lamports);
            }
            else if constexpr (std::same_as<T, CreateAccountWithSeed>) {
                BOOST_OUTCOME_TRY(check_account_count(accounts, 3));
                auto const &base = accounts[2];
                if (SPOOL_UNLIKELY(!base.is_signer())) {
                    return InstructionError::MissingRequiredSignature;
                }
                BOOST_OUTCOME_TRY(
                    auto const address,
                    create_with_seed(ix.base, ix.seed, ix.owner));
                if (SPOOL_UNLIKELY(
                        address != accounts[1].key() ||
                        base.key() != ix.base)) {
                    return SystemError::AddressWithSeedMismatch;
                }
                return create_account_checked(
                    accounts[0],
                    accounts[1],
                    true,
                    ix.lamports,
                    ix.space,
                    ix.owner);
            }
            else {
                static_assert(std::same_as<T, Allocate>);
                BOOST_OUTCOME_TRY(check_account_count(accounts, 1));
                return allocate_account(
                    accounts[0], accounts[0].is_signer(), ix.space);
            }
        },
        instruction);
}

SPOOL_SYSTEM_NAMESPACE_END
