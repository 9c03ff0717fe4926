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

#include <spool/runtime/instruction_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<spool::InstructionError>::mapping> const &
quick_status_code_from_enum<spool::InstructionError>::value_mappings()
{
    using spool::InstructionError;

    static std::initializer_list<mapping> const v = {
        {InstructionError::Success, "success", {errc::success}},
        {InstructionError::InvalidArgument, "invalid program argument", {}},
        {InstructionError::InvalidInstructionData,
         "invalid instruction data",
         {}},
        {InstructionError::InvalidAccountData,
         "invalid account data for instruction",
         {}},
        {InstructionError::AccountDataTooSmall,
         "account data too small for instruction",
         {}},
        {InstructionError::InsufficientFunds,
         "insufficient funds for instruction",
         {}},
        {InstructionError::IncorrectProgramId,
         "incorrect program id for instruction",
         {}},
        {InstructionError::MissingRequiredSignature,
         "missing required signature for instruction",
         {}},
        {InstructionError::AccountAlreadyInitialized,
         "account already initialized",
         {}},
        {InstructionError::UninitializedAccount,
         "attempt to operate on an uninitialized account",
         {}},
        {InstructionError::UnbalancedInstruction,
         "sum of account balances before and after instruction do not match",
         {}},
        {InstructionError::ModifiedProgramId,
         "instruction illegally modified the program id of an account",
         {}},
        {InstructionError::ExternalAccountLamportSpend,
         "instruction spent from the balance of an account it does not own",
         {}},
        {InstructionError::ExternalAccountDataModified,
         "instruction modified data of an account it does not own",
         {}},
        {InstructionError::ReadonlyLamportChange,
         "instruction changed the balance of a read-only account",
         {}},
        {InstructionError::ReadonlyDataModified,
         "instruction modified data of a read-only account",
         {}},
        {InstructionError::ExecutableModified,
         "instruction changed an executable account",
         {}},
        {InstructionError::NotEnoughAccountKeys,
         "insufficient account keys for instruction",
         {}},
        {InstructionError::InvalidAccountOwner, "invalid account owner", {}},
        {InstructionError::PrivilegeEscalation,
         "cross-program invocation with unauthorized signer or writable "
         "account",
         {}},
        {InstructionError::UnsupportedProgramId, "unsupported program id", {}},
        {InstructionError::CallDepth,
         "cross-program invocation call depth too deep",
         {}},
        {InstructionError::ReentrancyNotAllowed,
         "cross-program invocation reentrancy not allowed for this "
         "instruction",
         {}},
        {InstructionError::MissingAccount,
         "an account required by the instruction is missing",
         {}},
        {InstructionError::InvalidSeeds,
         "provided seeds do not result in a valid address",
         {}},
        {InstructionError::ArithmeticOverflow,
         "program arithmetic overflowed",
         {}},
        {InstructionError::InsufficientFundsForRent,
         "transaction results in an account with insufficient funds for rent",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
