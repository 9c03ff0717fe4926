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

#include <spool/pool/error.hpp>

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
    quick_status_code_from_enum<spool::pool::SinglePoolError>::mapping> const &
quick_status_code_from_enum<spool::pool::SinglePoolError>::value_mappings()
{
    using spool::pool::SinglePoolError;

    static std::initializer_list<mapping> const v = {
        {SinglePoolError::Success, "success", {errc::success}},
        {SinglePoolError::InvalidPoolAccount,
         "pool account has the wrong address for its vote account, is "
         "uninitialized, or is otherwise invalid",
         {}},
        {SinglePoolError::InvalidPoolStakeAccount,
         "pool stake account does not match the address derived from the pool",
         {}},
        {SinglePoolError::InvalidPoolMint,
         "pool mint does not match the address derived from the pool",
         {}},
        {SinglePoolError::InvalidPoolStakeAuthority,
         "pool stake authority does not match the address derived from the "
         "pool",
         {}},
        {SinglePoolError::InvalidPoolMintAuthority,
         "pool mint authority does not match the address derived from the "
         "pool",
         {}},
        {SinglePoolError::InvalidPoolMplAuthority,
         "pool metadata authority does not match the address derived from the "
         "pool",
         {}},
        {SinglePoolError::InvalidMetadataAccount,
         "metadata account does not match the address derived for the pool "
         "mint",
         {}},
        {SinglePoolError::InvalidMetadataSigner,
         "signer is not the authorized withdrawer of the vote account",
         {}},
        {SinglePoolError::DepositTooSmall,
         "deposit is too small to mint one pool token",
         {}},
        {SinglePoolError::WithdrawalTooSmall,
         "withdrawal is too small to be worth one lamport",
         {}},
        {SinglePoolError::PoolWouldBeUndersized,
         "withdrawal exceeds the stake under management",
         {}},
        {SinglePoolError::SignatureMissing,
         "required signature is missing",
         {}},
        {SinglePoolError::WrongStakeStake,
         "stake account is not in the state expected by the pool",
         {}},
        {SinglePoolError::ArithmeticOverflow,
         "unsigned subtraction crossed zero",
         {}},
        {SinglePoolError::UnexpectedMathError,
         "a calculation failed unexpectedly",
         {}},
        {SinglePoolError::InvalidValidator,
         "account is not a vote account",
         {}},
        {SinglePoolError::WrongValidator,
         "stake is delegated to a different validator",
         {}},
        {SinglePoolError::StakeNotFullyActive,
         "stake account is not fully active",
         {}},
        {SinglePoolError::WrongRentAmount,
         "incorrect number of lamports provided for rent exemption",
         {}},
        {SinglePoolError::InvalidPoolStakeAccountUsage,
         "attempted to deposit from or withdraw to a pool stake account",
         {}},
        {SinglePoolError::AlreadyInitialized,
         "attempted to initialize an account that is already initialized",
         {}},
        {SinglePoolError::InvalidPoolOnRampAccount,
         "pool onramp account does not match the address derived from the "
         "pool",
         {}},
        {SinglePoolError::OnRampDoesntExist,
         "the pool has no onramp account, InitializePoolOnRamp must run first",
         {}},
        {SinglePoolError::InsufficientWithdrawAmount,
         "withdrawal does not leave the destination stake account rent exempt",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
