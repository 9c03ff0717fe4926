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

#include <spool/native/stake/stake_error.hpp>

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
    quick_status_code_from_enum<spool::stake::StakeError>::mapping> const &
quick_status_code_from_enum<spool::stake::StakeError>::value_mappings()
{
    using spool::stake::StakeError;

    static std::initializer_list<mapping> const v = {
        {StakeError::Success, "success", {errc::success}},
        {StakeError::LockupInForce, "lockup has not yet expired", {}},
        {StakeError::AlreadyDeactivated, "stake already deactivated", {}},
        {StakeError::TooSoonToRedelegate,
         "one re-delegation permitted per epoch",
         {}},
        {StakeError::InsufficientStake,
         "split amount is more than is staked",
         {}},
        {StakeError::MergeTransientStake,
         "stake account with transient stake cannot be merged",
         {}},
        {StakeError::MergeMismatch,
         "stake account merge failed due to different authority, lockups "
         "or state",
         {}},
        {StakeError::CustodianMissing, "custodian address not present", {}},
        {StakeError::CustodianSignatureMissing,
         "custodian signature not present",
         {}},
        {StakeError::InsufficientDelegation,
         "delegation amount is less than the minimum",
         {}},
        {StakeError::VoteAddressMismatch,
         "stake account is not delegated to the provided vote account",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
