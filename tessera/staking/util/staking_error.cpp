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

#include <tessera/staking/util/staking_error.hpp>

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
    quick_status_code_from_enum<tessera::staking::StakingError>::mapping> const &
quick_status_code_from_enum<tessera::staking::StakingError>::value_mappings()
{
    using tessera::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::InternalError, "internal error", {}},
        {StakingError::InvalidInput, "invalid input", {}},
        {StakingError::NotGovernance, "caller is not the governance", {}},
        {StakingError::NotOwnerOrOperator,
         "caller is not the owner or the operator",
         {}},
        {StakingError::NotAuthorizer, "caller is not the authorizer", {}},
        {StakingError::NotPanicButton, "caller is not the panic button", {}},
        {StakingError::ApplicationNotApproved,
         "application is not approved",
         {}},
        {StakingError::ApplicationDisabled, "application is disabled", {}},
        {StakingError::ApplicationAlreadyApproved,
         "application has already been approved",
         {}},
        {StakingError::ApplicationNotDisabled,
         "application is not disabled",
         {}},
        {StakingError::ApplicationUnreachable,
         "application is not registered",
         {}},
        {StakingError::UnknownOperator, "unknown operator", {}},
        {StakingError::OperatorAlreadyInUse, "operator is already in use", {}},
        {StakingError::AmountBelowMinimum, "amount is below the minimum", {}},
        {StakingError::LegacyNotAuthorized,
         "legacy stake has not authorized the ledger",
         {}},
        {StakingError::NothingToSync, "nothing to sync", {}},
        {StakingError::NotEnoughStakeToAuthorize,
         "not enough stake to authorize",
         {}},
        {StakingError::TooManyApplications, "too many applications", {}},
        {StakingError::AmountExceedsAuthorized,
         "amount exceeds authorized",
         {}},
        {StakingError::InsufficientStake, "too much to unstake", {}},
        {StakingError::TooEarlyToUnstake, "can't unstake earlier than 24h", {}},
        {StakingError::StillAuthorized,
         "at least one application is still authorized",
         {}},
        {StakingError::NothingToDecrease,
         "there is no deauthorizing in process",
         {}},
        {StakingError::NothingWasAuthorized, "nothing was authorized", {}},
        {StakingError::NothingToTopUp, "nothing to top-up", {}},
        {StakingError::NothingToUnstake, "nothing to unstake", {}},
        {StakingError::NothingToProcess, "nothing to process", {}},
        {StakingError::NoDiscrepancy, "there is no discrepancy", {}},
        {StakingError::NothingToSlash, "nothing to slash", {}},
        {StakingError::InsufficientTreasury,
         "not enough tokens in the notifiers treasury",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
