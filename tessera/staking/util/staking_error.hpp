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

#include <tessera/staking/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

TESSERA_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    InternalError,
    InvalidInput,
    NotGovernance,
    NotOwnerOrOperator,
    NotAuthorizer,
    NotPanicButton,
    ApplicationNotApproved,
    ApplicationDisabled,
    ApplicationAlreadyApproved,
    ApplicationNotDisabled,
    ApplicationUnreachable,
    UnknownOperator,
    OperatorAlreadyInUse,
    AmountBelowMinimum,
    LegacyNotAuthorized,
    NothingToSync,
    NotEnoughStakeToAuthorize,
    TooManyApplications,
    AmountExceedsAuthorized,
    InsufficientStake,
    TooEarlyToUnstake,
    StillAuthorized,
    NothingToDecrease,
    NothingWasAuthorized,
    NothingToTopUp,
    NothingToUnstake,
    NothingToProcess,
    NoDiscrepancy,
    NothingToSlash,
    InsufficientTreasury,
};

TESSERA_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tessera::staking::StakingError>
    : quick_status_code_from_enum_defaults<tessera::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "8c0f4b7e-2d61-4a59-b3e8-61f2d09c7a15";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
