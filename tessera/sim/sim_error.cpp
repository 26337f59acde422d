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

#include <tessera/sim/sim_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tessera::sim::TokenError>::mapping> const &
quick_status_code_from_enum<tessera::sim::TokenError>::value_mappings()
{
    using tessera::sim::TokenError;

    static std::initializer_list<mapping> const v = {
        {TokenError::Success, "success", {errc::success}},
        {TokenError::InsufficientBalance, "insufficient balance", {}},
        {TokenError::InsufficientAllowance, "insufficient allowance", {}},
        {TokenError::InvalidRecipient, "invalid recipient", {}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<tessera::sim::MirrorError>::mapping> const &
quick_status_code_from_enum<tessera::sim::MirrorError>::value_mappings()
{
    using tessera::sim::MirrorError;

    static std::initializer_list<mapping> const v = {
        {MirrorError::Success, "success", {errc::success}},
        {MirrorError::UnknownStaker, "unknown staker", {}},
        {MirrorError::InsufficientStake, "not enough stake to seize", {}},
        {MirrorError::AlreadyMerged,
         "escrow already merged into another operator",
         {}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<tessera::sim::ApplicationError>::mapping> const &
quick_status_code_from_enum<tessera::sim::ApplicationError>::value_mappings()
{
    using tessera::sim::ApplicationError;

    static std::initializer_list<mapping> const v = {
        {ApplicationError::Success, "success", {errc::success}},
        {ApplicationError::Rejected, "application rejected the call", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
