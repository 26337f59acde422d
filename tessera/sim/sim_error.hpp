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

#include <tessera/sim/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

TESSERA_SIM_NAMESPACE_BEGIN

enum class TokenError
{
    Success = 0,
    InsufficientBalance,
    InsufficientAllowance,
    InvalidRecipient,
};

enum class MirrorError
{
    Success = 0,
    UnknownStaker,
    InsufficientStake,
    AlreadyMerged,
};

enum class ApplicationError
{
    Success = 0,
    Rejected,
};

TESSERA_SIM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tessera::sim::TokenError>
    : quick_status_code_from_enum_defaults<tessera::sim::TokenError>
{
    static constexpr auto const domain_name = "Token Error";
    static constexpr auto const domain_uuid =
        "3f6d2a90-51c4-4e8b-a7d2-9b0e14c58f23";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<tessera::sim::MirrorError>
    : quick_status_code_from_enum_defaults<tessera::sim::MirrorError>
{
    static constexpr auto const domain_name = "Mirror Error";
    static constexpr auto const domain_uuid =
        "b27e9c41-0d83-4f5a-8e16-c4a35d7f0b68";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<tessera::sim::ApplicationError>
    : quick_status_code_from_enum_defaults<tessera::sim::ApplicationError>
{
    static constexpr auto const domain_name = "Application Error";
    static constexpr auto const domain_uuid =
        "e4a8150b-6c2f-4d97-b3e0-71f9a26c8d45";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
