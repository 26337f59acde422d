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

#include <tessera/core/config.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/likely.h>
#include <tessera/core/result.hpp>

#include <initializer_list>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

TESSERA_NAMESPACE_BEGIN

enum class MathError
{
    Success = 0,
    Overflow,
    Underflow,
    DivisionByZero,
};

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_div(uint256_t const &x, uint256_t const &y);

// x * percentage / 100
Result<uint256_t>
checked_percent(uint256_t const &x, uint256_t const &percentage);

constexpr uint256_t saturating_sub(uint256_t const &x, uint256_t const &y)
{
    return x > y ? x - y : uint256_t{0};
}

TESSERA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tessera::MathError>
    : quick_status_code_from_enum_defaults<tessera::MathError>
{
    static constexpr auto const domain_name = "Math Error";
    static constexpr auto const domain_uuid =
        "5d1c0a42-7b2e-4f6a-9c38-0e1f6b7a2d94";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
