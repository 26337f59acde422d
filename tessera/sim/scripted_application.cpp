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

#include <tessera/core/likely.h>
#include <tessera/sim/scripted_application.hpp>
#include <tessera/sim/sim_error.hpp>

#include <boost/outcome/success_failure.hpp>

TESSERA_SIM_NAMESPACE_BEGIN

void ScriptedApplication::set_failing(bool const failing)
{
    failing_ = failing;
}

Result<void> ScriptedApplication::record(
    CallKind const kind, Address const &operator_address,
    uint256_t const &from_amount, uint256_t const &to_amount)
{
    calls_.push_back(Call{
        .kind = kind,
        .operator_address = operator_address,
        .from_amount = from_amount,
        .to_amount = to_amount});
    if (TESSERA_UNLIKELY(failing_)) {
        return ApplicationError::Rejected;
    }
    return outcome::success();
}

Result<void> ScriptedApplication::authorization_increased(
    Address const &operator_address, uint256_t const &from_amount,
    uint256_t const &to_amount)
{
    return record(
        CallKind::AuthorizationIncreased,
        operator_address,
        from_amount,
        to_amount);
}

Result<void> ScriptedApplication::authorization_decrease_requested(
    Address const &operator_address, uint256_t const &from_amount,
    uint256_t const &to_amount)
{
    return record(
        CallKind::AuthorizationDecreaseRequested,
        operator_address,
        from_amount,
        to_amount);
}

Result<void> ScriptedApplication::involuntary_authorization_decrease(
    Address const &operator_address, uint256_t const &from_amount,
    uint256_t const &to_amount)
{
    return record(
        CallKind::InvoluntaryAuthorizationDecrease,
        operator_address,
        from_amount,
        to_amount);
}

TESSERA_SIM_NAMESPACE_END
