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

#include <tessera/core/address.hpp>
#include <tessera/core/int.hpp>
#include <tessera/core/result.hpp>
#include <tessera/sim/config.hpp>
#include <tessera/staking/external.hpp>

#include <cstdint>
#include <vector>

TESSERA_SIM_NAMESPACE_BEGIN

// Application that records every callback and can be told to reject them.
// Recorded calls are not rolled back with the ledger.
class ScriptedApplication final : public staking::Application
{
public:
    enum class CallKind : uint8_t
    {
        AuthorizationIncreased,
        AuthorizationDecreaseRequested,
        InvoluntaryAuthorizationDecrease,
    };

    struct Call
    {
        CallKind kind;
        Address operator_address;
        uint256_t from_amount;
        uint256_t to_amount;
    };

private:
    std::vector<Call> calls_{};
    bool failing_{false};

    Result<void> record(
        CallKind, Address const &operator_address,
        uint256_t const &from_amount, uint256_t const &to_amount);

public:
    void set_failing(bool);

    std::vector<Call> const &calls() const
    {
        return calls_;
    }

    void clear()
    {
        calls_.clear();
    }

    Result<void> authorization_increased(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) override;

    Result<void> authorization_decrease_requested(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) override;

    Result<void> involuntary_authorization_decrease(
        Address const &operator_address, uint256_t const &from_amount,
        uint256_t const &to_amount) override;
};

TESSERA_SIM_NAMESPACE_END
