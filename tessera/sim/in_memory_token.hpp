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
#include <tessera/sim/journaled.hpp>
#include <tessera/staking/external.hpp>

#include <ankerl/unordered_dense.h>


TESSERA_SIM_NAMESPACE_BEGIN

struct TokenBalances
{
    ankerl::unordered_dense::map<Address, uint256_t> balances{};
    // owner => spender => allowance
    ankerl::unordered_dense::map<
        Address, ankerl::unordered_dense::map<Address, uint256_t>>
        allowances{};
    uint256_t total_supply{0};
};

class InMemoryToken final
    : public staking::Token
    , public Journaled<TokenBalances>
{
public:
    void mint(Address const &to, uint256_t const &amount);
    void approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    uint256_t balance_of(Address const &) const;
    uint256_t allowance(Address const &owner, Address const &spender) const;
    uint256_t total_supply() const;

    Result<void> transfer(
        Address const &from, Address const &to,
        uint256_t const &amount) override;

    Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) override;
};

TESSERA_SIM_NAMESPACE_END
