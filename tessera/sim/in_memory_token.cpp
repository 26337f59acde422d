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

#include <tessera/core/address.hpp>
#include <tessera/core/likely.h>
#include <tessera/sim/in_memory_token.hpp>
#include <tessera/sim/sim_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>


TESSERA_SIM_NAMESPACE_BEGIN

void InMemoryToken::mint(Address const &to, uint256_t const &amount)
{
    auto &state = current();
    state.balances[to] += amount;
    state.total_supply += amount;
}

void InMemoryToken::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    current().allowances[owner][spender] = amount;
}

uint256_t InMemoryToken::balance_of(Address const &account) const
{
    auto const &balances = recent().balances;
    auto const it = balances.find(account);
    return it == balances.end() ? uint256_t{0} : it->second;
}

uint256_t InMemoryToken::allowance(
    Address const &owner, Address const &spender) const
{
    auto const &allowances = recent().allowances;
    auto const it = allowances.find(owner);
    if (it == allowances.end()) {
        return 0;
    }
    auto const jt = it->second.find(spender);
    return jt == it->second.end() ? uint256_t{0} : jt->second;
}

uint256_t InMemoryToken::total_supply() const
{
    return recent().total_supply;
}

Result<void> InMemoryToken::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (TESSERA_UNLIKELY(to == Address{})) {
        return TokenError::InvalidRecipient;
    }
    if (TESSERA_UNLIKELY(balance_of(from) < amount)) {
        return TokenError::InsufficientBalance;
    }
    auto &balances = current().balances;
    balances[from] -= amount;
    balances[to] += amount;
    return outcome::success();
}

Result<void> InMemoryToken::transfer_from(
    Address const &spender, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (TESSERA_UNLIKELY(allowance(from, spender) < amount)) {
        return TokenError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRY(transfer(from, to, amount));
    current().allowances[from][spender] -= amount;
    return outcome::success();
}

TESSERA_SIM_NAMESPACE_END
