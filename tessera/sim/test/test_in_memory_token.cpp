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
#include <tessera/sim/in_memory_token.hpp>
#include <tessera/sim/sim_error.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::sim;
using namespace evmc::literals;

namespace
{
    constexpr Address ALICE = 0xa11ce0_address;
    constexpr Address BOB = 0x0b0b00_address;
    constexpr Address SPENDER = 0x5e4d_address;
}

TEST(InMemoryToken, transfer)
{
    InMemoryToken token;
    token.mint(ALICE, 100);
    EXPECT_EQ(token.total_supply(), 100);

    EXPECT_FALSE(token.transfer(ALICE, BOB, 40).has_error());
    EXPECT_EQ(token.balance_of(ALICE), 60);
    EXPECT_EQ(token.balance_of(BOB), 40);

    EXPECT_EQ(
        TokenError::InsufficientBalance,
        token.transfer(ALICE, BOB, 61).assume_error());
    EXPECT_EQ(
        TokenError::InvalidRecipient,
        token.transfer(ALICE, Address{}, 1).assume_error());
    EXPECT_EQ(token.total_supply(), 100);
}

TEST(InMemoryToken, transfer_from)
{
    InMemoryToken token;
    token.mint(ALICE, 100);

    EXPECT_EQ(
        TokenError::InsufficientAllowance,
        token.transfer_from(SPENDER, ALICE, BOB, 1).assume_error());

    token.approve(ALICE, SPENDER, 50);
    EXPECT_FALSE(token.transfer_from(SPENDER, ALICE, BOB, 30).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 20);
    EXPECT_EQ(token.balance_of(BOB), 30);

    // allowance without balance is not enough
    token.approve(ALICE, SPENDER, 500);
    EXPECT_EQ(
        TokenError::InsufficientBalance,
        token.transfer_from(SPENDER, ALICE, BOB, 71).assume_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 500);
}

TEST(InMemoryToken, follows_units)
{
    InMemoryToken token;
    token.mint(ALICE, 100);

    token.push();
    EXPECT_FALSE(token.transfer(ALICE, BOB, 40).has_error());
    token.push();
    EXPECT_FALSE(token.transfer(BOB, ALICE, 10).has_error());
    token.pop_reject();
    EXPECT_EQ(token.balance_of(BOB), 40);
    token.pop_accept();
    EXPECT_EQ(token.balance_of(BOB), 40);
    EXPECT_EQ(token.balance_of(ALICE), 60);

    token.push();
    token.approve(ALICE, SPENDER, 10);
    token.pop_reject();
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 0);
}
