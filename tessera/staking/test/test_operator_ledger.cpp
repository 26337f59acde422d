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

#include "ledger_fixture.hpp"

#include <tessera/core/int.hpp>
#include <tessera/sim/sim_error.hpp>
#include <tessera/sim/sim_environment.hpp>
#include <tessera/staking/events.hpp>
#include <tessera/staking/util/constants.hpp>
#include <tessera/staking/util/operator_info.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <variant>

using namespace tessera;
using namespace tessera::staking;
using namespace tessera::staking::test;

namespace
{
    void delegate_legacy_a(
        sim::SimEnvironment &env, Address const &operator_address,
        uint256_t const &amount)
    {
        env.legacy_a.delegate(
            operator_address, OWNER, BENEFICIARY, AUTHORIZER, amount, 1);
        env.legacy_a.authorize_ledger(operator_address, LEDGER);
    }
}

// one legacy B unit is worth ten native units
struct LegacyBRatioTest : public StakingTest
{
    LegacyBRatioTest()
        : StakingTest{sim::OracleRatio{}, sim::OracleRatio{10, 1}}
    {
    }
};

TEST_F(StakingTest, stake_native)
{
    fund(OWNER, 1000);
    ledger.set_timestamp(42);

    EXPECT_FALSE(
        ledger.stake(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER, 500)
            .has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).native, 500);
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_a, 0);
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 0);
    EXPECT_EQ(ledger.get_start_staking_timestamp(OPERATOR), 42);

    auto const roles = ledger.roles_of(OPERATOR);
    EXPECT_EQ(roles.owner, OWNER);
    EXPECT_EQ(roles.beneficiary, BENEFICIARY);
    EXPECT_EQ(roles.authorizer, AUTHORIZER);

    EXPECT_EQ(env.token.balance_of(OWNER), 500);
    EXPECT_EQ(env.token.balance_of(LEDGER), 500);
    EXPECT_EQ(env.token.allowance(OWNER, LEDGER), 500);

    auto const &staked = last_event<Staked>();
    EXPECT_EQ(staked.stake_type, StakeType::Native);
    EXPECT_EQ(staked.owner, OWNER);
    EXPECT_EQ(staked.operator_address, OPERATOR);
    EXPECT_EQ(staked.amount, 500);
}

TEST_F(StakingTest, stake_roles_default_to_sender)
{
    fund(OWNER, 500);
    EXPECT_FALSE(
        ledger.stake(OWNER, OPERATOR, Address{}, Address{}, 500).has_error());

    auto const roles = ledger.roles_of(OPERATOR);
    EXPECT_EQ(roles.owner, OWNER);
    EXPECT_EQ(roles.beneficiary, OWNER);
    EXPECT_EQ(roles.authorizer, OWNER);
}

TEST_F(StakingTest, stake_revert_operator_in_use)
{
    stake(OPERATOR, 500);
    fund(STRANGER, 500);

    auto const before = event_count();
    EXPECT_EQ(
        StakingError::OperatorAlreadyInUse,
        ledger.stake(STRANGER, OPERATOR, STRANGER, STRANGER, 500)
            .assume_error());
    EXPECT_EQ(ledger.roles_of(OPERATOR).owner, OWNER);
    EXPECT_EQ(env.token.balance_of(STRANGER), 500);
    EXPECT_EQ(event_count(), before);
}

TEST_F(StakingTest, stake_revert_delegated_in_legacy_a)
{
    delegate_legacy_a(env, OPERATOR, 1000);
    fund(OWNER, 500);
    EXPECT_EQ(
        StakingError::OperatorAlreadyInUse,
        ledger.stake(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER, 500)
            .assume_error());
}

TEST_F(StakingTest, stake_revert_invalid_input)
{
    fund(OWNER, 1000);
    EXPECT_EQ(
        StakingError::InvalidInput,
        ledger.stake(OWNER, Address{}, BENEFICIARY, AUTHORIZER, 500)
            .assume_error());
    // the minimum itself is not enough
    EXPECT_EQ(
        StakingError::AmountBelowMinimum,
        ledger.stake(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER, MIN_STAKE)
            .assume_error());
    EXPECT_FALSE(
        ledger
            .stake(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER, MIN_STAKE + 1)
            .has_error());
}

TEST_F(StakingTest, stake_revert_without_allowance)
{
    env.token.mint(OWNER, 500);
    auto const before = event_count();

    EXPECT_EQ(
        sim::TokenError::InsufficientAllowance,
        ledger.stake(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER, 500)
            .assume_error());

    // the operator record written before the pull is gone
    EXPECT_EQ(ledger.roles_of(OPERATOR).owner, Address{});
    EXPECT_EQ(ledger.stakes(OPERATOR).native, 0);
    EXPECT_EQ(env.token.balance_of(OWNER), 500);
    EXPECT_EQ(event_count(), before);
}

TEST_F(StakingTest, stake_legacy_a)
{
    delegate_legacy_a(env, OPERATOR, 800);

    EXPECT_FALSE(ledger.stake_legacy_a(STRANGER, OPERATOR).has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_a, 800);
    EXPECT_EQ(ledger.roles_of(OPERATOR).owner, OWNER);
    EXPECT_EQ(ledger.roles_of(OPERATOR).authorizer, AUTHORIZER);
    EXPECT_EQ(last_event<Staked>().stake_type, StakeType::LegacyA);

    EXPECT_EQ(
        StakingError::OperatorAlreadyInUse,
        ledger.stake_legacy_a(STRANGER, OPERATOR).assume_error());
}

TEST_F(StakingTest, stake_legacy_a_revert)
{
    env.legacy_a.delegate(OPERATOR, OWNER, BENEFICIARY, AUTHORIZER, 800, 1);
    EXPECT_EQ(
        StakingError::LegacyNotAuthorized,
        ledger.stake_legacy_a(OWNER, OPERATOR).assume_error());

    env.legacy_a.authorize_ledger(OPERATOR, LEDGER);
    env.legacy_a.set_amount(OPERATOR, 0);
    EXPECT_EQ(
        StakingError::NothingToSync,
        ledger.stake_legacy_a(OWNER, OPERATOR).assume_error());

    env.legacy_a.set_amount(OPERATOR, 800);
    env.legacy_a.undelegate(OPERATOR, 5);
    EXPECT_EQ(
        StakingError::NothingToSync,
        ledger.stake_legacy_a(OWNER, OPERATOR).assume_error());
}

TEST_F(StakingTest, stake_legacy_b)
{
    env.legacy_b.deposit(OWNER, 700);

    EXPECT_FALSE(
        ledger.stake_legacy_b(OWNER, OPERATOR, BENEFICIARY, Address{})
            .has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 700);
    EXPECT_EQ(ledger.roles_of(OPERATOR).beneficiary, BENEFICIARY);
    EXPECT_EQ(ledger.roles_of(OPERATOR).authorizer, OWNER);
    EXPECT_TRUE(env.legacy_b.is_merged(OWNER));
}

TEST_F(StakingTest, stake_legacy_b_revert_unknown_staker)
{
    EXPECT_EQ(
        sim::MirrorError::UnknownStaker,
        ledger.stake_legacy_b(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER)
            .assume_error());
    EXPECT_EQ(ledger.roles_of(OPERATOR).owner, Address{});

    env.legacy_b.deposit(OWNER, 0);
    EXPECT_EQ(
        StakingError::NothingToSync,
        ledger.stake_legacy_b(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER)
            .assume_error());
    // the merge is undone with the rest of the call
    EXPECT_FALSE(env.legacy_b.is_merged(OWNER));
}

TEST_F(StakingTest, stake_legacy_b_revert_escrow_already_merged)
{
    env.legacy_b.deposit(OWNER, 700);
    ASSERT_FALSE(
        ledger.stake_legacy_b(OWNER, OPERATOR, BENEFICIARY, AUTHORIZER)
            .has_error());

    auto const events = event_count();
    EXPECT_EQ(
        sim::MirrorError::AlreadyMerged,
        ledger.stake_legacy_b(OWNER, OPERATOR2, BENEFICIARY, AUTHORIZER)
            .assume_error());
    EXPECT_EQ(ledger.stakes(OPERATOR2).legacy_b, 0);
    EXPECT_EQ(ledger.roles_of(OPERATOR2).owner, Address{});
    EXPECT_EQ(event_count(), events);

    // the bound operator can still top up from the same escrow
    env.legacy_b.deposit(OWNER, 100);
    EXPECT_FALSE(ledger.top_up_legacy_b(OWNER, OPERATOR).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 800);
}

TEST_F(StakingTest, top_up)
{
    stake(OPERATOR, 500);
    // anyone may top up
    fund(STRANGER, 300);
    EXPECT_FALSE(ledger.top_up(STRANGER, OPERATOR, 300).has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).native, 800);
    EXPECT_EQ(env.token.balance_of(LEDGER), 800);
    EXPECT_EQ(last_event<ToppedUp>().amount, 300);

    EXPECT_EQ(
        StakingError::InvalidInput,
        ledger.top_up(STRANGER, OPERATOR, 0).assume_error());
    EXPECT_EQ(
        StakingError::UnknownOperator,
        ledger.top_up(STRANGER, OPERATOR2, 10).assume_error());
}

TEST_F(StakingTest, top_up_legacy_a)
{
    delegate_legacy_a(env, OPERATOR, 800);
    EXPECT_FALSE(ledger.stake_legacy_a(OWNER, OPERATOR).has_error());

    EXPECT_EQ(
        StakingError::NothingToTopUp,
        ledger.top_up_legacy_a(OWNER, OPERATOR).assume_error());

    env.legacy_a.set_amount(OPERATOR, 1000);
    EXPECT_EQ(
        StakingError::NotOwnerOrOperator,
        ledger.top_up_legacy_a(STRANGER, OPERATOR).assume_error());
    // the operator itself may act
    EXPECT_FALSE(ledger.top_up_legacy_a(OPERATOR, OPERATOR).has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_a, 1000);
    EXPECT_EQ(last_event<ToppedUp>().amount, 200);
}

TEST_F(StakingTest, top_up_legacy_b)
{
    stake(OPERATOR, 500);
    env.legacy_b.deposit(OWNER, 200);

    EXPECT_FALSE(ledger.top_up_legacy_b(OWNER, OPERATOR).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 200);
    EXPECT_EQ(ledger.stakes(OPERATOR).native, 500);

    EXPECT_EQ(
        StakingError::NothingToTopUp,
        ledger.top_up_legacy_b(OWNER, OPERATOR).assume_error());
}

TEST_F(StakingTest, unstake_native)
{
    stake(OPERATOR, 500);

    // below the minimum only after the minimum staking time
    EXPECT_EQ(
        StakingError::TooEarlyToUnstake,
        ledger.unstake_native(OWNER, OPERATOR, 450).assume_error());
    EXPECT_FALSE(ledger.unstake_native(OWNER, OPERATOR, 400).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).native, 100);
    EXPECT_EQ(env.token.balance_of(OWNER), 400);

    ledger.set_timestamp(MIN_STAKE_TIME);
    EXPECT_FALSE(ledger.unstake_native(OPERATOR, OPERATOR, 100).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).native, 0);
    // tokens always go back to the owner
    EXPECT_EQ(env.token.balance_of(OWNER), 500);
    EXPECT_EQ(env.token.balance_of(OPERATOR), 0);

    auto const &unstaked = last_event<Unstaked>();
    EXPECT_EQ(unstaked.stake_type, StakeType::Native);
    EXPECT_EQ(unstaked.amount, 100);
}

TEST_F(StakingTest, unstake_native_revert)
{
    stake(OPERATOR, 500);

    EXPECT_EQ(
        StakingError::UnknownOperator,
        ledger.unstake_native(OWNER, OPERATOR2, 10).assume_error());
    EXPECT_EQ(
        StakingError::NotOwnerOrOperator,
        ledger.unstake_native(STRANGER, OPERATOR, 10).assume_error());
    EXPECT_EQ(
        StakingError::InsufficientStake,
        ledger.unstake_native(OWNER, OPERATOR, 0).assume_error());
    EXPECT_EQ(
        StakingError::InsufficientStake,
        ledger.unstake_native(OWNER, OPERATOR, 501).assume_error());
}

TEST_F(StakingTest, unstake_legacy_a)
{
    delegate_legacy_a(env, OPERATOR, 800);
    EXPECT_FALSE(ledger.stake_legacy_a(OWNER, OPERATOR).has_error());
    authorize(OPERATOR, APP_A, 300);

    EXPECT_EQ(
        StakingError::StillAuthorized,
        ledger.unstake_legacy_a(OWNER, OPERATOR).assume_error());

    // native stake alone now covers the authorization
    fund(OWNER, 300);
    EXPECT_FALSE(ledger.top_up(OWNER, OPERATOR, 300).has_error());
    EXPECT_FALSE(ledger.unstake_legacy_a(OWNER, OPERATOR).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_a, 0);
    EXPECT_EQ(last_event<Unstaked>().amount, 800);

    EXPECT_EQ(
        StakingError::NothingToUnstake,
        ledger.unstake_legacy_a(OWNER, OPERATOR).assume_error());
}

TEST_F(LegacyBRatioTest, unstake_legacy_b_whole_units)
{
    env.legacy_b.deposit(OWNER, 30);
    EXPECT_FALSE(
        ledger.stake_legacy_b(OWNER, OPERATOR, Address{}, Address{})
            .has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 300);

    EXPECT_FALSE(ledger.unstake_legacy_b(OWNER, OPERATOR, 25).has_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 280);
    EXPECT_EQ(last_event<Unstaked>().amount, 20);

    EXPECT_EQ(
        StakingError::NothingToUnstake,
        ledger.unstake_legacy_b(OWNER, OPERATOR, 5).assume_error());
    EXPECT_EQ(
        StakingError::InsufficientStake,
        ledger.unstake_legacy_b(OWNER, OPERATOR, 281).assume_error());
}

TEST_F(StakingTest, unstake_all)
{
    stake(OPERATOR, 500);
    env.legacy_b.deposit(OWNER, 200);
    EXPECT_FALSE(ledger.top_up_legacy_b(OWNER, OPERATOR).has_error());

    EXPECT_EQ(
        StakingError::TooEarlyToUnstake,
        ledger.unstake_all(OWNER, OPERATOR).assume_error());

    ledger.set_timestamp(MIN_STAKE_TIME);
    auto const before = event_count();
    EXPECT_FALSE(ledger.unstake_all(OWNER, OPERATOR).has_error());

    EXPECT_EQ(ledger.stakes(OPERATOR).native, 0);
    EXPECT_EQ(ledger.stakes(OPERATOR).legacy_b, 0);
    EXPECT_EQ(env.token.balance_of(OWNER), 500);
    EXPECT_EQ(env.token.balance_of(LEDGER), 0);

    // one event per non-empty source
    auto const events = ledger.events().subspan(before);
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(std::get<Unstaked>(events[0]).stake_type, StakeType::Native);
    EXPECT_EQ(std::get<Unstaked>(events[1]).stake_type, StakeType::LegacyB);

    EXPECT_EQ(
        StakingError::NothingToUnstake,
        ledger.unstake_all(OWNER, OPERATOR).assume_error());
}

TEST_F(StakingTest, unstake_all_revert_still_authorized)
{
    stake(OPERATOR, 500);
    authorize(OPERATOR, APP_A, 100);
    ledger.set_timestamp(MIN_STAKE_TIME);

    EXPECT_EQ(
        StakingError::StillAuthorized,
        ledger.unstake_all(OWNER, OPERATOR).assume_error());
    EXPECT_EQ(ledger.stakes(OPERATOR).native, 500);
}
