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
#include <tessera/staking/events.hpp>
#include <tessera/staking/util/staking_error.hpp>

#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::staking;
using namespace tessera::staking::test;

TEST_F(StakingTest, governance_only)
{
    auto const before = event_count();

    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_minimum_stake_amount(STRANGER, 1).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.approve_application(STRANGER, STRANGER).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_panic_button(STRANGER, APP_A, STRANGER).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_authorization_ceiling(STRANGER, 1).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_stake_discrepancy_penalty(STRANGER, 1, 1).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_notification_reward(STRANGER, 1).assume_error());
    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.transfer_governance(STRANGER, STRANGER).assume_error());

    EXPECT_EQ(event_count(), before);
    EXPECT_EQ(ledger.params().min_stake_amount, MIN_STAKE);
}

TEST_F(StakingTest, set_params)
{
    EXPECT_FALSE(ledger.set_minimum_stake_amount(GOVERNANCE, 7).has_error());
    EXPECT_EQ(ledger.params().min_stake_amount, 7);
    EXPECT_EQ(last_event<MinimumStakeAmountSet>().amount, 7);

    EXPECT_FALSE(ledger.set_authorization_ceiling(GOVERNANCE, 3).has_error());
    EXPECT_EQ(ledger.params().authorization_ceiling, 3);

    EXPECT_FALSE(ledger.set_notification_reward(GOVERNANCE, 9).has_error());
    EXPECT_EQ(ledger.params().notification_reward, 9);

    EXPECT_FALSE(
        ledger.set_stake_discrepancy_penalty(GOVERNANCE, 200, 100).has_error());
    EXPECT_EQ(ledger.params().stake_discrepancy_penalty, 200);
    EXPECT_EQ(ledger.params().stake_discrepancy_reward_multiplier, 100);
    EXPECT_EQ(
        StakingError::InvalidInput,
        ledger.set_stake_discrepancy_penalty(GOVERNANCE, 200, 101)
            .assume_error());
    EXPECT_EQ(ledger.params().stake_discrepancy_reward_multiplier, 100);
}

TEST_F(StakingTest, approve_application)
{
    EXPECT_EQ(
        StakingError::ApplicationAlreadyApproved,
        ledger.approve_application(GOVERNANCE, APP_A).assume_error());
    EXPECT_EQ(
        StakingError::InvalidInput,
        ledger.approve_application(GOVERNANCE, Address{}).assume_error());

    EXPECT_FALSE(ledger.approve_application(GOVERNANCE, STRANGER).has_error());
    EXPECT_TRUE(ledger.application_info(STRANGER).approved);
    EXPECT_EQ(last_event<ApplicationApproved>().application, STRANGER);
}

TEST_F(StakingTest, panic_button)
{
    EXPECT_EQ(
        StakingError::ApplicationNotApproved,
        ledger.set_panic_button(GOVERNANCE, STRANGER, PANIC_BUTTON)
            .assume_error());
    EXPECT_EQ(ledger.application_info(APP_A).panic_button, PANIC_BUTTON);

    EXPECT_EQ(
        StakingError::NotPanicButton,
        ledger.disable_application(GOVERNANCE, APP_A).assume_error());
    EXPECT_EQ(
        StakingError::ApplicationNotApproved,
        ledger.disable_application(PANIC_BUTTON, STRANGER).assume_error());

    EXPECT_FALSE(
        ledger.disable_application(PANIC_BUTTON, APP_A).has_error());
    EXPECT_TRUE(ledger.application_info(APP_A).disabled);
    EXPECT_EQ(last_event<ApplicationDisabled>().application, APP_A);

    EXPECT_EQ(
        StakingError::ApplicationDisabled,
        ledger.disable_application(PANIC_BUTTON, APP_A).assume_error());

    // governance may bring it back
    EXPECT_FALSE(ledger.approve_application(GOVERNANCE, APP_A).has_error());
    EXPECT_FALSE(ledger.application_info(APP_A).disabled);
}

TEST_F(StakingTest, panic_button_unset)
{
    EXPECT_FALSE(ledger.approve_application(GOVERNANCE, STRANGER).has_error());
    // no panic button, nobody may disable
    EXPECT_EQ(
        StakingError::NotPanicButton,
        ledger.disable_application(Address{}, STRANGER).assume_error());
}

TEST_F(StakingTest, transfer_governance)
{
    EXPECT_EQ(
        StakingError::InvalidInput,
        ledger.transfer_governance(GOVERNANCE, Address{}).assume_error());

    EXPECT_FALSE(ledger.transfer_governance(GOVERNANCE, OWNER).has_error());
    EXPECT_EQ(ledger.governance(), OWNER);

    auto const &event = last_event<GovernanceTransferred>();
    EXPECT_EQ(event.old_governance, GOVERNANCE);
    EXPECT_EQ(event.new_governance, OWNER);

    EXPECT_EQ(
        StakingError::NotGovernance,
        ledger.set_minimum_stake_amount(GOVERNANCE, 1).assume_error());
    EXPECT_FALSE(ledger.set_minimum_stake_amount(OWNER, 1).has_error());
}

TEST_F(StakingTest, event_names)
{
    EXPECT_FALSE(ledger.set_notification_reward(GOVERNANCE, 9).has_error());
    EXPECT_EQ(event_name(ledger.events().back()), "NotificationRewardSet");
    EXPECT_EQ(event_name(StakingEvent{Staked{}}), "Staked");
    EXPECT_EQ(
        event_name(StakingEvent{TokensSeized{}}), "TokensSeized");
}
