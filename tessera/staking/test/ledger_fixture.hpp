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
#include <tessera/sim/scripted_application.hpp>
#include <tessera/sim/sim_environment.hpp>
#include <tessera/staking/events.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/staking_params.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <cstddef>
#include <initializer_list>
#include <variant>

namespace tessera::staking::test
{
    using namespace evmc::literals;

    inline constexpr Address LEDGER = 0x1ed9e7_address;
    inline constexpr Address GOVERNANCE = 0x9090_address;
    inline constexpr Address OWNER = 0x0a11ce_address;
    inline constexpr Address OPERATOR = 0x0b0b_address;
    inline constexpr Address OPERATOR2 = 0x0b0c_address;
    inline constexpr Address BENEFICIARY = 0xbeef_address;
    inline constexpr Address AUTHORIZER = 0xa0a0_address;
    inline constexpr Address APP_A = 0xaa01_address;
    inline constexpr Address APP_B = 0xaa02_address;
    inline constexpr Address PANIC_BUTTON = 0xdead_address;
    inline constexpr Address NOTIFIER = 0xf00d_address;
    inline constexpr Address STRANGER = 0x5555_address;

    inline constexpr uint256_t MIN_STAKE{100};

    inline LedgerConfig test_config()
    {
        LedgerConfig config;
        config.ledger = LEDGER;
        config.governance = GOVERNANCE;
        config.params.min_stake_amount = MIN_STAKE;
        config.params.stake_discrepancy_penalty = 100;
        config.params.stake_discrepancy_reward_multiplier = 50;
        return config;
    }

    // Ledger wired to in-memory collaborators with two approved
    // applications, both with a panic button.
    template <class Base = ::testing::Test>
    struct LedgerFixture : public Base
    {
        sim::ScriptedApplication app_a;
        sim::ScriptedApplication app_b;
        sim::SimEnvironment env;
        StakingLedger &ledger{env.ledger};

        explicit LedgerFixture(
            sim::OracleRatio const &legacy_a_ratio = {},
            sim::OracleRatio const &legacy_b_ratio = {})
            : env{test_config(), legacy_a_ratio, legacy_b_ratio}
        {
            EXPECT_TRUE(env.applications.add(APP_A, app_a));
            EXPECT_TRUE(env.applications.add(APP_B, app_b));
            for (auto const &app : {APP_A, APP_B}) {
                EXPECT_FALSE(
                    ledger.approve_application(GOVERNANCE, app).has_error());
                EXPECT_FALSE(
                    ledger.set_panic_button(GOVERNANCE, app, PANIC_BUTTON)
                        .has_error());
            }
        }

        void fund(Address const &account, uint256_t const &amount)
        {
            env.token.mint(account, amount);
            env.token.approve(
                account, LEDGER, env.token.allowance(account, LEDGER) + amount);
        }

        // native stake owned by OWNER, authorized by AUTHORIZER
        void stake(Address const &operator_address, uint256_t const &amount)
        {
            fund(OWNER, amount);
            ASSERT_FALSE(ledger
                             .stake(
                                 OWNER,
                                 operator_address,
                                 BENEFICIARY,
                                 AUTHORIZER,
                                 amount)
                             .has_error());
        }

        void authorize(
            Address const &operator_address, Address const &application,
            uint256_t const &amount)
        {
            ASSERT_FALSE(
                ledger
                    .increase_authorization(
                        AUTHORIZER, operator_address, application, amount)
                    .has_error());
        }

        // fills the notifiers treasury from a fresh account
        void fill_treasury(uint256_t const &amount)
        {
            fund(STRANGER, amount);
            ASSERT_FALSE(
                ledger.push_notification_reward(STRANGER, amount).has_error());
        }

        size_t event_count() const
        {
            return ledger.events().size();
        }

        template <class E>
        E const &last_event() const
        {
            auto const events = ledger.events();
            EXPECT_FALSE(events.empty());
            EXPECT_TRUE(std::holds_alternative<E>(events.back()));
            return std::get<E>(events.back());
        }
    };

    using StakingTest = LedgerFixture<>;
}
