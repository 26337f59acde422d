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

#include "script.hpp"

#include <tessera/core/address.hpp>
#include <tessera/sim/sim_environment.hpp>
#include <tessera/staking/util/staking_error.hpp>
#include <tessera/staking/util/staking_params.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace tessera;
using namespace evmc::literals;

namespace
{
    staking::LedgerConfig replay_config()
    {
        staking::LedgerConfig config;
        config.ledger = named_address("ledger").value();
        config.governance = named_address("governance").value();
        config.params.min_stake_amount = 100;
        return config;
    }

    constexpr char const *SCRIPT = R"(
# setup
mint alice 1000
approve alice 1000
app app_a
approve_app governance app_a

stake alice op1 - - 600
increase_authorization alice op1 app_a 500
! increase_authorization alice op1 app_a 200   # exceeds the stake
slash app_a 100 op1
process_slashing bob 1
)";
}

struct ScriptTest : public ::testing::Test
{
    sim::SimEnvironment env{replay_config()};
    std::ostringstream out;
    ScriptRunner runner{env, out};
};

TEST(NamedAddress, padding)
{
    auto const address = named_address("bob");
    ASSERT_FALSE(address.has_error());
    EXPECT_EQ(address.value().bytes[0], 'b');
    EXPECT_EQ(address.value().bytes[2], 'b');
    EXPECT_EQ(address.value().bytes[3], 0);

    EXPECT_EQ(ScriptError::InvalidAddress, named_address("").assume_error());
    EXPECT_EQ(
        ScriptError::InvalidAddress,
        named_address("a_name_longer_than_twenty").assume_error());
}

TEST_F(ScriptTest, run)
{
    std::istringstream in{SCRIPT};
    auto const summary = runner.run(in);

    EXPECT_EQ(summary.lines, 9);
    EXPECT_EQ(summary.succeeded, 8);
    EXPECT_EQ(summary.rejected, 1);
    EXPECT_EQ(summary.mismatched, 0);

    auto const op1 = named_address("op1").value();
    auto const bob = named_address("bob").value();
    EXPECT_EQ(env.ledger.stakes(op1).native, 500);
    EXPECT_EQ(
        env.ledger.authorized_stake(op1, named_address("app_a").value()),
        500);
    EXPECT_EQ(env.token.balance_of(bob), 5);
    EXPECT_EQ(env.ledger.notifiers_treasury(), 95);

    auto const *const app = runner.application("app_a");
    ASSERT_NE(app, nullptr);
    // the rejected increase never reached the application
    EXPECT_EQ(app->calls().size(), 1);

    std::ostringstream state;
    runner.print_state(state);
    EXPECT_NE(
        state.str().find("op1: balance 0 native 500 legacy_a 0 legacy_b 0 "
                         "applications 1"),
        std::string::npos);
    EXPECT_NE(state.str().find("bob: balance 5"), std::string::npos);
    EXPECT_NE(state.str().find("slashing queue 1/1"), std::string::npos);
}

TEST_F(ScriptTest, mismatches)
{
    std::istringstream in{R"(
! mint alice 1
stake alice op1 - - 600
frobnicate
)"};
    auto const summary = runner.run(in);

    EXPECT_EQ(summary.lines, 3);
    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.rejected, 1);
    EXPECT_EQ(summary.mismatched, 3);
    EXPECT_NE(out.str().find("unexpected success"), std::string::npos);
    EXPECT_NE(out.str().find("unexpected rejection"), std::string::npos);
    EXPECT_NE(out.str().find("malformed"), std::string::npos);
}

TEST_F(ScriptTest, execute)
{
    EXPECT_EQ(
        ScriptError::UnknownCommand,
        runner.execute("frobnicate").assume_error());
    EXPECT_EQ(
        ScriptError::MissingArgument,
        runner.execute("mint alice").assume_error());
    EXPECT_EQ(
        ScriptError::TooManyArguments,
        runner.execute("mint alice 1 2").assume_error());
    EXPECT_EQ(
        ScriptError::InvalidNumber,
        runner.execute("mint alice -1").assume_error());
    EXPECT_EQ(
        ScriptError::InvalidAddress,
        runner.execute("mint 0xzz 1").assume_error());
    EXPECT_EQ(
        ScriptError::UnknownApplication,
        runner.execute("app_fail nobody 1").assume_error());

    EXPECT_FALSE(runner.execute("").has_error());
    EXPECT_FALSE(
        runner.execute("mint 0x00000000000000000000000000000000000000aa 5")
            .has_error());
    EXPECT_EQ(env.token.balance_of(0xaa_address), 5);

    // ledger rejections come back unchanged
    EXPECT_EQ(
        staking::StakingError::NotGovernance,
        runner.execute("set_min_stake alice 1").assume_error());
}
