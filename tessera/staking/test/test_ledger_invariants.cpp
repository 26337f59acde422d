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
#include <tessera/staking/util/operator_info.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

using namespace tessera;
using namespace tessera::staking;
using namespace tessera::staking::test;

namespace
{
    std::vector<Address> const OPERATORS{
        OPERATOR, OPERATOR2, 0x0b0d_address, 0x0b0e_address};
    std::vector<Address> const APPS{APP_A, APP_B};

    struct Snapshot
    {
        std::vector<Stakes> stakes;
        std::vector<uint256_t> authorizations;
        uint256_t treasury;
        uint64_t queue_index;
        uint64_t queue_length;
        size_t events;
        uint256_t ledger_balance;
    };
}

struct InvariantTest : public StakingTest
{
    Snapshot snapshot() const
    {
        Snapshot s{
            .stakes = {},
            .authorizations = {},
            .treasury = ledger.notifiers_treasury(),
            .queue_index = ledger.slashing_queue_index(),
            .queue_length = ledger.slashing_queue_length(),
            .events = event_count(),
            .ledger_balance = env.token.balance_of(LEDGER)};
        for (auto const &op : OPERATORS) {
            s.stakes.push_back(ledger.stakes(op));
            for (auto const &app : APPS) {
                s.authorizations.push_back(ledger.authorized_stake(op, app));
            }
        }
        return s;
    }

    void expect_unchanged(Snapshot const &before) const
    {
        auto const after = snapshot();
        for (size_t i = 0; i < OPERATORS.size(); ++i) {
            EXPECT_EQ(after.stakes[i].native, before.stakes[i].native);
            EXPECT_EQ(after.stakes[i].legacy_b, before.stakes[i].legacy_b);
        }
        EXPECT_EQ(after.authorizations, before.authorizations);
        EXPECT_EQ(after.treasury, before.treasury);
        EXPECT_EQ(after.queue_index, before.queue_index);
        EXPECT_EQ(after.queue_length, before.queue_length);
        EXPECT_EQ(after.events, before.events);
        EXPECT_EQ(after.ledger_balance, before.ledger_balance);
    }

    void check_invariants() const
    {
        uint256_t native{0};
        for (auto const &op : OPERATORS) {
            auto const stakes = ledger.stakes(op);
            auto const total =
                stakes.native + stakes.legacy_a + stakes.legacy_b;
            native += stakes.native;

            auto const listed = ledger.authorized_applications(op);
            for (auto const &app : APPS) {
                auto const authorization = ledger.authorization(op, app);
                EXPECT_LE(authorization.authorized, total);
                EXPECT_LE(
                    authorization.deauthorizing, authorization.authorized);
                bool const in_list =
                    std::ranges::find(listed, app) != listed.end();
                EXPECT_EQ(in_list, authorization.authorized > 0);
            }
        }
        EXPECT_LE(
            ledger.slashing_queue_index(), ledger.slashing_queue_length());
        // every token the ledger holds is either stake or treasury
        EXPECT_EQ(
            env.token.balance_of(LEDGER), native + ledger.notifiers_treasury());
    }
};

TEST_F(InvariantTest, random_operations)
{
    std::mt19937_64 rng{0x7e55e7a};
    auto const pick = [&](auto const &v) -> auto const & {
        return v[std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng)];
    };
    auto const count = [&](uint64_t const max) {
        return std::uniform_int_distribution<uint64_t>{0, max}(rng);
    };
    auto const amount = [&](uint64_t const max) {
        return uint256_t{count(max)};
    };

    for (auto const &op : OPERATORS) {
        stake(op, 1000 + amount(1000));
    }
    env.legacy_b.deposit(OWNER, 500);
    EXPECT_FALSE(ledger.top_up_legacy_b(OWNER, OPERATOR).has_error());
    EXPECT_FALSE(ledger.set_notification_reward(GOVERNANCE, 3).has_error());

    unsigned accepted = 0;
    unsigned rejected = 0;
    for (unsigned i = 0; i < 2000; ++i) {
        auto const &op = pick(OPERATORS);
        auto const &app = pick(APPS);
        auto const before = snapshot();

        bool failed = false;
        switch (count(9)) {
        case 0: {
            auto const value = amount(300);
            fund(OWNER, value);
            failed = ledger.top_up(OWNER, op, value).has_error();
            break;
        }
        case 1:
            failed = ledger.unstake_native(OWNER, op, amount(500)).has_error();
            break;
        case 2:
        case 3:
            failed = ledger
                         .increase_authorization(
                             AUTHORIZER, op, app, amount(800))
                         .has_error();
            break;
        case 4:
            failed = ledger
                         .request_authorization_decrease(
                             AUTHORIZER, op, app, amount(400))
                         .has_error();
            break;
        case 5:
            failed =
                ledger.approve_authorization_decrease(app, op).has_error();
            break;
        case 6:
        case 7: {
            std::vector<Address> const targets{op, pick(OPERATORS)};
            failed = ledger.seize(app, amount(300), 50, NOTIFIER, targets)
                         .has_error();
            break;
        }
        case 8:
            failed =
                ledger.process_slashing(NOTIFIER, 1 + count(3)).has_error();
            break;
        default:
            ledger.set_timestamp(ledger.timestamp() + count(20000));
            break;
        }

        if (failed) {
            ++rejected;
            expect_unchanged(before);
        }
        else {
            ++accepted;
        }
        // the queue is consumed in order and never shrinks
        EXPECT_GE(ledger.slashing_queue_index(), before.queue_index);
        EXPECT_GE(ledger.slashing_queue_length(), before.queue_length);
        check_invariants();
        if (HasFailure()) {
            FAIL() << "step " << i;
        }
    }

    EXPECT_GT(ledger.slashing_queue_index(), 0);
    EXPECT_GT(accepted, 100);
    EXPECT_GT(rejected, 100);
}
