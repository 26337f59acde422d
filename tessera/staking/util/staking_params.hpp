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
#include <tessera/staking/config.hpp>

#include <cstdint>

TESSERA_STAKING_NAMESPACE_BEGIN

// Parameters tunable by the governance.
struct StakingParams
{
    // a new native stake must be strictly larger than this
    uint256_t min_stake_amount{0};

    // max number of applications one operator may authorize, 0 is unlimited
    uint64_t authorization_ceiling{0};

    // amount seized from a legacy stake when a discrepancy is reported
    uint256_t stake_discrepancy_penalty{0};
    // percentage of the legacy reward paid to the discrepancy notifier
    uint256_t stake_discrepancy_reward_multiplier{100};

    // paid from the notifiers treasury per queued slashing event
    uint256_t notification_reward{0};
};

struct LedgerConfig
{
    // identity under which the ledger holds tokens
    Address ledger{};
    Address governance{};
    StakingParams params{};
};

TESSERA_STAKING_NAMESPACE_END
