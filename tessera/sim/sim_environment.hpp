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

#include <tessera/core/int.hpp>
#include <tessera/sim/config.hpp>
#include <tessera/sim/in_memory_mirrors.hpp>
#include <tessera/sim/in_memory_token.hpp>
#include <tessera/sim/ratio_conversion_oracle.hpp>
#include <tessera/staking/application_registry.hpp>
#include <tessera/staking/staking_ledger.hpp>
#include <tessera/staking/util/staking_params.hpp>

TESSERA_SIM_NAMESPACE_BEGIN

struct OracleRatio
{
    uint256_t ratio{1};
    uint256_t divisor{1};
};

// A ledger wired to in-memory collaborators. The token and both mirrors
// follow the ledger's accept/reject decisions.
struct SimEnvironment
{
    InMemoryToken token;
    InMemoryLegacyMirrorA legacy_a;
    InMemoryLegacyMirrorB legacy_b;
    RatioConversionOracle legacy_a_oracle;
    RatioConversionOracle legacy_b_oracle;
    staking::ApplicationRegistry applications;
    staking::StakingLedger ledger;

    explicit SimEnvironment(
        staking::LedgerConfig const &, OracleRatio const &legacy_a_ratio = {},
        OracleRatio const &legacy_b_ratio = {});

    SimEnvironment(SimEnvironment const &) = delete;
    SimEnvironment &operator=(SimEnvironment const &) = delete;
};

TESSERA_SIM_NAMESPACE_END
