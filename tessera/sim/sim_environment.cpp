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

#include <tessera/sim/sim_environment.hpp>

TESSERA_SIM_NAMESPACE_BEGIN

SimEnvironment::SimEnvironment(
    staking::LedgerConfig const &config, OracleRatio const &legacy_a_ratio,
    OracleRatio const &legacy_b_ratio)
    : legacy_a_oracle{legacy_a_ratio.ratio, legacy_a_ratio.divisor}
    , legacy_b_oracle{legacy_b_ratio.ratio, legacy_b_ratio.divisor}
    , ledger{
          config,
          staking::Collaborators{
              .token = token,
              .legacy_a = legacy_a,
              .legacy_b = legacy_b,
              .legacy_a_oracle = legacy_a_oracle,
              .legacy_b_oracle = legacy_b_oracle,
              .applications = applications}}
{
    ledger.add_transactional(token);
    ledger.add_transactional(legacy_a);
    ledger.add_transactional(legacy_b);
}

TESSERA_SIM_NAMESPACE_END
