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
#include <tessera/staking/config.hpp>

#include <cstdint>

TESSERA_STAKING_NAMESPACE_BEGIN

// A native stake below the minimum may only be withdrawn once it has been
// held for this long.
inline constexpr uint64_t MIN_STAKE_TIME{24 * 60 * 60};

// Share of every processed slash paid to whoever processed it. The remainder
// is kept in the notifiers treasury.
inline constexpr uint256_t SLASHING_REWARD_PERCENT{5};

// Reward multipliers are percentages.
inline constexpr uint256_t MAX_REWARD_MULTIPLIER{100};

// Multiplier used when the slashing processor seizes legacy stake.
inline constexpr uint256_t SLASHING_REWARD_MULTIPLIER{100};

static_assert(SLASHING_REWARD_PERCENT <= 100);
static_assert(SLASHING_REWARD_MULTIPLIER <= MAX_REWARD_MULTIPLIER);

TESSERA_STAKING_NAMESPACE_END
