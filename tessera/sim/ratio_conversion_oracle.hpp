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
#include <tessera/staking/external.hpp>

TESSERA_SIM_NAMESPACE_BEGIN

// Fixed-ratio conversion between a legacy denomination and the native one.
// One legacy unit of `divisor` base units is worth `ratio` native base units.
// Only whole legacy units are converted; the rest is returned as remainder.
class RatioConversionOracle final : public staking::ConversionOracle
{
    uint256_t ratio_;
    uint256_t divisor_;

public:
    RatioConversionOracle(uint256_t const &ratio, uint256_t const &divisor);

    staking::Conversion
    to_native(uint256_t const &legacy_amount) const override;
    staking::Conversion
    from_native(uint256_t const &native_amount) const override;

    uint256_t const &ratio() const
    {
        return ratio_;
    }

    uint256_t const &divisor() const
    {
        return divisor_;
    }
};

TESSERA_SIM_NAMESPACE_END
