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

#include <tessera/core/assert.h>
#include <tessera/core/int.hpp>
#include <tessera/sim/ratio_conversion_oracle.hpp>

#include <intx/intx.hpp>

TESSERA_SIM_NAMESPACE_BEGIN

namespace
{
    // x * y / z without intermediate overflow, saturating
    uint256_t
    mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z)
    {
        uint512_t const q = intx::umul(x, y) / uint512_t{z};
        return q > UINT256_MAX ? UINT256_MAX : static_cast<uint256_t>(q);
    }
}

RatioConversionOracle::RatioConversionOracle(
    uint256_t const &ratio, uint256_t const &divisor)
    : ratio_{ratio}
    , divisor_{divisor}
{
    TESSERA_ASSERT(ratio_ != 0 && divisor_ != 0);
}

staking::Conversion
RatioConversionOracle::to_native(uint256_t const &legacy_amount) const
{
    auto const remainder = legacy_amount % divisor_;
    return staking::Conversion{
        .amount = mul_div(legacy_amount - remainder, ratio_, divisor_),
        .remainder = remainder};
}

staking::Conversion
RatioConversionOracle::from_native(uint256_t const &native_amount) const
{
    auto const remainder = native_amount % ratio_;
    return staking::Conversion{
        .amount = mul_div(native_amount - remainder, divisor_, ratio_),
        .remainder = remainder};
}

TESSERA_SIM_NAMESPACE_END
