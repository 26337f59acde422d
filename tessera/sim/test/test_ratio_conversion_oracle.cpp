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

#include <tessera/core/int.hpp>
#include <tessera/sim/ratio_conversion_oracle.hpp>

#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::sim;

TEST(RatioConversionOracle, identity)
{
    RatioConversionOracle const oracle{1, 1};
    EXPECT_EQ(oracle.to_native(123).amount, 123);
    EXPECT_EQ(oracle.to_native(123).remainder, 0);
    EXPECT_EQ(oracle.from_native(123).amount, 123);
    EXPECT_EQ(oracle.from_native(UINT256_MAX).amount, UINT256_MAX);
}

TEST(RatioConversionOracle, whole_legacy_units)
{
    // 1000 legacy base units make one unit worth 3 native base units
    RatioConversionOracle const oracle{3, 1000};

    auto const native = oracle.to_native(2500);
    EXPECT_EQ(native.amount, 6);
    EXPECT_EQ(native.remainder, 500);

    auto const legacy = oracle.from_native(7);
    EXPECT_EQ(legacy.amount, 2000);
    EXPECT_EQ(legacy.remainder, 1);

    EXPECT_EQ(oracle.to_native(999).amount, 0);
    EXPECT_EQ(oracle.from_native(2).amount, 0);
}

TEST(RatioConversionOracle, large_amounts_saturate)
{
    RatioConversionOracle const oracle{10, 1};
    EXPECT_EQ(oracle.to_native(UINT256_MAX).amount, UINT256_MAX);
    EXPECT_EQ(oracle.from_native(100).amount, 10);
}
