//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/NumberFormatTests.cpp
// Purpose: Verify the display formatting shared by `say` and the transpiler.
// Key invariants: Integral values in fixed range keep a `.0` suffix.
// Ownership/Lifetime: Stateless.
// Links: src/support/number_format.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/number_format.hpp"

#include <limits>

using roadman::support::formatNumber;

TEST(NumberFormatTest, IntegralValuesGetFractionSuffix)
{
    EXPECT_EQ(formatNumber(0.0), "0.0");
    EXPECT_EQ(formatNumber(10.0), "10.0");
    EXPECT_EQ(formatNumber(120.0), "120.0");
    EXPECT_EQ(formatNumber(-3.0), "-3.0");
}

TEST(NumberFormatTest, FractionsUseShortestRoundTrip)
{
    EXPECT_EQ(formatNumber(22.5), "22.5");
    EXPECT_EQ(formatNumber(0.1), "0.1");
    EXPECT_EQ(formatNumber(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(formatNumber(0.0001), "0.0001");
}

TEST(NumberFormatTest, ExtremeMagnitudesUseScientific)
{
    EXPECT_EQ(formatNumber(1e16), "1e+16");
    EXPECT_EQ(formatNumber(1.5e-7), "1.5e-07");
    EXPECT_EQ(formatNumber(123456789012345.0), "123456789012345.0");
}

TEST(NumberFormatTest, NonFiniteValues)
{
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatNumber(-std::numeric_limits<double>::infinity()), "-inf");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::quiet_NaN()), "nan");
}
