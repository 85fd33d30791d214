// test_roundtrip.cpp - Canonical form fixed-point check

#include <gtest/gtest.h>

#include "castlist/render/roundtrip.hpp"

TEST(RoundTrip, CanonicalInputIsStable)
{
  const auto report = castlist::check_roundtrip("Batman [Bruce Wayne] (origin);");
  EXPECT_TRUE(report.stable);
  EXPECT_EQ(report.first, "Batman [Bruce Wayne] (origin);");
  EXPECT_EQ(report.second, report.first);
}

TEST(RoundTrip, MessyInputReachesFixedPointAfterOnePass)
{
  const auto report = castlist::check_roundtrip("  A[ x ];;B (y)  ");
  EXPECT_TRUE(report.stable);
  EXPECT_EQ(report.first, "A [x]; B (y);");
}

TEST(RoundTrip, RecoveredInputIsStable)
{
  for (const char * input :
       {"Zeta (a,b;", "A [x; B (y);", "A [x]]; B ) C;", "[Solo]; Kept;",
        "Team [[Alias]; Hero [H]];", "Hal (Green (Lantern) Corps);"}) {
    const auto report = castlist::check_roundtrip(input);
    EXPECT_TRUE(report.stable) << input << " -> " << report.first << " -> " << report.second;
  }
}

TEST(RoundTrip, EmptyInput)
{
  const auto report = castlist::check_roundtrip("");
  EXPECT_TRUE(report.stable);
  EXPECT_EQ(report.first, "");
}

TEST(RoundTrip, UnclosedGroupAroundUnclosedOpenerIsUnstable)
{
  const auto report = castlist::check_roundtrip("Z (a(b");
  EXPECT_FALSE(report.stable);
  EXPECT_EQ(report.first, "Z (a(b);");
  EXPECT_EQ(report.second, "Z (a(b););");
}

TEST(RoundTrip, UnclosedNestedSquaresAreStable)
{
  const auto report = castlist::check_roundtrip("A [b [c");
  EXPECT_TRUE(report.stable);
  EXPECT_EQ(report.first, "A [b [c]];");
}
