// test_canonicalizer.cpp - Canonical rendering and root selection

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "castlist/render/canonicalizer.hpp"
#include "castlist/syntax/frontend.hpp"
#include "castlist/test_support/parse_helpers.hpp"

using castlist::render;
using castlist::test_support::names;
using castlist::test_support::parse;

namespace
{

std::string canonical(std::string_view input) { return render(castlist::parse(input)); }

}  // namespace

TEST(Canonicalizer, EmptyDatasetRendersEmpty)
{
  EXPECT_EQ(render(castlist::Dataset{}), "");
  EXPECT_EQ(canonical(""), "");
  EXPECT_EQ(canonical("[Solo];"), "");
}

TEST(Canonicalizer, SingleEntries)
{
  EXPECT_EQ(canonical("SingleCharacter;"), "SingleCharacter;");
  EXPECT_EQ(canonical("SingleCharacter"), "SingleCharacter;");
  EXPECT_EQ(canonical("Jimmy Olsen (origin, death);"), "Jimmy Olsen (origin, death);");
  EXPECT_EQ(canonical("Superman [Clark Kent; Kal-El];"), "Superman [Clark Kent; Kal-El];");
}

TEST(Canonicalizer, NormalizesSpacing)
{
  EXPECT_EQ(
    canonical("  Batman[ Bruce Wayne ](  origin );Robin ;"),
    "Batman [Bruce Wayne] (origin); Robin;");
  EXPECT_EQ(canonical("A   [x]   [y]"), "A [x] [y];");
}

TEST(Canonicalizer, GroupIsRebuiltFromMembers)
{
  EXPECT_EQ(
    canonical("Justice League [Wonder Woman;Batman[Bruce Wayne] ;  ];"),
    "Justice League [Wonder Woman; Batman [Bruce Wayne]];");
}

TEST(Canonicalizer, OnlyRootsAtTopLevel)
{
  const auto unit = parse("Justice League [Wonder Woman; Batman [Bruce Wayne]]; Flash;");
  EXPECT_EQ(
    names(castlist::find_roots(unit.dataset)),
    (std::vector<std::string>{"Justice League", "Flash"}));
  EXPECT_EQ(castlist::collect_members(unit.dataset).size(), 2U);
  EXPECT_EQ(render(unit.dataset), "Justice League [Wonder Woman; Batman [Bruce Wayne]]; Flash;");
}

TEST(Canonicalizer, RawMembersRenderAsTrimmedText)
{
  EXPECT_EQ(canonical("Team [ [Alias] ;Hero [H]];"), "Team [[Alias]; Hero [H]];");
}

TEST(Canonicalizer, DroppedMembersDisappear)
{
  EXPECT_EQ(canonical("Team [Solo [x]; (info)];"), "Team [Solo [x]];");
}

TEST(Canonicalizer, UnclosedBracketsAreClosed)
{
  EXPECT_EQ(canonical("Zeta (a,b;"), "Zeta (a,b;);");
  EXPECT_EQ(canonical("A [x; B (y);"), "A [x; B (y);];");
}

TEST(Canonicalizer, OutOfOrderFragmentsAreKept)
{
  EXPECT_EQ(canonical("Iota [A] (x) [B] (y);"), "Iota [A] (x) [B] (y);");
}

TEST(Canonicalizer, RenderNodeAndCharacter)
{
  const auto unit = parse("Green Lantern [Hal Jordan; John Stewart [Marine]] (Corps);");
  const auto * node = unit.find("Green Lantern");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(
    castlist::render_node(*node), "Green Lantern [Hal Jordan; John Stewart [Marine]] (Corps)");

  const castlist::Character member = unit.find("John Stewart");
  EXPECT_EQ(castlist::render_character(member), "John Stewart [Marine]");
  EXPECT_EQ(castlist::render_character(castlist::RawCharacter{" [x] "}), "[x]");
}
