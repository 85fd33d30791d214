// test_roundtrip_fixtures.cpp - Canonical output and stability for multi-line lists

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/render/canonicalizer.hpp"
#include "castlist/render/roundtrip.hpp"
#include "castlist/syntax/frontend.hpp"

using castlist::IssueCode;

namespace
{

struct Fixture
{
  const char * name;
  const char * input;
  const char * canonical;
  std::vector<IssueCode> codes;
};

const std::vector<Fixture> & fixtures()
{
  static const std::vector<Fixture> k_fixtures = {
    {"dc_mixed",
     "\n"
     "Green Lantern [John Stewart];\n"
     "Justice League [Superman [Clark Kent; Kal-El]; Batman [Bruce Wayne]];\n"
     "Jimmy Olsen (origin, death);\n",
     "Green Lantern [John Stewart]; Justice League [Superman [Clark Kent; Kal-El]; Batman [Bruce "
     "Wayne]]; Jimmy Olsen (origin, death);",
     {IssueCode::AmbiguousSquareList}},
    {"flat_entries",
     "\n"
     "Batman;\n"
     "Superman (death);\n"
     "Flash [Barry Allen];\n",
     "Batman; Superman (death); Flash [Barry Allen];",
     {}},
    {"flat_list_in_square",
     "\nJustice League [Superman; Batman; Wonder Woman];\n",
     "Justice League [Superman; Batman; Wonder Woman];",
     {IssueCode::AmbiguousSquareList}},
    {"separators_inside_brackets",
     "\n"
     "Foo (a; b; c);\n"
     "Bar [x; y; z];\n",
     "Foo (a; b; c); Bar [x; y; z];",
     {IssueCode::AmbiguousSquareList}},
    {"single_character", "SingleCharacter;", "SingleCharacter;", {}},
    {"solo_info", "SoloInfo (only info);", "SoloInfo (only info);", {}},
  };
  return k_fixtures;
}

std::vector<IssueCode> codes_of(const castlist::Dataset & dataset)
{
  std::vector<IssueCode> out;
  for (const auto & issue : dataset.issues()) {
    out.push_back(issue.code);
  }
  return out;
}

}  // namespace

TEST(RoundTripFixtures, CanonicalFormAndIssues)
{
  for (const auto & fx : fixtures()) {
    SCOPED_TRACE(fx.name);
    const auto dataset = castlist::parse(fx.input);
    EXPECT_EQ(castlist::render(dataset), fx.canonical);
    EXPECT_EQ(codes_of(dataset), fx.codes);
  }
}

TEST(RoundTripFixtures, CanonicalFormIsStable)
{
  for (const auto & fx : fixtures()) {
    SCOPED_TRACE(fx.name);
    const auto report = castlist::check_roundtrip(fx.input);
    EXPECT_TRUE(report.stable) << report.first << "\n" << report.second;
    EXPECT_EQ(report.first, fx.canonical);
  }
}

TEST(RoundTripFixtures, GroupMembersAreNotRepeatedAtTopLevel)
{
  const auto dataset = castlist::parse(fixtures()[0].input);
  // Green Lantern, Justice League, Superman, Batman, Jimmy Olsen
  EXPECT_EQ(dataset.size(), 5U);
  EXPECT_EQ(castlist::find_roots(dataset).size(), 3U);
}

TEST(RoundTripFixtures, CanonicalOutputParsesToSameShape)
{
  for (const auto & fx : fixtures()) {
    SCOPED_TRACE(fx.name);
    const auto first = castlist::parse(fx.input);
    const auto second = castlist::parse(castlist::render(first));
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
      EXPECT_EQ(first.entries()[i]->name, second.entries()[i]->name);
      EXPECT_EQ(first.entries()[i]->fragments.size(), second.entries()[i]->fragments.size());
    }
  }
}
