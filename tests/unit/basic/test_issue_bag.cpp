// test_issue_bag.cpp - Issue codes, severities and the issue collector

#include <gtest/gtest.h>

#include <string>

#include "castlist/basic/issue.hpp"

using castlist::IssueBag;
using castlist::IssueCode;
using castlist::Severity;

TEST(IssueCode, ExactSpellings)
{
  EXPECT_EQ(castlist::to_string(IssueCode::MissingName), "MISSING_NAME");
  EXPECT_EQ(castlist::to_string(IssueCode::InvalidMemberAliasOnly), "INVALID_MEMBER_ALIAS_ONLY");
  EXPECT_EQ(castlist::to_string(IssueCode::InvalidFragmentOrder), "INVALID_FRAGMENT_ORDER");
  EXPECT_EQ(castlist::to_string(IssueCode::UnmatchedRound), "UNMATCHED_ROUND");
  EXPECT_EQ(castlist::to_string(IssueCode::NestedRoundNotAllowed), "NESTED_ROUND_NOT_ALLOWED");
  EXPECT_EQ(castlist::to_string(IssueCode::UnmatchedSquare), "UNMATCHED_SQUARE");
  EXPECT_EQ(castlist::to_string(IssueCode::AmbiguousSquareList), "AMBIGUOUS_SQUARE_LIST");
  EXPECT_EQ(castlist::to_string(IssueCode::ExtraClosingRound), "EXTRA_CLOSING_ROUND");
  EXPECT_EQ(castlist::to_string(IssueCode::ExtraClosingSquare), "EXTRA_CLOSING_SQUARE");
}

TEST(IssueCode, FromStringAcceptsEveryCode)
{
  ASSERT_EQ(castlist::all_issue_codes().size(), 9U);
  for (const IssueCode code : castlist::all_issue_codes()) {
    EXPECT_EQ(castlist::issue_code_from_string(castlist::to_string(code)), code);
  }
  EXPECT_FALSE(castlist::issue_code_from_string("missing_name").has_value());
  EXPECT_FALSE(castlist::issue_code_from_string("").has_value());
}

TEST(IssueCode, Severity)
{
  EXPECT_EQ(castlist::severity_of(IssueCode::InvalidFragmentOrder), Severity::Warning);
  EXPECT_EQ(castlist::severity_of(IssueCode::NestedRoundNotAllowed), Severity::Warning);
  EXPECT_EQ(castlist::severity_of(IssueCode::AmbiguousSquareList), Severity::Warning);
  EXPECT_EQ(castlist::severity_of(IssueCode::MissingName), Severity::Error);
  EXPECT_EQ(castlist::severity_of(IssueCode::UnmatchedSquare), Severity::Error);
  EXPECT_EQ(castlist::to_string(Severity::Warning), "warning");
}

TEST(IssueBag, BuilderCommitsOnDestruction)
{
  IssueBag bag;
  {
    auto builder = bag.report(IssueCode::UnmatchedRound, "(abc");
    builder.with_path("top[0]").with_message("Missing closing ')'.");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  const auto & issue = bag.all()[0];
  EXPECT_EQ(issue.raw, "(abc");
  EXPECT_EQ(issue.path, "top[0]");
  EXPECT_EQ(issue.message, "Missing closing ')'.");
  EXPECT_TRUE(issue.range.is_invalid());
}

TEST(IssueBag, MovedBuilderCommitsOnce)
{
  IssueBag bag;
  {
    auto first = bag.report(IssueCode::MissingName, "[x]");
    auto second = std::move(first);
    second.with_range(castlist::SourceRange(0, 3));
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].range, castlist::SourceRange(0, 3));
}

TEST(IssueBag, PreservesOrderAndCounts)
{
  IssueBag bag;
  bag.report(IssueCode::AmbiguousSquareList, "[a; b]");
  bag.report(IssueCode::MissingName, "[x]");
  bag.report(IssueCode::AmbiguousSquareList, "[c; d]");

  ASSERT_EQ(bag.size(), 3U);
  EXPECT_EQ(bag.all()[0].raw, "[a; b]");
  EXPECT_EQ(bag.all()[1].raw, "[x]");
  EXPECT_EQ(bag.count(IssueCode::AmbiguousSquareList), 2U);
  EXPECT_TRUE(bag.has(IssueCode::MissingName));
  EXPECT_FALSE(bag.has(IssueCode::UnmatchedSquare));
  EXPECT_TRUE(bag.has_errors());
}

TEST(IssueBag, WarningsOnly)
{
  IssueBag bag;
  bag.report(IssueCode::InvalidFragmentOrder, "[B]");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_FALSE(bag.empty());
}
