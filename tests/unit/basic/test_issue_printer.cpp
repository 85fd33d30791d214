// test_issue_printer.cpp - Rust-style issue output (without colors)

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "castlist/basic/issue_printer.hpp"
#include "castlist/test_support/parse_helpers.hpp"

using castlist::IssuePrinter;
using castlist::test_support::parse;

TEST(IssuePrinter, HeaderLocationSnippetAndPath)
{
  auto unit = parse("Alpha;\nZeta (a,b;");
  ASSERT_EQ(unit.issues().size(), 1U);

  std::ostringstream out;
  IssuePrinter printer(out, false);
  printer.print(unit.issues()[0], unit.source);

  const std::string expected =
    "error[UNMATCHED_ROUND]: Missing closing ')'.\n"
    "  --> <input>:2:6\n"
    "      |\n"
    "    2 | Zeta (a,b;\n"
    "      |      ^^^^^\n"
    "      |\n"
    "   = note: at top[1]\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(IssuePrinter, WarningHeader)
{
  auto unit = parse("Superman [Clark Kent; Kal-El];");
  std::ostringstream out;
  IssuePrinter printer(out, false);
  printer.print_all(unit.dataset.issues(), unit.source);

  const std::string text = out.str();
  EXPECT_EQ(
    text.rfind("warning[AMBIGUOUS_SQUARE_LIST]: Could be a group or aliases.", 0), 0U);

  // The marker covers the brackets: 9 columns in, 20 wide.
  const std::string marker = "      | " + std::string(9, ' ') + std::string(20, '^') + "\n";
  EXPECT_NE(text.find(marker), std::string::npos);
}

TEST(IssuePrinter, IssueWithoutRangeShowsText)
{
  castlist::ParseIssue issue;
  issue.code = castlist::IssueCode::ExtraClosingSquare;
  issue.raw = "]x";

  const castlist::SourceManager source("]x");
  std::ostringstream out;
  IssuePrinter printer(out, false);
  printer.print(issue, source);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[EXTRA_CLOSING_SQUARE]: EXTRA_CLOSING_SQUARE\n"), std::string::npos);
  EXPECT_NE(text.find("  --> <input>\n"), std::string::npos);
  EXPECT_NE(text.find("   = note: text: ]x\n"), std::string::npos);
  EXPECT_EQ(text.find("at "), std::string::npos);
}

TEST(IssuePrinter, PrintAllKeepsEmissionOrder)
{
  auto unit = parse("[a]; B (x) [y];");
  std::ostringstream out;
  IssuePrinter printer(out, false);
  printer.print_all(unit.dataset.issues(), unit.source);

  const std::string text = out.str();
  const auto first = text.find("MISSING_NAME");
  const auto second = text.find("INVALID_FRAGMENT_ORDER");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(IssuePrinter, Summary)
{
  auto unit = parse("[a]; [b]; B (x) [y];");
  std::ostringstream out;
  IssuePrinter printer(out, false);
  printer.print_summary(unit.dataset.issues(), unit.source);
  EXPECT_EQ(out.str(), "<input>: 2 errors, 1 warning\n");
}
