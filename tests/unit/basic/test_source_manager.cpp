// test_source_manager.cpp - Offsets, lines and slices

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "castlist/basic/source_manager.hpp"

using castlist::SourceLocation;
using castlist::SourceManager;
using castlist::SourceRange;

TEST(SourceManager, LineColumn)
{
  const SourceManager sm("Alpha;\nBeta [x];\r\nGamma");
  EXPECT_EQ(sm.get_line_count(), 3U);

  auto lc = sm.get_line_column(SourceLocation(0));
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = sm.get_line_column(SourceLocation(12));
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 6U);

  lc = sm.get_line_column(SourceLocation());
  EXPECT_FALSE(lc.is_valid());
}

TEST(SourceManager, GetLineStripsLineBreaks)
{
  const SourceManager sm("Alpha;\nBeta [x];\r\nGamma");
  EXPECT_EQ(sm.get_line(0), "Alpha;");
  EXPECT_EQ(sm.get_line(1), "Beta [x];");
  EXPECT_EQ(sm.get_line(2), "Gamma");
  EXPECT_EQ(sm.get_line(3), "");
}

TEST(SourceManager, SliceAndFullRange)
{
  const SourceManager sm("Alpha;\nBeta [x];");
  EXPECT_EQ(sm.get_source_slice(SourceRange(7, 11)), "Beta");
  EXPECT_EQ(sm.get_source_slice(SourceRange(12, 999)), "[x];");
  EXPECT_EQ(sm.get_source_slice(SourceRange()), "");

  const auto fr = sm.get_full_range(SourceRange(12, 15));
  EXPECT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 6U);
  EXPECT_EQ(fr.end_column, 9U);
  EXPECT_EQ(fr.start_byte, 12U);
  EXPECT_EQ(fr.end_byte, 15U);
}

TEST(SourceManager, FilePath)
{
  const SourceManager anonymous("x");
  EXPECT_FALSE(anonymous.has_file_path());

  const SourceManager named("cast/list.txt", "x");
  EXPECT_TRUE(named.has_file_path());
  EXPECT_EQ(named.get_file_path().filename(), "list.txt");
}

TEST(SourceManager, LineOutOfRange)
{
  const SourceManager sm("one\ntwo\nthree");
  EXPECT_EQ(sm.get_line_count(), 3U);
  EXPECT_EQ(sm.get_line(2), "three");
  EXPECT_EQ(sm.get_line(3), "");
}

TEST(RangeOf, ViewIntoSource)
{
  const std::string_view source = "Superman [Clark Kent; Kal-El];";
  const std::string_view alias = source.substr(10, 18);
  EXPECT_EQ(castlist::range_of(source, alias), SourceRange(10, 28));
  EXPECT_EQ(castlist::range_of(source, source), SourceRange(0, 30));
}

TEST(RangeOf, ForeignSliceIsInvalid)
{
  const std::string_view source = "Superman;";
  const std::string other = "Superman;";
  EXPECT_TRUE(castlist::range_of(source, other).is_invalid());
}
