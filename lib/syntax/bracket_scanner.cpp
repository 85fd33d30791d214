// castlist/syntax/bracket_scanner.cpp - Bracket-depth scanning primitives
#include "castlist/syntax/bracket_scanner.hpp"

#include <cctype>
#include <string>

namespace castlist::syntax
{
namespace
{

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

void report_extra_closer(
  IssueCode code, std::string_view rest, std::string_view path, ScanContext & ctx,
  const char * message)
{
  ctx.issues.report(code, rest)
    .with_path(std::string(path))
    .with_message(message)
    .with_range(ctx.range_of(rest));
}

}  // namespace

std::string_view trim(std::string_view s) noexcept
{
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool scan_top_level(
  std::string_view s, std::string_view path, ScanContext & ctx,
  const TopLevelCallback & on_top_level)
{
  size_t round = 0;
  size_t square = 0;

  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    switch (c) {
      case '(':
        ++round;
        continue;
      case ')':
        if (round > 0) {
          --round;
        } else {
          report_extra_closer(
            IssueCode::ExtraClosingRound, s.substr(i), path, ctx,
            "Found ')' with no matching '('.");
        }
        continue;
      case '[':
        ++square;
        continue;
      case ']':
        if (square > 0) {
          --square;
        } else {
          report_extra_closer(
            IssueCode::ExtraClosingSquare, s.substr(i), path, ctx,
            "Found ']' with no matching '['.");
        }
        continue;
      default:
        break;
    }

    if (round == 0 && square == 0 && !on_top_level(c, i)) {
      return false;
    }
  }
  return true;
}

std::vector<std::string_view> split_top_level(
  std::string_view s, char separator, std::string_view path, ScanContext & ctx)
{
  std::vector<std::string_view> out;
  size_t start = 0;
  scan_top_level(s, path, ctx, [&](char c, size_t i) {
    if (c == separator) {
      out.push_back(s.substr(start, i - start));
      start = i + 1;
    }
    return true;
  });
  out.push_back(s.substr(start));
  return out;
}

BracketRead read_round(std::string_view s, size_t open, std::string_view path, ScanContext & ctx)
{
  const size_t inner_start = open + 1;
  size_t depth = 1;
  bool saw_nested = false;

  for (size_t i = inner_start; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '(') {
      ++depth;
      saw_nested = true;
    } else if (c == ')') {
      if (--depth == 0) {
        if (saw_nested) {
          const std::string_view span = s.substr(open, i + 1 - open);
          ctx.issues.report(IssueCode::NestedRoundNotAllowed, span)
            .with_path(std::string(path))
            .with_message("Nested '(' is not allowed.")
            .with_range(ctx.range_of(span));
        }
        return {s.substr(inner_start, i - inner_start), i + 1};
      }
    }
  }

  const std::string_view rest = s.substr(open);
  ctx.issues.report(IssueCode::UnmatchedRound, rest)
    .with_path(std::string(path))
    .with_message("Missing closing ')'.")
    .with_range(ctx.range_of(rest));
  return {s.substr(inner_start), s.size()};
}

BracketRead read_square(std::string_view s, size_t open, std::string_view path, ScanContext & ctx)
{
  const size_t inner_start = open + 1;
  const std::string inner_path = std::string(path) + ".square";
  size_t depth = 1;
  size_t i = inner_start;

  while (i < s.size()) {
    const char c = s[i];
    if (c == '[') {
      ++depth;
      ++i;
    } else if (c == ']') {
      if (--depth == 0) {
        return {s.substr(inner_start, i - inner_start), i + 1};
      }
      ++i;
    } else if (c == '(') {
      i = read_round(s, i, inner_path, ctx).next;
    } else {
      ++i;
    }
  }

  const std::string_view rest = s.substr(open);
  ctx.issues.report(IssueCode::UnmatchedSquare, rest)
    .with_path(std::string(path))
    .with_message("Missing closing ']'.")
    .with_range(ctx.range_of(rest));
  return {s.substr(inner_start), s.size()};
}

}  // namespace castlist::syntax
