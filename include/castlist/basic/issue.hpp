// castlist/basic/issue.hpp - Parse issue types and the issue collector
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "castlist/basic/source_manager.hpp"

namespace castlist
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Structural problems the parser can report.
 *
 * The set is closed; emission order within one parse is deterministic.
 */
enum class IssueCode : uint8_t {
  MissingName,
  InvalidMemberAliasOnly,
  InvalidFragmentOrder,
  UnmatchedRound,
  NestedRoundNotAllowed,
  UnmatchedSquare,
  AmbiguousSquareList,
  ExtraClosingRound,
  ExtraClosingSquare,
};

/**
 * Severity level for reporting. Parsing itself treats every issue except
 * MissingName as advisory.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

[[nodiscard]] constexpr std::string_view to_string(IssueCode code) noexcept
{
  switch (code) {
    case IssueCode::MissingName:
      return "MISSING_NAME";
    case IssueCode::InvalidMemberAliasOnly:
      return "INVALID_MEMBER_ALIAS_ONLY";
    case IssueCode::InvalidFragmentOrder:
      return "INVALID_FRAGMENT_ORDER";
    case IssueCode::UnmatchedRound:
      return "UNMATCHED_ROUND";
    case IssueCode::NestedRoundNotAllowed:
      return "NESTED_ROUND_NOT_ALLOWED";
    case IssueCode::UnmatchedSquare:
      return "UNMATCHED_SQUARE";
    case IssueCode::AmbiguousSquareList:
      return "AMBIGUOUS_SQUARE_LIST";
    case IssueCode::ExtraClosingRound:
      return "EXTRA_CLOSING_ROUND";
    case IssueCode::ExtraClosingSquare:
      return "EXTRA_CLOSING_SQUARE";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "";
}

[[nodiscard]] constexpr Severity severity_of(IssueCode code) noexcept
{
  switch (code) {
    case IssueCode::InvalidFragmentOrder:
    case IssueCode::NestedRoundNotAllowed:
    case IssueCode::AmbiguousSquareList:
      return Severity::Warning;
    case IssueCode::MissingName:
    case IssueCode::InvalidMemberAliasOnly:
    case IssueCode::UnmatchedRound:
    case IssueCode::UnmatchedSquare:
    case IssueCode::ExtraClosingRound:
    case IssueCode::ExtraClosingSquare:
      return Severity::Error;
  }
  return Severity::Error;
}

/// Parse an exact code spelling such as "MISSING_NAME".
[[nodiscard]] std::optional<IssueCode> issue_code_from_string(std::string_view s) noexcept;

/// All codes, in declaration order.
[[nodiscard]] const std::vector<IssueCode> & all_issue_codes();

struct ParseIssue
{
  IssueCode code = IssueCode::MissingName;
  std::string raw;                     // offending text span
  std::optional<std::string> path;     // e.g. "top[1].group[0]"
  std::optional<std::string> message;  // human readable explanation
  SourceRange range;                   // byte range of `raw` in the input, if known

  [[nodiscard]] Severity severity() const noexcept { return severity_of(code); }
};

// ============================================================================
// IssueBuilder
// ============================================================================

class IssueBag;

/**
 * Fluent builder that registers the issue with its bag on destruction (RAII).
 */
class IssueBuilder
{
public:
  IssueBuilder(IssueBag & bag, ParseIssue issue);

  IssueBuilder(const IssueBuilder &) = delete;
  IssueBuilder & operator=(const IssueBuilder &) = delete;

  IssueBuilder(IssueBuilder && other) noexcept;

  ~IssueBuilder();

  IssueBuilder & with_path(std::string path);
  IssueBuilder & with_message(std::string message);
  IssueBuilder & with_range(SourceRange range);

private:
  IssueBag & bag_;
  ParseIssue issue_;
  bool active_ = true;
};

// ============================================================================
// IssueBag
// ============================================================================

/**
 * Ordered, append-only collection of ParseIssue.
 *
 * One bag is threaded through a single parse; it is never shared between
 * parses.
 */
class IssueBag
{
public:
  IssueBag() = default;

  IssueBag(const IssueBag &) = default;
  IssueBag & operator=(const IssueBag &) = default;
  IssueBag(IssueBag &&) = default;
  IssueBag & operator=(IssueBag &&) = default;

  // Builder starter
  IssueBuilder report(IssueCode code, std::string_view raw);

  void add(ParseIssue && issue);
  void add(const ParseIssue & issue);

  [[nodiscard]] const std::vector<ParseIssue> & all() const { return issues_; }
  [[nodiscard]] bool empty() const { return issues_.empty(); }
  [[nodiscard]] size_t size() const { return issues_.size(); }

  [[nodiscard]] size_t count(IssueCode code) const;
  [[nodiscard]] bool has(IssueCode code) const { return count(code) > 0; }
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return issues_.begin(); }
  [[nodiscard]] auto end() const { return issues_.end(); }

private:
  std::vector<ParseIssue> issues_;
};

}  // namespace castlist
