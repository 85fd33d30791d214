// castlist/basic/issue.cpp - Issue collector implementation
#include "castlist/basic/issue.hpp"

#include <algorithm>
#include <utility>

namespace castlist
{

std::optional<IssueCode> issue_code_from_string(std::string_view s) noexcept
{
  for (const IssueCode code : all_issue_codes()) {
    if (to_string(code) == s) {
      return code;
    }
  }
  return std::nullopt;
}

const std::vector<IssueCode> & all_issue_codes()
{
  static const std::vector<IssueCode> k_codes = {
    IssueCode::MissingName,         IssueCode::InvalidMemberAliasOnly,
    IssueCode::InvalidFragmentOrder, IssueCode::UnmatchedRound,
    IssueCode::NestedRoundNotAllowed, IssueCode::UnmatchedSquare,
    IssueCode::AmbiguousSquareList, IssueCode::ExtraClosingRound,
    IssueCode::ExtraClosingSquare,
  };
  return k_codes;
}

// ============================================================================
// IssueBuilder
// ============================================================================

IssueBuilder::IssueBuilder(IssueBag & bag, ParseIssue issue) : bag_(bag), issue_(std::move(issue))
{
}

IssueBuilder::IssueBuilder(IssueBuilder && other) noexcept
: bag_(other.bag_), issue_(std::move(other.issue_)), active_(other.active_)
{
  other.active_ = false;
}

IssueBuilder::~IssueBuilder()
{
  if (active_) {
    bag_.add(std::move(issue_));
  }
}

IssueBuilder & IssueBuilder::with_path(std::string path)
{
  issue_.path = std::move(path);
  return *this;
}

IssueBuilder & IssueBuilder::with_message(std::string message)
{
  issue_.message = std::move(message);
  return *this;
}

IssueBuilder & IssueBuilder::with_range(SourceRange range)
{
  issue_.range = range;
  return *this;
}

// ============================================================================
// IssueBag
// ============================================================================

IssueBuilder IssueBag::report(IssueCode code, std::string_view raw)
{
  ParseIssue issue;
  issue.code = code;
  issue.raw = std::string(raw);
  return {*this, std::move(issue)};
}

void IssueBag::add(ParseIssue && issue) { issues_.push_back(std::move(issue)); }

void IssueBag::add(const ParseIssue & issue) { issues_.push_back(issue); }

size_t IssueBag::count(IssueCode code) const
{
  return static_cast<size_t>(std::count_if(
    issues_.begin(), issues_.end(), [code](const ParseIssue & i) { return i.code == code; }));
}

bool IssueBag::has_errors() const
{
  return std::any_of(issues_.begin(), issues_.end(), [](const ParseIssue & i) {
    return i.severity() == Severity::Error;
  });
}

}  // namespace castlist
