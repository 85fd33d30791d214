// castlist/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// Keeps the input text alongside its Dataset so tests can look up issue
// ranges in the source they were reported against.
//
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/basic/source_manager.hpp"
#include "castlist/model/character.hpp"
#include "castlist/model/dataset.hpp"
#include "castlist/syntax/frontend.hpp"

namespace castlist::test_support
{

struct TestParseUnit
{
  SourceManager source;
  Dataset dataset;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_source_slice(r);
  }

  [[nodiscard]] const std::vector<ParseIssue> & issues() const noexcept
  {
    return dataset.issues_detailed();
  }

  /// Issue codes in emission order.
  [[nodiscard]] std::vector<IssueCode> codes() const
  {
    std::vector<IssueCode> out;
    for (const auto & issue : dataset.issues()) {
      out.push_back(issue.code);
    }
    return out;
  }

  /// First entry with the given name, or nullptr.
  [[nodiscard]] const CharacterNode * find(std::string_view name) const noexcept
  {
    for (const CharacterNode * node : dataset.entries()) {
      if (node->name == name) {
        return node;
      }
    }
    return nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse(std::string src)
{
  TestParseUnit out;
  out.source = SourceManager(std::move(src));
  out.dataset = castlist::parse(out.source.get_source());
  return out;
}

/// Names of `nodes`, in order.
[[nodiscard]] inline std::vector<std::string> names(
  const std::vector<const CharacterNode *> & nodes)
{
  std::vector<std::string> out;
  out.reserve(nodes.size());
  for (const CharacterNode * node : nodes) {
    out.emplace_back(node->name);
  }
  return out;
}

template <typename T>
[[nodiscard]] const T * fragment_as(const CharacterNode & node, size_t index)
{
  if (index >= node.fragments.size()) {
    return nullptr;
  }
  return std::get_if<T>(&node.fragments[index]);
}

}  // namespace castlist::test_support
