// castlist/render/json_dump.cpp - JSON serialization implementation
//
#include "castlist/render/json_dump.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <variant>

#include "castlist/render/canonicalizer.hpp"

namespace castlist
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_member(const Character & member, const Dataset & dataset)
{
  return std::visit(
    [&dataset](const auto & c) -> json {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, const CharacterNode *>) {
        return json{
          {"kind", "node"}, {"entry", dataset.index_of(c)}, {"name", std::string(c->name)}};
      } else if constexpr (std::is_same_v<T, RawCharacter>) {
        return json{{"kind", "raw"}, {"raw", std::string(c.raw)}};
      } else {
        static_assert(detail::always_false_v<T>, "unhandled character kind");
      }
    },
    member);
}

json j_fragment(const Fragment & fragment, const Dataset & dataset)
{
  json j{
    {"kind", std::string(fragment_kind(fragment))},
    {"raw", std::string(fragment_raw(fragment))}};

  if (const auto * group = std::get_if<GroupFragment>(&fragment)) {
    json members = json::array();
    for (const Character & m : group->members) {
      members.push_back(j_member(m, dataset));
    }
    j["members"] = std::move(members);
  }
  return j;
}

json j_node(const CharacterNode & node, const Dataset & dataset)
{
  json fragments = json::array();
  for (const Fragment & f : node.fragments) {
    fragments.push_back(j_fragment(f, dataset));
  }
  return json{
    {"kind", "node"},
    {"name", std::string(node.name)},
    {"range", j_range(node.range)},
    {"fragments", std::move(fragments)}};
}

}  // namespace

json to_json(const ParseIssue & issue)
{
  json j{
    {"code", std::string(to_string(issue.code))},
    {"severity", std::string(to_string(issue.severity()))},
    {"raw", issue.raw},
    {"range", j_range(issue.range)}};
  if (issue.path) {
    j["path"] = *issue.path;
  }
  if (issue.message) {
    j["message"] = *issue.message;
  }
  return j;
}

json to_json(const Dataset & dataset)
{
  json entries = json::array();
  for (const CharacterNode * node : dataset.entries()) {
    entries.push_back(j_node(*node, dataset));
  }

  json roots = json::array();
  for (const CharacterNode * root : find_roots(dataset)) {
    roots.push_back(dataset.index_of(root));
  }

  json issues = json::array();
  for (const ParseIssue & issue : dataset.issues()) {
    issues.push_back(to_json(issue));
  }

  return json{
    {"entries", std::move(entries)},
    {"roots", std::move(roots)},
    {"issuesDetailed", std::move(issues)}};
}

}  // namespace castlist
