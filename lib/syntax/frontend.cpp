// castlist/syntax/frontend.cpp - High-level parse pipeline
#include "castlist/syntax/frontend.hpp"

#include <memory>
#include <unordered_set>
#include <utility>

#include "castlist/syntax/parser.hpp"

namespace castlist
{

namespace
{

void visit_node(
  const CharacterNode * node, std::unordered_set<const CharacterNode *> & seen,
  std::vector<const CharacterNode *> & out)
{
  // The grammar only nests downward, but a revisit must not recurse forever.
  if (!seen.insert(node).second) {
    return;
  }
  out.push_back(node);

  for (const Fragment & f : node->fragments) {
    const auto * group = std::get_if<GroupFragment>(&f);
    if (group == nullptr) {
      continue;
    }
    for (const Character & member : group->members) {
      if (const CharacterNode * child = as_node(member)) {
        visit_node(child, seen, out);
      }
    }
  }
}

}  // namespace

std::vector<const CharacterNode *> flatten(const std::vector<const CharacterNode *> & roots)
{
  std::vector<const CharacterNode *> entries;
  std::unordered_set<const CharacterNode *> seen;
  for (const CharacterNode * node : roots) {
    visit_node(node, seen, entries);
  }
  return entries;
}

Dataset parse(std::string_view input)
{
  auto arena = std::make_unique<DatasetArena>();
  IssueBag issues;

  syntax::Parser parser(input, *arena, issues);
  const std::vector<const CharacterNode *> top = parser.parse_entries();

  return Dataset(std::move(arena), flatten(top), std::move(issues));
}

}  // namespace castlist
