// castlist/render/canonicalizer.hpp - Canonical text rendering
//
// Canonical form:
//   root; root; ...;
//   root  = name fragment*
//   info  = " (" raw ")"
//   alias = " [" raw "]"
//   group = " [" member "; " member ... "]"   (rebuilt from parsed members)
//
// render(parse(render(parse(x)))) == render(parse(x)) holds for well-formed
// input. It does not hold when an unclosed group holds another unclosed
// opener: "Z (a(b" renders "Z (a(b);", which renders "Z (a(b););".
// check_roundtrip reports such inputs as unstable.
//
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "castlist/model/character.hpp"
#include "castlist/model/dataset.hpp"

namespace castlist
{

/// Nodes that appear as a member of some group fragment of any entry.
[[nodiscard]] std::unordered_set<const CharacterNode *> collect_members(const Dataset & dataset);

/// Entries not referenced as a group member, in entry order.
[[nodiscard]] std::vector<const CharacterNode *> find_roots(const Dataset & dataset);

/// Render one node and, recursively, the members of its groups.
[[nodiscard]] std::string render_node(const CharacterNode & node);

/// Render a group member: raw members as their trimmed text.
[[nodiscard]] std::string render_character(const Character & character);

/// Render all roots joined by "; " and terminated by ';'. Empty for no roots.
[[nodiscard]] std::string render(const Dataset & dataset);

}  // namespace castlist
