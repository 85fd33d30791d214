// castlist/syntax/frontend.hpp - High-level parse entry point
#pragma once

#include <string_view>
#include <vector>

#include "castlist/model/character.hpp"
#include "castlist/model/dataset.hpp"

namespace castlist
{

// Parse pipeline:
// input -> entry splitter -> node parser (recursive for groups) -> flatten -> Dataset
//
// Never fails: structural problems end up in Dataset::issues(). Each call
// uses its own arena and issue bag, so concurrent calls are independent.
// Stack depth grows with bracket nesting depth of the input.
[[nodiscard]] Dataset parse(std::string_view input);

/**
 * Collect every node reachable from `roots` through group members, once
 * each, in first-visit depth-first order. Raw members are skipped. Nodes
 * are compared by address.
 */
[[nodiscard]] std::vector<const CharacterNode *> flatten(
  const std::vector<const CharacterNode *> & roots);

}  // namespace castlist
