#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/model/character.hpp"
#include "castlist/model/dataset_arena.hpp"
#include "castlist/syntax/bracket_scanner.hpp"

namespace castlist::syntax
{

/**
 * Recursive parser for character entries.
 *
 * One Parser serves one parse: it allocates nodes in `arena` and appends to
 * `issues`. It never throws and never invents names; entries without a name
 * are dropped after MISSING_NAME is reported.
 *
 * Recursion depth follows the bracket nesting depth of the input
 * (parse_node -> parse_member_list -> parse_node for every nested group).
 */
class Parser
{
public:
  Parser(std::string_view source, DatasetArena & arena, IssueBag & issues)
  : source_(source), arena_(arena), issues_(issues)
  {
  }

  /**
   * Split the whole input into entries and parse each non-empty one.
   *
   * @return the top-level nodes, in input order
   */
  [[nodiscard]] std::vector<const CharacterNode *> parse_entries();

  /**
   * Parse one entry: a name followed by `(...)` / `[...]` fragments.
   *
   * @return the node, or nullptr if the name is missing
   */
  [[nodiscard]] const CharacterNode * parse_node(std::string_view entry, const std::string & path);

  /**
   * Parse the inner text of a group into its members.
   *
   * Pieces starting with '[' become RawCharacter members; pieces whose name
   * is missing are left out.
   */
  [[nodiscard]] std::vector<Character> parse_member_list(
    std::string_view inner, char separator, const std::string & path);

private:
  [[nodiscard]] Fragment parse_square_fragment(
    std::string_view inner, const std::string & path);

  [[nodiscard]] ScanContext scan_context() { return ScanContext{source_, issues_}; }

  std::string_view source_;
  DatasetArena & arena_;
  IssueBag & issues_;
};

}  // namespace castlist::syntax
