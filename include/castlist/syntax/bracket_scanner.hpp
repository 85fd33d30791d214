// castlist/syntax/bracket_scanner.hpp - Bracket-depth scanning primitives
//
// Leaf layer of the parser: top-level scanning, separator splitting and the
// two bracket readers. None of these keep state between calls; issues go to
// the bag carried by ScanContext.
//
#pragma once

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/basic/source_manager.hpp"

namespace castlist::syntax
{

/// Separator between entries and between group members.
inline constexpr char k_entry_separator = ';';

/**
 * What the scanning functions need besides the text they scan: the complete
 * input (so issue ranges can be computed from views into it) and the issue
 * bag of the current parse.
 */
struct ScanContext
{
  std::string_view source;
  IssueBag & issues;

  [[nodiscard]] SourceRange range_of(std::string_view slice) const noexcept
  {
    return castlist::range_of(source, slice);
  }
};

/**
 * Callback for scan_top_level: receives a character at bracket depth zero
 * and its index. Return false to stop scanning.
 */
using TopLevelCallback = std::function<bool(char, size_t)>;

/**
 * Scan `s` left to right tracking round and square depth independently.
 *
 * `on_top_level` is invoked for non-bracket characters while both depths are
 * zero. A closer at depth zero reports EXTRA_CLOSING_ROUND/SQUARE whose raw
 * text is the rest of `s` from that closer; the depth stays at zero.
 *
 * @return false if the callback stopped the scan, true otherwise
 */
bool scan_top_level(
  std::string_view s, std::string_view path, ScanContext & ctx,
  const TopLevelCallback & on_top_level);

/**
 * Split `s` at every top-level occurrence of `separator`.
 *
 * The trailing piece after the last separator is always included, even if
 * empty. Pieces are not trimmed.
 */
[[nodiscard]] std::vector<std::string_view> split_top_level(
  std::string_view s, char separator, std::string_view path, ScanContext & ctx);

/// Result of reading one bracketed span.
struct BracketRead
{
  std::string_view inner;  ///< text between the brackets (to end of input if unclosed)
  size_t next = 0;         ///< index just past the closing bracket, or s.size()
};

/**
 * Read the `(...)` starting at `open` (which must index a '(').
 *
 * Nested parentheses are consumed so the span ends at the matching ')', and
 * reported once as NESTED_ROUND_NOT_ALLOWED. Without a matching ')' reports
 * UNMATCHED_ROUND and consumes to the end of `s`.
 */
[[nodiscard]] BracketRead read_round(
  std::string_view s, size_t open, std::string_view path, ScanContext & ctx);

/**
 * Read the balanced `[...]` starting at `open` (which must index a '[').
 *
 * Any '(' inside is read with read_round so its issues are still reported.
 * Without a matching ']' reports UNMATCHED_SQUARE and consumes to the end of
 * `s`.
 */
[[nodiscard]] BracketRead read_square(
  std::string_view s, size_t open, std::string_view path, ScanContext & ctx);

/// Trim ASCII whitespace from both ends.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

}  // namespace castlist::syntax
