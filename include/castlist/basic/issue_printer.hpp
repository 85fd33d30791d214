// castlist/basic/issue_printer.hpp
//
// Prints parse issues with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "castlist/basic/issue.hpp"
#include "castlist/basic/source_manager.hpp"

namespace castlist
{

/**
 * Prints issues in Rust-style format.
 *
 * Produces output like:
 *   error[UNMATCHED_ROUND]: Missing closing ')'.
 *     --> cast.txt:3:6
 *         |
 *       3 | Zeta (a,b;
 *         |      ^^^^^
 *         |
 *      = note: at top[2]
 */
class IssuePrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit IssuePrinter(std::ostream & os, bool use_color = true);

  /// Print a single issue with context from `source`.
  void print(const ParseIssue & issue, const SourceManager & source);

  /// Print all issues in emission order.
  void print_all(const IssueBag & issues, const SourceManager & source);

  /// Print "<file>: N error(s), M warning(s)".
  void print_summary(const IssueBag & issues, const SourceManager & source);

private:
  void print_header(const ParseIssue & issue);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col);

  void print_note(std::string_view message);

  [[nodiscard]] static std::string display_name(const SourceManager & source);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace castlist
