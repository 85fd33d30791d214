// castlist/basic/issue_printer.cpp - Rust-style issue output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "castlist/basic/issue_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace castlist
{

IssuePrinter::IssuePrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  } else {
    rang::setControlMode(rang::control::Force);
  }
}

void IssuePrinter::print(const ParseIssue & issue, const SourceManager & source)
{
  const std::string filename = display_name(source);
  const FullSourceRange fr = source.get_full_range(issue.range);

  // === Header line: error[CODE]: message ===
  print_header(issue);

  // === Location line: --> file:line:col ===
  if (fr.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, fr.start_line, fr.start_column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Source snippet ===
  if (fr.is_valid()) {
    // Multi-line spans are marked to the end of their first line.
    const auto first_line_end =
      static_cast<uint32_t>(source.get_line(fr.start_line - 1).size()) + 1;
    const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                               ? fr.end_column
                               : first_line_end;
    print_source_line(source, fr.start_line - 1, fr.start_column, end_col);
  } else if (!issue.raw.empty()) {
    print_note(fmt::format("text: {}", issue.raw));
  }

  if (issue.path) {
    print_note(fmt::format("at {}", *issue.path));
  }

  fmt::print(os_, "\n");
}

void IssuePrinter::print_all(const IssueBag & issues, const SourceManager & source)
{
  for (const auto & issue : issues) {
    print(issue, source);
  }
}

void IssuePrinter::print_summary(const IssueBag & issues, const SourceManager & source)
{
  size_t errors = 0;
  size_t warnings = 0;
  for (const auto & issue : issues) {
    if (issue.severity() == Severity::Error) {
      ++errors;
    } else {
      ++warnings;
    }
  }
  fmt::print(
    os_, "{}: {} error{}, {} warning{}\n", display_name(source), errors, errors == 1 ? "" : "s",
    warnings, warnings == 1 ? "" : "s");
}

// =============================================================================
// Private helpers
// =============================================================================

std::string IssuePrinter::display_name(const SourceManager & source)
{
  if (!source.has_file_path()) {
    return "<input>";
  }
  const auto & path = source.get_file_path();
  std::error_code ec;
  auto rel_path = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  return (ec || rel_path.empty()) ? path.string() : rel_path.string();
}

void IssuePrinter::print_header(const ParseIssue & issue)
{
  const std::string_view code = to_string(issue.code);
  const std::string message = issue.message.value_or(std::string(code));

  if (use_color_) {
    os_ << rang::style::bold;
    switch (issue.severity()) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
    }
    os_ << "[" << code << "]" << rang::fg::reset << ": " << message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}[{}]: {}\n", to_string(issue.severity()), code, message);
  }
}

void IssuePrinter::print_source_line(
  const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col)
{
  if (line_index >= source.get_line_count()) {
    return;
  }
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // Tabs are shown as 4 spaces
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }
  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void IssuePrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string IssuePrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string IssuePrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string IssuePrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace castlist
