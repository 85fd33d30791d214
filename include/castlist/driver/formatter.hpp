// castlist/driver/formatter.hpp - Format/check driver
//
// Single entry point for the parse -> render pipeline.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/basic/source_manager.hpp"
#include "castlist/model/dataset.hpp"
#include "castlist/project/project_config.hpp"
#include "castlist/render/roundtrip.hpp"

namespace castlist
{

// ============================================================================
// Format Mode
// ============================================================================

enum class FormatMode {
  Format,  ///< Produce canonical text
  Check,   ///< Report issues and round-trip stability only
  Dump,    ///< Produce the JSON dump
};

// ============================================================================
// Format Options
// ============================================================================

struct FormatOptions
{
  FormatMode mode = FormatMode::Format;

  /// Warnings fail the run as well as errors
  bool strict = false;

  /// Fail when the canonical form is not a fixed point
  bool verify_roundtrip = true;

  /// When non-empty, only these codes fail the run
  std::vector<IssueCode> fail_on;

  /// Terminate canonical text with '\n'
  bool trailing_newline = true;

  /// Enable verbose output
  bool verbose = false;

  /// Options taken from the check/output sections of a project config
  [[nodiscard]] static FormatOptions from_config(const ProjectConfig & config);
};

// ============================================================================
// Format Result
// ============================================================================

struct FileReport
{
  /// Input text and its file path (if any)
  SourceManager source;

  /// Parse result
  Dataset dataset;

  /// Canonical text (Format) or serialized JSON (Dump); empty for Check
  std::string output;

  /// Present when verify_roundtrip was requested
  std::optional<RoundTripReport> roundtrip;

  /// Set when the file could not be read
  std::optional<std::string> io_error;

  /// No failing issue, stable round trip, no I/O error
  bool success = false;
};

struct FormatResult
{
  /// Whether every processed file succeeded
  bool success = false;

  std::vector<FileReport> files;
};

// ============================================================================
// Formatter
// ============================================================================

/**
 * Driver that runs parse, render, round-trip check and JSON dump for one
 * or more inputs and decides success according to FormatOptions.
 */
class Formatter
{
public:
  /**
   * Process in-memory text.
   *
   * @param text Input text
   * @param file Path reported in diagnostics, if the text came from a file
   * @param options Format options
   */
  [[nodiscard]] static FileReport process_text(
    std::string text, const std::optional<std::filesystem::path> & file,
    const FormatOptions & options);

  /**
   * Read and process a single file. A missing or unreadable file yields a
   * failed report with io_error set.
   */
  [[nodiscard]] static FileReport process_file(
    const std::filesystem::path & file, const FormatOptions & options);

  /**
   * Process every input listed in a project configuration, in order.
   */
  [[nodiscard]] static FormatResult process_project(
    const ProjectConfig & config, const FormatOptions & options);

  /// Whether `issue` makes the run fail under `options`.
  [[nodiscard]] static bool is_failing(const ParseIssue & issue, const FormatOptions & options);
};

}  // namespace castlist
