// castlist/project/project_config.hpp - Project configuration (castlist.yaml)
//
// Parses and validates castlist.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "castlist/basic/issue.hpp"

namespace castlist
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode {
  Auto,    ///< Color only when stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept;

/**
 * Rules for `castlist check`.
 */
struct CheckConfig
{
  /// Treat warnings as failures too
  bool strict = false;

  /// Require the canonical form to be a fixed point
  bool verify_roundtrip = true;

  /// Explicit failing codes; when non-empty it replaces the severity rule
  std::vector<IssueCode> fail_on;
};

/**
 * Output settings.
 */
struct OutputConfig
{
  ColorMode color = ColorMode::Auto;

  /// Terminate formatted output with '\n'
  bool trailing_newline = true;
};

struct PackageConfig
{
  std::string name;
};

/**
 * Complete project configuration (castlist.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;

  /// Input files processed in project mode
  std::vector<std::filesystem::path> inputs;

  CheckConfig check;
  OutputConfig output;

  /// Directory containing castlist.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Inputs resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_inputs() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a castlist.yaml file.
 *
 * @param config_path Path to castlist.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Load a project configuration from YAML text.
 *
 * @param yaml_text Contents of a castlist.yaml
 * @param project_root Directory that relative inputs are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find castlist.yaml by searching upward from a directory.
 *
 * @return Path to castlist.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * castlist.yaml text for a new project with one input, data/characters.txt.
 *
 * The package name is quoted as YAML requires, so any name loads back intact.
 * Throws std::runtime_error if the document cannot be emitted.
 */
[[nodiscard]] std::string make_default_project_config(const std::string & package_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "castlist.yaml";

}  // namespace castlist
