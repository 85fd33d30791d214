// castlist/project/project_config.cpp - Project configuration implementation
//
#include "castlist/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace castlist
{

namespace
{

/// Parse the 'check' section
std::optional<CheckConfig> parse_check(const YAML::Node & node, std::string & error)
{
  CheckConfig check;
  if (!node.IsMap()) {
    error = "check must be a map";
    return std::nullopt;
  }

  if (node["strict"]) {
    check.strict = node["strict"].as<bool>();
  }
  if (node["verify_roundtrip"]) {
    check.verify_roundtrip = node["verify_roundtrip"].as<bool>();
  }
  if (node["fail_on"]) {
    if (!node["fail_on"].IsSequence()) {
      error = "check.fail_on must be a list";
      return std::nullopt;
    }
    for (const auto & entry : node["fail_on"]) {
      const auto text = entry.as<std::string>();
      const auto code = issue_code_from_string(text);
      if (!code) {
        error = "unknown issue code in check.fail_on: '" + text + "'";
        return std::nullopt;
      }
      check.fail_on.push_back(*code);
    }
  }
  return check;
}

/// Parse the 'output' section
std::optional<OutputConfig> parse_output(const YAML::Node & node, std::string & error)
{
  OutputConfig output;
  if (!node.IsMap()) {
    error = "output must be a map";
    return std::nullopt;
  }

  if (node["color"]) {
    const auto text = node["color"].as<std::string>();
    const auto mode = color_mode_from_string(text);
    if (!mode) {
      error = "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')";
      return std::nullopt;
    }
    output.color = *mode;
  }
  if (node["trailing_newline"]) {
    output.trailing_newline = node["trailing_newline"].as<bool>();
  }
  return output;
}

}  // namespace

std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

std::vector<std::filesystem::path> ProjectConfig::resolved_inputs() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(inputs.size());
  for (const auto & input : inputs) {
    out.push_back(input.is_absolute() ? input : (project_root / input).lexically_normal());
  }
  return out;
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    // Parse 'package' section
    if (root["package"] && root["package"]["name"]) {
      config.package.name = root["package"]["name"].as<std::string>();
    }

    // Parse 'inputs' section
    if (root["inputs"]) {
      if (!root["inputs"].IsSequence()) {
        return ConfigLoadResult::fail("inputs must be a list");
      }
      for (const auto & input : root["inputs"]) {
        config.inputs.emplace_back(input.as<std::string>());
      }
    }

    std::string error;
    if (root["check"]) {
      auto check = parse_check(root["check"], error);
      if (!check) {
        return ConfigLoadResult::fail(error);
      }
      config.check = std::move(*check);
    }

    if (root["output"]) {
      auto output = parse_output(root["output"], error);
      if (!output) {
        return ConfigLoadResult::fail(error);
      }
      config.output = *output;
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in.is_open()) {
    return ConfigLoadResult::fail("failed to open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  return parse_project_config(buffer.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string make_default_project_config(const std::string & package_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << package_name;
  out << YAML::EndMap;

  out << YAML::Key << "inputs" << YAML::Value << YAML::BeginSeq << "data/characters.txt"
      << YAML::EndSeq;

  out << YAML::Key << "check" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "strict" << YAML::Value << false;
  out << YAML::Key << "verify_roundtrip" << YAML::Value << true;
  out << YAML::EndMap;

  out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "color" << YAML::Value << "auto";
  out << YAML::Key << "trailing_newline" << YAML::Value << true;
  out << YAML::EndMap;

  out << YAML::EndMap;

  if (!out.good()) {
    throw std::runtime_error("failed to emit project configuration: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

}  // namespace castlist
