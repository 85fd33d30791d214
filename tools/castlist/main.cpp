// castlist - Character list formatter Command Line Interface
//
// Usage:
//   castlist format [file | - | --project] [-o output]
//   castlist check [file | - | --project] [--strict]
//   castlist dump [file | -] [-o output]
//   castlist init <project-name>
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "castlist/basic/issue_printer.hpp"
#include "castlist/driver/formatter.hpp"
#include "castlist/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "castlist v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  format [file|-]          Write the canonical form\n"
            << "  check [file|-]           Report issues and round-trip stability\n"
            << "  dump [file|-]            Print the parse result as JSON\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (directory with --project)\n"
            << "  --project                Process the inputs listed in castlist.yaml\n"
            << "  --strict                 Warnings fail the check too\n"
            << "  --color=<when>           auto, always or never\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::optional<castlist::ColorMode> color;
  bool use_project = false;
  bool strict = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      } else {
        args.error = "missing value for " + arg;
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg.rfind("--color=", 0) == 0) {
      const std::string value = arg.substr(std::strlen("--color="));
      args.color = castlist::color_mode_from_string(value);
      if (!args.color) {
        args.error = "invalid --color value '" + value + "'";
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if ((arg == "-" || arg[0] != '-') && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Helpers
// ============================================================================

/// Project configuration found from the working directory, if any.
struct LoadedConfig
{
  std::optional<castlist::ProjectConfig> config;
  bool ok = true;
};

LoadedConfig load_config(const CommandArgs & args)
{
  LoadedConfig loaded;
  auto config_path = castlist::find_project_config(fs::current_path());
  if (!config_path) {
    if (args.use_project) {
      std::cerr << "error: no " << castlist::k_project_config_file_name
                << " found in current directory or parents\n";
      loaded.ok = false;
    }
    return loaded;
  }

  auto result = castlist::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
    loaded.ok = false;
    return loaded;
  }

  if (args.verbose) {
    std::cerr << "Using " << config_path->string();
    if (!result.config.package.name.empty()) {
      std::cerr << " (package " << result.config.package.name << ")";
    }
    std::cerr << "\n";
  }
  loaded.config = std::move(result.config);
  return loaded;
}

castlist::FormatOptions make_options(
  const CommandArgs & args, const LoadedConfig & loaded, castlist::FormatMode mode)
{
  castlist::FormatOptions options;
  if (loaded.config) {
    options = castlist::FormatOptions::from_config(*loaded.config);
  }
  options.mode = mode;
  options.verbose = args.verbose;
  if (args.strict) {
    options.strict = true;
  }
  return options;
}

bool use_color(const CommandArgs & args, const LoadedConfig & loaded)
{
  castlist::ColorMode mode = castlist::ColorMode::Auto;
  if (args.color) {
    mode = *args.color;
  } else if (loaded.config) {
    mode = loaded.config->output.color;
  }

  switch (mode) {
    case castlist::ColorMode::Always:
      return true;
    case castlist::ColorMode::Never:
      return false;
    case castlist::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

std::string read_stdin()
{
  std::stringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

/// Print the issues, the round-trip verdict and the summary of one report.
void print_report(const castlist::FileReport & report, castlist::IssuePrinter & printer)
{
  if (report.io_error) {
    std::cerr << "error: " << *report.io_error << "\n";
    return;
  }

  const auto & issues = report.dataset.issues();
  printer.print_all(issues, report.source);

  if (report.roundtrip && !report.roundtrip->stable) {
    fmt::print(std::cerr, "error: canonical form is not stable\n");
    fmt::print(std::cerr, "  first:  {}\n", report.roundtrip->first);
    fmt::print(std::cerr, "  second: {}\n", report.roundtrip->second);
  }

  if (!issues.empty()) {
    printer.print_summary(issues, report.source);
  }
}

bool write_file(const fs::path & path, const std::string & text)
{
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path.string() << "\n";
    return false;
  }
  out << text;
  return out.good();
}

/// Run one of format/check/dump on a single file or stdin.
int run_single(const CommandArgs & args, const LoadedConfig & loaded, castlist::FormatMode mode)
{
  const castlist::FormatOptions options = make_options(args, loaded, mode);
  castlist::IssuePrinter printer(std::cerr, use_color(args, loaded));

  castlist::FileReport report;
  if (args.input_file.empty() || args.input_file == "-") {
    if (args.verbose) {
      std::cerr << "Reading from stdin\n";
    }
    report = castlist::Formatter::process_text(read_stdin(), std::nullopt, options);
  } else {
    const fs::path input_path = fs::absolute(args.input_file);
    if (args.verbose) {
      std::cerr << "Processing: " << input_path.string() << "\n";
    }
    report = castlist::Formatter::process_file(input_path, options);
  }

  print_report(report, printer);
  if (report.io_error) {
    return 1;
  }

  if (mode == castlist::FormatMode::Check) {
    if (report.success) {
      std::cout << (args.input_file.empty() || args.input_file == "-" ? "<stdin>" : args.input_file)
                << ": OK\n";
    }
  } else if (!args.output_path.empty()) {
    if (!write_file(args.output_path, report.output)) {
      return 1;
    }
  } else {
    std::cout << report.output;
  }

  return report.success ? 0 : 1;
}

/// Run one of format/check on every input of the project configuration.
int run_project(const CommandArgs & args, const LoadedConfig & loaded, castlist::FormatMode mode)
{
  const castlist::ProjectConfig & config = *loaded.config;
  if (config.inputs.empty()) {
    std::cerr << "error: no inputs listed in " << castlist::k_project_config_file_name << "\n";
    return 1;
  }

  const castlist::FormatOptions options = make_options(args, loaded, mode);
  castlist::IssuePrinter printer(std::cerr, use_color(args, loaded));

  if (args.verbose) {
    std::cerr << "Project: " << config.package.name << "\n";
  }

  const castlist::FormatResult result = castlist::Formatter::process_project(config, options);

  const fs::path out_dir = args.output_path;
  if (mode == castlist::FormatMode::Format && !out_dir.empty()) {
    fs::create_directories(out_dir);
  }

  bool success = result.success;
  for (const auto & report : result.files) {
    print_report(report, printer);
    if (report.io_error) {
      continue;
    }

    const std::string name = report.source.get_file_path().string();
    if (mode == castlist::FormatMode::Check) {
      if (report.success) {
        std::cout << name << ": OK\n";
      }
    } else if (!out_dir.empty()) {
      const fs::path target = out_dir / report.source.get_file_path().filename();
      if (!write_file(target, report.output)) {
        success = false;
      } else if (args.verbose) {
        std::cerr << "Wrote: " << target.string() << "\n";
      }
    } else {
      std::cout << report.output;
    }
  }

  return success ? 0 : 1;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_process(const CommandArgs & args, castlist::FormatMode mode)
{
  const LoadedConfig loaded = load_config(args);
  if (!loaded.ok) {
    return 1;
  }

  if (args.use_project) {
    if (mode == castlist::FormatMode::Dump) {
      std::cerr << "error: dump does not support --project\n";
      return 1;
    }
    return run_project(args, loaded, mode);
  }
  return run_single(args, loaded, mode);
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: castlist init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  fs::create_directories(project_dir / "data");

  // Create castlist.yaml
  std::ofstream config(project_dir / castlist::k_project_config_file_name);
  config << castlist::make_default_project_config(args.input_file);
  config.close();

  std::ofstream data(project_dir / "data" / "characters.txt");
  data << "Justice League [Wonder Woman; Batman [Bruce Wayne]];\n";
  data.close();

  if (!config || !data) {
    std::cerr << "error: failed to write project files in " << project_dir.string() << "\n";
    return 1;
  }

  std::cout << "Initialized new castlist project in " << project_dir.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  cd " << args.input_file << "\n"
            << "  castlist check --project\n";

  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (args.command == "format") {
      return cmd_process(args, castlist::FormatMode::Format);
    }

    if (args.command == "check") {
      return cmd_process(args, castlist::FormatMode::Check);
    }

    if (args.command == "dump") {
      return cmd_process(args, castlist::FormatMode::Dump);
    }

    if (args.command == "init") {
      return cmd_init(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
