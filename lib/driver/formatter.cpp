// castlist/driver/formatter.cpp - Format/check driver implementation
//
#include "castlist/driver/formatter.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include "castlist/render/canonicalizer.hpp"
#include "castlist/render/json_dump.hpp"
#include "castlist/syntax/frontend.hpp"

namespace castlist
{

FormatOptions FormatOptions::from_config(const ProjectConfig & config)
{
  FormatOptions options;
  options.strict = config.check.strict;
  options.verify_roundtrip = config.check.verify_roundtrip;
  options.fail_on = config.check.fail_on;
  options.trailing_newline = config.output.trailing_newline;
  return options;
}

bool Formatter::is_failing(const ParseIssue & issue, const FormatOptions & options)
{
  if (!options.fail_on.empty()) {
    return std::find(options.fail_on.begin(), options.fail_on.end(), issue.code) !=
           options.fail_on.end();
  }
  return options.strict || issue.severity() == Severity::Error;
}

FileReport Formatter::process_text(
  std::string text, const std::optional<std::filesystem::path> & file,
  const FormatOptions & options)
{
  FileReport report;
  report.source = file ? SourceManager(*file, std::move(text)) : SourceManager(std::move(text));
  report.dataset = parse(report.source.get_source());

  switch (options.mode) {
    case FormatMode::Format:
      report.output = render(report.dataset);
      if (options.trailing_newline && !report.output.empty()) {
        report.output += '\n';
      }
      break;
    case FormatMode::Dump:
      report.output = to_json(report.dataset).dump(2) + "\n";
      break;
    case FormatMode::Check:
      break;
  }

  const IssueBag & issues = report.dataset.issues();
  bool success = true;
  if (!options.fail_on.empty()) {
    success = std::none_of(issues.begin(), issues.end(), [&options](const ParseIssue & issue) {
      return is_failing(issue, options);
    });
  } else if (options.strict) {
    success = issues.empty();
  } else {
    success = !issues.has_errors();
  }

  if (options.verify_roundtrip) {
    report.roundtrip = check_roundtrip(report.source.get_source());
    if (!report.roundtrip->stable) {
      success = false;
    }
  }

  if (options.verbose) {
    std::cerr << "Parsed " << (file ? file->string() : std::string("<input>")) << ": "
              << report.dataset.size() << " entries, " << report.dataset.issues().size()
              << " issues\n";
  }

  report.success = success;
  return report;
}

FileReport Formatter::process_file(
  const std::filesystem::path & file, const FormatOptions & options)
{
  namespace fs = std::filesystem;

  const auto fail = [&file](std::string message) {
    FileReport report;
    report.source = SourceManager(file, std::string{});
    report.io_error = std::move(message);
    report.success = false;
    return report;
  };

  std::error_code ec;
  if (!fs::exists(file, ec)) {
    return fail("cannot read file: " + file.string());
  }
  if (!fs::is_regular_file(file, ec)) {
    return fail("not a regular file: " + file.string());
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return fail("cannot read file: " + file.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad() || buffer.fail()) {
    // Inserting an empty file sets failbit on the buffer.
    if (fs::file_size(file, ec) != 0 || ec) {
      return fail("cannot read file: " + file.string());
    }
  }
  return process_text(buffer.str(), file, options);
}

FormatResult Formatter::process_project(
  const ProjectConfig & config, const FormatOptions & options)
{
  FormatResult result;
  result.success = true;

  for (const auto & input : config.resolved_inputs()) {
    if (options.verbose) {
      std::cerr << "Processing " << input.string() << "\n";
    }
    FileReport report = process_file(input, options);
    if (!report.success) {
      result.success = false;
    }
    result.files.push_back(std::move(report));
  }

  return result;
}

}  // namespace castlist
