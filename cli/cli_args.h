#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace qplan::cli {

/// Parsed command-line options.
struct CliOptions {
  std::string plan_file;
  std::string operation;
  std::string format = "text";
  bool param_base_set = false;
  size_t param_base = 0;
  bool lint = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

/// Prints the startup help shown when no arguments are given.
void print_startup_help(std::ostream& os);
/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags, with `error` describing the first problem.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace qplan::cli
