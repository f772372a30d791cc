#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace qplan::cli {

void print_startup_help(std::ostream& os) {
  os << "qplan - query planner command line interface\n\n";
  os << "Usage:\n";
  os << "  qplan --plan <request.json> [--operation all|update_all|delete_all]\n";
  os << "        [--format text|json] [--param-base <n>] [--verbose]\n";
  os << "  qplan --lint <request.json> [--format text|json]\n";
  os << "  qplan --version\n\n";
  os << "Notes:\n";
  os << "  - Use '-' as the request path to read the plan request from stdin.\n";
  os << "  - --operation overrides the request's \"operation\" member.\n";
  os << "  - Exit codes: 0=success, 1=compile error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  qplan --plan ./examples/subquery.json\n";
  os << "  qplan --plan ./examples/subquery.json --format json\n";
  os << "  qplan --lint ./examples/subquery.json\n";
}

void print_help(std::ostream& os) {
  os << "Usage: qplan --plan <request.json> [--operation all|update_all|delete_all]\n";
  os << "             [--format text|json] [--param-base <n>] [--verbose]\n";
  os << "       qplan --lint <request.json> [--format text|json]\n";
  os << "       qplan --version\n";
  os << "--plan prepares and normalizes the request's query and prints the plan.\n";
  os << "--lint reports diagnostics without printing the plan.\n";
  os << "--format json emits the plan (or diagnostics) as JSON.\n";
  os << "--param-base offsets every parameter index of the plan.\n";
  os << "--verbose traces planner stages on stderr.\n";
  os << "Exit codes: 0=success, 1=compile error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--plan" || arg == "--lint") {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      if (!parsed.plan_file.empty()) {
        error = "--plan and --lint take a single request file";
        return false;
      }
      parsed.plan_file = argv[++i];
      parsed.lint = parsed.lint || arg == "--lint";
    } else if (arg == "--operation") {
      if (i + 1 >= argc) {
        error = "Missing value for --operation";
        return false;
      }
      parsed.operation = argv[++i];
      if (parsed.operation != "all" && parsed.operation != "update_all" &&
          parsed.operation != "delete_all") {
        error = "Invalid --operation value (use all|update_all|delete_all)";
        return false;
      }
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      parsed.format = argv[++i];
    } else if (arg == "--param-base") {
      if (i + 1 >= argc) {
        error = "Missing value for --param-base";
        return false;
      }
      const std::string value = argv[++i];
      try {
        size_t idx = 0;
        const long long base = std::stoll(value, &idx);
        if (idx != value.size() || base < 0) throw std::invalid_argument(value);
        parsed.param_base = static_cast<size_t>(base);
        parsed.param_base_set = true;
      } catch (const std::exception&) {
        error = "Invalid --param-base value (use a non-negative integer)";
        return false;
      }
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (parsed.format != "text" && parsed.format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  if (parsed.plan_file.empty() && !parsed.show_help && !parsed.show_version) {
    error = "Missing request file (use --plan <file> or --lint <file>)";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace qplan::cli
