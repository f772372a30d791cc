#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.h"
#include "plan_io.h"
#include "qplan/diagnostics.h"
#include "qplan/errors.h"
#include "qplan/render.h"
#include "qplan/version.h"

using namespace qplan::cli;

namespace {

void trace(bool verbose, const std::string& message) {
  if (verbose) std::cerr << "[qplan] " << message << std::endl;
}

void print_diagnostics(const std::vector<qplan::Diagnostic>& diagnostics, const std::string& format) {
  if (format == "json") {
    std::cout << qplan::render_diagnostics_json(diagnostics) << std::endl;
  } else if (diagnostics.empty()) {
    std::cout << "No diagnostics." << std::endl;
  } else {
    std::cout << qplan::render_diagnostics_text(diagnostics) << std::endl;
  }
}

}  // namespace

/// Entry point that parses CLI options and dispatches to plan or lint mode.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "qplan " << qplan::version_string() << std::endl;
    return 0;
  }

  std::string source;
  try {
    source = read_request_source(options.plan_file);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }
  trace(options.verbose, "read " + std::to_string(source.size()) + " bytes from " + options.plan_file);

  PlanRequestResult decoded = parse_plan_request(source);
  if (!decoded.request) {
    const std::string message = decoded.error.value_or("unreadable plan request");
    if (options.lint) {
      print_diagnostics({qplan::make_request_diagnostic(source, message, decoded.error_byte)},
                        options.format);
      return 1;
    }
    std::cerr << "Error: " << message << std::endl;
    return 2;
  }
  PlanRequest& request = *decoded.request;
  if (!options.operation.empty()) {
    auto operation = qplan::operation_from_name(options.operation);
    if (operation) request.operation = *operation;
  }
  if (options.param_base_set) request.param_base = options.param_base;
  trace(options.verbose, std::string("decoded request: operation ") +
                             qplan::operation_name(request.operation) + ", " +
                             std::to_string(request.catalog.schema_names().size()) + " schemas");
  trace(options.verbose, "query: " + qplan::render_query(request.query));

  if (options.lint) {
    std::vector<qplan::Diagnostic> diagnostics =
        qplan::lint_query(request.query, request.operation, request.catalog, request.param_base);
    print_diagnostics(diagnostics, options.format);
    return qplan::has_error_diagnostics(diagnostics) ? 1 : 0;
  }

  try {
    const auto started_at = std::chrono::steady_clock::now();
    Plan plan = build_plan(request);
    const auto finished_at = std::chrono::steady_clock::now();
    trace(options.verbose,
          "planned in " +
              std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(finished_at - started_at)
                                 .count()) +
              "us, " + std::to_string(plan.params.size()) + " params");
    if (options.format == "json") {
      std::cout << render_plan_json(plan, request.catalog) << std::endl;
    } else {
      std::cout << render_plan_text(plan, request.catalog);
    }
  } catch (const qplan::QueryError& ex) {
    if (options.format == "json") {
      print_diagnostics({qplan::make_compile_diagnostic(ex)}, options.format);
    } else {
      std::cerr << "Error: " << ex.what() << std::endl;
    }
    return 1;
  }
  return 0;
}
