#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "qplan/errors.h"
#include "qplan/planner.h"

namespace qplan {

/// Classifies diagnostic urgency for linting and compile error rendering.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a span of the rendered query in byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

/// Holds an additional location tied to the primary diagnostic.
struct DiagnosticRelated {
  std::string message;
  DiagnosticSpan span;
};

/// Structured planner diagnostic.
/// MUST include a stable code, actionable help and a docs pointer.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  std::string doc_ref;
  DiagnosticSpan span;
  std::string snippet;
  std::vector<DiagnosticRelated> related;
};

/// Maps a compile failure to a diagnostic anchored in its rendered query.
/// Subquery wrappers report the innermost cause and add one note per boundary.
Diagnostic make_compile_diagnostic(const QueryError& error);
/// Builds a diagnostic for an unreadable or malformed plan request.
/// `error_byte` locates the failure in `source` when known.
Diagnostic make_request_diagnostic(const std::string& source,
                                   const std::string& message,
                                   size_t error_byte);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a stable JSON array for machine consumption.
/// MUST keep key ordering stable across runs.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
/// Returns true when at least one ERROR severity diagnostic exists.
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

/// Prepares and normalizes without keeping the plan, and returns diagnostics.
/// Valid queries yield no errors; untyped parameters yield warnings.
std::vector<Diagnostic> lint_query(const Query& query,
                                   Operation operation,
                                   const SchemaResolver& resolver,
                                   size_t param_base = 0);

}  // namespace qplan
