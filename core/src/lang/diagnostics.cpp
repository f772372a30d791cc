#include "qplan/diagnostics.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <string_view>

#include "planner/planner_internal.h"
#include "qplan/render.h"

namespace qplan {

namespace {

constexpr const char* kErrorsDoc = "docs/query-errors.md";
constexpr const char* kPlanDoc = "docs/plan-requests.md";

std::optional<std::string> extract_backquoted(std::string_view message) {
  size_t start = message.find('`');
  if (start == std::string::npos) return std::nullopt;
  size_t end = message.find('`', start + 1);
  if (end == std::string::npos || end <= start + 1) return std::nullopt;
  return std::string(message.substr(start + 1, end - start - 1));
}

DiagnosticSpan span_from_bytes(const std::string& query, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = query.size();
  span.byte_start = std::min(byte_start, size);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + (size == 0 ? 0u : 1u)), size);
  if (size == 0) {
    span.start_line = 1;
    span.start_col = 1;
    span.end_line = 1;
    span.end_col = 1;
    span.byte_start = 0;
    span.byte_end = 0;
    return span;
  }
  if (span.byte_start >= size) {
    span.byte_start = size - 1;
  }
  if (span.byte_end <= span.byte_start) {
    span.byte_end = std::min(size, span.byte_start + 1);
  }

  size_t line = 1;
  size_t col = 1;
  for (size_t i = 0; i < span.byte_start && i < size; ++i) {
    if (query[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.start_line = line;
  span.start_col = col;

  for (size_t i = span.byte_start; i < span.byte_end && i < size; ++i) {
    if (query[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.end_line = line;
  span.end_col = col;
  return span;
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

std::string json_escape(std::string_view s) {
  std::ostringstream out;
  for (char c : s) {
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        out << c;
        break;
    }
  }
  return out.str();
}

std::string render_code_frame(const std::string& query,
                              const DiagnosticSpan& span,
                              const std::string& label) {
  if (query.empty()) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < query.size()) {
    size_t nl = query.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = query.find('\n', line_start);
  if (line_end == std::string::npos) line_end = query.size();
  std::string line_text = query.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  if (caret_start > line_text.size()) {
    return "";
  }
  if (caret_start + caret_width > line_text.size() + 1) {
    caret_width = std::max<size_t>(1, line_text.size() > caret_start ? line_text.size() - caret_start : 1);
  }
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  if (!label.empty()) out << " " << label;
  return out.str();
}


std::optional<DiagnosticSpan> find_text_span(const std::string& query, const std::string& needle) {
  if (needle.empty()) return std::nullopt;
  size_t pos = query.find(needle);
  if (pos == std::string::npos) return std::nullopt;
  return span_from_bytes(query, pos, pos + needle.size());
}

struct KindInfo {
  const char* code;
  const char* help;
};

KindInfo kind_info(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidQuery:
      return {"QPL-SEM-0001", "Check that the query's clauses are allowed for the requested operation."};
    case ErrorKind::CastError:
      return {"QPL-SEM-0101", "Pin a value of the field's type, or annotate the parameter with an explicit type."};
    case ErrorKind::UnknownSchema:
      return {"QPL-SEM-0201", "Declare the schema in the catalog before referencing it."};
    case ErrorKind::UnknownField:
      return {"QPL-SEM-0202", "Reference a declared, non-virtual field of the schema and check spelling."};
    case ErrorKind::UnknownFieldInSubquery:
      return {"QPL-SEM-0203", "Reference only the fields the subquery selects, or add the field to its select."};
    case ErrorKind::UnknownAssociation:
      return {"QPL-SEM-0204", "Declare the association on the parent schema or join the related schema explicitly."};
    case ErrorKind::InvalidBinding:
      return {"QPL-SEM-0205", "Reference only bindings introduced by `from` or a preceding join."};
    case ErrorKind::InvalidMapKey:
      return {"QPL-SEM-0301", "Use atom keys naming declared fields when selecting maps or structs in a subquery."};
    case ErrorKind::UnsupportedSubquerySelect:
      return {"QPL-SEM-0302", "Select a source, a field or a map in the subquery; wrap other expressions in a map."};
    case ErrorKind::IllegalMergeTarget:
      return {"QPL-SEM-0303", "Merge a struct or map into a struct of the same schema, or a map into a map."};
    case ErrorKind::IllegalPreloadInSubquery:
      return {"QPL-SEM-0401", "Move the preload to the outer query."};
    case ErrorKind::IllegalUpdateInSubquery:
      return {"QPL-SEM-0402", "Remove the update from the subquery; subqueries are always read-only."};
    case ErrorKind::SubqueryNotAllowedInBulkFrom:
      return {"QPL-SEM-0403", "Join the subquery instead of using it as the primary source of a bulk operation."};
    case ErrorKind::AssociationRequiresSourceSchema:
      return {"QPL-SEM-0404", "Select the whole source (or a map update of it) in the subquery to keep its schema."};
    case ErrorKind::CannotSubsetSubqueryStruct:
      return {"QPL-SEM-0405", "Select the whole subquery binding or individual fields instead of a field subset."};
    case ErrorKind::SubQueryError:
      return {"QPL-SEM-0501", "Fix the error inside the subquery."};
  }
  return {"QPL-SEM-0999", "Review the failing clause."};
}

DiagnosticSpan best_effort_error_span(const QueryError& error) {
  const std::string& query = error.query_text();
  const std::string& reason = error.reason();
  std::optional<DiagnosticSpan> span;
  auto token = extract_backquoted(reason);
  switch (error.kind()) {
    case ErrorKind::CastError:
      if (const auto* cast = dynamic_cast<const CastError*>(&error)) {
        span = find_text_span(query, "^" + render_value(cast->value()));
        if (!span) span = find_text_span(query, cast->clause() + ": ");
      }
      break;
    case ErrorKind::UnknownField:
    case ErrorKind::UnknownFieldInSubquery:
      if (token) span = find_text_span(query, "." + *token);
      break;
    case ErrorKind::UnknownAssociation:
      if (token) span = find_text_span(query, ":" + *token);
      break;
    case ErrorKind::UnknownSchema:
      if (token) span = find_text_span(query, *token);
      break;
    case ErrorKind::IllegalPreloadInSubquery:
      span = find_text_span(query, "preload:");
      break;
    case ErrorKind::IllegalUpdateInSubquery:
      span = find_text_span(query, "update:");
      break;
    case ErrorKind::SubqueryNotAllowedInBulkFrom:
    case ErrorKind::SubQueryError:
      span = find_text_span(query, "subquery(");
      break;
    case ErrorKind::AssociationRequiresSourceSchema:
      span = find_text_span(query, "assoc(");
      break;
    case ErrorKind::InvalidMapKey:
    case ErrorKind::UnsupportedSubquerySelect:
    case ErrorKind::IllegalMergeTarget:
    case ErrorKind::CannotSubsetSubqueryStruct:
      span = find_text_span(query, "select:");
      break;
    default:
      break;
  }
  if (span) return *span;
  if (query.empty()) return span_from_bytes(query, 0, 0);
  return span_from_bytes(query, 0, 1);
}

std::string first_line(const std::string& text) {
  size_t nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

void warn_untyped_params(Query& prepared, Operation operation, const std::string& query_text,
                         std::vector<Diagnostic>& out) {
  detail::walk_canonical(
      prepared, operation, [](Source&) {},
      [&](detail::ClauseView& clause) {
        for (const auto& slot : *clause.params) {
          if (!slot.type || slot.type->kind != FieldType::Kind::Any) continue;
          if (std::holds_alternative<std::monostate>(slot.value)) continue;
          Diagnostic d;
          d.severity = DiagnosticSeverity::Warning;
          d.code = "QPL-LNT-0001";
          d.message = "parameter `^" + render_value(slot.value) + "` in `" + clause.name +
                      "` has no inferred type and is passed through uncast";
          d.help = "Compare the parameter with a typed field or annotate it with an explicit type.";
          d.doc_ref = kErrorsDoc;
          auto span = find_text_span(query_text, "^" + render_value(slot.value));
          d.span = span ? *span : span_from_bytes(query_text, 0, 1);
          d.snippet = render_code_frame(query_text, d.span, "");
          out.push_back(std::move(d));
        }
      });
}

}  // namespace

Diagnostic make_compile_diagnostic(const QueryError& error) {
  const QueryError* cause = &error;
  std::vector<const SubQueryError*> boundaries;
  while (const auto* wrapped = dynamic_cast<const SubQueryError*>(cause)) {
    boundaries.push_back(wrapped);
    cause = &wrapped->inner();
  }

  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = cause->reason();
  const KindInfo info = kind_info(cause->kind());
  d.code = info.code;
  d.help = info.help;
  d.doc_ref = kErrorsDoc;
  d.span = best_effort_error_span(*cause);
  d.snippet = render_code_frame(cause->query_text(), d.span, "");
  for (auto it = boundaries.rbegin(); it != boundaries.rend(); ++it) {
    DiagnosticRelated related;
    related.message = "raised while compiling a subquery of `" + first_line((*it)->query_text()) + "`";
    related.span = best_effort_error_span(**it);
    d.related.push_back(std::move(related));
  }
  return d;
}

Diagnostic make_request_diagnostic(const std::string& source,
                                   const std::string& message,
                                   size_t error_byte) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = message;
  d.doc_ref = kPlanDoc;
  d.span = span_from_bytes(source, error_byte, error_byte + 1);
  if (source.empty()) {
    d.code = "QPL-IO-0001";
    d.help = "Check that the plan request file exists and is readable.";
    return d;
  }
  if (message.rfind("[json.exception.parse_error", 0) == 0) {
    d.code = "QPL-IO-0002";
    d.help = "Fix the JSON syntax of the plan request.";
  } else {
    d.code = "QPL-IO-0003";
    d.help = "Check the plan request against the documented request format.";
  }
  d.snippet = render_code_frame(source, d.span, "");
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    for (const auto& related : d.related) {
      out << "note: " << related.message
          << " (line " << related.span.start_line << ", col " << related.span.start_col << ")\n";
    }
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    if (i != 0) out << ",";
    out << "{";
    out << "\"severity\":\"" << json_escape(severity_name(d.severity)) << "\",";
    out << "\"code\":\"" << json_escape(d.code) << "\",";
    out << "\"message\":\"" << json_escape(d.message) << "\",";
    out << "\"help\":\"" << json_escape(d.help) << "\",";
    out << "\"doc_ref\":\"" << json_escape(d.doc_ref) << "\",";
    out << "\"span\":{"
        << "\"start_line\":" << d.span.start_line << ","
        << "\"start_col\":" << d.span.start_col << ","
        << "\"end_line\":" << d.span.end_line << ","
        << "\"end_col\":" << d.span.end_col << ","
        << "\"byte_start\":" << d.span.byte_start << ","
        << "\"byte_end\":" << d.span.byte_end
        << "},";
    out << "\"snippet\":\"" << json_escape(d.snippet) << "\",";
    out << "\"related\":[";
    for (size_t j = 0; j < d.related.size(); ++j) {
      if (j != 0) out << ",";
      const auto& related = d.related[j];
      out << "{";
      out << "\"message\":\"" << json_escape(related.message) << "\",";
      out << "\"span\":{"
          << "\"start_line\":" << related.span.start_line << ","
          << "\"start_col\":" << related.span.start_col << ","
          << "\"end_line\":" << related.span.end_line << ","
          << "\"end_col\":" << related.span.end_col << ","
          << "\"byte_start\":" << related.span.byte_start << ","
          << "\"byte_end\":" << related.span.byte_end
          << "}";
      out << "}";
    }
    out << "]";
    out << "}";
  }
  out << "]";
  return out.str();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}


std::vector<Diagnostic> lint_query(const Query& query,
                                   Operation operation,
                                   const SchemaResolver& resolver,
                                   size_t param_base) {
  std::vector<Diagnostic> out;
  try {
    PrepareResult prepared = prepare(query, operation, resolver, param_base);
    Query normalized = ensure_select(prepared.query, operation == Operation::All);
    normalize(normalized, operation, resolver, param_base);
    warn_untyped_params(prepared.query, operation, render_query(prepared.query), out);
  } catch (const QueryError& err) {
    out.push_back(make_compile_diagnostic(err));
  }
  return out;
}

}  // namespace qplan
