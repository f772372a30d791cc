#include "test_harness.h"

#include <vector>

#include "qplan/builder.h"
#include "qplan/diagnostics.h"
#include "qplan/version.h"
#include "test_utils.h"

using namespace qplan;

namespace {

Query bad_cast_subquery() {
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin(1)));
  return build::from(build::subquery(inner));
}

void test_lint_valid_query_has_no_diagnostics() {
  Catalog catalog = make_blog_catalog();
  Query query = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("hello")));
  std::vector<Diagnostic> diagnostics = lint_query(query, Operation::All, catalog);
  expect_eq(diagnostics.size(), 0, "valid query has no diagnostics");
}

void test_lint_unknown_field_has_stable_code_and_span() {
  Catalog catalog = make_blog_catalog();
  Query query = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "missing"), build::pin(1)));
  std::vector<Diagnostic> diagnostics = lint_query(query, Operation::All, catalog);
  expect_eq(diagnostics.size(), 1, "one diagnostic");
  if (diagnostics.empty()) return;
  const auto& first = diagnostics.front();
  expect_true(first.severity == DiagnosticSeverity::Error, "unknown field severity is error");
  expect_eq(first.code, "QPL-SEM-0202", "unknown field code is stable");
  expect_eq(first.span.start_line, 1, "span line");
  expect_true(first.span.start_col > 1, "span points at the field reference");
  expect_true(!first.help.empty(), "help is present");
  expect_eq(first.doc_ref, "docs/query-errors.md", "doc ref");
}

void test_lint_subquery_error_reports_root_cause() {
  Catalog catalog = make_blog_catalog();
  std::vector<Diagnostic> diagnostics = lint_query(bad_cast_subquery(), Operation::All, catalog);
  expect_eq(diagnostics.size(), 1, "one diagnostic for the wrapped failure");
  if (diagnostics.empty()) return;
  const auto& first = diagnostics.front();
  expect_eq(first.code, "QPL-SEM-0101", "root cause code is reported");
  expect_eq(first.message, "value `1` in `where` cannot be cast to type :string", "root cause message");
  expect_eq(first.related.size(), 1, "one note per subquery boundary");
  if (first.related.empty()) return;
  expect_true(first.related[0].message.find("raised while compiling a subquery of `from p in subquery(") == 0,
              "boundary note names the outer query");
}

void test_lint_warns_about_untyped_params() {
  Catalog catalog = make_blog_catalog();
  Query query = build::where(build::from(build::schema("Post")),
                             build::fragment("lower(?) = ?", {build::field(0, "title"), build::pin("x")}));
  std::vector<Diagnostic> diagnostics = lint_query(query, Operation::All, catalog);
  expect_eq(diagnostics.size(), 1, "one warning");
  if (diagnostics.empty()) return;
  expect_true(diagnostics[0].severity == DiagnosticSeverity::Warning, "untyped param is a warning");
  expect_eq(diagnostics[0].code, "QPL-LNT-0001", "warning code");
  expect_true(!has_error_diagnostics(diagnostics), "warnings are not errors");
}

void test_diagnostic_text_renderer_contains_help_and_caret() {
  Catalog catalog = make_blog_catalog();
  std::vector<Diagnostic> diagnostics = lint_query(bad_cast_subquery(), Operation::All, catalog);
  std::string rendered = render_diagnostics_text(diagnostics);
  expect_true(rendered.find("ERROR[QPL-SEM-0101]") == 0, "text renderer header");
  expect_true(rendered.find("help:") != std::string::npos, "text renderer has help");
  expect_true(rendered.find("^") != std::string::npos, "text renderer has caret snippet");
  expect_true(rendered.find("note: raised while compiling a subquery") != std::string::npos,
              "text renderer has boundary note");
}

void test_diagnostic_json_renderer_contains_stable_fields() {
  Catalog catalog = make_blog_catalog();
  std::vector<Diagnostic> diagnostics = lint_query(bad_cast_subquery(), Operation::All, catalog);
  std::string json = render_diagnostics_json(diagnostics);
  expect_true(json.find("\"severity\":\"ERROR\"") != std::string::npos, "json severity");
  expect_true(json.find("\"code\":\"QPL-SEM-0101\"") != std::string::npos, "json code");
  expect_true(json.find("\"span\"") != std::string::npos, "json span");
  expect_true(json.find("\"related\":[{") != std::string::npos, "json related notes");
  expect_eq(render_diagnostics_json({}), "[]", "empty list renders as an empty array");
}

void test_request_diagnostics_classify_failures() {
  Diagnostic missing = make_request_diagnostic("", "Failed to open file: x.json", 0);
  expect_eq(missing.code, "QPL-IO-0001", "empty source code");
  Diagnostic syntax = make_request_diagnostic("{\"query\": }", "[json.exception.parse_error.101] parse error", 10);
  expect_eq(syntax.code, "QPL-IO-0002", "json syntax code");
  expect_eq(syntax.span.start_col, 11, "json syntax column");
  Diagnostic shape = make_request_diagnostic("{}", "request: missing member 'query'", 0);
  expect_eq(shape.code, "QPL-IO-0003", "request shape code");
  expect_eq(shape.doc_ref, "docs/plan-requests.md", "request doc ref");
}

void test_version_string_has_commit() {
  VersionInfo info = get_version_info();
  expect_true(!info.version.empty(), "version is set");
  expect_true(version_string().find(info.version + " (") == 0, "version string layout");
}

}  // namespace

void register_diagnostics_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lint_valid_query_has_no_diagnostics", test_lint_valid_query_has_no_diagnostics});
  tests.push_back({"lint_unknown_field_has_stable_code_and_span",
                   test_lint_unknown_field_has_stable_code_and_span});
  tests.push_back({"lint_subquery_error_reports_root_cause", test_lint_subquery_error_reports_root_cause});
  tests.push_back({"lint_warns_about_untyped_params", test_lint_warns_about_untyped_params});
  tests.push_back({"diagnostic_text_renderer_contains_help_and_caret",
                   test_diagnostic_text_renderer_contains_help_and_caret});
  tests.push_back({"diagnostic_json_renderer_contains_stable_fields",
                   test_diagnostic_json_renderer_contains_stable_fields});
  tests.push_back({"request_diagnostics_classify_failures", test_request_diagnostics_classify_failures});
  tests.push_back({"version_string_has_commit", test_version_string_has_commit});
}
