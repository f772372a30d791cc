#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "qplan/ast.h"
#include "qplan/planner.h"
#include "qplan/schema.h"

namespace qplan::cli {

/// A decoded plan request: the catalog, the query tree and planner options.
struct PlanRequest {
  Operation operation = Operation::All;
  size_t param_base = 0;
  Catalog catalog;
  Query query;
};

/// Result of decoding a request. Exactly one of `request` and `error` is set;
/// `error_byte` locates JSON syntax errors in the input.
struct PlanRequestResult {
  std::optional<PlanRequest> request;
  std::optional<std::string> error;
  size_t error_byte = 0;
};

/// Loads a plan request from `path`, or from stdin when `path` is "-".
/// MUST throw on IO errors.
std::string read_request_source(const std::string& path);

/// Decodes a JSON plan request. Never throws.
PlanRequestResult parse_plan_request(const std::string& text);

/// An execution-ready plan.
struct Plan {
  Operation operation = Operation::All;
  Query query;
  std::vector<Value> params;
  CacheKey cache_key;
};

/// Runs prepare, ensure_select and normalize. Throws QueryError on failure.
Plan build_plan(const PlanRequest& request);

std::string render_plan_json(const Plan& plan, const SchemaResolver& resolver);
std::string render_plan_text(const Plan& plan, const SchemaResolver& resolver);

}  // namespace qplan::cli
