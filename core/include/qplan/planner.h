#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "qplan/ast.h"
#include "qplan/schema.h"

namespace qplan {

enum class Operation { All, UpdateAll, DeleteAll };

/// Canonical name of an operation ("all", "update_all", "delete_all").
const char* operation_name(Operation operation);
std::optional<Operation> operation_from_name(const std::string& name);
/// True for operations that mutate rows in bulk.
bool is_bulk_operation(Operation operation);

struct PrepareResult {
  Query query;
  // Cast values in canonical clause order; subquery values sit at their offsets.
  std::vector<Value> params;
  CacheKey cache_key;
};

/// Resolves sources, expands association joins, compiles subqueries depth-first,
/// infers and casts parameters, and computes the cache key.
/// `param_base` offsets every parameter index this query contributes.
/// Failures throw QueryError (or a subclass); nothing is partially prepared.
PrepareResult prepare(const Query& query,
                      Operation operation,
                      const SchemaResolver& resolver,
                      size_t param_base = 0);

/// Defaults a missing select to the whole first source when `is_all` is true.
Query ensure_select(const Query& query, bool is_all);

/// Validates the prepared query for `operation`, expands select fields and
/// renumbers every parameter placeholder into the flat parameter space.
/// Normalizing an already-normalized query returns it unchanged.
Query normalize(const Query& query,
                Operation operation,
                const SchemaResolver& resolver,
                size_t param_base = 0);

/// Storage column read for `&ix.field` of a prepared query: the schema field's
/// source column, or the field name for tables and subqueries.
std::string field_column(const Query& query,
                         size_t ix,
                         const std::string& field,
                         const SchemaResolver& resolver);

}  // namespace qplan
