#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qplan/ast.h"
#include "qplan/errors.h"
#include "qplan/planner.h"
#include "qplan/schema.h"

namespace qplan::detail {

/// Outcome of compiling one subquery occurrence. Exactly one member is set.
struct SubqueryCompileResult {
  std::optional<Subquery> subquery;
  std::shared_ptr<const QueryError> error;
};

/// Prepares the inner query of `raw` as an `all` query and compiles its select.
/// Errors are returned, not thrown, so the caller wraps them once at the boundary.
SubqueryCompileResult compile_subquery(const Subquery& raw,
                                       size_t param_offset,
                                       const SchemaResolver& resolver);

/// Copy of a compiled subquery attached at `param_offset`. A normalized inner
/// query has its placeholders moved along with the offset.
Subquery attach_subquery(const Subquery& compiled, size_t param_offset);

struct CompiledSelect {
  SelectShape shape;
  // Canonical expanded select, e.g. %Post{id: &0.id(), ...}.
  Expr expr;
};

/// Computes the output shape of a prepared subquery's select.
/// Throws QueryError for selects a subquery cannot expose.
CompiledSelect compile_subquery_select(const Query& query, const SchemaResolver& resolver);

/// Sets query.sources from `from` and the join sources, indexed by binding.
void rebuild_sources(Query& query);

/// Non-virtual fields of a schema in declaration order.
/// Throws UnknownSchema when the resolver does not know the schema.
std::vector<ShapeField> schema_fields(const std::string& schema,
                                      const SchemaResolver& resolver,
                                      const Query& query);

/// Type of `&ix.name`. Throws InvalidBinding, UnknownField or
/// UnknownFieldInSubquery; `clause` names the clause in messages.
FieldType resolve_field(const Query& query,
                        size_t ix,
                        const std::string& name,
                        const std::string& clause,
                        const SchemaResolver& resolver);

/// Fields a whole-binding select reads, in order.
std::vector<ShapeField> binding_fields(const Query& query,
                                       size_t ix,
                                       const SchemaResolver& resolver);

/// Schema carried by a binding: a schema source, or a subquery whose shape
/// is Row or Struct. Empty for tables and map-shaped subqueries.
std::optional<std::string> binding_schema(const Query& query, size_t ix);

const Source& source_at(const Query& query, size_t ix);

/// Casts `value` to `type`; nullopt when the value is not accepted.
/// Throws InvalidQuery for custom types the resolver does not know.
std::optional<Value> cast_value(const Value& value,
                                const FieldType& type,
                                const SchemaResolver& resolver,
                                const Query& query);

FieldType type_of_value(const Value& value);

/// Builds `[operation, param_count, clauses..., from]`.
CacheKey build_cache_key(const Query& query,
                         Operation operation,
                         size_t param_count,
                         const SchemaResolver& resolver);

/// One clause visited in canonical order.
struct ClauseView {
  enum class Kind { Select, Join, Where, GroupBy, Having, OrderBy, Limit, Offset, Update } kind;
  const char* name = "";
  // Top-level expressions of the clause. Update: one per op, aligned with update_fields.
  std::vector<Expr*> exprs;
  std::vector<ParamSlot>* params = nullptr;
  std::vector<std::string> update_fields;
};

/// Visits sources and clauses in the canonical order of `operation`:
/// `all` is select, from, joins (source then on), wheres, group_bys, havings,
/// order_bys, limit, offset; `update_all` is updates, from, joins, wheres,
/// select; `delete_all` is from, joins, wheres, select. Clauses an operation
/// does not allow are visited last so no parameter is ever dropped.
template <typename SourceFn, typename ClauseFn>
void walk_canonical(Query& query, Operation operation, SourceFn&& on_source, ClauseFn&& on_clause) {
  auto visit_select = [&]() {
    if (!query.select) return;
    ClauseView view{ClauseView::Kind::Select, "select", {&query.select->expr}, &query.select->params, {}};
    on_clause(view);
  };
  auto visit_updates = [&]() {
    for (auto& update : query.updates) {
      ClauseView view{ClauseView::Kind::Update, "update", {}, &update.params, {}};
      for (auto& op : update.ops) {
        view.exprs.push_back(&op.value);
        view.update_fields.push_back(op.field);
      }
      on_clause(view);
    }
  };
  auto visit_expr_list = [&](std::vector<QueryExpr>& clauses, ClauseView::Kind kind, const char* name) {
    for (auto& clause : clauses) {
      ClauseView view{kind, name, {&clause.expr}, &clause.params, {}};
      on_clause(view);
    }
  };
  auto visit_sources_and_wheres = [&]() {
    on_source(query.from);
    for (auto& join : query.joins) {
      on_source(join.source);
      ClauseView view{ClauseView::Kind::Join, "join", {&join.on.expr}, &join.on.params, {}};
      on_clause(view);
    }
    visit_expr_list(query.wheres, ClauseView::Kind::Where, "where");
  };
  auto visit_tail = [&]() {
    visit_expr_list(query.group_bys, ClauseView::Kind::GroupBy, "group_by");
    visit_expr_list(query.havings, ClauseView::Kind::Having, "having");
    for (auto& order : query.order_bys) {
      ClauseView view{ClauseView::Kind::OrderBy, "order_by", {}, &order.params, {}};
      for (auto& term : order.terms) view.exprs.push_back(&term.expr);
      on_clause(view);
    }
    if (query.limit) {
      ClauseView view{ClauseView::Kind::Limit, "limit", {&query.limit->expr}, &query.limit->params, {}};
      on_clause(view);
    }
    if (query.offset) {
      ClauseView view{ClauseView::Kind::Offset, "offset", {&query.offset->expr}, &query.offset->params, {}};
      on_clause(view);
    }
  };

  switch (operation) {
    case Operation::All:
      visit_select();
      visit_sources_and_wheres();
      visit_tail();
      visit_updates();
      break;
    case Operation::UpdateAll:
      visit_updates();
      visit_sources_and_wheres();
      visit_select();
      visit_tail();
      break;
    case Operation::DeleteAll:
      visit_sources_and_wheres();
      visit_select();
      visit_tail();
      visit_updates();
      break;
  }
}

/// Parameters a query binds before its `from` source in canonical order.
size_t params_before_from(const Query& query, Operation operation);

}  // namespace qplan::detail
