#include "planner_internal.h"

#include "qplan/builder.h"
#include "qplan/render.h"

namespace qplan {

namespace {

using detail::ClauseView;

void renumber(Expr& expr, size_t offset) {
  if (expr.kind == Expr::Kind::Param) {
    expr.index += offset;
    return;
  }
  for (auto& arg : expr.args) renumber(arg, offset);
  for (auto& entry : expr.entries) {
    renumber(entry.key, offset);
    renumber(entry.value, offset);
  }
}

void validate_operation(const Query& query, Operation operation) {
  const std::string name = operation_name(operation);
  if (operation == Operation::All) {
    if (!query.updates.empty()) {
      throw QueryError(ErrorKind::InvalidQuery, "`all` does not allow `update` expressions",
                       render_query(query));
    }
    return;
  }
  if (query.from.kind == Source::Kind::Subquery) {
    throw QueryError(ErrorKind::SubqueryNotAllowedInBulkFrom,
                     "`" + name + "` does not allow subqueries in `from`", render_query(query));
  }
  if (operation == Operation::UpdateAll && query.updates.empty()) {
    throw QueryError(ErrorKind::InvalidQuery, "`update_all` requires at least one field to be updated",
                     render_query(query));
  }
  if (operation == Operation::DeleteAll && !query.updates.empty()) {
    throw QueryError(ErrorKind::InvalidQuery, "`delete_all` does not allow `update` expressions",
                     render_query(query));
  }
  if (!query.group_bys.empty() || !query.havings.empty() || !query.order_bys.empty() ||
      query.limit || query.offset || !query.preloads.empty()) {
    throw QueryError(ErrorKind::InvalidQuery,
                     "`" + name + "` allows only `where` and `join` expressions",
                     render_query(query));
  }
}

/// Collects the flat list of values the adapter reads for a select.
class FieldCollector {
 public:
  FieldCollector(const Query& query, const SchemaResolver& resolver)
      : query_(query), resolver_(resolver) {}

  void collect(const Expr& expr, std::vector<Expr>& out) const {
    switch (expr.kind) {
      case Expr::Kind::Binding:
        for (const auto& field : detail::binding_fields(query_, expr.index, resolver_)) {
          out.push_back(build::field(expr.index, field.name));
        }
        return;
      case Expr::Kind::Take:
        collect_take(expr, out);
        return;
      case Expr::Kind::Field:
      case Expr::Kind::Param:
      case Expr::Kind::Call:
      case Expr::Kind::Fragment:
        out.push_back(expr);
        return;
      case Expr::Kind::Literal:
      case Expr::Kind::Atom:
        return;
      case Expr::Kind::List:
      case Expr::Kind::Merge:
      case Expr::Kind::MapUpdate:
        for (const auto& arg : expr.args) collect(arg, out);
        break;
      case Expr::Kind::Map:
      case Expr::Kind::Struct:
        break;
    }
    for (const auto& entry : expr.entries) {
      if (entry.key.kind != Expr::Kind::Atom) collect(entry.key, out);
      collect(entry.value, out);
    }
  }

 private:
  void collect_take(const Expr& expr, std::vector<Expr>& out) const {
    const Source& source = detail::source_at(query_, expr.index);
    if (source.kind == Source::Kind::Subquery && source.subquery && source.subquery->shape &&
        source.subquery->shape->kind != SelectShape::Kind::Row &&
        source.subquery->shape->fields.size() > 1) {
      throw QueryError(ErrorKind::CannotSubsetSubqueryStruct,
                       "it is not possible to return a map/struct subset of a subquery, you must "
                       "explicitly select the whole subquery or individual fields only",
                       render_query(query_));
    }
    for (const auto& name : expr.fields) {
      detail::resolve_field(query_, expr.index, name, "select", resolver_);
      out.push_back(build::field(expr.index, name));
    }
  }

  const Query& query_;
  const SchemaResolver& resolver_;
};

}  // namespace

const char* operation_name(Operation operation) {
  switch (operation) {
    case Operation::All:
      return "all";
    case Operation::UpdateAll:
      return "update_all";
    case Operation::DeleteAll:
      return "delete_all";
  }
  return "all";
}

std::optional<Operation> operation_from_name(const std::string& name) {
  if (name == "all") return Operation::All;
  if (name == "update_all") return Operation::UpdateAll;
  if (name == "delete_all") return Operation::DeleteAll;
  return std::nullopt;
}

bool is_bulk_operation(Operation operation) { return operation != Operation::All; }

Query ensure_select(const Query& query, bool is_all) {
  Query out = query;
  if (!out.select && is_all) {
    SelectExpr select;
    select.expr = build::binding(0);
    out.select = std::move(select);
  }
  return out;
}

Query normalize(const Query& input,
                Operation operation,
                const SchemaResolver& resolver,
                size_t param_base) {
  if (input.stage == Query::Stage::Normalized) return input;
  if (input.stage != Query::Stage::Prepared) {
    throw QueryError(ErrorKind::InvalidQuery, "query must be prepared before it is normalized",
                     render_query(input));
  }
  validate_operation(input, operation);

  Query query = input;
  size_t counter = param_base;
  detail::walk_canonical(
      query, operation,
      [&](Source& source) {
        if (source.kind != Source::Kind::Subquery || !source.subquery) return;
        Subquery attached = *source.subquery;
        attached.query = std::make_shared<const Query>(
            normalize(*attached.query, Operation::All, resolver, counter));
        attached.param_offset = counter;
        counter += attached.params.size();
        source.subquery = std::make_shared<const Subquery>(std::move(attached));
      },
      [&](ClauseView& clause) {
        for (Expr* expr : clause.exprs) renumber(*expr, counter);
        counter += clause.params->size();
        clause.params->clear();
      });
  detail::rebuild_sources(query);

  if (query.select) {
    FieldCollector collector(query, resolver);
    query.select->fields.clear();
    collector.collect(query.select->expr, query.select->fields);
  }
  query.stage = Query::Stage::Normalized;
  return query;
}

}  // namespace qplan
