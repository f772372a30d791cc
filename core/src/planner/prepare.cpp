#include "planner_internal.h"

#include <algorithm>
#include <set>

#include "qplan/builder.h"
#include "qplan/render.h"

namespace qplan {

namespace {

using detail::ClauseView;

bool is_typed_operator(const std::string& name) {
  static const std::set<std::string> ops = {"==", "!=", "<", "<=", ">", ">=", "+", "-", "*", "/"};
  return ops.count(name) > 0;
}

bool is_literal_true(const Expr& expr) {
  if (expr.kind != Expr::Kind::Literal) return false;
  const auto* b = std::get_if<bool>(&expr.value);
  return b != nullptr && *b;
}

/// Resolves sources, expands association joins and casts parameters of one query.
class Preparer {
 public:
  Preparer(const Query& input, Operation operation, const SchemaResolver& resolver, size_t base)
      : input_(input), query_(input), operation_(operation), resolver_(resolver), base_(base) {}

  PrepareResult run() {
    if (input_.stage == Query::Stage::Normalized) {
      throw QueryError(ErrorKind::InvalidQuery, "query has already been normalized",
                       render_query(input_));
    }
    if (is_bulk_operation(operation_) && input_.from.kind == Source::Kind::Subquery) {
      throw QueryError(ErrorKind::SubqueryNotAllowedInBulkFrom,
                       std::string("`") + operation_name(operation_) +
                           "` does not allow subqueries in `from`",
                       render_query(input_));
    }
    resolve_sources();
    detail::rebuild_sources(query_);

    std::vector<Value> params;
    detail::walk_canonical(
        query_, operation_,
        [&](Source& source) { attach_subquery_params(source, params); },
        [&](ClauseView& clause) { cast_clause(clause, params); });
    detail::rebuild_sources(query_);
    validate_preloads();

    PrepareResult result;
    result.cache_key = detail::build_cache_key(query_, operation_, params.size(), resolver_);
    query_.stage = Query::Stage::Prepared;
    result.query = std::move(query_);
    result.params = std::move(params);
    return result;
  }

 private:
  // ---- sources ----

  void resolve_sources() {
    size_t max_ix = 0;
    std::set<size_t> seen;
    for (const auto& join : query_.joins) {
      if (join.ix == 0 || !seen.insert(join.ix).second) {
        throw QueryError(ErrorKind::InvalidBinding,
                         "binding `&" + std::to_string(join.ix) + "` is bound more than once",
                         render_query(input_));
      }
      max_ix = std::max(max_ix, join.ix);
    }
    next_free_ = max_ix + 1;
    bound_.assign(max_ix + 1, false);

    size_t consumed = base_ + detail::params_before_from(query_, operation_);
    query_.from = resolve_source(query_.from, consumed);
    bind(0, query_.from);

    std::vector<JoinExpr> joins;
    joins.reserve(query_.joins.size());
    for (auto& join : query_.joins) {
      if (join.assoc) {
        expand_assoc(join, joins);
      } else {
        join.source = resolve_source(join.source, consumed);
        bind(join.ix, join.source);
        joins.push_back(std::move(join));
      }
      consumed += joins.back().on.params.size();
    }
    query_.joins = std::move(joins);
  }

  void bind(size_t ix, const Source& source) {
    if (ix >= bound_.size()) bound_.resize(ix + 1, false);
    bound_[ix] = true;
    if (ix >= arena_.size()) arena_.resize(ix + 1);
    arena_[ix] = source;
  }

  Source schema_source(const std::string& schema) const {
    auto table = resolver_.source(schema);
    if (!table) {
      throw QueryError(ErrorKind::UnknownSchema, "schema `" + schema + "` is not known",
                       render_query(input_));
    }
    Source out = build::schema(schema);
    out.table = *table;
    return out;
  }

  Source resolve_source(const Source& source, size_t& consumed) const {
    switch (source.kind) {
      case Source::Kind::Schema:
        return schema_source(source.schema);
      case Source::Kind::Table:
        return source;
      case Source::Kind::Subquery: {
        if (!source.subquery) {
          throw QueryError(ErrorKind::InvalidQuery, "subquery source has no query",
                           render_query(input_));
        }
        detail::SubqueryCompileResult compiled =
            detail::compile_subquery(*source.subquery, consumed, resolver_);
        if (compiled.error) throw SubQueryError(compiled.error, render_query(input_));
        consumed += compiled.subquery->params.size();
        Source out = source;
        out.subquery = std::make_shared<const Subquery>(std::move(*compiled.subquery));
        return out;
      }
    }
    return source;
  }

  std::string assoc_owner(size_t parent) const {
    if (parent >= bound_.size() || !bound_[parent]) {
      throw QueryError(ErrorKind::InvalidBinding,
                       "association join refers to binding `&" + std::to_string(parent) +
                           "` which is not bound before it",
                       render_query(input_));
    }
    const Source& source = arena_[parent];
    switch (source.kind) {
      case Source::Kind::Schema:
        return source.schema;
      case Source::Kind::Table:
        throw QueryError(ErrorKind::InvalidQuery,
                         "cannot perform association join on schemaless source `" + source.table + "`",
                         render_query(input_));
      case Source::Kind::Subquery:
        if (source.subquery && source.subquery->shape &&
            source.subquery->shape->kind != SelectShape::Kind::Map) {
          return source.subquery->shape->schema;
        }
        break;
    }
    throw QueryError(ErrorKind::AssociationRequiresSourceSchema,
                     "can only perform association joins on subqueries that return a source with "
                     "schema in select",
                     render_query(input_));
  }

  AssociationSpec lookup_assoc(const std::string& schema, const std::string& name) const {
    auto assoc = resolver_.association(schema, name);
    if (!assoc) {
      throw QueryError(ErrorKind::UnknownAssociation,
                       "could not find association `" + name + "` on schema " + schema,
                       render_query(input_));
    }
    return *assoc;
  }

  /// Flattens `through` chains into direct hops, starting from `schema`.
  void collect_hops(const std::string& schema, const AssociationSpec& assoc,
                    std::vector<AssociationSpec>& hops, size_t depth) const {
    if (depth > 16) {
      throw QueryError(ErrorKind::InvalidQuery,
                       "association `" + assoc.name + "` on schema " + schema + " is recursive",
                       render_query(input_));
    }
    if (assoc.kind != AssociationSpec::Kind::Through) {
      hops.push_back(assoc);
      return;
    }
    std::string current = schema;
    for (const auto& name : assoc.through) {
      AssociationSpec hop = lookup_assoc(current, name);
      const size_t before = hops.size();
      collect_hops(current, hop, hops, depth + 1);
      if (hops.size() > before) current = hops.back().related;
    }
  }

  void expand_assoc(JoinExpr& join, std::vector<JoinExpr>& out) {
    const std::string owner = assoc_owner(join.assoc->binding);
    AssociationSpec assoc = lookup_assoc(owner, join.assoc->name);
    std::vector<AssociationSpec> hops;
    collect_hops(owner, assoc, hops, 0);
    if (hops.empty()) {
      throw QueryError(ErrorKind::UnknownAssociation,
                       "association `" + assoc.name + "` on schema " + owner + " has no hops",
                       render_query(input_));
    }

    size_t parent_ix = join.assoc->binding;
    for (size_t i = 0; i < hops.size(); ++i) {
      const AssociationSpec& hop = hops[i];
      const bool last = i + 1 == hops.size();
      JoinExpr expanded;
      expanded.qual = join.qual;
      expanded.ix = last ? join.ix : next_free_++;
      expanded.source = schema_source(hop.related);
      Expr on = build::eq(build::field(expanded.ix, hop.related_key),
                          build::field(parent_ix, hop.owner_key));
      if (last) {
        if (!is_literal_true(join.on.expr)) on = build::and_(std::move(on), join.on.expr);
        expanded.on.op = join.on.op;
        expanded.on.params = join.on.params;
      }
      expanded.on.expr = std::move(on);
      bind(expanded.ix, expanded.source);
      parent_ix = expanded.ix;
      out.push_back(std::move(expanded));
    }
  }

  void attach_subquery_params(Source& source, std::vector<Value>& params) const {
    if (source.kind != Source::Kind::Subquery || !source.subquery) return;
    const size_t offset = base_ + params.size();
    if (source.subquery->param_offset != offset) {
      source.subquery = std::make_shared<const Subquery>(detail::attach_subquery(*source.subquery, offset));
    }
    params.insert(params.end(), source.subquery->params.begin(), source.subquery->params.end());
  }

  // ---- casting ----

  void check_fields(const Expr& expr, const char* clause) const {
    switch (expr.kind) {
      case Expr::Kind::Field:
        detail::resolve_field(query_, expr.index, expr.name, clause, resolver_);
        break;
      case Expr::Kind::Binding: {
        const Source& source = detail::source_at(query_, expr.index);
        if (source.kind == Source::Kind::Schema && source.schema.empty()) {
          throw QueryError(ErrorKind::InvalidBinding,
                           "could not find binding `&" + std::to_string(expr.index) + "`",
                           render_query(query_));
        }
        break;
      }
      case Expr::Kind::Take:
        for (const auto& name : expr.fields) {
          detail::resolve_field(query_, expr.index, name, clause, resolver_);
        }
        break;
      default:
        break;
    }
    for (const auto& arg : expr.args) check_fields(arg, clause);
    for (const auto& entry : expr.entries) {
      check_fields(entry.key, clause);
      check_fields(entry.value, clause);
    }
  }

  void check_literal(const Value& value, const FieldType& type, const char* clause) const {
    if (std::holds_alternative<std::monostate>(value)) return;
    if (!detail::cast_value(value, type, resolver_, query_)) {
      throw CastError(value, type, clause, render_query(query_));
    }
  }

  /// Types parameters compared with (or combined with) a field, and checks
  /// literals in the same position.
  void infer(const Expr& expr, std::vector<std::optional<FieldType>>& types, const char* clause) const {
    if (expr.kind == Expr::Kind::Call && expr.args.size() == 2 && is_typed_operator(expr.name)) {
      for (size_t side = 0; side < 2; ++side) {
        const Expr& field = expr.args[side];
        const Expr& other = expr.args[1 - side];
        if (field.kind != Expr::Kind::Field) continue;
        FieldType type = detail::resolve_field(query_, field.index, field.name, clause, resolver_);
        if (other.kind == Expr::Kind::Param && other.index < types.size() && !types[other.index]) {
          types[other.index] = type;
        } else if (other.kind == Expr::Kind::Literal) {
          check_literal(other.value, type, clause);
        }
      }
    }
    for (const auto& arg : expr.args) infer(arg, types, clause);
    for (const auto& entry : expr.entries) infer(entry.value, types, clause);
  }

  FieldType update_field_type(const std::string& field) const {
    const Source& from = detail::source_at(query_, 0);
    if (from.kind != Source::Kind::Schema) return FieldType{};
    return detail::resolve_field(query_, 0, field, "update", resolver_);
  }

  void cast_clause(ClauseView& clause, std::vector<Value>& params) const {
    std::vector<std::optional<FieldType>> types(clause.params->size());
    for (size_t i = 0; i < clause.exprs.size(); ++i) {
      const Expr& expr = *clause.exprs[i];
      check_fields(expr, clause.name);
      if (clause.kind == ClauseView::Kind::Update) {
        FieldType type = update_field_type(clause.update_fields[i]);
        if (expr.kind == Expr::Kind::Param && expr.index < types.size()) {
          types[expr.index] = type;
        } else if (expr.kind == Expr::Kind::Literal) {
          check_literal(expr.value, type, clause.name);
        }
      }
      if ((clause.kind == ClauseView::Kind::Limit || clause.kind == ClauseView::Kind::Offset) &&
          expr.kind == Expr::Kind::Param && expr.index < types.size()) {
        types[expr.index] = build::type(FieldType::Kind::Integer);
      }
      infer(expr, types, clause.name);
    }

    for (size_t i = 0; i < clause.params->size(); ++i) {
      ParamSlot& slot = (*clause.params)[i];
      FieldType type = slot.type ? *slot.type : (types[i] ? *types[i] : FieldType{});
      std::optional<Value> cast = detail::cast_value(slot.value, type, resolver_, query_);
      if (!cast) throw CastError(slot.value, type, clause.name, render_query(query_));
      slot.type = type;
      params.push_back(std::move(*cast));
    }
  }

  void validate_preloads() const {
    for (const auto& preload : query_.preloads) {
      const size_t ix = preload.binding.value_or(0);
      const Source& source = detail::source_at(query_, ix);
      if (source.kind == Source::Kind::Schema && source.schema.empty()) {
        throw QueryError(ErrorKind::InvalidBinding,
                         "could not find binding `&" + std::to_string(ix) + "` for preload",
                         render_query(query_));
      }
      // Preloading through a join checks the association on the root schema.
      auto schema = detail::binding_schema(query_, 0);
      if (!schema) {
        throw QueryError(ErrorKind::InvalidQuery,
                         "cannot preload `" + preload.assoc + "` from a source without schema",
                         render_query(query_));
      }
      lookup_assoc(*schema, preload.assoc);
    }
  }

  const Query& input_;
  Query query_;
  Operation operation_;
  const SchemaResolver& resolver_;
  size_t base_;
  size_t next_free_ = 1;
  std::vector<bool> bound_;
  std::vector<Source> arena_;
};

}  // namespace

PrepareResult prepare(const Query& query,
                      Operation operation,
                      const SchemaResolver& resolver,
                      size_t param_base) {
  Preparer preparer(query, operation, resolver, param_base);
  return preparer.run();
}

}  // namespace qplan
