#include "planner_internal.h"

#include "qplan/render.h"

namespace qplan::detail {

namespace {

void rebase_params(Expr& expr, size_t from, size_t to) {
  if (expr.kind == Expr::Kind::Param) {
    expr.index = expr.index - from + to;
    return;
  }
  for (auto& arg : expr.args) rebase_params(arg, from, to);
  for (auto& entry : expr.entries) {
    rebase_params(entry.key, from, to);
    rebase_params(entry.value, from, to);
  }
}

// Normalized placeholders are absolute; nested subqueries move with their parent.
void rebase_normalized(Query& query, size_t from, size_t to) {
  walk_canonical(
      query, Operation::All,
      [&](Source& source) {
        if (source.kind != Source::Kind::Subquery || !source.subquery || !source.subquery->query) return;
        Subquery nested = *source.subquery;
        Query inner = *nested.query;
        rebase_normalized(inner, from, to);
        nested.query = std::make_shared<const Query>(std::move(inner));
        nested.param_offset = nested.param_offset - from + to;
        source.subquery = std::make_shared<const Subquery>(std::move(nested));
      },
      [&](ClauseView& clause) {
        for (Expr* expr : clause.exprs) rebase_params(*expr, from, to);
      });
  rebuild_sources(query);
}

}  // namespace

Subquery attach_subquery(const Subquery& compiled, size_t param_offset) {
  Subquery attached = compiled;
  if (compiled.query && compiled.query->stage == Query::Stage::Normalized &&
      compiled.param_offset != param_offset) {
    Query inner = *compiled.query;
    rebase_normalized(inner, compiled.param_offset, param_offset);
    attached.query = std::make_shared<const Query>(std::move(inner));
  }
  attached.param_offset = param_offset;
  return attached;
}

SubqueryCompileResult compile_subquery(const Subquery& raw,
                                       size_t param_offset,
                                       const SchemaResolver& resolver) {
  SubqueryCompileResult result;
  try {
    if (!raw.query) {
      throw QueryError(ErrorKind::InvalidQuery, "subquery has no inner query", "");
    }
    // Already compiled: only the attachment offset changes.
    if (raw.shape && raw.query->stage != Query::Stage::Built) {
      result.subquery = attach_subquery(raw, param_offset);
      return result;
    }

    const Query& inner = *raw.query;
    PrepareResult prepared = prepare(inner, Operation::All, resolver, 0);
    if (!inner.updates.empty()) {
      throw QueryError(ErrorKind::IllegalUpdateInSubquery, "`all` does not allow `update` expressions",
                       render_query(inner));
    }
    if (!inner.preloads.empty()) {
      throw QueryError(ErrorKind::IllegalPreloadInSubquery, "cannot preload associations in subquery",
                       render_query(inner));
    }

    Query compiled = ensure_select(prepared.query, true);
    CompiledSelect select = compile_subquery_select(compiled, resolver);
    compiled.select->expr = std::move(select.expr);

    Subquery out;
    out.query = std::make_shared<const Query>(std::move(compiled));
    out.params = std::move(prepared.params);
    out.shape = std::move(select.shape);
    out.param_offset = param_offset;
    out.cache_key = std::move(prepared.cache_key);
    result.subquery = std::move(out);
  } catch (const QueryError& err) {
    result.error = err.clone();
  }
  return result;
}

}  // namespace qplan::detail
