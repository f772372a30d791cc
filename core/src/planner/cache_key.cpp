#include "planner_internal.h"

#include <functional>

#include "qplan/render.h"

namespace qplan::detail {

namespace {

inline void mix_hash(size_t& h, size_t v) {
  h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
}

size_t hash_string(const std::string& s) { return std::hash<std::string>{}(s); }

/// Structural hash of a schema's storage layout; changes when a field, its
/// type or its column changes.
int64_t schema_hash(const std::string& schema, const SchemaResolver& resolver) {
  size_t h = 0;
  mix_hash(h, hash_string(schema));
  if (auto source = resolver.source(schema)) mix_hash(h, hash_string(*source));
  if (auto fields = resolver.fields(schema)) {
    for (const auto& field : *fields) {
      if (field.virtual_field) continue;
      mix_hash(h, hash_string(field.name));
      mix_hash(h, static_cast<size_t>(field.type.kind));
      mix_hash(h, hash_string(field.type.custom_name));
      mix_hash(h, hash_string(field.source));
    }
  }
  return static_cast<int64_t>(h & 0x7ffffffULL);
}

CacheKey leaf(CacheKey::Kind kind, std::string text) {
  CacheKey key;
  key.kind = kind;
  key.text = std::move(text);
  return key;
}

CacheKey atom(std::string text) { return leaf(CacheKey::Kind::Atom, std::move(text)); }

CacheKey text(std::string value) { return leaf(CacheKey::Kind::Text, std::move(value)); }

CacheKey integer(int64_t value) {
  CacheKey key;
  key.kind = CacheKey::Kind::Integer;
  key.integer = value;
  return key;
}

CacheKey node(CacheKey::Kind kind, std::vector<CacheKey> items) {
  CacheKey key;
  key.kind = kind;
  key.items = std::move(items);
  return key;
}

CacheKey tuple(std::vector<CacheKey> items) { return node(CacheKey::Kind::Tuple, std::move(items)); }

CacheKey list(std::vector<CacheKey> items) { return node(CacheKey::Kind::List, std::move(items)); }

CacheKey source_key(const Source& source, const SchemaResolver& resolver) {
  switch (source.kind) {
    case Source::Kind::Schema:
      return tuple({text(source.table), leaf(CacheKey::Kind::Name, source.schema),
                    integer(schema_hash(source.schema, resolver))});
    case Source::Kind::Table:
      return tuple({text(source.table), leaf(CacheKey::Kind::Name, ""), integer(0)});
    case Source::Kind::Subquery:
      if (source.subquery) return source.subquery->cache_key;
      break;
  }
  return atom("nil");
}

const char* qual_name(JoinExpr::Qual qual) {
  switch (qual) {
    case JoinExpr::Qual::Inner:
      return "inner";
    case JoinExpr::Qual::Left:
      return "left";
    case JoinExpr::Qual::Right:
      return "right";
    case JoinExpr::Qual::Full:
      return "full";
    case JoinExpr::Qual::Cross:
      return "cross";
  }
  return "inner";
}

const char* update_op_name(UpdateExpr::Op::Kind kind) {
  switch (kind) {
    case UpdateExpr::Op::Kind::Set:
      return "set";
    case UpdateExpr::Op::Kind::Inc:
      return "inc";
    case UpdateExpr::Op::Kind::Push:
      return "push";
    case UpdateExpr::Op::Kind::Pull:
      return "pull";
  }
  return "set";
}

CacheKey bool_exprs(const char* name, const std::vector<QueryExpr>& clauses) {
  std::vector<CacheKey> items;
  for (const auto& clause : clauses) {
    items.push_back(tuple({atom(clause.op == QueryExpr::BoolOp::Or ? "or" : "and"),
                           text(render_expr(clause.expr))}));
  }
  return tuple({atom(name), list(std::move(items))});
}

}  // namespace

CacheKey build_cache_key(const Query& query,
                         Operation operation,
                         size_t param_count,
                         const SchemaResolver& resolver) {
  std::vector<CacheKey> items;
  items.push_back(atom(operation_name(operation)));
  items.push_back(integer(static_cast<int64_t>(param_count)));

  if (query.select) {
    items.push_back(tuple({atom("select"), text(render_expr(query.select->expr))}));
  }
  if (!query.joins.empty()) {
    std::vector<CacheKey> joins;
    for (const auto& join : query.joins) {
      joins.push_back(tuple({atom(qual_name(join.qual)), source_key(join.source, resolver),
                             text(render_expr(join.on.expr))}));
    }
    items.push_back(tuple({atom("join"), list(std::move(joins))}));
  }
  if (!query.wheres.empty()) items.push_back(bool_exprs("where", query.wheres));
  if (!query.group_bys.empty()) items.push_back(bool_exprs("group_by", query.group_bys));
  if (!query.havings.empty()) items.push_back(bool_exprs("having", query.havings));
  if (!query.order_bys.empty()) {
    std::vector<CacheKey> orders;
    for (const auto& order : query.order_bys) {
      for (const auto& term : order.terms) {
        const char* dir = term.direction == OrderByExpr::Term::Direction::Desc ? "desc" : "asc";
        orders.push_back(tuple({atom(dir), text(render_expr(term.expr))}));
      }
    }
    items.push_back(tuple({atom("order_by"), list(std::move(orders))}));
  }
  if (query.limit) items.push_back(tuple({atom("limit"), text(render_expr(query.limit->expr))}));
  if (query.offset) {
    items.push_back(tuple({atom("offset"), text(render_expr(query.offset->expr))}));
  }
  if (!query.updates.empty()) {
    std::vector<CacheKey> ops;
    for (const auto& update : query.updates) {
      for (const auto& op : update.ops) {
        ops.push_back(tuple({atom(update_op_name(op.kind)), atom(op.field), text(render_expr(op.value))}));
      }
    }
    items.push_back(tuple({atom("update"), list(std::move(ops))}));
  }
  items.push_back(source_key(query.from, resolver));
  return list(std::move(items));
}

}  // namespace qplan::detail
