#include "qplan/builder.h"

#include <memory>

namespace qplan::build {

namespace {

void number_params(Expr& expr, std::vector<ParamSlot>& params) {
  if (expr.kind == Expr::Kind::Param) {
    ParamSlot slot;
    slot.value = std::move(expr.value);
    slot.type = std::move(expr.cast_type);
    expr.value = Value{};
    expr.cast_type.reset();
    expr.index = params.size();
    params.push_back(std::move(slot));
    return;
  }
  for (auto& arg : expr.args) number_params(arg, params);
  for (auto& entry : expr.entries) {
    number_params(entry.key, params);
    number_params(entry.value, params);
  }
}

Expr make(Expr::Kind kind) {
  Expr e;
  e.kind = kind;
  return e;
}

std::vector<MapEntry> atom_entries(std::vector<std::pair<std::string, Expr>> entries) {
  std::vector<MapEntry> out;
  out.reserve(entries.size());
  for (auto& [key, value] : entries) {
    out.push_back(MapEntry{atom(std::move(key)), std::move(value)});
  }
  return out;
}

size_t next_binding(const Query& query) {
  size_t next = 1;
  for (const auto& join : query.joins) {
    if (join.ix >= next) next = join.ix + 1;
  }
  return next;
}

}  // namespace

Expr binding(size_t ix) {
  Expr e = make(Expr::Kind::Binding);
  e.index = ix;
  return e;
}

Expr field(size_t ix, std::string name) {
  Expr e = make(Expr::Kind::Field);
  e.index = ix;
  e.name = std::move(name);
  return e;
}

Expr literal(Value value) {
  Expr e = make(Expr::Kind::Literal);
  e.value = std::move(value);
  return e;
}

Expr literal(const char* value) { return literal(Value{std::string(value)}); }

Expr literal(bool value) { return literal(Value{value}); }

Expr literal(int value) { return literal(Value{static_cast<int64_t>(value)}); }

Expr literal(int64_t value) { return literal(Value{value}); }

Expr literal(double value) { return literal(Value{value}); }

Expr nil() { return literal(Value{}); }

Expr atom(std::string name) {
  Expr e = make(Expr::Kind::Atom);
  e.name = std::move(name);
  return e;
}

Expr pin(Value value) {
  Expr e = make(Expr::Kind::Param);
  e.value = std::move(value);
  return e;
}

Expr pin(const char* value) { return pin(Value{std::string(value)}); }

Expr pin(bool value) { return pin(Value{value}); }

Expr pin(int value) { return pin(Value{static_cast<int64_t>(value)}); }

Expr pin(int64_t value) { return pin(Value{value}); }

Expr pin(double value) { return pin(Value{value}); }

Expr pin(Value value, FieldType type) {
  Expr e = pin(std::move(value));
  e.cast_type = std::move(type);
  return e;
}

Expr call(std::string name, std::vector<Expr> args) {
  Expr e = make(Expr::Kind::Call);
  e.name = std::move(name);
  e.args = std::move(args);
  return e;
}

Expr eq(Expr lhs, Expr rhs) { return call("==", {std::move(lhs), std::move(rhs)}); }

Expr and_(Expr lhs, Expr rhs) { return call("and", {std::move(lhs), std::move(rhs)}); }

Expr fragment(std::string text, std::vector<Expr> args) {
  Expr e = make(Expr::Kind::Fragment);
  e.name = std::move(text);
  e.args = std::move(args);
  return e;
}

Expr list(std::vector<Expr> items) {
  Expr e = make(Expr::Kind::List);
  e.args = std::move(items);
  return e;
}

Expr map(std::vector<MapEntry> entries) {
  Expr e = make(Expr::Kind::Map);
  e.entries = std::move(entries);
  return e;
}

Expr map_of(std::vector<std::pair<std::string, Expr>> entries) {
  return map(atom_entries(std::move(entries)));
}

Expr struct_of(std::string schema, std::vector<std::pair<std::string, Expr>> entries) {
  Expr e = make(Expr::Kind::Struct);
  e.name = std::move(schema);
  e.entries = atom_entries(std::move(entries));
  return e;
}

Expr map_update(Expr base, std::vector<std::pair<std::string, Expr>> entries) {
  Expr e = make(Expr::Kind::MapUpdate);
  e.args.push_back(std::move(base));
  e.entries = atom_entries(std::move(entries));
  return e;
}

Expr merge(Expr lhs, Expr rhs) {
  Expr e = make(Expr::Kind::Merge);
  e.args.push_back(std::move(lhs));
  e.args.push_back(std::move(rhs));
  return e;
}

Expr take(size_t ix, std::vector<std::string> fields) {
  Expr e = make(Expr::Kind::Take);
  e.index = ix;
  e.fields = std::move(fields);
  return e;
}

FieldType type(FieldType::Kind kind) {
  FieldType t;
  t.kind = kind;
  return t;
}

Source schema(std::string name) {
  Source src;
  src.kind = Source::Kind::Schema;
  src.schema = std::move(name);
  return src;
}

Source table(std::string name) {
  Source src;
  src.kind = Source::Kind::Table;
  src.table = std::move(name);
  return src;
}

Source subquery(const Query& query) {
  auto sub = std::make_shared<Subquery>();
  sub->query = std::make_shared<const Query>(query);
  Source src;
  src.kind = Source::Kind::Subquery;
  src.subquery = std::move(sub);
  return src;
}

QueryExpr clause(Expr expr, QueryExpr::BoolOp op) {
  QueryExpr out;
  out.op = op;
  out.expr = std::move(expr);
  number_params(out.expr, out.params);
  return out;
}

Query from(Source source) {
  Query query;
  query.from = std::move(source);
  return query;
}

Query where(Query query, Expr expr) {
  query.wheres.push_back(clause(std::move(expr)));
  return query;
}

Query or_where(Query query, Expr expr) {
  query.wheres.push_back(clause(std::move(expr), QueryExpr::BoolOp::Or));
  return query;
}

Query join(Query query, JoinExpr::Qual qual, Source source, Expr on) {
  JoinExpr join;
  join.qual = qual;
  join.ix = next_binding(query);
  join.source = std::move(source);
  join.on = clause(std::move(on));
  query.joins.push_back(std::move(join));
  return query;
}

Query join(Query query, JoinExpr::Qual qual, Source source) {
  return join(std::move(query), qual, std::move(source), literal(Value{true}));
}

Query assoc_join(Query query, JoinExpr::Qual qual, size_t parent, std::string assoc) {
  return assoc_join(std::move(query), qual, parent, std::move(assoc), literal(Value{true}));
}

Query assoc_join(Query query, JoinExpr::Qual qual, size_t parent, std::string assoc, Expr on) {
  JoinExpr join;
  join.qual = qual;
  join.ix = next_binding(query);
  join.on = clause(std::move(on));
  join.assoc = JoinExpr::Assoc{parent, std::move(assoc)};
  query.joins.push_back(std::move(join));
  return query;
}

Query group_by(Query query, std::vector<Expr> exprs) {
  query.group_bys.push_back(clause(list(std::move(exprs))));
  return query;
}

Query having(Query query, Expr expr) {
  query.havings.push_back(clause(std::move(expr)));
  return query;
}

Query order_by(Query query, std::vector<OrderByExpr::Term> terms) {
  OrderByExpr order;
  order.terms = std::move(terms);
  for (auto& term : order.terms) number_params(term.expr, order.params);
  query.order_bys.push_back(std::move(order));
  return query;
}

Query limit(Query query, Expr expr) {
  query.limit = clause(std::move(expr));
  return query;
}

Query offset(Query query, Expr expr) {
  query.offset = clause(std::move(expr));
  return query;
}

Query update(Query query, std::vector<UpdateExpr::Op> ops) {
  UpdateExpr update;
  update.ops = std::move(ops);
  for (auto& op : update.ops) number_params(op.value, update.params);
  query.updates.push_back(std::move(update));
  return query;
}

Query preload(Query query, std::string assoc) {
  query.preloads.push_back(Preload{std::move(assoc), std::nullopt});
  return query;
}

Query preload(Query query, std::string assoc, size_t binding) {
  query.preloads.push_back(Preload{std::move(assoc), binding});
  return query;
}

Query select(Query query, Expr expr) {
  QueryExpr numbered = clause(std::move(expr));
  SelectExpr select;
  select.expr = std::move(numbered.expr);
  select.params = std::move(numbered.params);
  query.select = std::move(select);
  return query;
}

OrderByExpr::Term asc(Expr expr) {
  return OrderByExpr::Term{OrderByExpr::Term::Direction::Asc, std::move(expr)};
}

OrderByExpr::Term desc(Expr expr) {
  return OrderByExpr::Term{OrderByExpr::Term::Direction::Desc, std::move(expr)};
}

UpdateExpr::Op set(std::string field, Expr value) {
  return UpdateExpr::Op{UpdateExpr::Op::Kind::Set, std::move(field), std::move(value)};
}

UpdateExpr::Op inc(std::string field, Expr value) {
  return UpdateExpr::Op{UpdateExpr::Op::Kind::Inc, std::move(field), std::move(value)};
}

}  // namespace qplan::build
