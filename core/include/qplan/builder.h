#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "qplan/ast.h"

/// Minimal constructors for query trees. Every function returns a new value;
/// inputs are never mutated. Clause helpers number pinned values in
/// first-occurrence order and move them into the clause's parameter slots.
namespace qplan::build {

Expr binding(size_t ix);
Expr field(size_t ix, std::string name);
Expr literal(Value value);
Expr literal(const char* value);
Expr literal(bool value);
Expr literal(int value);
Expr literal(int64_t value);
Expr literal(double value);
Expr nil();
Expr atom(std::string name);

Expr pin(Value value);
Expr pin(const char* value);
Expr pin(bool value);
Expr pin(int value);
Expr pin(int64_t value);
Expr pin(double value);
/// Pinned value with an explicit type annotation.
Expr pin(Value value, FieldType type);

Expr call(std::string name, std::vector<Expr> args);
Expr eq(Expr lhs, Expr rhs);
Expr and_(Expr lhs, Expr rhs);
Expr fragment(std::string text, std::vector<Expr> args);
Expr list(std::vector<Expr> items);
/// Map literal with arbitrary keys.
Expr map(std::vector<MapEntry> entries);
/// Map literal with atom keys.
Expr map_of(std::vector<std::pair<std::string, Expr>> entries);
Expr struct_of(std::string schema, std::vector<std::pair<std::string, Expr>> entries);
Expr map_update(Expr base, std::vector<std::pair<std::string, Expr>> entries);
Expr merge(Expr lhs, Expr rhs);
/// `[:a, :b]` field subset of a binding.
Expr take(size_t ix, std::vector<std::string> fields);

FieldType type(FieldType::Kind kind);

Source schema(std::string name);
Source table(std::string name);
Source subquery(const Query& query);

/// Numbers the pinned values of `expr` and returns the clause owning them.
QueryExpr clause(Expr expr, QueryExpr::BoolOp op = QueryExpr::BoolOp::And);

Query from(Source source);
Query where(Query query, Expr expr);
Query or_where(Query query, Expr expr);
/// Appends a join bound at the next binding index.
Query join(Query query, JoinExpr::Qual qual, Source source, Expr on);
Query join(Query query, JoinExpr::Qual qual, Source source);
Query assoc_join(Query query, JoinExpr::Qual qual, size_t parent, std::string assoc);
Query assoc_join(Query query, JoinExpr::Qual qual, size_t parent, std::string assoc, Expr on);
Query group_by(Query query, std::vector<Expr> exprs);
Query having(Query query, Expr expr);
Query order_by(Query query, std::vector<OrderByExpr::Term> terms);
Query limit(Query query, Expr expr);
Query offset(Query query, Expr expr);
Query update(Query query, std::vector<UpdateExpr::Op> ops);
Query preload(Query query, std::string assoc);
Query preload(Query query, std::string assoc, size_t binding);
Query select(Query query, Expr expr);

OrderByExpr::Term asc(Expr expr);
OrderByExpr::Term desc(Expr expr);
UpdateExpr::Op set(std::string field, Expr value);
UpdateExpr::Op inc(std::string field, Expr value);

}  // namespace qplan::build
