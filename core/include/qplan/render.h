#pragma once

#include <string>

#include "qplan/ast.h"

namespace qplan {

/// Renders a query in inspection form, e.g.
/// `from p in Post, join: c in Comment, on: c.post_id == p.id, where: p.title == ^"hello"`.
/// Bindings are named after the first letter of their source; pinned values are
/// shown when the clause still owns them, `^...` otherwise.
std::string render_query(const Query& query);

/// Renders an expression in positional form, e.g. `&1.post_id() == &0.id()`.
/// MUST be deterministic: cache keys and golden tests rely on it.
std::string render_expr(const Expr& expr);

std::string render_value(const Value& value);
std::string render_type(const FieldType& type);
std::string render_cache_key(const CacheKey& key);

}  // namespace qplan
