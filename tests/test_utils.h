#pragma once

#include <memory>
#include <string>

#include "qplan/ast.h"
#include "qplan/errors.h"
#include "qplan/planner.h"
#include "qplan/schema.h"

/// Post/Comment catalog shared by the planner tests.
/// Post.id is a Permalink (leading-integer cast) and Post.title is stored in `post_title`.
qplan::Catalog make_blog_catalog();

/// Prepares, defaults the select and normalizes `query` as an `all` query.
qplan::Query plan_all(const qplan::Query& query, const qplan::SchemaResolver& resolver);

/// Runs `fn` and returns a copy of the QueryError it throws, or null.
template <typename Fn>
std::shared_ptr<const qplan::QueryError> capture_error(Fn&& fn) {
  try {
    fn();
  } catch (const qplan::QueryError& err) {
    return err.clone();
  }
  return nullptr;
}

/// Positional rendering of the select expression of the `from` subquery.
std::string subquery_select(const qplan::Query& prepared);
