#include "test_harness.h"

#include <vector>

#include "qplan/builder.h"
#include "qplan/render.h"
#include "qplan/schema.h"

using namespace qplan;

namespace {

void test_render_query_inspection_form() {
  Query query = build::join(build::from(build::schema("Post")), JoinExpr::Qual::Inner,
                            build::schema("Comment"),
                            build::eq(build::field(1, "post_id"), build::field(0, "id")));
  query = build::where(query, build::eq(build::field(0, "title"), build::pin("hello")));
  query = build::select(query, build::binding(0));
  expect_eq(render_query(query),
            "from p in Post, join: c in Comment, on: c.post_id == p.id, "
            "where: p.title == ^\"hello\", select: p",
            "query renders with binding names and pinned values");
}

void test_render_query_clause_keywords() {
  Query query = build::from(build::table("tags"));
  query = build::join(query, JoinExpr::Qual::Left, build::schema("Post"));
  query = build::or_where(query, build::eq(build::field(0, "name"), build::literal("x")));
  query = build::group_by(query, {build::field(0, "name")});
  query = build::order_by(query, {build::desc(build::field(0, "name"))});
  query = build::limit(query, build::literal(10));
  query = build::preload(query, "posts");
  expect_eq(render_query(query),
            "from t in \"tags\", left_join: p in Post, or_where: t.name == \"x\", group_by: [t.name], "
            "order_by: [desc: t.name], limit: 10, preload: [:posts]",
            "clause keywords render in a fixed order");
}

void test_render_query_update_and_assoc() {
  Query query = build::assoc_join(build::from(build::schema("Post")), JoinExpr::Qual::Inner, 0, "comments");
  query = build::update(query, {build::set("title", build::pin("t")), build::inc("views", build::literal(1))});
  expect_eq(render_query(query),
            "from p in Post, join: c in assoc(p, :comments), update: [set: [title: ^\"t\"], inc: [views: 1]]",
            "association joins and updates render");
}

void test_render_query_names_duplicate_letters_by_index() {
  Query query = build::join(build::from(build::schema("Post")), JoinExpr::Qual::Inner, build::schema("Post"),
                            build::eq(build::field(1, "id"), build::field(0, "id")));
  expect_eq(render_query(query), "from p in Post, join: p1 in Post, on: p1.id == p.id",
            "second binding with the same letter gets its index");
}

void test_render_query_subquery_source() {
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("a")));
  Query outer = build::select(build::from(build::subquery(inner)), build::field(0, "title"));
  expect_eq(render_query(outer),
            "from p in subquery(from p in Post, where: p.title == ^\"a\"), select: p.title",
            "subquery source renders its inner query");
}

void test_render_expr_positional_form() {
  Expr expr = build::and_(build::eq(build::field(1, "post_id"), build::field(0, "id")),
                          build::call("!=", {build::field(0, "title"), build::nil()}));
  expect_eq(render_expr(expr), "(&1.post_id() == &0.id()) and (&0.title() != nil)",
            "nested binary operators are parenthesized");
  expect_eq(render_expr(build::call("count", {build::field(0, "id")})), "count(&0.id())", "function call");
  expect_eq(render_expr(build::fragment("lower(?)", {build::field(0, "title")})),
            "fragment(\"lower(?)\", &0.title())", "fragment");
  expect_eq(render_expr(build::take(0, {"id", "title"})), "[:id, :title]", "take on the root binding");
  expect_eq(render_expr(build::take(2, {"id"})), "struct(&2, [:id])", "take on a joined binding");
  expect_eq(render_expr(build::map_update(build::binding(0), {{"text", build::literal("x")}})),
            "%{&0 | text: \"x\"}", "map update");
  expect_eq(render_expr(build::merge(build::binding(0), build::map_of({}))), "merge(&0, %{})", "merge");
}

void test_render_values_and_types() {
  expect_eq(render_value(Value{}), "nil", "nil");
  expect_eq(render_value(Value{true}), "true", "true");
  expect_eq(render_value(Value{int64_t{-4}}), "-4", "integer");
  expect_eq(render_value(Value{2.0}), "2.0", "integral float keeps a decimal point");
  expect_eq(render_value(Value{1.5}), "1.5", "float");
  expect_eq(render_value(Value{std::string("a\"b")}), "\"a\\\"b\"", "strings are escaped");
  expect_eq(render_type(build::type(FieldType::Kind::Id)), "id", "builtin type");
  expect_eq(render_type(field_type_from_name("Permalink")), "Permalink", "custom type");
}

}  // namespace

void register_render_tests(std::vector<TestCase>& tests) {
  tests.push_back({"render_query_inspection_form", test_render_query_inspection_form});
  tests.push_back({"render_query_clause_keywords", test_render_query_clause_keywords});
  tests.push_back({"render_query_update_and_assoc", test_render_query_update_and_assoc});
  tests.push_back({"render_query_names_duplicate_letters_by_index",
                   test_render_query_names_duplicate_letters_by_index});
  tests.push_back({"render_query_subquery_source", test_render_query_subquery_source});
  tests.push_back({"render_expr_positional_form", test_render_expr_positional_form});
  tests.push_back({"render_values_and_types", test_render_values_and_types});
}
