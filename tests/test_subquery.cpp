#include "test_harness.h"

#include <vector>

#include "qplan/builder.h"
#include "qplan/render.h"
#include "test_utils.h"

using namespace qplan;

namespace {

Query post_subquery(const Query& inner) { return build::from(build::subquery(inner)); }

void test_implicit_subquery_select_expands_schema_fields() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::from(build::schema("Post"));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query), "%Post{id: &0.id(), title: &0.title(), text: &0.text()}",
            "whole source select is expanded into a struct");
  const auto& shape = prepared.query.from.subquery->shape;
  expect_true(shape.has_value(), "subquery shape is cached");
  if (!shape) return;
  expect_true(shape->kind == SelectShape::Kind::Row, "whole source keeps the row shape");
  expect_eq(shape->schema, "Post", "row shape carries its schema");
  expect_eq(shape->fields.size(), 3, "row shape lists non-virtual fields");
}

void test_subquery_field_select_becomes_map() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Post")), build::field(0, "text"));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query), "%{text: &0.text()}", "field select becomes a map");
  const auto& shape = *prepared.query.from.subquery->shape;
  expect_true(shape.kind == SelectShape::Kind::Map, "field select has map shape");
  expect_true(shape.fields[0].type.kind == FieldType::Kind::String, "field type is inferred");
}

void test_subquery_map_select_is_kept() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Post")),
                              build::map_of({{"text", build::field(0, "text")}}));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query), "%{text: &0.text()}", "map select is kept as is");
}

void test_subquery_struct_select_exposes_schema_fields() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Post")),
                              build::struct_of("Post", {{"text", build::field(0, "text")}}));
  Query outer = build::where(post_subquery(inner), build::eq(build::field(0, "id"), build::pin("1-x")));
  PrepareResult prepared = prepare(outer, Operation::All, catalog);
  expect_eq(subquery_select(prepared.query), "%Post{text: &0.text()}", "struct literal is kept");
  const auto& shape = *prepared.query.from.subquery->shape;
  expect_true(shape.kind == SelectShape::Kind::Struct, "struct literal has struct shape");
  expect_eq(shape.fields.size(), 3, "struct literal exposes the whole schema");
  if (shape.fields.size() != 3) return;
  expect_eq(shape.fields[0].name, "id", "primary key comes first");
  expect_eq(shape.fields[1].name, "title", "declared fields follow");
  expect_eq(shape.fields[2].name, "text", "written entry keeps its place");
  expect_true(shape.fields[0].type.kind == FieldType::Kind::Custom, "unwritten field keeps its declared type");
  expect_eq(prepared.params.size(), 1, "outer reference to an unwritten field");
  if (prepared.params.empty()) return;
  expect_true(std::get<int64_t>(prepared.params[0]) == 1, "unwritten field drives casting");
}

void test_subquery_map_update_overrides_field() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Post")),
                              build::map_update(build::binding(0), {{"text", build::field(0, "title")}}));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query),
            "%Post{id: &0.id(), title: &0.title(), text: &0.title()}",
            "map update replaces one entry of the expanded row");
  const auto& shape = *prepared.query.from.subquery->shape;
  expect_true(shape.kind == SelectShape::Kind::Struct, "map update keeps a schema");
  expect_eq(shape.schema, "Post", "map update schema");
}

void test_subquery_merge_with_map_overrides_field() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(
      build::from(build::schema("Post")),
      build::merge(build::binding(0), build::map_of({{"text", build::field(0, "title")}})));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query),
            "%Post{id: &0.id(), title: &0.title(), text: &0.title()}",
            "merge with a map overrides the row entry");
}

void test_subquery_merge_of_empty_maps() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Post")),
                              build::merge(build::map_of({}), build::map_of({})));
  PrepareResult prepared = prepare(post_subquery(inner), Operation::All, catalog);
  expect_eq(subquery_select(prepared.query), "%{}", "merging empty maps yields an empty map");
}

void test_subquery_params_are_flattened_in_canonical_order() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("hello")));
  inner = build::order_by(inner, {build::asc(build::eq(build::field(0, "text"), build::pin("world")))});
  Query outer = post_subquery(inner);
  outer = build::where(outer, build::eq(build::field(0, "text"), build::pin("last")));
  outer = build::select(outer, build::list({build::field(0, "title"), build::pin("first")}));

  PrepareResult prepared = prepare(outer, Operation::All, catalog);
  expect_eq(prepared.params.size(), 4, "all params are collected");
  if (prepared.params.size() != 4) return;
  expect_eq(std::get<std::string>(prepared.params[0]), "first", "select param first");
  expect_eq(std::get<std::string>(prepared.params[1]), "hello", "inner where param");
  expect_eq(std::get<std::string>(prepared.params[2]), "world", "inner order_by param");
  expect_eq(std::get<std::string>(prepared.params[3]), "last", "outer where param last");
  expect_eq(prepared.query.from.subquery->param_offset, 1, "subquery attached after the select");

  Query normalized = normalize(prepared.query, Operation::All, catalog);
  const Query& inner_normalized = *normalized.from.subquery->query;
  expect_eq(render_expr(inner_normalized.wheres[0].expr), "&0.title() == ^1", "inner where renumbered");
  expect_eq(render_expr(inner_normalized.order_bys[0].terms[0].expr), "&0.text() == ^2",
            "inner order_by renumbered");
  expect_eq(render_expr(normalized.wheres[0].expr), "&0.text() == ^3", "outer where renumbered");
  expect_eq(render_expr(normalized.select->expr), "[&0.title(), ^0]", "select param renumbered");
  expect_true(normalized.wheres[0].params.empty(), "normalized clauses no longer own params");
}

void test_joined_subquery_params_are_flattened_in_canonical_order() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("hello")));
  inner = build::order_by(inner, {build::asc(build::eq(build::field(0, "text"), build::pin("world")))});
  Query outer = build::join(build::from(build::schema("Comment")), JoinExpr::Qual::Inner,
                            build::subquery(inner), build::eq(build::field(1, "text"), build::pin("last")));
  outer = build::select(outer, build::list({build::field(1, "title"), build::pin("first")}));

  PrepareResult prepared = prepare(outer, Operation::All, catalog);
  expect_eq(prepared.params.size(), 4, "all params are collected");
  if (prepared.params.size() != 4) return;
  expect_eq(std::get<std::string>(prepared.params[0]), "first", "select param first");
  expect_eq(std::get<std::string>(prepared.params[1]), "hello", "joined subquery where param");
  expect_eq(std::get<std::string>(prepared.params[2]), "world", "joined subquery order_by param");
  expect_eq(std::get<std::string>(prepared.params[3]), "last", "join on param last");
  expect_eq(prepared.query.joins[0].source.subquery->param_offset, 1, "joined subquery follows the select");

  Query normalized = normalize(prepared.query, Operation::All, catalog);
  const Query& joined = *normalized.joins[0].source.subquery->query;
  expect_eq(render_expr(joined.wheres[0].expr), "&0.title() == ^1", "joined where renumbered");
  expect_eq(render_expr(joined.order_bys[0].terms[0].expr), "&0.text() == ^2", "joined order_by renumbered");
  expect_eq(render_expr(normalized.joins[0].on.expr), "&1.text() == ^3", "join on renumbered");
  expect_eq(render_expr(normalized.select->expr), "[&1.title(), ^0]", "select param renumbered");
}

void test_subquery_field_types_drive_casting() {
  Catalog catalog = make_blog_catalog();
  Query outer = post_subquery(build::from(build::schema("Post")));
  outer = build::where(outer, build::eq(build::field(0, "id"), build::pin("1-hello-world")));
  PrepareResult prepared = prepare(outer, Operation::All, catalog);
  expect_eq(prepared.params.size(), 1, "one param");
  if (prepared.params.empty()) return;
  expect_true(std::holds_alternative<int64_t>(prepared.params[0]), "permalink is cast to an integer");
  expect_true(std::get<int64_t>(prepared.params[0]) == 1, "permalink keeps the leading integer");
}

void test_unknown_field_in_subquery_is_rejected() {
  Catalog catalog = make_blog_catalog();
  Query outer = build::select(post_subquery(build::select(build::from(build::schema("Post")),
                                                          build::field(0, "text"))),
                              build::field(0, "title"));
  auto err = capture_error([&] { prepare(outer, Operation::All, catalog); });
  expect_true(err != nullptr, "unknown subquery field fails");
  if (!err) return;
  expect_true(err->kind() == ErrorKind::UnknownFieldInSubquery, "unknown subquery field kind");
  expect_eq(err->reason(), "field `title` does not exist in subquery", "unknown subquery field reason");
}

void test_cast_error_inside_subquery_is_wrapped() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin(1)));
  auto err = capture_error([&] { prepare(post_subquery(inner), Operation::All, catalog); });
  expect_true(err != nullptr, "subquery cast failure is raised");
  if (!err) return;
  expect_true(err->kind() == ErrorKind::SubQueryError, "failure is wrapped at the boundary");
  const auto* wrapped = dynamic_cast<const SubQueryError*>(err.get());
  expect_true(wrapped != nullptr, "wrapper keeps its dynamic type");
  if (!wrapped) return;
  expect_true(wrapped->inner().kind() == ErrorKind::CastError, "inner error is the cast error");
  expect_eq(wrapped->inner().reason(), "value `1` in `where` cannot be cast to type :string",
            "cast reason");
  expect_true(std::string(err->what()).find("the following exception happened while compiling a subquery.") == 0,
              "wrapper message prefix");
  expect_true(std::string(err->what()).find("The subquery originated from the following query:") !=
                  std::string::npos,
              "wrapper message names the outer query");
}

void test_nested_subquery_errors_wrap_once_per_boundary() {
  Catalog catalog = make_blog_catalog();
  Query innermost = build::where(build::from(build::schema("Post")),
                                 build::eq(build::field(0, "title"), build::pin(1)));
  Query middle = post_subquery(innermost);
  auto err = capture_error([&] { prepare(post_subquery(middle), Operation::All, catalog); });
  const auto* wrapped = dynamic_cast<const SubQueryError*>(err.get());
  expect_true(wrapped != nullptr, "outer boundary wraps");
  if (!wrapped) return;
  expect_true(wrapped->inner().kind() == ErrorKind::SubQueryError, "middle boundary wraps once");
  expect_true(wrapped->root_cause().kind() == ErrorKind::CastError, "root cause is the cast error");
}

void test_update_in_subquery_is_rejected() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::update(build::from(build::schema("Post")),
                              {build::set("title", build::pin("x"))});
  auto err = capture_error([&] { prepare(post_subquery(inner), Operation::All, catalog); });
  const auto* wrapped = dynamic_cast<const SubQueryError*>(err.get());
  expect_true(wrapped != nullptr, "update in subquery fails at the boundary");
  if (!wrapped) return;
  expect_true(wrapped->inner().kind() == ErrorKind::IllegalUpdateInSubquery, "update kind");
  expect_eq(wrapped->inner().reason(), "`all` does not allow `update` expressions", "update reason");
}

void test_subquery_is_prepared_before_update_check() {
  Catalog catalog = make_blog_catalog();
  Query nested = build::where(build::from(build::schema("Post")),
                              build::eq(build::field(0, "title"), build::pin(1)));
  Query inner = build::update(build::from(build::subquery(nested)), {build::set("title", build::pin("x"))});
  auto err = capture_error([&] { prepare(post_subquery(inner), Operation::All, catalog); });
  const auto* wrapped = dynamic_cast<const SubQueryError*>(err.get());
  expect_true(wrapped != nullptr, "failure is wrapped at the outer boundary");
  if (!wrapped) return;
  expect_true(wrapped->inner().kind() == ErrorKind::SubQueryError, "nested subquery fails first");
  expect_true(wrapped->root_cause().kind() == ErrorKind::CastError, "nested cast error is the root cause");
}

void test_preload_in_subquery_is_rejected() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::preload(build::from(build::schema("Post")), "comments");
  auto err = capture_error([&] { prepare(post_subquery(inner), Operation::All, catalog); });
  const auto* wrapped = dynamic_cast<const SubQueryError*>(err.get());
  expect_true(wrapped != nullptr, "preload in subquery fails at the boundary");
  if (!wrapped) return;
  expect_true(wrapped->inner().kind() == ErrorKind::IllegalPreloadInSubquery, "preload kind");
  expect_eq(wrapped->inner().reason(), "cannot preload associations in subquery", "preload reason");
}

void test_bulk_operations_reject_subquery_from() {
  Catalog catalog = make_blog_catalog();
  Query outer = post_subquery(build::from(build::schema("Post")));
  outer = build::update(outer, {build::set("title", build::pin("x"))});
  auto err = capture_error([&] { prepare(outer, Operation::UpdateAll, catalog); });
  expect_true(err != nullptr, "update_all over a subquery fails");
  if (!err) return;
  expect_true(err->kind() == ErrorKind::SubqueryNotAllowedInBulkFrom, "bulk from kind");
  expect_eq(err->reason(), "`update_all` does not allow subqueries in `from`", "bulk from reason");

  auto delete_err = capture_error([&] {
    prepare(post_subquery(build::from(build::schema("Post"))), Operation::DeleteAll, catalog);
  });
  expect_true(delete_err && delete_err->kind() == ErrorKind::SubqueryNotAllowedInBulkFrom,
              "delete_all over a subquery fails");
}

void test_joined_subquery_is_allowed_in_bulk_operations() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::select(build::from(build::schema("Comment")),
                              build::map_of({{"post_id", build::field(0, "post_id")}}));
  Query outer = build::join(build::from(build::schema("Post")), JoinExpr::Qual::Inner,
                            build::subquery(inner),
                            build::eq(build::field(1, "post_id"), build::field(0, "id")));
  PrepareResult prepared = prepare(outer, Operation::DeleteAll, catalog);
  Query normalized = normalize(prepared.query, Operation::DeleteAll, catalog);
  expect_true(normalized.stage == Query::Stage::Normalized, "delete_all with joined subquery plans");
  expect_true(!normalized.select.has_value(), "bulk operations get no default select");
}

void test_compiled_subquery_is_reused() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("hello")));
  PrepareResult first = prepare(post_subquery(inner), Operation::All, catalog);
  Query reused = build::from(first.query.from);
  reused = build::select(reused, build::list({build::pin("a"), build::field(0, "id")}));
  PrepareResult second = prepare(reused, Operation::All, catalog);
  expect_eq(second.params.size(), 2, "reused subquery params are attached again");
  expect_eq(second.query.from.subquery->param_offset, 1, "reused subquery is re-attached");
  expect_eq(subquery_select(second.query), subquery_select(first.query), "shape is not recompiled");
}

void test_normalized_subquery_is_renumbered_when_reattached() {
  Catalog catalog = make_blog_catalog();
  Query inner = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "title"), build::pin("hello")));
  Query first = plan_all(post_subquery(inner), catalog);
  expect_eq(render_expr(first.from.subquery->query->wheres[0].expr), "&0.title() == ^0",
            "first attachment starts at zero");

  Query reused = build::from(first.from);
  reused = build::select(reused, build::list({build::pin("a"), build::field(0, "id")}));
  PrepareResult prepared = prepare(reused, Operation::All, catalog);
  expect_eq(prepared.params.size(), 2, "select param and subquery param");
  if (prepared.params.size() != 2) return;
  expect_eq(std::get<std::string>(prepared.params[0]), "a", "select param first");
  expect_eq(std::get<std::string>(prepared.params[1]), "hello", "subquery param second");

  Query normalized = normalize(prepared.query, Operation::All, catalog);
  expect_eq(normalized.from.subquery->param_offset, 1, "offset follows the select");
  expect_eq(render_expr(normalized.from.subquery->query->wheres[0].expr), "&0.title() == ^1",
            "inner placeholder follows the new offset");
  expect_eq(render_expr(normalized.select->expr), "[^0, &0.id()]", "outer select keeps ^0");
}

}  // namespace

void register_subquery_tests(std::vector<TestCase>& tests) {
  tests.push_back({"implicit_subquery_select_expands_schema_fields",
                   test_implicit_subquery_select_expands_schema_fields});
  tests.push_back({"subquery_field_select_becomes_map", test_subquery_field_select_becomes_map});
  tests.push_back({"subquery_map_select_is_kept", test_subquery_map_select_is_kept});
  tests.push_back({"subquery_struct_select_exposes_schema_fields",
                   test_subquery_struct_select_exposes_schema_fields});
  tests.push_back({"subquery_map_update_overrides_field", test_subquery_map_update_overrides_field});
  tests.push_back({"subquery_merge_with_map_overrides_field",
                   test_subquery_merge_with_map_overrides_field});
  tests.push_back({"subquery_merge_of_empty_maps", test_subquery_merge_of_empty_maps});
  tests.push_back({"subquery_params_are_flattened_in_canonical_order",
                   test_subquery_params_are_flattened_in_canonical_order});
  tests.push_back({"joined_subquery_params_are_flattened_in_canonical_order",
                   test_joined_subquery_params_are_flattened_in_canonical_order});
  tests.push_back({"subquery_field_types_drive_casting", test_subquery_field_types_drive_casting});
  tests.push_back({"unknown_field_in_subquery_is_rejected", test_unknown_field_in_subquery_is_rejected});
  tests.push_back({"cast_error_inside_subquery_is_wrapped", test_cast_error_inside_subquery_is_wrapped});
  tests.push_back({"nested_subquery_errors_wrap_once_per_boundary",
                   test_nested_subquery_errors_wrap_once_per_boundary});
  tests.push_back({"update_in_subquery_is_rejected", test_update_in_subquery_is_rejected});
  tests.push_back({"subquery_is_prepared_before_update_check", test_subquery_is_prepared_before_update_check});
  tests.push_back({"preload_in_subquery_is_rejected", test_preload_in_subquery_is_rejected});
  tests.push_back({"bulk_operations_reject_subquery_from", test_bulk_operations_reject_subquery_from});
  tests.push_back({"joined_subquery_is_allowed_in_bulk_operations",
                   test_joined_subquery_is_allowed_in_bulk_operations});
  tests.push_back({"compiled_subquery_is_reused", test_compiled_subquery_is_reused});
  tests.push_back({"normalized_subquery_is_renumbered_when_reattached",
                   test_normalized_subquery_is_renumbered_when_reattached});
}
