#include "test_harness.h"

#include <vector>

#include "qplan/builder.h"
#include "qplan/render.h"
#include "test_utils.h"

using namespace qplan;

namespace {

Query titled(const char* title) {
  return build::where(build::from(build::schema("Post")),
                      build::eq(build::field(0, "title"), build::pin(title)));
}

void test_cache_key_layout() {
  Catalog catalog = make_blog_catalog();
  PrepareResult prepared = prepare(titled("a"), Operation::All, catalog);
  const std::string rendered = render_cache_key(prepared.cache_key);
  expect_true(rendered.find("[:all, 1, {:where, [{:and, \"&0.title() == ^0\"}]}, {\"posts\", Post, ") == 0,
              "cache key lists operation, param count, clauses and source: " + rendered);
  expect_true(prepared.cache_key.items.back().kind == CacheKey::Kind::Tuple, "source key is a tuple");
}

void test_cache_key_ignores_param_values() {
  Catalog catalog = make_blog_catalog();
  PrepareResult a = prepare(titled("a"), Operation::All, catalog);
  PrepareResult b = prepare(titled("b"), Operation::All, catalog);
  expect_true(a.cache_key == b.cache_key, "different pinned values share a cache key");

  Query other = build::where(build::from(build::schema("Post")),
                             build::eq(build::field(0, "text"), build::pin("a")));
  PrepareResult c = prepare(other, Operation::All, catalog);
  expect_true(a.cache_key != c.cache_key, "different clauses produce different keys");

  PrepareResult d = prepare(titled("a"), Operation::DeleteAll, catalog);
  expect_true(a.cache_key != d.cache_key, "operation is part of the key");
}

void test_cache_key_tracks_schema_changes() {
  Catalog catalog = make_blog_catalog();
  Catalog changed = make_blog_catalog();
  SchemaSpec post;
  post.name = "Post";
  post.source = "posts";
  post.fields.push_back({"id", build::type(FieldType::Kind::Id), "", false});
  post.fields.push_back({"title", build::type(FieldType::Kind::String), "", false});
  post.fields.push_back({"text", build::type(FieldType::Kind::String), "", false});
  changed.add_schema(post);
  PrepareResult a = prepare(titled("a"), Operation::All, catalog);
  PrepareResult b = prepare(titled("a"), Operation::All, changed);
  expect_true(a.cache_key != b.cache_key, "schema layout changes invalidate the key");
}

void test_cache_key_for_schemaless_source() {
  Catalog catalog = make_blog_catalog();
  PrepareResult prepared = prepare(build::from(build::table("logs")), Operation::All, catalog);
  expect_eq(render_cache_key(prepared.cache_key), "[:all, 0, {\"logs\", nil, 0}]",
            "schemaless sources are keyed by table only");
}

void test_cache_key_embeds_subquery_key() {
  Catalog catalog = make_blog_catalog();
  PrepareResult prepared = prepare(build::from(build::subquery(titled("a"))), Operation::All, catalog);
  const CacheKey& sub = prepared.query.from.subquery->cache_key;
  expect_true(prepared.cache_key.items.back() == sub, "subquery source is keyed by the subquery's key");
  expect_true(render_cache_key(sub).find("[:all, 1, ") == 0, "subquery key counts its own params");
  expect_true(render_cache_key(prepared.cache_key).find("[:all, 1, ") == 0,
              "outer key counts the subquery params");
}

void test_cache_key_includes_joins_and_updates() {
  Catalog catalog = make_blog_catalog();
  Query query = build::assoc_join(build::from(build::schema("Post")), JoinExpr::Qual::Left, 0, "comments");
  query = build::update(query, {build::set("title", build::pin("x"))});
  PrepareResult prepared = prepare(query, Operation::UpdateAll, catalog);
  const std::string rendered = render_cache_key(prepared.cache_key);
  expect_true(rendered.find("{:join, [{:left, {\"comments\", Comment, ") != std::string::npos,
              "join entry: " + rendered);
  expect_true(rendered.find("\"&1.post_id() == &0.id()\"}]}") != std::string::npos, "join condition");
  expect_true(rendered.find("{:update, [{:set, :title, \"^0\"}]}") != std::string::npos,
              "update entry: " + rendered);
}

}  // namespace

void register_cache_key_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cache_key_layout", test_cache_key_layout});
  tests.push_back({"cache_key_ignores_param_values", test_cache_key_ignores_param_values});
  tests.push_back({"cache_key_tracks_schema_changes", test_cache_key_tracks_schema_changes});
  tests.push_back({"cache_key_for_schemaless_source", test_cache_key_for_schemaless_source});
  tests.push_back({"cache_key_embeds_subquery_key", test_cache_key_embeds_subquery_key});
  tests.push_back({"cache_key_includes_joins_and_updates", test_cache_key_includes_joins_and_updates});
}
