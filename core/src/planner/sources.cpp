#include "planner_internal.h"

#include <algorithm>

#include "qplan/render.h"

namespace qplan::detail {

namespace {

const Source& unbound_source() {
  static const Source empty;
  return empty;
}

bool is_unbound(const Source& source) {
  return source.kind == Source::Kind::Schema && source.schema.empty();
}

void throw_unbound(const Query& query, size_t ix) {
  throw QueryError(ErrorKind::InvalidBinding,
                   "could not find binding `&" + std::to_string(ix) + "`", render_query(query));
}

const FieldSpec* find_field(const std::vector<FieldSpec>& fields, const std::string& name) {
  auto it = std::find_if(fields.begin(), fields.end(),
                         [&](const FieldSpec& f) { return f.name == name; });
  return it == fields.end() ? nullptr : &*it;
}

}  // namespace

void rebuild_sources(Query& query) {
  size_t count = 1;
  for (const auto& join : query.joins) count = std::max(count, join.ix + 1);
  query.sources.assign(count, Source{});
  query.sources[0] = query.from;
  for (const auto& join : query.joins) {
    if (join.ix < count) query.sources[join.ix] = join.source;
  }
}

const Source& source_at(const Query& query, size_t ix) {
  if (ix >= query.sources.size()) return unbound_source();
  return query.sources[ix];
}

std::vector<ShapeField> schema_fields(const std::string& schema,
                                      const SchemaResolver& resolver,
                                      const Query& query) {
  auto fields = resolver.fields(schema);
  if (!fields) {
    throw QueryError(ErrorKind::UnknownSchema, "schema `" + schema + "` is not known",
                     render_query(query));
  }
  std::vector<ShapeField> out;
  for (const auto& field : *fields) {
    if (field.virtual_field) continue;
    out.push_back(ShapeField{field.name, field.type});
  }
  return out;
}

FieldType resolve_field(const Query& query,
                        size_t ix,
                        const std::string& name,
                        const std::string& clause,
                        const SchemaResolver& resolver) {
  const Source& source = source_at(query, ix);
  if (is_unbound(source)) throw_unbound(query, ix);
  switch (source.kind) {
    case Source::Kind::Schema: {
      auto fields = resolver.fields(source.schema);
      if (!fields) {
        throw QueryError(ErrorKind::UnknownSchema, "schema `" + source.schema + "` is not known",
                         render_query(query));
      }
      const FieldSpec* field = find_field(*fields, name);
      if (field == nullptr) {
        throw QueryError(ErrorKind::UnknownField,
                         "field `" + name + "` in `" + clause + "` does not exist in schema " +
                             source.schema,
                         render_query(query));
      }
      if (field->virtual_field) {
        throw QueryError(ErrorKind::UnknownField,
                         "field `" + name + "` in `" + clause + "` is a virtual field in schema " +
                             source.schema,
                         render_query(query));
      }
      return field->type;
    }
    case Source::Kind::Table:
      return FieldType{};
    case Source::Kind::Subquery: {
      if (source.subquery && source.subquery->shape) {
        for (const auto& field : source.subquery->shape->fields) {
          if (field.name == name) return field.type;
        }
      }
      throw QueryError(ErrorKind::UnknownFieldInSubquery,
                       "field `" + name + "` does not exist in subquery", render_query(query));
    }
  }
  return FieldType{};
}

std::vector<ShapeField> binding_fields(const Query& query,
                                       size_t ix,
                                       const SchemaResolver& resolver) {
  const Source& source = source_at(query, ix);
  if (is_unbound(source)) throw_unbound(query, ix);
  switch (source.kind) {
    case Source::Kind::Schema:
      return schema_fields(source.schema, resolver, query);
    case Source::Kind::Table:
      throw QueryError(ErrorKind::InvalidQuery,
                       "cannot select the whole schemaless source `" + source.table +
                           "`, select individual fields instead",
                       render_query(query));
    case Source::Kind::Subquery:
      if (source.subquery && source.subquery->shape) return source.subquery->shape->fields;
      break;
  }
  return {};
}

std::optional<std::string> binding_schema(const Query& query, size_t ix) {
  const Source& source = source_at(query, ix);
  if (is_unbound(source)) return std::nullopt;
  switch (source.kind) {
    case Source::Kind::Schema:
      return source.schema;
    case Source::Kind::Table:
      return std::nullopt;
    case Source::Kind::Subquery:
      if (source.subquery && source.subquery->shape &&
          source.subquery->shape->kind != SelectShape::Kind::Map) {
        return source.subquery->shape->schema;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

size_t params_before_from(const Query& query, Operation operation) {
  size_t count = 0;
  switch (operation) {
    case Operation::All:
      if (query.select) count += query.select->params.size();
      break;
    case Operation::UpdateAll:
      for (const auto& update : query.updates) count += update.params.size();
      break;
    case Operation::DeleteAll:
      break;
  }
  return count;
}

}  // namespace qplan::detail

namespace qplan {

std::string field_column(const Query& query,
                         size_t ix,
                         const std::string& name,
                         const SchemaResolver& resolver) {
  const Source& source = detail::source_at(query, ix);
  if (source.kind != Source::Kind::Schema || source.schema.empty()) return name;
  auto fields = resolver.fields(source.schema);
  if (!fields) return name;
  const FieldSpec* field = detail::find_field(*fields, name);
  if (field == nullptr || field->source.empty()) return name;
  return field->source;
}

}  // namespace qplan
