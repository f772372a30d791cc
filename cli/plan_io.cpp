#include "plan_io.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "qplan/builder.h"
#include "qplan/render.h"

namespace qplan::cli {

namespace {

using json = nlohmann::ordered_json;

std::runtime_error request_error(const std::string& path, const std::string& message) {
  return std::runtime_error(path + ": " + message);
}

const json& require(const json& node, const char* key, const std::string& path) {
  if (!node.is_object() || !node.contains(key)) throw request_error(path, std::string("missing member '") + key + "'");
  return node.at(key);
}

std::string require_string(const json& node, const std::string& path) {
  if (!node.is_string()) throw request_error(path, "expected a string");
  return node.get<std::string>();
}

size_t require_index(const json& node, const std::string& path) {
  if (!node.is_number_integer() || node.get<int64_t>() < 0) {
    throw request_error(path, "expected a non-negative integer");
  }
  return static_cast<size_t>(node.get<int64_t>());
}

Value decode_value(const json& node, const std::string& path) {
  if (node.is_null()) return Value{};
  if (node.is_boolean()) return Value{node.get<bool>()};
  if (node.is_number_integer()) return Value{node.get<int64_t>()};
  if (node.is_number_float()) return Value{node.get<double>()};
  if (node.is_string()) return Value{node.get<std::string>()};
  throw request_error(path, "expected null, a boolean, a number or a string");
}

json encode_value(const Value& value) {
  if (const auto* b = std::get_if<bool>(&value)) return *b;
  if (const auto* i = std::get_if<int64_t>(&value)) return *i;
  if (const auto* d = std::get_if<double>(&value)) return *d;
  if (const auto* s = std::get_if<std::string>(&value)) return *s;
  return nullptr;
}

Expr decode_expr(const json& node, const std::string& path);

std::vector<Expr> decode_expr_list(const json& node, const std::string& path) {
  if (!node.is_array()) throw request_error(path, "expected an array of expressions");
  std::vector<Expr> out;
  for (size_t i = 0; i < node.size(); ++i) {
    out.push_back(decode_expr(node[i], path + "[" + std::to_string(i) + "]"));
  }
  return out;
}

std::vector<std::pair<std::string, Expr>> decode_atom_map(const json& node, const std::string& path) {
  if (!node.is_object()) throw request_error(path, "expected an object of field expressions");
  std::vector<std::pair<std::string, Expr>> out;
  for (auto it = node.begin(); it != node.end(); ++it) {
    out.emplace_back(it.key(), decode_expr(it.value(), path + "." + it.key()));
  }
  return out;
}

Expr decode_expr(const json& node, const std::string& path) {
  if (!node.is_object()) throw request_error(path, "expected an expression object");
  if (node.contains("binding")) return build::binding(require_index(node.at("binding"), path + ".binding"));
  if (node.contains("field")) {
    const json& ref = node.at("field");
    if (!ref.is_array() || ref.size() != 2) throw request_error(path + ".field", "expected [binding, name]");
    return build::field(require_index(ref[0], path + ".field[0]"),
                        require_string(ref[1], path + ".field[1]"));
  }
  if (node.contains("literal")) return build::literal(decode_value(node.at("literal"), path + ".literal"));
  if (node.contains("atom")) return build::atom(require_string(node.at("atom"), path + ".atom"));
  if (node.contains("pin")) {
    Value value = decode_value(node.at("pin"), path + ".pin");
    if (node.contains("type")) {
      return build::pin(std::move(value),
                        field_type_from_name(require_string(node.at("type"), path + ".type")));
    }
    return build::pin(std::move(value));
  }
  if (node.contains("call")) {
    std::vector<Expr> args;
    if (node.contains("args")) args = decode_expr_list(node.at("args"), path + ".args");
    return build::call(require_string(node.at("call"), path + ".call"), std::move(args));
  }
  if (node.contains("fragment")) {
    std::vector<Expr> args;
    if (node.contains("args")) args = decode_expr_list(node.at("args"), path + ".args");
    return build::fragment(require_string(node.at("fragment"), path + ".fragment"), std::move(args));
  }
  if (node.contains("list")) return build::list(decode_expr_list(node.at("list"), path + ".list"));
  if (node.contains("map")) return build::map_of(decode_atom_map(node.at("map"), path + ".map"));
  if (node.contains("map_entries")) {
    const json& entries = node.at("map_entries");
    if (!entries.is_array()) throw request_error(path + ".map_entries", "expected an array of [key, value] pairs");
    std::vector<MapEntry> out;
    for (size_t i = 0; i < entries.size(); ++i) {
      const std::string entry_path = path + ".map_entries[" + std::to_string(i) + "]";
      if (!entries[i].is_array() || entries[i].size() != 2) throw request_error(entry_path, "expected [key, value]");
      out.push_back(MapEntry{decode_expr(entries[i][0], entry_path + "[0]"),
                             decode_expr(entries[i][1], entry_path + "[1]")});
    }
    return build::map(std::move(out));
  }
  if (node.contains("struct")) {
    return build::struct_of(require_string(node.at("struct"), path + ".struct"),
                            decode_atom_map(require(node, "fields", path), path + ".fields"));
  }
  if (node.contains("map_update")) {
    return build::map_update(decode_expr(node.at("map_update"), path + ".map_update"),
                             decode_atom_map(require(node, "fields", path), path + ".fields"));
  }
  if (node.contains("merge")) {
    std::vector<Expr> operands = decode_expr_list(node.at("merge"), path + ".merge");
    if (operands.size() != 2) throw request_error(path + ".merge", "expected exactly two operands");
    return build::merge(std::move(operands[0]), std::move(operands[1]));
  }
  if (node.contains("take")) {
    const json& take = node.at("take");
    if (!take.is_array() || take.size() != 2 || !take[1].is_array()) {
      throw request_error(path + ".take", "expected [binding, [field, ...]]");
    }
    std::vector<std::string> fields;
    for (size_t i = 0; i < take[1].size(); ++i) {
      fields.push_back(require_string(take[1][i], path + ".take[1][" + std::to_string(i) + "]"));
    }
    return build::take(require_index(take[0], path + ".take[0]"), std::move(fields));
  }
  throw request_error(path, "unknown expression kind");
}

Query decode_query(const json& node, const std::string& path);

Source decode_source(const json& node, const std::string& path) {
  if (!node.is_object()) throw request_error(path, "expected a source object");
  if (node.contains("schema")) return build::schema(require_string(node.at("schema"), path + ".schema"));
  if (node.contains("table")) return build::table(require_string(node.at("table"), path + ".table"));
  if (node.contains("subquery")) {
    return build::subquery(decode_query(node.at("subquery"), path + ".subquery"));
  }
  throw request_error(path, "expected one of 'schema', 'table' or 'subquery'");
}

JoinExpr::Qual decode_qual(const std::string& name, const std::string& path) {
  if (name == "inner") return JoinExpr::Qual::Inner;
  if (name == "left") return JoinExpr::Qual::Left;
  if (name == "right") return JoinExpr::Qual::Right;
  if (name == "full") return JoinExpr::Qual::Full;
  if (name == "cross") return JoinExpr::Qual::Cross;
  throw request_error(path, "unknown join qualifier '" + name + "'");
}

Query decode_joins(Query query, const json& joins, const std::string& path) {
  if (!joins.is_array()) throw request_error(path, "expected an array of joins");
  for (size_t i = 0; i < joins.size(); ++i) {
    const std::string join_path = path + "[" + std::to_string(i) + "]";
    const json& join = joins[i];
    if (!join.is_object()) throw request_error(join_path, "expected a join object");
    JoinExpr::Qual qual = JoinExpr::Qual::Inner;
    if (join.contains("qual")) qual = decode_qual(require_string(join.at("qual"), join_path + ".qual"), join_path + ".qual");
    std::optional<Expr> on;
    if (join.contains("on")) on = decode_expr(join.at("on"), join_path + ".on");
    if (join.contains("assoc")) {
      const json& assoc = join.at("assoc");
      const size_t parent = require_index(require(assoc, "binding", join_path + ".assoc"), join_path + ".assoc.binding");
      std::string name = require_string(require(assoc, "name", join_path + ".assoc"), join_path + ".assoc.name");
      query = on ? build::assoc_join(std::move(query), qual, parent, std::move(name), std::move(*on))
                 : build::assoc_join(std::move(query), qual, parent, std::move(name));
    } else {
      Source source = decode_source(require(join, "source", join_path), join_path + ".source");
      query = on ? build::join(std::move(query), qual, std::move(source), std::move(*on))
                 : build::join(std::move(query), qual, std::move(source));
    }
  }
  return query;
}

/// Boolean clause lists accept plain expressions (and) or {"or": expr}.
void decode_bool_clauses(const json& node, const std::string& path, std::vector<QueryExpr>& out) {
  if (!node.is_array()) throw request_error(path, "expected an array of expressions");
  for (size_t i = 0; i < node.size(); ++i) {
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (node[i].is_object() && node[i].contains("or")) {
      out.push_back(build::clause(decode_expr(node[i].at("or"), item_path + ".or"), QueryExpr::BoolOp::Or));
    } else {
      out.push_back(build::clause(decode_expr(node[i], item_path)));
    }
  }
}

UpdateExpr::Op::Kind decode_update_kind(const std::string& name, const std::string& path) {
  if (name == "set") return UpdateExpr::Op::Kind::Set;
  if (name == "inc") return UpdateExpr::Op::Kind::Inc;
  if (name == "push") return UpdateExpr::Op::Kind::Push;
  if (name == "pull") return UpdateExpr::Op::Kind::Pull;
  throw request_error(path, "unknown update operation '" + name + "'");
}

Query decode_query(const json& node, const std::string& path) {
  if (!node.is_object()) throw request_error(path, "expected a query object");
  Query query = build::from(decode_source(require(node, "from", path), path + ".from"));
  if (node.contains("joins")) query = decode_joins(std::move(query), node.at("joins"), path + ".joins");
  if (node.contains("where")) decode_bool_clauses(node.at("where"), path + ".where", query.wheres);
  if (node.contains("group_by")) {
    query = build::group_by(std::move(query), decode_expr_list(node.at("group_by"), path + ".group_by"));
  }
  if (node.contains("having")) decode_bool_clauses(node.at("having"), path + ".having", query.havings);
  if (node.contains("order_by")) {
    const json& terms = node.at("order_by");
    if (!terms.is_array()) throw request_error(path + ".order_by", "expected an array of {asc|desc: expr}");
    std::vector<OrderByExpr::Term> out;
    for (size_t i = 0; i < terms.size(); ++i) {
      const std::string term_path = path + ".order_by[" + std::to_string(i) + "]";
      if (terms[i].is_object() && terms[i].contains("desc")) {
        out.push_back(build::desc(decode_expr(terms[i].at("desc"), term_path + ".desc")));
      } else if (terms[i].is_object() && terms[i].contains("asc")) {
        out.push_back(build::asc(decode_expr(terms[i].at("asc"), term_path + ".asc")));
      } else {
        throw request_error(term_path, "expected {\"asc\": expr} or {\"desc\": expr}");
      }
    }
    query = build::order_by(std::move(query), std::move(out));
  }
  if (node.contains("limit")) query = build::limit(std::move(query), decode_expr(node.at("limit"), path + ".limit"));
  if (node.contains("offset")) query = build::offset(std::move(query), decode_expr(node.at("offset"), path + ".offset"));
  if (node.contains("update")) {
    const json& update = node.at("update");
    if (!update.is_object()) throw request_error(path + ".update", "expected an object of update operations");
    std::vector<UpdateExpr::Op> ops;
    for (auto it = update.begin(); it != update.end(); ++it) {
      const std::string op_path = path + ".update." + it.key();
      const UpdateExpr::Op::Kind kind = decode_update_kind(it.key(), op_path);
      for (auto& [field, value] : decode_atom_map(it.value(), op_path)) {
        ops.push_back(UpdateExpr::Op{kind, field, std::move(value)});
      }
    }
    query = build::update(std::move(query), std::move(ops));
  }
  if (node.contains("preload")) {
    const json& preloads = node.at("preload");
    if (!preloads.is_array()) throw request_error(path + ".preload", "expected an array of associations");
    for (size_t i = 0; i < preloads.size(); ++i) {
      const std::string item_path = path + ".preload[" + std::to_string(i) + "]";
      if (preloads[i].is_string()) {
        query = build::preload(std::move(query), preloads[i].get<std::string>());
      } else {
        std::string assoc = require_string(require(preloads[i], "assoc", item_path), item_path + ".assoc");
        const size_t binding = require_index(require(preloads[i], "binding", item_path), item_path + ".binding");
        query = build::preload(std::move(query), std::move(assoc), binding);
      }
    }
  }
  if (node.contains("select")) query = build::select(std::move(query), decode_expr(node.at("select"), path + ".select"));
  return query;
}

std::string lower_first(const std::string& name) {
  std::string out = name;
  if (!out.empty() && out[0] >= 'A' && out[0] <= 'Z') out[0] = static_cast<char>(out[0] - 'A' + 'a');
  return out;
}

AssociationSpec decode_association(const json& node, const std::string& owner, const std::string& path) {
  AssociationSpec assoc;
  assoc.name = require_string(require(node, "name", path), path + ".name");
  const std::string kind = node.contains("kind") ? require_string(node.at("kind"), path + ".kind") : "has_many";
  if (kind == "belongs_to") {
    assoc.kind = AssociationSpec::Kind::BelongsTo;
    assoc.owner_key = assoc.name + "_id";
    assoc.related_key = "id";
  } else if (kind == "has_one" || kind == "has_many") {
    assoc.kind = kind == "has_one" ? AssociationSpec::Kind::HasOne : AssociationSpec::Kind::HasMany;
    assoc.owner_key = "id";
    assoc.related_key = lower_first(owner) + "_id";
  } else if (kind == "through") {
    assoc.kind = AssociationSpec::Kind::Through;
    const json& through = require(node, "through", path);
    if (!through.is_array() || through.empty()) throw request_error(path + ".through", "expected a non-empty array");
    for (size_t i = 0; i < through.size(); ++i) {
      assoc.through.push_back(require_string(through[i], path + ".through[" + std::to_string(i) + "]"));
    }
    return assoc;
  } else {
    throw request_error(path + ".kind", "unknown association kind '" + kind + "'");
  }
  assoc.related = require_string(require(node, "related", path), path + ".related");
  if (node.contains("owner_key")) assoc.owner_key = require_string(node.at("owner_key"), path + ".owner_key");
  if (node.contains("related_key")) assoc.related_key = require_string(node.at("related_key"), path + ".related_key");
  return assoc;
}

SchemaSpec decode_schema(const json& node, const std::string& path) {
  SchemaSpec schema;
  schema.name = require_string(require(node, "name", path), path + ".name");
  if (node.contains("source")) schema.source = require_string(node.at("source"), path + ".source");
  if (node.contains("primary_key")) {
    schema.primary_key = require_string(node.at("primary_key"), path + ".primary_key");
  }
  const json& fields = require(node, "fields", path);
  if (!fields.is_array()) throw request_error(path + ".fields", "expected an array of fields");
  for (size_t i = 0; i < fields.size(); ++i) {
    const std::string field_path = path + ".fields[" + std::to_string(i) + "]";
    FieldSpec field;
    field.name = require_string(require(fields[i], "name", field_path), field_path + ".name");
    if (fields[i].contains("type")) {
      field.type = field_type_from_name(require_string(fields[i].at("type"), field_path + ".type"));
    }
    if (fields[i].contains("source")) field.source = require_string(fields[i].at("source"), field_path + ".source");
    if (fields[i].contains("virtual")) {
      if (!fields[i].at("virtual").is_boolean()) throw request_error(field_path + ".virtual", "expected a boolean");
      field.virtual_field = fields[i].at("virtual").get<bool>();
    }
    schema.fields.push_back(std::move(field));
  }
  if (node.contains("associations")) {
    const json& assocs = node.at("associations");
    if (!assocs.is_array()) throw request_error(path + ".associations", "expected an array of associations");
    for (size_t i = 0; i < assocs.size(); ++i) {
      schema.associations.push_back(
          decode_association(assocs[i], schema.name, path + ".associations[" + std::to_string(i) + "]"));
    }
  }
  return schema;
}

void decode_catalog(const json& root, Catalog& catalog) {
  if (root.contains("custom_types")) {
    const json& types = root.at("custom_types");
    if (!types.is_array()) throw request_error("custom_types", "expected an array");
    for (size_t i = 0; i < types.size(); ++i) {
      const std::string path = "custom_types[" + std::to_string(i) + "]";
      std::string name = require_string(require(types[i], "name", path), path + ".name");
      const std::string strategy = types[i].contains("strategy")
                                       ? require_string(types[i].at("strategy"), path + ".strategy")
                                       : "leading_integer";
      if (strategy != "leading_integer") throw request_error(path + ".strategy", "unknown cast strategy '" + strategy + "'");
      catalog.add_custom_type(std::make_shared<LeadingIntegerType>(std::move(name)));
    }
  }
  const json& schemas = require(root, "schemas", "request");
  if (!schemas.is_array()) throw request_error("schemas", "expected an array");
  for (size_t i = 0; i < schemas.size(); ++i) {
    catalog.add_schema(decode_schema(schemas[i], "schemas[" + std::to_string(i) + "]"));
  }
}

const char* shape_kind_name(SelectShape::Kind kind) {
  switch (kind) {
    case SelectShape::Kind::Row:
      return "row";
    case SelectShape::Kind::Map:
      return "map";
    case SelectShape::Kind::Struct:
      return "struct";
  }
  return "map";
}

json encode_source(const Query& query, size_t ix) {
  const Source& source = query.sources[ix];
  json out;
  out["binding"] = ix;
  switch (source.kind) {
    case Source::Kind::Schema:
      out["kind"] = "schema";
      out["schema"] = source.schema;
      out["table"] = source.table;
      break;
    case Source::Kind::Table:
      out["kind"] = "table";
      out["table"] = source.table;
      break;
    case Source::Kind::Subquery: {
      out["kind"] = "subquery";
      if (!source.subquery) break;
      const Subquery& sub = *source.subquery;
      out["param_offset"] = sub.param_offset;
      out["param_count"] = sub.params.size();
      if (sub.shape) {
        json fields = json::array();
        for (const auto& field : sub.shape->fields) {
          fields.push_back({{"name", field.name}, {"type", render_type(field.type)}});
        }
        out["shape"] = {{"kind", shape_kind_name(sub.shape->kind)},
                        {"schema", sub.shape->schema},
                        {"fields", std::move(fields)}};
      }
      if (sub.query) out["query"] = render_query(*sub.query);
      out["cache_key"] = render_cache_key(sub.cache_key);
      break;
    }
  }
  return out;
}

json encode_select_field(const Query& query, const Expr& field, const SchemaResolver& resolver) {
  json out;
  out["expr"] = render_expr(field);
  if (field.kind == Expr::Kind::Field) {
    out["binding"] = field.index;
    out["field"] = field.name;
    out["column"] = field_column(query, field.index, field.name, resolver);
  }
  return out;
}

}  // namespace

std::string read_request_source(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

PlanRequestResult parse_plan_request(const std::string& text) {
  PlanRequestResult result;
  try {
    const json root = json::parse(text);
    if (!root.is_object()) throw request_error("request", "expected a JSON object");
    PlanRequest request;
    if (root.contains("operation")) {
      const std::string name = require_string(root.at("operation"), "operation");
      auto operation = operation_from_name(name);
      if (!operation) throw request_error("operation", "unknown operation '" + name + "'");
      request.operation = *operation;
    }
    if (root.contains("param_base")) request.param_base = require_index(root.at("param_base"), "param_base");
    decode_catalog(root, request.catalog);
    request.query = decode_query(require(root, "query", "request"), "query");
    result.request = std::move(request);
  } catch (const json::parse_error& ex) {
    result.error = ex.what();
    result.error_byte = ex.byte > 0 ? ex.byte - 1 : 0;
  } catch (const json::exception& ex) {
    result.error = ex.what();
  } catch (const std::runtime_error& ex) {
    result.error = ex.what();
  }
  return result;
}

Plan build_plan(const PlanRequest& request) {
  PrepareResult prepared = prepare(request.query, request.operation, request.catalog, request.param_base);
  Plan plan;
  plan.operation = request.operation;
  plan.query = normalize(ensure_select(prepared.query, request.operation == Operation::All),
                         request.operation, request.catalog, request.param_base);
  plan.params = std::move(prepared.params);
  plan.cache_key = std::move(prepared.cache_key);
  return plan;
}

std::string render_plan_json(const Plan& plan, const SchemaResolver& resolver) {
  json out;
  out["operation"] = operation_name(plan.operation);
  out["query"] = render_query(plan.query);
  json params = json::array();
  for (const auto& value : plan.params) params.push_back(encode_value(value));
  out["params"] = std::move(params);
  out["cache_key"] = render_cache_key(plan.cache_key);
  json sources = json::array();
  for (size_t ix = 0; ix < plan.query.sources.size(); ++ix) {
    sources.push_back(encode_source(plan.query, ix));
  }
  out["sources"] = std::move(sources);
  if (plan.query.select) {
    json fields = json::array();
    for (const auto& field : plan.query.select->fields) {
      fields.push_back(encode_select_field(plan.query, field, resolver));
    }
    out["select"] = {{"expr", render_expr(plan.query.select->expr)}, {"fields", std::move(fields)}};
  } else {
    out["select"] = nullptr;
  }
  return out.dump(2);
}

std::string render_plan_text(const Plan& plan, const SchemaResolver& resolver) {
  std::ostringstream out;
  out << "operation: " << operation_name(plan.operation) << "\n";
  out << "query: " << render_query(plan.query) << "\n";
  out << "sources:\n";
  for (size_t ix = 0; ix < plan.query.sources.size(); ++ix) {
    const Source& source = plan.query.sources[ix];
    out << "  &" << ix << " ";
    switch (source.kind) {
      case Source::Kind::Schema:
        out << source.schema << " (" << source.table << ")";
        break;
      case Source::Kind::Table:
        out << "\"" << source.table << "\"";
        break;
      case Source::Kind::Subquery:
        out << "subquery";
        if (source.subquery && source.subquery->shape) {
          const SelectShape& shape = *source.subquery->shape;
          out << " " << shape_kind_name(shape.kind);
          if (!shape.schema.empty()) out << " " << shape.schema;
          out << " {";
          for (size_t i = 0; i < shape.fields.size(); ++i) {
            if (i > 0) out << ", ";
            out << shape.fields[i].name << ": " << render_type(shape.fields[i].type);
          }
          out << "}";
        }
        if (source.subquery) out << " params @" << source.subquery->param_offset;
        break;
    }
    out << "\n";
  }
  if (plan.query.select) {
    out << "select: " << render_expr(plan.query.select->expr) << "\n";
    out << "fields:\n";
    for (const auto& field : plan.query.select->fields) {
      out << "  " << render_expr(field);
      if (field.kind == Expr::Kind::Field) {
        out << " -> " << field_column(plan.query, field.index, field.name, resolver);
      }
      out << "\n";
    }
  }
  out << "params: [";
  for (size_t i = 0; i < plan.params.size(); ++i) {
    if (i > 0) out << ", ";
    out << render_value(plan.params[i]);
  }
  out << "]\n";
  out << "cache key: " << render_cache_key(plan.cache_key) << "\n";
  return out.str();
}

}  // namespace qplan::cli
