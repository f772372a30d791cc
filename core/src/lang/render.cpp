#include "qplan/render.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <vector>

#include "util/string_util.h"

namespace qplan {

namespace {

bool is_binary_operator(const std::string& name) {
  static const std::set<std::string> ops = {"==", "!=", "<",  "<=",  ">",  ">=", "+",
                                            "-",  "*",  "/",  "and", "or", "in"};
  return ops.count(name) > 0;
}

bool is_binary_call(const Expr& expr) {
  return expr.kind == Expr::Kind::Call && expr.args.size() == 2 && is_binary_operator(expr.name);
}

/// How binding, field and parameter nodes are spelled.
struct Naming {
  // Inspection form: binding names by index. Empty in positional form.
  std::vector<std::string> bindings;
  // Inspection form: the clause parameters still owned by the clause being rendered.
  const std::vector<ParamSlot>* params = nullptr;
  bool positional = true;
};

std::string render_node(const Expr& expr, const Naming& naming);

std::string binding_name(size_t ix, const Naming& naming) {
  if (naming.positional) return "&" + std::to_string(ix);
  if (ix < naming.bindings.size() && !naming.bindings[ix].empty()) return naming.bindings[ix];
  return "&" + std::to_string(ix);
}

std::string render_key(const Expr& key, const Naming& naming, bool& atom_key) {
  atom_key = key.kind == Expr::Kind::Atom;
  if (atom_key) return key.name;
  return render_node(key, naming);
}

std::string render_entries(const std::vector<MapEntry>& entries, const Naming& naming) {
  std::vector<std::string> parts;
  parts.reserve(entries.size());
  for (const auto& entry : entries) {
    bool atom_key = false;
    std::string key = render_key(entry.key, naming, atom_key);
    if (atom_key) {
      parts.push_back(key + ": " + render_node(entry.value, naming));
    } else {
      parts.push_back(key + " => " + render_node(entry.value, naming));
    }
  }
  return util::join(parts, ", ");
}

std::string render_args(const std::vector<Expr>& args, const Naming& naming) {
  std::vector<std::string> parts;
  parts.reserve(args.size());
  for (const auto& arg : args) parts.push_back(render_node(arg, naming));
  return util::join(parts, ", ");
}

std::string render_operand(const Expr& expr, const Naming& naming) {
  if (is_binary_call(expr)) return "(" + render_node(expr, naming) + ")";
  return render_node(expr, naming);
}

std::string render_param(const Expr& expr, const Naming& naming) {
  if (naming.positional) return "^" + std::to_string(expr.index);
  if (naming.params != nullptr && expr.index < naming.params->size()) {
    return "^" + render_value((*naming.params)[expr.index].value);
  }
  return "^...";
}

std::string render_node(const Expr& expr, const Naming& naming) {
  switch (expr.kind) {
    case Expr::Kind::Binding:
      return binding_name(expr.index, naming);
    case Expr::Kind::Field:
      if (naming.positional) return binding_name(expr.index, naming) + "." + expr.name + "()";
      return binding_name(expr.index, naming) + "." + expr.name;
    case Expr::Kind::Literal:
      return render_value(expr.value);
    case Expr::Kind::Atom:
      return ":" + expr.name;
    case Expr::Kind::Param:
      return render_param(expr, naming);
    case Expr::Kind::Call:
      if (is_binary_call(expr)) {
        return render_operand(expr.args[0], naming) + " " + expr.name + " " +
               render_operand(expr.args[1], naming);
      }
      return expr.name + "(" + render_args(expr.args, naming) + ")";
    case Expr::Kind::Fragment: {
      std::string out = "fragment(\"" + util::escape_quoted(expr.name) + "\"";
      for (const auto& arg : expr.args) out += ", " + render_node(arg, naming);
      return out + ")";
    }
    case Expr::Kind::List:
      return "[" + render_args(expr.args, naming) + "]";
    case Expr::Kind::Map:
      return "%{" + render_entries(expr.entries, naming) + "}";
    case Expr::Kind::Struct:
      return "%" + expr.name + "{" + render_entries(expr.entries, naming) + "}";
    case Expr::Kind::MapUpdate: {
      std::string base = expr.args.empty() ? "nil" : render_node(expr.args[0], naming);
      return "%{" + base + " | " + render_entries(expr.entries, naming) + "}";
    }
    case Expr::Kind::Merge:
      return "merge(" + render_args(expr.args, naming) + ")";
    case Expr::Kind::Take: {
      std::vector<std::string> atoms;
      atoms.reserve(expr.fields.size());
      for (const auto& f : expr.fields) atoms.push_back(":" + f);
      std::string list = "[" + util::join(atoms, ", ") + "]";
      if (expr.index == 0) return list;
      return "struct(" + binding_name(expr.index, naming) + ", " + list + ")";
    }
  }
  return "";
}

std::string first_letter(const std::string& name) {
  for (char c : name) {
    if (std::isalpha(static_cast<unsigned char>(c))) {
      return std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return "x";
}

std::string source_letter(const Source& source) {
  switch (source.kind) {
    case Source::Kind::Schema:
      return first_letter(source.schema);
    case Source::Kind::Table:
      return first_letter(source.table);
    case Source::Kind::Subquery:
      if (source.subquery && source.subquery->query) {
        return source_letter(source.subquery->query->from);
      }
      return "s";
  }
  return "x";
}

std::vector<std::string> binding_names(const Query& query) {
  size_t count = 1;
  for (const auto& join : query.joins) {
    if (join.ix + 1 > count) count = join.ix + 1;
  }
  std::vector<std::string> letters(count);
  letters[0] = source_letter(query.from);
  for (const auto& join : query.joins) {
    if (join.assoc.has_value()) {
      letters[join.ix] = first_letter(join.assoc->name);
    } else {
      letters[join.ix] = source_letter(join.source);
    }
  }
  std::vector<std::string> names(count);
  std::set<std::string> used;
  for (size_t ix = 0; ix < count; ++ix) {
    if (letters[ix].empty()) continue;
    std::string name = letters[ix];
    if (used.count(name) > 0) name += std::to_string(ix);
    used.insert(name);
    names[ix] = name;
  }
  return names;
}

std::string render_source(const Source& source) {
  switch (source.kind) {
    case Source::Kind::Schema:
      return source.schema;
    case Source::Kind::Table:
      return "\"" + util::escape_quoted(source.table) + "\"";
    case Source::Kind::Subquery:
      if (source.subquery && source.subquery->query) {
        return "subquery(" + render_query(*source.subquery->query) + ")";
      }
      return "subquery(nil)";
  }
  return "";
}

const char* join_keyword(JoinExpr::Qual qual) {
  switch (qual) {
    case JoinExpr::Qual::Inner:
      return "join";
    case JoinExpr::Qual::Left:
      return "left_join";
    case JoinExpr::Qual::Right:
      return "right_join";
    case JoinExpr::Qual::Full:
      return "full_join";
    case JoinExpr::Qual::Cross:
      return "cross_join";
  }
  return "join";
}

const char* update_keyword(UpdateExpr::Op::Kind kind) {
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

bool is_literal_true(const Expr& expr) {
  if (expr.kind != Expr::Kind::Literal) return false;
  const auto* b = std::get_if<bool>(&expr.value);
  return b != nullptr && *b;
}

std::string render_clause_expr(const Expr& expr, const std::vector<ParamSlot>& params,
                               const Naming& base) {
  Naming naming = base;
  naming.params = &params;
  return render_node(expr, naming);
}

std::string render_update(const UpdateExpr& update, const Naming& base) {
  Naming naming = base;
  naming.params = &update.params;
  std::vector<UpdateExpr::Op::Kind> order;
  for (const auto& op : update.ops) {
    bool seen = false;
    for (auto kind : order) seen = seen || kind == op.kind;
    if (!seen) order.push_back(op.kind);
  }
  std::vector<std::string> groups;
  for (auto kind : order) {
    std::vector<std::string> parts;
    for (const auto& op : update.ops) {
      if (op.kind != kind) continue;
      parts.push_back(op.field + ": " + render_node(op.value, naming));
    }
    groups.push_back(std::string(update_keyword(kind)) + ": [" + util::join(parts, ", ") + "]");
  }
  return "[" + util::join(groups, ", ") + "]";
}

std::string render_float_text(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", value);
  std::string out = buf;
  if (out.find_first_of(".eni") == std::string::npos) out += ".0";
  return out;
}

}  // namespace

std::string render_value(const Value& value) {
  if (std::holds_alternative<std::monostate>(value)) return "nil";
  if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&value)) return render_float_text(*d);
  return "\"" + util::escape_quoted(std::get<std::string>(value)) + "\"";
}

std::string render_type(const FieldType& type) {
  switch (type.kind) {
    case FieldType::Kind::Any:
      return "any";
    case FieldType::Kind::Id:
      return "id";
    case FieldType::Kind::Integer:
      return "integer";
    case FieldType::Kind::Float:
      return "float";
    case FieldType::Kind::Boolean:
      return "boolean";
    case FieldType::Kind::String:
      return "string";
    case FieldType::Kind::Custom:
      return type.custom_name;
  }
  return "any";
}

std::string render_expr(const Expr& expr) {
  Naming naming;
  return render_node(expr, naming);
}

std::string render_query(const Query& query) {
  Naming naming;
  naming.positional = false;
  naming.bindings = binding_names(query);

  std::vector<std::string> parts;
  parts.push_back("from " + naming.bindings[0] + " in " + render_source(query.from));

  for (const auto& join : query.joins) {
    std::string target;
    if (join.assoc.has_value()) {
      target = "assoc(" + binding_name(join.assoc->binding, naming) + ", :" + join.assoc->name + ")";
    } else {
      target = render_source(join.source);
    }
    parts.push_back(std::string(join_keyword(join.qual)) + ": " + binding_name(join.ix, naming) +
                    " in " + target);
    if (!is_literal_true(join.on.expr)) {
      parts.push_back("on: " + render_clause_expr(join.on.expr, join.on.params, naming));
    }
  }
  for (const auto& where : query.wheres) {
    const char* keyword = where.op == QueryExpr::BoolOp::Or ? "or_where: " : "where: ";
    parts.push_back(keyword + render_clause_expr(where.expr, where.params, naming));
  }
  for (const auto& group : query.group_bys) {
    parts.push_back("group_by: " + render_clause_expr(group.expr, group.params, naming));
  }
  for (const auto& having : query.havings) {
    const char* keyword = having.op == QueryExpr::BoolOp::Or ? "or_having: " : "having: ";
    parts.push_back(keyword + render_clause_expr(having.expr, having.params, naming));
  }
  for (const auto& order : query.order_bys) {
    Naming scoped = naming;
    scoped.params = &order.params;
    std::vector<std::string> terms;
    for (const auto& term : order.terms) {
      const char* dir = term.direction == OrderByExpr::Term::Direction::Desc ? "desc: " : "asc: ";
      terms.push_back(dir + render_node(term.expr, scoped));
    }
    parts.push_back("order_by: [" + util::join(terms, ", ") + "]");
  }
  if (query.limit) {
    parts.push_back("limit: " + render_clause_expr(query.limit->expr, query.limit->params, naming));
  }
  if (query.offset) {
    parts.push_back("offset: " +
                    render_clause_expr(query.offset->expr, query.offset->params, naming));
  }
  for (const auto& update : query.updates) {
    parts.push_back("update: " + render_update(update, naming));
  }
  if (query.select) {
    parts.push_back("select: " +
                    render_clause_expr(query.select->expr, query.select->params, naming));
  }
  if (!query.preloads.empty()) {
    std::vector<std::string> items;
    for (const auto& preload : query.preloads) {
      if (preload.binding.has_value()) {
        items.push_back(preload.assoc + ": " + binding_name(*preload.binding, naming));
      } else {
        items.push_back(":" + preload.assoc);
      }
    }
    parts.push_back("preload: [" + util::join(items, ", ") + "]");
  }
  return util::join(parts, ", ");
}

std::string render_cache_key(const CacheKey& key) {
  switch (key.kind) {
    case CacheKey::Kind::List:
    case CacheKey::Kind::Tuple: {
      std::vector<std::string> parts;
      parts.reserve(key.items.size());
      for (const auto& item : key.items) parts.push_back(render_cache_key(item));
      const bool list = key.kind == CacheKey::Kind::List;
      return (list ? "[" : "{") + util::join(parts, ", ") + (list ? "]" : "}");
    }
    case CacheKey::Kind::Atom:
      return ":" + key.text;
    case CacheKey::Kind::Name:
      return key.text.empty() ? "nil" : key.text;
    case CacheKey::Kind::Text:
      return "\"" + util::escape_quoted(key.text) + "\"";
    case CacheKey::Kind::Integer:
      return std::to_string(key.integer);
  }
  return "";
}

bool operator==(const CacheKey& a, const CacheKey& b) {
  return a.kind == b.kind && a.text == b.text && a.integer == b.integer && a.items == b.items;
}

}  // namespace qplan
