#include "planner_internal.h"

#include "qplan/builder.h"
#include "qplan/render.h"

namespace qplan::detail {

namespace {

const char* kUnsupportedSelect =
    "subquery must select a source (t), a field (t.field) or a map, got: `";

/// Compiles one select node against the prepared query it belongs to.
class SelectCompiler {
 public:
  SelectCompiler(const Query& query, const SchemaResolver& resolver)
      : query_(query), resolver_(resolver) {}

  CompiledSelect compile(const Expr& expr) {
    switch (expr.kind) {
      case Expr::Kind::Binding:
        return compile_binding(expr.index);
      case Expr::Kind::Field:
        return compile_field(expr);
      case Expr::Kind::Map:
        return compile_map(expr);
      case Expr::Kind::Struct:
        return compile_struct(expr);
      case Expr::Kind::MapUpdate:
        return compile_map_update(expr);
      case Expr::Kind::Merge:
        return compile_merge(expr);
      default:
        break;
    }
    fail(ErrorKind::UnsupportedSubquerySelect, kUnsupportedSelect + render_expr(expr) + "`");
    return {};
  }

 private:
  void fail(ErrorKind kind, const std::string& reason) const {
    throw QueryError(kind, reason, render_query(query_));
  }

  FieldType type_of(const Expr& expr) const {
    switch (expr.kind) {
      case Expr::Kind::Field:
        return resolve_field(query_, expr.index, expr.name, "select", resolver_);
      case Expr::Kind::Param:
        if (query_.select && expr.index < query_.select->params.size() &&
            query_.select->params[expr.index].type) {
          return *query_.select->params[expr.index].type;
        }
        return FieldType{};
      case Expr::Kind::Literal:
        return type_of_value(expr.value);
      default:
        return FieldType{};
    }
  }

  static CompiledSelect make_entries(SelectShape shape, const std::vector<Expr>& values) {
    std::vector<std::pair<std::string, Expr>> pairs;
    for (size_t i = 0; i < shape.fields.size() && i < values.size(); ++i) {
      pairs.emplace_back(shape.fields[i].name, values[i]);
    }
    CompiledSelect out;
    if (shape.kind == SelectShape::Kind::Map) {
      out.expr = build::map_of(std::move(pairs));
    } else {
      out.expr = build::struct_of(shape.schema, std::move(pairs));
    }
    out.shape = std::move(shape);
    return out;
  }

  CompiledSelect compile_binding(size_t ix) {
    const Source& source = source_at(query_, ix);
    SelectShape shape;
    if (source.kind == Source::Kind::Schema && !source.schema.empty()) {
      shape.kind = SelectShape::Kind::Row;
      shape.schema = source.schema;
      shape.fields = schema_fields(source.schema, resolver_, query_);
    } else if (source.kind == Source::Kind::Subquery && source.subquery &&
               source.subquery->shape) {
      shape = *source.subquery->shape;
    } else {
      fail(ErrorKind::UnsupportedSubquerySelect,
           kUnsupportedSelect + render_expr(build::binding(ix)) + "`");
    }
    std::vector<Expr> values;
    values.reserve(shape.fields.size());
    for (const auto& field : shape.fields) values.push_back(build::field(ix, field.name));
    return make_entries(std::move(shape), values);
  }

  CompiledSelect compile_field(const Expr& expr) {
    SelectShape shape;
    shape.kind = SelectShape::Kind::Map;
    shape.fields.push_back(ShapeField{expr.name, type_of(expr)});
    return make_entries(std::move(shape), {expr});
  }

  CompiledSelect compile_map(const Expr& expr) {
    CompiledSelect out;
    out.shape.kind = SelectShape::Kind::Map;
    for (const auto& entry : expr.entries) {
      if (entry.key.kind != Expr::Kind::Atom) {
        fail(ErrorKind::InvalidMapKey,
             "only atom keys are allowed when selecting a map in subquery, got: `" +
                 render_expr(expr) + "`");
      }
      set_field(out.shape, ShapeField{entry.key.name, type_of(entry.value)});
    }
    out.expr = collapse_keys(expr);
    return out;
  }

  CompiledSelect compile_struct(const Expr& expr) {
    const auto declared = schema_fields(expr.name, resolver_, query_);
    CompiledSelect out;
    out.shape.kind = SelectShape::Kind::Struct;
    out.shape.schema = expr.name;
    for (const auto& entry : expr.entries) {
      const ShapeField* field = entry.key.kind == Expr::Kind::Atom
                                    ? find(declared, entry.key.name)
                                    : nullptr;
      if (field == nullptr) {
        fail(ErrorKind::InvalidMapKey, "invalid key `" + render_expr(entry.key) + "` for struct " +
                                           expr.name + " in subquery");
      }
    }
    // The struct exposes its whole schema: primary key first, then the
    // remaining declared fields. Unnamed fields read as nil.
    const auto pk = resolver_.primary_key(expr.name);
    const ShapeField* pk_field = pk ? find(declared, *pk) : nullptr;
    if (pk_field != nullptr) out.shape.fields.push_back(*pk_field);
    for (const auto& field : declared) {
      if (pk_field == nullptr || field.name != pk_field->name) out.shape.fields.push_back(field);
    }
    out.expr = collapse_keys(expr);
    return out;
  }

  CompiledSelect compile_map_update(const Expr& expr) {
    if (expr.args.empty() || expr.args[0].kind != Expr::Kind::Binding) {
      fail(ErrorKind::UnsupportedSubquerySelect, kUnsupportedSelect + render_expr(expr) + "`");
    }
    CompiledSelect base = compile_binding(expr.args[0].index);
    for (const auto& entry : expr.entries) {
      if (entry.key.kind != Expr::Kind::Atom || find(base.shape.fields, entry.key.name) == nullptr) {
        fail(ErrorKind::InvalidMapKey,
             "invalid key `" + render_expr(entry.key) + "` on map update in subquery");
      }
      override_entry(base, entry.key.name, entry.value);
    }
    if (base.shape.kind == SelectShape::Kind::Row) {
      base.shape.kind = SelectShape::Kind::Struct;
    }
    return base;
  }

  CompiledSelect compile_merge_operand(const Expr& expr) {
    switch (expr.kind) {
      case Expr::Kind::Binding:
      case Expr::Kind::Map:
      case Expr::Kind::Struct:
      case Expr::Kind::MapUpdate:
      case Expr::Kind::Merge:
        return compile(expr);
      default:
        break;
    }
    fail(ErrorKind::IllegalMergeTarget,
         "cannot merge because `" + render_expr(expr) + "` is not a map or a struct");
    return {};
  }

  CompiledSelect compile_merge(const Expr& expr) {
    if (expr.args.size() != 2) {
      fail(ErrorKind::IllegalMergeTarget, "merge expects exactly two operands");
    }
    CompiledSelect left = compile_merge_operand(expr.args[0]);
    CompiledSelect right = compile_merge_operand(expr.args[1]);
    const bool left_map = left.shape.kind == SelectShape::Kind::Map;
    const bool right_map = right.shape.kind == SelectShape::Kind::Map;

    if (left_map && !right_map) {
      fail(ErrorKind::IllegalMergeTarget, "cannot merge because the left side is a map and the right side is a " +
                                              right.shape.schema + " struct");
    }
    if (!left_map && !right_map && left.shape.schema != right.shape.schema) {
      fail(ErrorKind::IllegalMergeTarget, "cannot merge because the left side is a " +
                                              left.shape.schema + " and right side is a " +
                                              right.shape.schema);
    }
    std::vector<ShapeField> declared;
    if (!left_map) declared = schema_fields(left.shape.schema, resolver_, query_);
    // Only the entries the right side spells out override the left side.
    for (const auto& entry : right.expr.entries) {
      const std::string& name = entry.key.name;
      if (!left_map && find(left.shape.fields, name) == nullptr && find(declared, name) == nullptr) {
        fail(ErrorKind::InvalidMapKey, "invalid key `:" + name + "` on merge with struct " +
                                           left.shape.schema + " in subquery");
      }
      const ShapeField* field = find(right.shape.fields, name);
      override_entry(left, name, entry.value, field != nullptr ? &field->type : nullptr);
    }
    if (left.shape.kind == SelectShape::Kind::Row) left.shape.kind = SelectShape::Kind::Struct;
    return left;
  }

  static const ShapeField* find(const std::vector<ShapeField>& fields, const std::string& name) {
    for (const auto& field : fields) {
      if (field.name == name) return &field;
    }
    return nullptr;
  }

  static void set_field(SelectShape& shape, const ShapeField& field) {
    for (auto& existing : shape.fields) {
      if (existing.name == field.name) {
        existing.type = field.type;
        return;
      }
    }
    shape.fields.push_back(field);
  }

  /// Keeps one entry per atom key: the first position, the last value.
  static Expr collapse_keys(const Expr& expr) {
    Expr out = expr;
    out.entries.clear();
    for (const auto& entry : expr.entries) {
      bool replaced = false;
      for (auto& existing : out.entries) {
        if (existing.key.kind == Expr::Kind::Atom && existing.key.name == entry.key.name) {
          existing.value = entry.value;
          replaced = true;
          break;
        }
      }
      if (!replaced) out.entries.push_back(entry);
    }
    return out;
  }

  /// Replaces (or appends) `key` in a compiled map/struct. Struct fields keep
  /// their declared type unless `type` is given for a map merge.
  void override_entry(CompiledSelect& target, const std::string& key, const Expr& value,
                      const FieldType* type = nullptr) {
    bool replaced = false;
    for (auto& entry : target.expr.entries) {
      if (entry.key.kind == Expr::Kind::Atom && entry.key.name == key) {
        entry.value = value;
        replaced = true;
        break;
      }
    }
    if (!replaced) target.expr.entries.push_back(MapEntry{build::atom(key), value});

    const bool keep_declared = target.shape.kind != SelectShape::Kind::Map;
    const ShapeField* existing = find(target.shape.fields, key);
    FieldType field_type = type != nullptr ? *type : type_of(value);
    if (keep_declared && existing != nullptr) field_type = existing->type;
    if (keep_declared && existing == nullptr) {
      auto declared = schema_fields(target.shape.schema, resolver_, query_);
      const ShapeField* declared_field = find(declared, key);
      if (declared_field != nullptr) field_type = declared_field->type;
    }
    set_field(target.shape, ShapeField{key, field_type});
  }

  const Query& query_;
  const SchemaResolver& resolver_;
};

}  // namespace

CompiledSelect compile_subquery_select(const Query& query, const SchemaResolver& resolver) {
  SelectCompiler compiler(query, resolver);
  if (!query.select) return compiler.compile(build::binding(0));
  return compiler.compile(query.select->expr);
}

}  // namespace qplan::detail
