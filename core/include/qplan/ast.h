#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qplan {

/// Literal payload carried by literal nodes and bound parameters.
/// MUST use monostate for nil so a missing value never collides with false or 0.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// Static type of a field, parameter or select entry.
/// Custom types are resolved by name through the schema resolver.
struct FieldType {
  enum class Kind { Any, Id, Integer, Float, Boolean, String, Custom } kind = Kind::Any;
  std::string custom_name;
};

inline bool operator==(const FieldType& a, const FieldType& b) {
  return a.kind == b.kind && a.custom_name == b.custom_name;
}

inline bool operator!=(const FieldType& a, const FieldType& b) { return !(a == b); }

struct MapEntry;

/// Node of the query expression tree.
/// Binding and field nodes store the numeric source index instead of a pointer,
/// so resolution is an array lookup into Query::sources.
struct Expr {
  enum class Kind {
    Binding,
    Field,
    Literal,
    Atom,
    Param,
    Call,
    Fragment,
    List,
    Map,
    Struct,
    MapUpdate,
    Merge,
    Take
  } kind = Kind::Literal;
  // Binding/Field/Take: source index. Param: slot index (clause-local until normalized).
  size_t index = 0;
  // Field: field name. Atom: atom name. Call: operator or function. Fragment: raw text.
  // Struct: schema name.
  std::string name;
  Value value;
  // Explicit type annotation of a pinned value, e.g. type(^v, :integer).
  std::optional<FieldType> cast_type;
  // Call/Fragment/List arguments; MapUpdate base in args[0]; Merge operands in args[0..1].
  std::vector<Expr> args;
  // Map/Struct/MapUpdate entries, in declaration order.
  std::vector<MapEntry> entries;
  // Take: selected field names.
  std::vector<std::string> fields;
};

struct MapEntry {
  Expr key;
  Expr value;
};

/// One bound value owned by a clause. `type` is filled during prepare.
struct ParamSlot {
  Value value;
  std::optional<FieldType> type;
};

/// A clause expression with the parameters it binds.
/// Param nodes inside `expr` index into `params` until the query is normalized.
struct QueryExpr {
  enum class BoolOp { And, Or } op = BoolOp::And;
  Expr expr;
  std::vector<ParamSlot> params;
};

struct OrderByExpr {
  struct Term {
    enum class Direction { Asc, Desc } direction = Direction::Asc;
    Expr expr;
  };
  std::vector<Term> terms;
  std::vector<ParamSlot> params;
};

struct UpdateExpr {
  struct Op {
    enum class Kind { Set, Inc, Push, Pull } kind = Kind::Set;
    std::string field;
    Expr value;
  };
  std::vector<Op> ops;
  std::vector<ParamSlot> params;
};

struct SelectExpr {
  Expr expr;
  std::vector<ParamSlot> params;
  // Flat list of values the adapter must read; filled by normalize.
  std::vector<Expr> fields;
};

struct Preload {
  std::string assoc;
  // Join binding that already loads the association, when preloading through a join.
  std::optional<size_t> binding;
};

struct Subquery;

/// A query source: a schema, a schemaless table, or a nested subquery.
struct Source {
  enum class Kind { Schema, Table, Subquery } kind = Kind::Schema;
  std::string schema;
  // Table name; resolved from the schema during prepare for Schema sources.
  std::string table;
  std::shared_ptr<const Subquery> subquery;
};

struct JoinExpr {
  enum class Qual { Inner, Left, Right, Full, Cross } qual = Qual::Inner;
  struct Assoc {
    size_t binding = 0;
    std::string name;
  };
  // Binding index of the joined source. Independent of the join's list position.
  size_t ix = 0;
  Source source;
  QueryExpr on;
  // Set while the join is still an association join; cleared once expanded.
  std::optional<Assoc> assoc;
};

struct Query {
  enum class Stage { Built, Prepared, Normalized } stage = Stage::Built;
  Source from;
  std::vector<JoinExpr> joins;
  std::vector<QueryExpr> wheres;
  std::vector<QueryExpr> group_bys;
  std::vector<QueryExpr> havings;
  std::vector<OrderByExpr> order_bys;
  std::optional<QueryExpr> limit;
  std::optional<QueryExpr> offset;
  std::vector<UpdateExpr> updates;
  std::vector<Preload> preloads;
  std::optional<SelectExpr> select;
  // Source arena indexed by binding; filled during prepare.
  std::vector<Source> sources;
};

struct ShapeField {
  std::string name;
  FieldType type;
};

/// Output shape of a compiled select.
/// Row exposes a whole schema row; Struct is a schema-carrying row with overrides
/// (struct literals, map updates and merges); Map is an ordered atom-keyed map.
struct SelectShape {
  enum class Kind { Row, Map, Struct } kind = Kind::Map;
  std::string schema;
  std::vector<ShapeField> fields;
};

/// Structural fingerprint of a prepared query, shaped as a nested term.
struct CacheKey {
  enum class Kind { List, Tuple, Atom, Name, Text, Integer } kind = Kind::List;
  std::string text;
  int64_t integer = 0;
  std::vector<CacheKey> items;
};

bool operator==(const CacheKey& a, const CacheKey& b);
inline bool operator!=(const CacheKey& a, const CacheKey& b) { return !(a == b); }

/// A query used as a source. Before prepare only `query` is set; compilation
/// produces a new Subquery with the prepared inner query, its cast parameters
/// (indexed relative to the inner query), the cached shape and the offset at
/// which it is attached in the enclosing parameter list.
struct Subquery {
  std::shared_ptr<const Query> query;
  std::vector<Value> params;
  std::optional<SelectShape> shape;
  size_t param_offset = 0;
  CacheKey cache_key;
};

}  // namespace qplan
