#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qplan/ast.h"

namespace qplan {

struct FieldSpec {
  std::string name;
  FieldType type;
  // Column name in the storage table; defaults to the field name.
  std::string source;
  bool virtual_field = false;
};

struct AssociationSpec {
  enum class Kind { BelongsTo, HasOne, HasMany, Through } kind = Kind::HasMany;
  std::string name;
  std::string related;
  // Key on the owner schema (the schema declaring the association).
  std::string owner_key;
  // Key on the related schema.
  std::string related_key;
  // Through: association names walked hop by hop from the owner.
  std::vector<std::string> through;
};

struct SchemaSpec {
  std::string name;
  std::string source;
  std::vector<FieldSpec> fields;
  std::optional<std::string> primary_key;
  std::vector<AssociationSpec> associations;
};

/// User-defined field type with its own cast rule.
/// MUST be stateless so one instance can serve concurrent compilations.
class CustomType {
 public:
  virtual ~CustomType() = default;
  virtual const std::string& name() const = 0;
  /// Storage type the cast value is dumped as.
  virtual FieldType base_type() const = 0;
  /// Casts an external value; returns nullopt when the value is not accepted.
  virtual std::optional<Value> cast(const Value& value) const = 0;
};

/// Accepts integers and strings that start with an integer ("1-hello-world" -> 1).
class LeadingIntegerType : public CustomType {
 public:
  explicit LeadingIntegerType(std::string name);
  const std::string& name() const override;
  FieldType base_type() const override;
  std::optional<Value> cast(const Value& value) const override;

 private:
  std::string name_;
};

/// Read-only schema metadata consumed by the planner.
/// Every lookup MAY fail; callers MUST treat nullopt as an unknown entity.
class SchemaResolver {
 public:
  virtual ~SchemaResolver() = default;
  /// Declared fields in declaration order, virtual fields included.
  virtual std::optional<std::vector<FieldSpec>> fields(const std::string& schema) const = 0;
  virtual std::optional<std::string> primary_key(const std::string& schema) const = 0;
  virtual std::optional<AssociationSpec> association(const std::string& schema,
                                                     const std::string& name) const = 0;
  /// Table the schema is stored in.
  virtual std::optional<std::string> source(const std::string& schema) const = 0;
  virtual std::shared_ptr<const CustomType> custom_type(const std::string& name) const = 0;
};

/// In-memory schema registry.
class Catalog : public SchemaResolver {
 public:
  void add_schema(SchemaSpec schema);
  void add_custom_type(std::shared_ptr<const CustomType> type);
  bool has_schema(const std::string& name) const;
  std::vector<std::string> schema_names() const;

  std::optional<std::vector<FieldSpec>> fields(const std::string& schema) const override;
  std::optional<std::string> primary_key(const std::string& schema) const override;
  std::optional<AssociationSpec> association(const std::string& schema,
                                             const std::string& name) const override;
  std::optional<std::string> source(const std::string& schema) const override;
  std::shared_ptr<const CustomType> custom_type(const std::string& name) const override;

 private:
  std::map<std::string, SchemaSpec> schemas_;
  std::map<std::string, std::shared_ptr<const CustomType>> custom_types_;
};

/// Parses a type name ("string", "id", "integer", ...). Unknown names become
/// custom types, which the planner resolves through the schema resolver.
FieldType field_type_from_name(const std::string& name);

}  // namespace qplan
