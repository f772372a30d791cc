#include "qplan/schema.h"

#include <cctype>
#include <limits>
#include <utility>

#include "util/string_util.h"

namespace qplan {

namespace {

bool parse_leading_integer(const std::string& text, int64_t& out) {
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }
  const size_t digits_start = pos;
  int64_t value = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    const int64_t digit = text[pos] - '0';
    if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) return false;
    value = value * 10 + digit;
    ++pos;
  }
  if (pos == digits_start) return false;
  out = negative ? -value : value;
  return true;
}

}  // namespace

LeadingIntegerType::LeadingIntegerType(std::string name) : name_(std::move(name)) {}

const std::string& LeadingIntegerType::name() const { return name_; }

FieldType LeadingIntegerType::base_type() const {
  FieldType t;
  t.kind = FieldType::Kind::Id;
  return t;
}

std::optional<Value> LeadingIntegerType::cast(const Value& value) const {
  if (const auto* i = std::get_if<int64_t>(&value)) return Value{*i};
  if (const auto* s = std::get_if<std::string>(&value)) {
    int64_t parsed = 0;
    if (parse_leading_integer(*s, parsed)) return Value{parsed};
  }
  return std::nullopt;
}

void Catalog::add_schema(SchemaSpec schema) {
  for (auto& field : schema.fields) {
    if (field.source.empty()) field.source = field.name;
  }
  if (schema.source.empty()) schema.source = util::to_lower(schema.name);
  std::string name = schema.name;
  schemas_[name] = std::move(schema);
}

void Catalog::add_custom_type(std::shared_ptr<const CustomType> type) {
  if (!type) return;
  std::string name = type->name();
  custom_types_[name] = std::move(type);
}

bool Catalog::has_schema(const std::string& name) const {
  return schemas_.find(name) != schemas_.end();
}

std::vector<std::string> Catalog::schema_names() const {
  std::vector<std::string> out;
  out.reserve(schemas_.size());
  for (const auto& entry : schemas_) out.push_back(entry.first);
  return out;
}

std::optional<std::vector<FieldSpec>> Catalog::fields(const std::string& schema) const {
  auto it = schemas_.find(schema);
  if (it == schemas_.end()) return std::nullopt;
  return it->second.fields;
}

std::optional<std::string> Catalog::primary_key(const std::string& schema) const {
  auto it = schemas_.find(schema);
  if (it == schemas_.end()) return std::nullopt;
  return it->second.primary_key;
}

std::optional<AssociationSpec> Catalog::association(const std::string& schema,
                                                    const std::string& name) const {
  auto it = schemas_.find(schema);
  if (it == schemas_.end()) return std::nullopt;
  for (const auto& assoc : it->second.associations) {
    if (assoc.name == name) return assoc;
  }
  return std::nullopt;
}

std::optional<std::string> Catalog::source(const std::string& schema) const {
  auto it = schemas_.find(schema);
  if (it == schemas_.end()) return std::nullopt;
  return it->second.source;
}

std::shared_ptr<const CustomType> Catalog::custom_type(const std::string& name) const {
  auto it = custom_types_.find(name);
  if (it == custom_types_.end()) return nullptr;
  return it->second;
}

FieldType field_type_from_name(const std::string& name) {
  const std::string lower = util::to_lower(util::trim_ws(name));
  FieldType t;
  if (lower == "any") {
    t.kind = FieldType::Kind::Any;
  } else if (lower == "id") {
    t.kind = FieldType::Kind::Id;
  } else if (lower == "integer") {
    t.kind = FieldType::Kind::Integer;
  } else if (lower == "float") {
    t.kind = FieldType::Kind::Float;
  } else if (lower == "boolean") {
    t.kind = FieldType::Kind::Boolean;
  } else if (lower == "string") {
    t.kind = FieldType::Kind::String;
  } else {
    t.kind = FieldType::Kind::Custom;
    t.custom_name = util::trim_ws(name);
  }
  return t;
}

}  // namespace qplan
