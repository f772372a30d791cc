#include "planner_internal.h"

#include <cmath>
#include <stdexcept>

#include "qplan/render.h"
#include "util/string_util.h"

namespace qplan::detail {

namespace {

std::optional<int64_t> parse_int64_value(const std::string& value) {
  try {
    size_t idx = 0;
    int64_t out = std::stoll(value, &idx);
    if (idx != value.size()) return std::nullopt;
    return out;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<double> parse_double_value(const std::string& value) {
  try {
    size_t idx = 0;
    double out = std::stod(value, &idx);
    if (idx != value.size()) return std::nullopt;
    return out;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<Value> cast_integer(const Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) return Value{*i};
  if (const auto* d = std::get_if<double>(&value)) {
    // [-2^63, 2^63): outside it the conversion is undefined.
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (*d >= -kInt64Bound && *d < kInt64Bound && std::floor(*d) == *d) {
      return Value{static_cast<int64_t>(*d)};
    }
    return std::nullopt;
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    auto parsed = parse_int64_value(util::trim_ws(*s));
    if (parsed) return Value{*parsed};
  }
  return std::nullopt;
}

std::optional<Value> cast_float(const Value& value) {
  if (const auto* d = std::get_if<double>(&value)) return Value{*d};
  if (const auto* i = std::get_if<int64_t>(&value)) return Value{static_cast<double>(*i)};
  if (const auto* s = std::get_if<std::string>(&value)) {
    auto parsed = parse_double_value(util::trim_ws(*s));
    if (parsed) return Value{*parsed};
  }
  return std::nullopt;
}

std::optional<Value> cast_boolean(const Value& value) {
  if (const auto* b = std::get_if<bool>(&value)) return Value{*b};
  if (const auto* s = std::get_if<std::string>(&value)) {
    const std::string lower = util::to_lower(util::trim_ws(*s));
    if (lower == "true" || lower == "1") return Value{true};
    if (lower == "false" || lower == "0") return Value{false};
  }
  return std::nullopt;
}

}  // namespace

FieldType type_of_value(const Value& value) {
  FieldType type;
  if (std::holds_alternative<bool>(value)) {
    type.kind = FieldType::Kind::Boolean;
  } else if (std::holds_alternative<int64_t>(value)) {
    type.kind = FieldType::Kind::Integer;
  } else if (std::holds_alternative<double>(value)) {
    type.kind = FieldType::Kind::Float;
  } else if (std::holds_alternative<std::string>(value)) {
    type.kind = FieldType::Kind::String;
  }
  return type;
}

std::optional<Value> cast_value(const Value& value,
                                const FieldType& type,
                                const SchemaResolver& resolver,
                                const Query& query) {
  if (std::holds_alternative<std::monostate>(value)) return value;
  switch (type.kind) {
    case FieldType::Kind::Any:
      return value;
    case FieldType::Kind::Id:
    case FieldType::Kind::Integer:
      return cast_integer(value);
    case FieldType::Kind::Float:
      return cast_float(value);
    case FieldType::Kind::Boolean:
      return cast_boolean(value);
    case FieldType::Kind::String:
      if (std::holds_alternative<std::string>(value)) return value;
      return std::nullopt;
    case FieldType::Kind::Custom: {
      auto custom = resolver.custom_type(type.custom_name);
      if (!custom) {
        throw QueryError(ErrorKind::InvalidQuery, "type `" + type.custom_name + "` is not known",
                         render_query(query));
      }
      return custom->cast(value);
    }
  }
  return std::nullopt;
}

}  // namespace qplan::detail
