#include "qplan/errors.h"

#include <utility>

#include "qplan/render.h"
#include "util/string_util.h"

namespace qplan {

namespace {

std::string query_message(const std::string& reason, const std::string& query_text) {
  if (query_text.empty()) return reason;
  return reason + " in query:\n\n" + query_text;
}

std::string type_label(const FieldType& type) {
  if (type.kind == FieldType::Kind::Custom) return type.custom_name;
  return ":" + render_type(type);
}

std::string cast_reason(const Value& value, const FieldType& type, const std::string& clause) {
  return "value `" + render_value(value) + "` in `" + clause + "` cannot be cast to type " +
         type_label(type);
}

std::string subquery_reason(const QueryError& inner) {
  return "the following exception happened while compiling a subquery.\n\n" +
         util::indent_lines(inner.what(), 4);
}

std::string subquery_message(const QueryError& inner, const std::string& query_text) {
  return subquery_reason(inner) +
         "\n\nThe subquery originated from the following query:\n\n" + query_text;
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidQuery:
      return "InvalidQuery";
    case ErrorKind::CastError:
      return "CastError";
    case ErrorKind::UnknownSchema:
      return "UnknownSchema";
    case ErrorKind::UnknownField:
      return "UnknownField";
    case ErrorKind::UnknownFieldInSubquery:
      return "UnknownFieldInSubquery";
    case ErrorKind::UnknownAssociation:
      return "UnknownAssociation";
    case ErrorKind::InvalidBinding:
      return "InvalidBinding";
    case ErrorKind::InvalidMapKey:
      return "InvalidMapKey";
    case ErrorKind::UnsupportedSubquerySelect:
      return "UnsupportedSubquerySelect";
    case ErrorKind::IllegalMergeTarget:
      return "IllegalMergeTarget";
    case ErrorKind::IllegalPreloadInSubquery:
      return "IllegalPreloadInSubquery";
    case ErrorKind::IllegalUpdateInSubquery:
      return "IllegalUpdateInSubquery";
    case ErrorKind::SubqueryNotAllowedInBulkFrom:
      return "SubqueryNotAllowedInBulkFrom";
    case ErrorKind::AssociationRequiresSourceSchema:
      return "AssociationRequiresSourceSchema";
    case ErrorKind::CannotSubsetSubqueryStruct:
      return "CannotSubsetSubqueryStruct";
    case ErrorKind::SubQueryError:
      return "SubQueryError";
  }
  return "Unknown";
}

QueryError::QueryError(ErrorKind kind, const std::string& reason, const std::string& query_text)
    : QueryError(kind, reason, query_text, query_message(reason, query_text)) {}

QueryError::QueryError(ErrorKind kind, std::string reason, std::string query_text,
                       const std::string& message)
    : std::runtime_error(message),
      kind_(kind),
      reason_(std::move(reason)),
      query_text_(std::move(query_text)) {}

std::shared_ptr<const QueryError> QueryError::clone() const {
  return std::make_shared<QueryError>(*this);
}

CastError::CastError(const Value& value, const FieldType& type, const std::string& clause,
                     const std::string& query_text)
    : QueryError(ErrorKind::CastError, cast_reason(value, type, clause), query_text),
      value_(value),
      type_(type),
      clause_(clause) {}

std::shared_ptr<const QueryError> CastError::clone() const {
  return std::make_shared<CastError>(*this);
}

SubQueryError::SubQueryError(std::shared_ptr<const QueryError> inner,
                             const std::string& query_text)
    : QueryError(ErrorKind::SubQueryError, subquery_reason(*inner), query_text,
                 subquery_message(*inner, query_text)),
      inner_(std::move(inner)) {}

const QueryError& SubQueryError::root_cause() const {
  const QueryError* current = inner_.get();
  while (const auto* wrapped = dynamic_cast<const SubQueryError*>(current)) {
    current = wrapped->inner_.get();
  }
  return *current;
}

std::shared_ptr<const QueryError> SubQueryError::clone() const {
  return std::make_shared<SubQueryError>(*this);
}

}  // namespace qplan
