#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "qplan/ast.h"

namespace qplan {

/// Classifies every compile failure the planner can report.
/// MUST remain stable: diagnostics codes and tests key off these values.
enum class ErrorKind {
  InvalidQuery,
  CastError,
  UnknownSchema,
  UnknownField,
  UnknownFieldInSubquery,
  UnknownAssociation,
  InvalidBinding,
  InvalidMapKey,
  UnsupportedSubquerySelect,
  IllegalMergeTarget,
  IllegalPreloadInSubquery,
  IllegalUpdateInSubquery,
  SubqueryNotAllowedInBulkFrom,
  AssociationRequiresSourceSchema,
  CannotSubsetSubqueryStruct,
  SubQueryError,
};

const char* error_kind_name(ErrorKind kind);

/// Compile failure raised by prepare/normalize.
/// what() is "<reason> in query:\n\n<rendered query>".
class QueryError : public std::runtime_error {
 public:
  QueryError(ErrorKind kind, const std::string& reason, const std::string& query_text);
  ~QueryError() override = default;

  ErrorKind kind() const { return kind_; }
  /// Message without the query rendering.
  const std::string& reason() const { return reason_; }
  /// Rendered query the failure was detected in.
  const std::string& query_text() const { return query_text_; }
  /// Copies the error keeping its dynamic type, so a subquery boundary can hold it.
  virtual std::shared_ptr<const QueryError> clone() const;

 protected:
  QueryError(ErrorKind kind, std::string reason, std::string query_text, const std::string& message);

 private:
  ErrorKind kind_;
  std::string reason_;
  std::string query_text_;
};

/// A value that cannot be cast to the type inferred for it.
class CastError : public QueryError {
 public:
  CastError(const Value& value, const FieldType& type, const std::string& clause,
            const std::string& query_text);

  const Value& value() const { return value_; }
  const FieldType& type() const { return type_; }
  const std::string& clause() const { return clause_; }
  std::shared_ptr<const QueryError> clone() const override;

 private:
  Value value_;
  FieldType type_;
  std::string clause_;
};

/// Wraps a failure raised strictly inside a subquery compilation.
/// The wrapped error stays inspectable through inner().
class SubQueryError : public QueryError {
 public:
  SubQueryError(std::shared_ptr<const QueryError> inner, const std::string& query_text);

  const QueryError& inner() const { return *inner_; }
  std::shared_ptr<const QueryError> inner_ptr() const { return inner_; }
  /// Innermost non-wrapper error across nested subquery boundaries.
  const QueryError& root_cause() const;
  std::shared_ptr<const QueryError> clone() const override;

 private:
  std::shared_ptr<const QueryError> inner_;
};

}  // namespace qplan
