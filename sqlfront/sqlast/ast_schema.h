// Create table statement and sub expressions.
#ifndef SQLFRONT_SQLAST_AST_SCHEMA_H_
#define SQLFRONT_SQLAST_AST_SCHEMA_H_

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "sqlfront/sqlast/ast_abstract.h"
#include "sqlfront/sqlast/ast_schema_enums.h"
#include "sqlfront/sqlast/source_span.h"

namespace sqlfront {
namespace sqlast {

// A resolved name. Unquoted names arrive here already lowercased.
class Identifier {
 public:
  Identifier(const std::string &name, const SourceSpan &span)
      : name_(name), span_(span) {}

  // Accessors.
  const std::string &name() const { return this->name_; }
  const SourceSpan &span() const { return this->span_; }

  // For testing.
  bool operator==(const Identifier &other) const = default;

 private:
  std::string name_;
  SourceSpan span_;
};

class DataType {
 public:
  // Supported column types.
  using Type = DataTypeEnum;

  // Looks up a type name in the canonical type table, ignoring case.
  static std::optional<Type> Resolve(absl::string_view type_name);
  static std::string TypeToString(Type type);

  DataType(Type type, const SourceSpan &span) : type_(type), span_(span) {}

  // Accessors.
  Type type() const { return this->type_; }
  const SourceSpan &span() const { return this->span_; }

 private:
  Type type_;
  SourceSpan span_;
};

class ColumnConstraint {
 public:
  // Supported constraint types.
  using Type = ColumnConstraintTypeEnum;
  static std::string TypeToString(Type type);

  ColumnConstraint(Type type, const SourceSpan &span)
      : type_(type), span_(span) {}

  // Accessors.
  const Type &type() const { return this->type_; }
  const SourceSpan &span() const { return this->span_; }

 private:
  Type type_;
  SourceSpan span_;
};

class ColumnDefinition {
 public:
  using Strategy = ColumnStrategyEnum;

  // Only NOT NULL makes a column non-nullable.
  static Strategy StrategyFor(const ColumnConstraint &constraint);
  static std::string StrategyToString(Strategy strategy);

  ColumnDefinition(const Identifier &name, const DataType &type,
                   Strategy strategy, const SourceSpan &span)
      : name_(name), type_(type), strategy_(strategy), span_(span) {}

  // Accessors.
  const Identifier &name() const { return this->name_; }
  const std::string &column_name() const { return this->name_.name(); }
  const DataType &data_type() const { return this->type_; }
  DataType::Type column_type() const { return this->type_.type(); }
  Strategy strategy() const { return this->strategy_; }
  bool nullable() const { return this->strategy_ == Strategy::NULLABLE; }
  const SourceSpan &span() const { return this->span_; }

  // Visitor pattern.
  template <class T>
  T Visit(AbstractVisitor<T> *visitor) const {
    return visitor->VisitColumnDefinition(*this);
  }

 private:
  Identifier name_;
  DataType type_;
  Strategy strategy_;
  SourceSpan span_;
};

class CreateTable : public AbstractStatement {
 public:
  // `elements_span` is the span of the first table element.
  CreateTable(const Identifier &table_name,
              std::vector<ColumnDefinition> &&columns, bool if_not_exists,
              const SourceSpan &span, const SourceSpan &elements_span);

  // Accessors.
  const Identifier &name() const { return this->table_name_; }
  const std::string &table_name() const { return this->table_name_.name(); }
  bool if_not_exists() const { return this->if_not_exists_; }
  const SourceSpan &elements_span() const { return this->elements_span_; }

  // Columns in declaration order.
  const std::vector<ColumnDefinition> &GetColumns() const;
  const ColumnDefinition &GetColumn(const std::string &column_name) const;
  bool HasColumn(const std::string &column_name) const;

  // Visitor pattern.
  template <class T>
  T Visit(AbstractVisitor<T> *visitor) const {
    return visitor->VisitCreateTable(*this);
  }

  template <class T>
  std::vector<T> VisitChildren(AbstractVisitor<T> *visitor) const {
    std::vector<T> result;
    for (const auto &def : this->columns_) {
      result.push_back(std::move(visitor->VisitColumnDefinition(def)));
    }
    return result;
  }

 private:
  Identifier table_name_;
  std::vector<ColumnDefinition> columns_;
  std::unordered_map<std::string, size_t> columns_map_;
  bool if_not_exists_;
  SourceSpan elements_span_;
};

std::ostream &operator<<(std::ostream &os, const ColumnConstraint::Type &r);
std::ostream &operator<<(std::ostream &os, const DataType::Type &r);
std::ostream &operator<<(std::ostream &os, const ColumnDefinition::Strategy &s);

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_AST_SCHEMA_H_
