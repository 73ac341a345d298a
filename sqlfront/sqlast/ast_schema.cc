// Create table statement and sub expressions.
#include "sqlfront/sqlast/ast_schema.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "glog/logging.h"

namespace sqlfront {
namespace sqlast {

/*
 * DataType.
 */
namespace {

// The canonical type table. Keys are upper case. Built once, never mutated,
// safe to read from concurrent transformations.
const absl::flat_hash_map<std::string, DataType::Type> &TypeTable() {
  static const auto *table =
      new absl::flat_hash_map<std::string, DataType::Type>({
          {"INT", DataType::Type::INTEGER},
          {"INTEGER", DataType::Type::INTEGER},
      });
  return *table;
}

}  // namespace

std::optional<DataType::Type> DataType::Resolve(absl::string_view type_name) {
  const auto &table = TypeTable();
  auto it = table.find(absl::AsciiStrToUpper(type_name));
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string DataType::TypeToString(DataType::Type type) {
  switch (type) {
    case Type::INTEGER:
      return "INTEGER";
    default:
      LOG(FATAL) << "Unsupported data type: " << static_cast<int>(type);
  }
}

/*
 * ColumnConstraint.
 */
std::string ColumnConstraint::TypeToString(Type type) {
  switch (type) {
    case Type::PRIMARY_KEY:
      return "PRIMARY KEY";
    case Type::NOT_NULL:
      return "NOT NULL";
    default:
      LOG(FATAL) << "Unsupported constraint type: " << static_cast<int>(type);
  }
}

/*
 * ColumnDefinition.
 */
ColumnDefinition::Strategy ColumnDefinition::StrategyFor(
    const ColumnConstraint &constraint) {
  if (constraint.type() == ColumnConstraint::Type::NOT_NULL) {
    return Strategy::NOT_NULLABLE;
  }
  return Strategy::NULLABLE;
}

std::string ColumnDefinition::StrategyToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::NULLABLE:
      return "NULLABLE";
    case Strategy::NOT_NULLABLE:
      return "NOT NULLABLE";
    default:
      LOG(FATAL) << "Unsupported column strategy: "
                 << static_cast<int>(strategy);
  }
}

/*
 * CreateTable.
 */
CreateTable::CreateTable(const Identifier &table_name,
                         std::vector<ColumnDefinition> &&columns,
                         bool if_not_exists, const SourceSpan &span,
                         const SourceSpan &elements_span)
    : AbstractStatement(AbstractStatement::Type::CREATE_TABLE, span),
      table_name_(table_name),
      columns_(std::move(columns)),
      if_not_exists_(if_not_exists),
      elements_span_(elements_span) {
  // Lookups resolve to the first column declared under a name.
  for (size_t i = 0; i < this->columns_.size(); i++) {
    this->columns_map_.insert({this->columns_.at(i).column_name(), i});
  }
}

const std::vector<ColumnDefinition> &CreateTable::GetColumns() const {
  return this->columns_;
}
bool CreateTable::HasColumn(const std::string &column_name) const {
  return this->columns_map_.count(column_name) == 1;
}
const ColumnDefinition &CreateTable::GetColumn(
    const std::string &column_name) const {
  return this->columns_.at(this->columns_map_.at(column_name));
}

/*
 * Printing / logging
 */
std::ostream &operator<<(std::ostream &os, const ColumnConstraint::Type &r) {
  return os << ColumnConstraint::TypeToString(r);
}
std::ostream &operator<<(std::ostream &os, const DataType::Type &r) {
  return os << DataType::TypeToString(r);
}
std::ostream &operator<<(std::ostream &os,
                         const ColumnDefinition::Strategy &s) {
  return os << ColumnDefinition::StrategyToString(s);
}

}  // namespace sqlast
}  // namespace sqlfront
