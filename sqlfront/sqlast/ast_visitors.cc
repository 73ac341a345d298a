// Helper visitors for traversing ASTs.
#include "sqlfront/sqlast/ast_visitors.h"

#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"

namespace sqlfront {
namespace sqlast {

namespace {

// Words that cannot appear as bare names. Lower case, names are compared
// after folding.
const absl::flat_hash_set<std::string> &ReservedKeywords() {
  static const auto *keywords = new absl::flat_hash_set<std::string>({
      "all", "alter", "and", "any", "array", "as", "asc", "between", "by",
      "case", "cast", "check", "clustered", "collate", "column", "constraint",
      "create", "cross", "current", "default", "delete", "desc", "distinct",
      "drop", "else", "end", "escape", "except", "exists", "extract", "false",
      "fetch", "for", "foreign", "from", "full", "grant", "group", "having",
      "if", "in", "index", "inner", "insert", "intersect", "into", "is", "join",
      "key", "left", "like", "limit", "natural", "not", "null", "offset", "on",
      "or", "order", "outer", "partitioned", "primary", "references", "right",
      "select", "set", "table", "then", "to", "true", "union", "unique",
      "update", "using", "values", "when", "where", "with",
  });
  return *keywords;
}

// [a-z_][a-z0-9_]* and not a keyword.
bool IsPlainIdentifier(const std::string &name) {
  if (name.empty() || absl::ascii_isdigit(name.front())) {
    return false;
  }
  for (char c : name) {
    if (!(absl::ascii_islower(c) || absl::ascii_isdigit(c) || c == '_')) {
      return false;
    }
  }
  return !ReservedKeywords().contains(name);
}

}  // namespace

std::string Stringifier::QuoteIdentifier(const Identifier &identifier) {
  const std::string &name = identifier.name();
  if (IsPlainIdentifier(name)) {
    return name;
  }
  return "\"" + absl::StrReplaceAll(name, {{"\"", "\"\""}}) + "\"";
}

/*
 * Table creation.
 */

std::string Stringifier::VisitCreateTable(const CreateTable &ast) {
  std::string result = "CREATE TABLE ";
  if (ast.if_not_exists()) {
    result += "IF NOT EXISTS ";
  }
  result += QuoteIdentifier(ast.name()) + " (";
  result += absl::StrJoin(ast.VisitChildren(this), ", ");
  result += ")";
  return result;
}

std::string Stringifier::VisitColumnDefinition(const ColumnDefinition &ast) {
  std::string result = QuoteIdentifier(ast.name()) + " " +
                       DataType::TypeToString(ast.column_type());
  if (!ast.nullable()) {
    result += " NOT NULL";
  }
  return result;
}

/*
 * Printing / logging
 */

std::ostream &operator<<(std::ostream &os, const AbstractStatement &r) {
  Stringifier stringifier;
  return os << r.Visit(&stringifier);
}

}  // namespace sqlast
}  // namespace sqlfront
