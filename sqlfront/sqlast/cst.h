// Concrete parse tree handed to us by the grammar-driven parser.
//
// One struct per grammar production. Alternatives of a production are
// closed sums (std::variant), so the transformer has to name a handler for
// every alternative. Nodes are plain values: the parser fills them in and
// the transformer only reads them.
#ifndef SQLFRONT_SQLAST_CST_H_
#define SQLFRONT_SQLAST_CST_H_

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlfront {
namespace cst {

// A lexical token, positions are 1-based.
struct Token {
  std::string text;
  size_t line;
  size_t column;
};

// Every node remembers the first and last token it was derived from.
struct Node {
  Token start;
  Token stop;
};

// Identifiers.
struct UnquotedIdentifier : Node {
  std::string text;
};
// `text` has the surrounding quotes stripped and "" escapes resolved.
struct QuotedIdentifier : Node {
  std::string text;
};
using Identifier = std::variant<UnquotedIdentifier, QuotedIdentifier>;

// ident ('.' ident)*
struct QualifiedName : Node {
  std::vector<Identifier> parts;
};
struct TableName : Node {
  QualifiedName qname;
};

// Data types.
struct IdentDataType : Node {
  Identifier ident;
};
// Multi keyword type names, e.g. DOUBLE PRECISION or
// TIMESTAMP WITH TIME ZONE.
struct KeywordDataType : Node {
  std::vector<Token> keywords;
};
using BaseDataType = std::variant<IdentDataType, KeywordDataType>;

// baseDataType ('(' integerLiteral (',' integerLiteral)* ')')?
struct MaybeParametrizedDataType : Node {
  BaseDataType base;
  std::vector<Token> parameters;
};
using DataType =
    std::variant<IdentDataType, KeywordDataType, MaybeParametrizedDataType>;

// Column constraints.
struct ColumnConstraintPrimaryKey : Node {};
struct ColumnConstraintNotNull : Node {};
// INDEX USING ..., INDEX OFF, STORAGE WITH (...), CHECK (...).
struct GenericColumnConstraint : Node {
  std::string rule;
};
using ColumnConstraint =
    std::variant<ColumnConstraintPrimaryKey, ColumnConstraintNotNull,
                 GenericColumnConstraint>;

// Table elements.
struct ColumnDefinition : Node {
  Identifier ident;
  DataType type;
  std::vector<ColumnConstraint> constraints;
};
// PRIMARY KEY (...), INDEX name USING ..., CHECK (...).
struct TableConstraint : Node {
  std::string rule;
};
using TableElement = std::variant<ColumnDefinition, TableConstraint>;

// Create table clauses.
struct PartitionedBy : Node {};
struct ClusteredBy : Node {};
struct WithProperties : Node {};

// Statements.
struct CreateTable : Node {
  // Set iff the IF NOT EXISTS keywords are present, holds the EXISTS token.
  std::optional<Token> exists;
  TableName table;
  std::vector<TableElement> elements;
  std::optional<PartitionedBy> partitioned_by;
  std::optional<ClusteredBy> clustered_by;
  std::optional<WithProperties> with_properties;
};
// CREATE TABLE name AS query.
struct CreateTableAs : Node {
  TableName table;
};
// Any other statement the grammar accepts, named by its grammar rule.
struct UnsupportedStatement : Node {
  std::string rule;
};
using Statement =
    std::variant<CreateTable, CreateTableAs, UnsupportedStatement>;

// statement ';'? EOF
struct SingleStatement : Node {
  Statement statement;
};

// The common node part of any alternative of a sum.
template <class... Ts>
const Node &NodeOf(const std::variant<Ts...> &alternatives) {
  return std::visit([](const auto &node) -> const Node & { return node; },
                    alternatives);
}

}  // namespace cst
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_CST_H_
