// Helpers for tests: build the concrete trees the grammar parser would hand
// us, with tokens at the positions they would have in the source text.
#ifndef SQLFRONT_SQLAST_CST_TESTING_H_
#define SQLFRONT_SQLAST_CST_TESTING_H_

#include <cstddef>
#include <string>
#include <vector>

#include "sqlfront/sqlast/cst.h"

namespace sqlfront {
namespace sqlast {
namespace cst_testing {

// Lays out tokens left to right and records the resulting source text.
class TokenCursor {
 public:
  TokenCursor() : line_(1), column_(1), space_pending_(false) {}

  // Token separated from the previous one by a single space.
  cst::Token Next(const std::string &text);
  // Token directly adjacent to the previous one.
  cst::Token Attach(const std::string &text);
  // Space separated words, one token each.
  std::vector<cst::Token> Words(const std::string &text);
  void NewLine(size_t indent = 0);
  // The next token starts right after the previous one.
  void Hug();

  const std::string &source() const { return this->source_; }

 private:
  cst::Token Emit(const std::string &text);

  size_t line_;
  size_t column_;
  bool space_pending_;
  std::string source_;
};

// "abc" lexemes become quoted identifiers ("" unescaped), anything else an
// unquoted identifier.
cst::Identifier MakeIdentifier(cst::Token token);

// CREATE TABLE [IF NOT EXISTS] <name> (<elements>) [clauses].
class CreateTableBuilder {
 public:
  // Dotted names ("doc.t") become multi part qualified names.
  explicit CreateTableBuilder(const std::string &table_name)
      : table_name_(table_name) {}

  CreateTableBuilder &IfNotExists();
  // `type` is a type name ("INT"), a keyword type ("DOUBLE PRECISION") or a
  // parametrized type ("VARCHAR(10)"). Constraints "PRIMARY KEY" and
  // "NOT NULL" are recognized, anything else is a generic constraint.
  CreateTableBuilder &AddColumn(const std::string &name,
                                const std::string &type,
                                const std::vector<std::string> &constraints);
  CreateTableBuilder &AddTableConstraint(const std::string &rule);
  CreateTableBuilder &PartitionedBy(const std::string &column);
  CreateTableBuilder &ClusteredBy(const std::string &column);
  CreateTableBuilder &WithProperties(const std::string &properties);
  // Puts every table element on a line of its own.
  CreateTableBuilder &OneElementPerLine();

  cst::SingleStatement Build(TokenCursor *cursor) const;
  cst::CreateTable BuildCreateTable(TokenCursor *cursor) const;

 private:
  struct Element {
    bool is_column;
    std::string name_or_rule;
    std::string type;
    std::vector<std::string> constraints;
  };

  cst::TableName BuildTableName(TokenCursor *cursor) const;
  cst::TableElement BuildElement(const Element &element,
                                 TokenCursor *cursor) const;

  std::string table_name_;
  bool if_not_exists_ = false;
  bool one_per_line_ = false;
  std::vector<Element> elements_;
  std::string partitioned_by_;
  std::string clustered_by_;
  std::string properties_;
};

}  // namespace cst_testing
}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_CST_TESTING_H_
