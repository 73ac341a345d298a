#include "sqlfront/sqlast/cst_testing.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"

namespace sqlfront {
namespace sqlast {
namespace cst_testing {

/*
 * TokenCursor.
 */
cst::Token TokenCursor::Emit(const std::string &text) {
  cst::Token token{text, this->line_, this->column_};
  this->source_ += text;
  this->column_ += text.size();
  this->space_pending_ = true;
  return token;
}

cst::Token TokenCursor::Next(const std::string &text) {
  if (this->space_pending_) {
    this->source_ += ' ';
    this->column_++;
  }
  return this->Emit(text);
}

cst::Token TokenCursor::Attach(const std::string &text) {
  return this->Emit(text);
}

std::vector<cst::Token> TokenCursor::Words(const std::string &text) {
  std::vector<cst::Token> tokens;
  for (absl::string_view word : absl::StrSplit(text, ' ', absl::SkipEmpty())) {
    tokens.push_back(this->Next(std::string(word)));
  }
  return tokens;
}

void TokenCursor::NewLine(size_t indent) {
  this->source_ += '\n';
  this->source_ += std::string(indent, ' ');
  this->line_++;
  this->column_ = 1 + indent;
  this->space_pending_ = false;
}

void TokenCursor::Hug() { this->space_pending_ = false; }

/*
 * Identifiers.
 */
cst::Identifier MakeIdentifier(cst::Token token) {
  const std::string &lexeme = token.text;
  if (lexeme.size() >= 2 && lexeme.front() == '"' && lexeme.back() == '"') {
    cst::QuotedIdentifier ident;
    ident.text = absl::StrReplaceAll(lexeme.substr(1, lexeme.size() - 2),
                                     {{"\"\"", "\""}});
    ident.start = token;
    ident.stop = std::move(token);
    return ident;
  }
  cst::UnquotedIdentifier ident;
  ident.text = lexeme;
  ident.start = token;
  ident.stop = std::move(token);
  return ident;
}

/*
 * CreateTableBuilder.
 */
CreateTableBuilder &CreateTableBuilder::IfNotExists() {
  this->if_not_exists_ = true;
  return *this;
}

CreateTableBuilder &CreateTableBuilder::AddColumn(
    const std::string &name, const std::string &type,
    const std::vector<std::string> &constraints) {
  this->elements_.push_back(Element{true, name, type, constraints});
  return *this;
}

CreateTableBuilder &CreateTableBuilder::AddTableConstraint(
    const std::string &rule) {
  this->elements_.push_back(Element{false, rule, "", {}});
  return *this;
}

CreateTableBuilder &CreateTableBuilder::PartitionedBy(
    const std::string &column) {
  this->partitioned_by_ = column;
  return *this;
}

CreateTableBuilder &CreateTableBuilder::ClusteredBy(const std::string &column) {
  this->clustered_by_ = column;
  return *this;
}

CreateTableBuilder &CreateTableBuilder::WithProperties(
    const std::string &properties) {
  this->properties_ = properties;
  return *this;
}

CreateTableBuilder &CreateTableBuilder::OneElementPerLine() {
  this->one_per_line_ = true;
  return *this;
}

cst::TableName CreateTableBuilder::BuildTableName(TokenCursor *cursor) const {
  cst::TableName table;
  std::vector<std::string> parts = absl::StrSplit(this->table_name_, '.');
  for (size_t i = 0; i < parts.size(); i++) {
    cst::Token token;
    if (i == 0) {
      token = cursor->Next(parts.at(i));
      table.qname.start = token;
    } else {
      cursor->Attach(".");
      token = cursor->Attach(parts.at(i));
    }
    table.qname.stop = token;
    table.qname.parts.push_back(MakeIdentifier(std::move(token)));
  }
  table.start = table.qname.start;
  table.stop = table.qname.stop;
  return table;
}

cst::TableElement CreateTableBuilder::BuildElement(const Element &element,
                                                   TokenCursor *cursor) const {
  if (!element.is_column) {
    std::vector<cst::Token> tokens = cursor->Words(element.name_or_rule);
    cst::TableConstraint constraint;
    constraint.rule = element.name_or_rule;
    constraint.start = tokens.front();
    constraint.stop = tokens.back();
    return constraint;
  }

  cst::ColumnDefinition column;
  column.start = cursor->Next(element.name_or_rule);
  column.ident = MakeIdentifier(column.start);

  // Type name, optionally followed by parameters.
  std::string base = element.type;
  std::vector<std::string> parameters;
  size_t paren = element.type.find('(');
  if (paren != std::string::npos) {
    base = element.type.substr(0, paren);
    std::string inner = element.type.substr(
        paren + 1, element.type.rfind(')') - paren - 1);
    parameters = absl::StrSplit(inner, ',', absl::SkipEmpty());
  }

  std::vector<cst::Token> words = cursor->Words(base);
  cst::MaybeParametrizedDataType type;
  if (words.size() == 1) {
    cst::IdentDataType ident_type;
    ident_type.ident = MakeIdentifier(words.front());
    ident_type.start = words.front();
    ident_type.stop = words.front();
    type.base = std::move(ident_type);
  } else {
    cst::KeywordDataType keyword_type;
    keyword_type.keywords = words;
    keyword_type.start = words.front();
    keyword_type.stop = words.back();
    type.base = std::move(keyword_type);
  }
  type.start = words.front();
  type.stop = words.back();
  if (!parameters.empty()) {
    cursor->Attach("(");
    for (size_t i = 0; i < parameters.size(); i++) {
      if (i > 0) {
        cursor->Attach(",");
      }
      std::string parameter(absl::StripAsciiWhitespace(parameters.at(i)));
      type.parameters.push_back(cursor->Attach(parameter));
    }
    type.stop = cursor->Attach(")");
  }
  column.stop = type.stop;
  column.type = std::move(type);

  for (const std::string &text : element.constraints) {
    std::vector<cst::Token> tokens = cursor->Words(text);
    column.stop = tokens.back();
    if (text == "PRIMARY KEY") {
      cst::ColumnConstraintPrimaryKey constraint;
      constraint.start = tokens.front();
      constraint.stop = tokens.back();
      column.constraints.push_back(std::move(constraint));
    } else if (text == "NOT NULL") {
      cst::ColumnConstraintNotNull constraint;
      constraint.start = tokens.front();
      constraint.stop = tokens.back();
      column.constraints.push_back(std::move(constraint));
    } else {
      cst::GenericColumnConstraint constraint;
      constraint.rule = text;
      constraint.start = tokens.front();
      constraint.stop = tokens.back();
      column.constraints.push_back(std::move(constraint));
    }
  }
  return column;
}

cst::CreateTable CreateTableBuilder::BuildCreateTable(
    TokenCursor *cursor) const {
  cst::CreateTable stmt;
  stmt.start = cursor->Next("CREATE");
  cursor->Next("TABLE");
  if (this->if_not_exists_) {
    cursor->Next("IF");
    cursor->Next("NOT");
    stmt.exists = cursor->Next("EXISTS");
  }
  stmt.table = this->BuildTableName(cursor);

  // Table elements, the first one hugs the opening parenthesis.
  cursor->Next("(");
  for (size_t i = 0; i < this->elements_.size(); i++) {
    if (this->one_per_line_) {
      cursor->NewLine(2);
    } else if (i == 0) {
      cursor->Hug();
    }
    stmt.elements.push_back(this->BuildElement(this->elements_.at(i), cursor));
    if (i + 1 < this->elements_.size()) {
      cursor->Attach(",");
    }
  }
  cst::Token last;
  if (this->one_per_line_) {
    cursor->NewLine(0);
    last = cursor->Next(")");
  } else {
    last = cursor->Attach(")");
  }

  if (!this->partitioned_by_.empty()) {
    cst::PartitionedBy clause;
    clause.start = cursor->Next("PARTITIONED");
    cursor->Next("BY");
    cursor->Next("(");
    cursor->Attach(this->partitioned_by_);
    clause.stop = last = cursor->Attach(")");
    stmt.partitioned_by = std::move(clause);
  }
  if (!this->clustered_by_.empty()) {
    cst::ClusteredBy clause;
    clause.start = cursor->Next("CLUSTERED");
    cursor->Next("BY");
    cursor->Next("(");
    cursor->Attach(this->clustered_by_);
    clause.stop = last = cursor->Attach(")");
    stmt.clustered_by = std::move(clause);
  }
  if (!this->properties_.empty()) {
    cst::WithProperties clause;
    clause.start = cursor->Next("WITH");
    cursor->Next("(");
    cursor->Attach(this->properties_);
    clause.stop = last = cursor->Attach(")");
    stmt.with_properties = std::move(clause);
  }
  stmt.stop = last;
  return stmt;
}

cst::SingleStatement CreateTableBuilder::Build(TokenCursor *cursor) const {
  cst::SingleStatement single;
  cst::CreateTable stmt = this->BuildCreateTable(cursor);
  single.start = stmt.start;
  single.stop = stmt.stop;
  single.statement = std::move(stmt);
  return single;
}

}  // namespace cst_testing
}  // namespace sqlast
}  // namespace sqlfront
