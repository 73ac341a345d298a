#include "sqlfront/sqlast/ast_visitors.h"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "sqlfront/sqlast/ast.h"

namespace sqlfront {
namespace sqlast {

using Strategy = ColumnDefinition::Strategy;

namespace {

const SourceSpan kSpan{1, 1, 1, 1};

std::unique_ptr<AbstractStatement> MakeTable(const std::string &name,
                                             bool if_not_exists) {
  std::vector<ColumnDefinition> columns;
  columns.emplace_back(Identifier("id", kSpan),
                       DataType(DataType::Type::INTEGER, kSpan),
                       Strategy::NOT_NULLABLE, kSpan);
  columns.emplace_back(Identifier("Owner Name", kSpan),
                       DataType(DataType::Type::INTEGER, kSpan),
                       Strategy::NULLABLE, kSpan);
  return std::make_unique<CreateTable>(Identifier(name, kSpan),
                                       std::move(columns), if_not_exists,
                                       kSpan, kSpan);
}

// Counts columns without knowing the statement type.
class ColumnCounter : public AbstractVisitor<size_t> {
 public:
  size_t VisitCreateTable(const CreateTable &ast) override {
    size_t count = 0;
    for (size_t c : ast.VisitChildren(this)) {
      count += c;
    }
    return count;
  }
  size_t VisitColumnDefinition(const ColumnDefinition &ast) override {
    return 1;
  }
};

}  // namespace

TEST(StringifierTest, CreateTable) {
  std::unique_ptr<AbstractStatement> table = MakeTable("users", false);
  Stringifier stringifier;
  EXPECT_EQ(table->Visit(&stringifier),
            "CREATE TABLE users (id INTEGER NOT NULL, \"Owner Name\" INTEGER)");

  std::ostringstream os;
  os << *MakeTable("Users", true);
  EXPECT_EQ(os.str(),
            "CREATE TABLE IF NOT EXISTS \"Users\" (id INTEGER NOT NULL, "
            "\"Owner Name\" INTEGER)");
}

TEST(StringifierTest, QuoteIdentifier) {
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("t_1", kSpan)), "t_1");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("_x", kSpan)), "_x");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("1t", kSpan)), "\"1t\"");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("Ab", kSpan)), "\"Ab\"");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("a\"b", kSpan)),
            "\"a\"\"b\"");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("", kSpan)), "\"\"");
}

// Keywords used as names are quoted, or the output would not parse.
TEST(StringifierTest, KeywordNames) {
  std::vector<ColumnDefinition> columns;
  columns.emplace_back(Identifier("from", kSpan),
                       DataType(DataType::Type::INTEGER, kSpan),
                       Strategy::NOT_NULLABLE, kSpan);
  columns.emplace_back(Identifier("fromage", kSpan),
                       DataType(DataType::Type::INTEGER, kSpan),
                       Strategy::NULLABLE, kSpan);
  CreateTable table(Identifier("select", kSpan), std::move(columns), false,
                    kSpan, kSpan);

  Stringifier stringifier;
  EXPECT_EQ(stringifier.VisitCreateTable(table),
            "CREATE TABLE \"select\" (\"from\" INTEGER NOT NULL, fromage "
            "INTEGER)");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("null", kSpan)),
            "\"null\"");
  EXPECT_EQ(Stringifier::QuoteIdentifier(Identifier("nullable", kSpan)),
            "nullable");
}

TEST(VisitorTest, DispatchOnStatementType) {
  ColumnCounter counter;
  EXPECT_EQ(MakeTable("t", false)->Visit(&counter), 2);
}

}  // namespace sqlast
}  // namespace sqlfront
