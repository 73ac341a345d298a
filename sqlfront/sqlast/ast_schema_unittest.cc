#include "sqlfront/sqlast/ast_schema.h"

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

namespace sqlfront {
namespace sqlast {

using CType = DataType::Type;
using Strategy = ColumnDefinition::Strategy;

namespace {

const SourceSpan kSpan{1, 1, 1, 1};

ColumnDefinition MakeColumn(const std::string &name, Strategy strategy) {
  return ColumnDefinition(Identifier(name, kSpan),
                          DataType(CType::INTEGER, kSpan), strategy, kSpan);
}

}  // namespace

// Both spellings of the integer type, in any case.
TEST(DataTypeTest, ResolveIntegers) {
  for (const std::string &name :
       {"INT", "int", "Int", "INTEGER", "integer", "iNtEgEr"}) {
    std::optional<CType> type = DataType::Resolve(name);
    ASSERT_TRUE(type.has_value()) << name;
    EXPECT_EQ(*type, CType::INTEGER);
  }
}

TEST(DataTypeTest, ResolveOthers) {
  for (const std::string &name :
       {"REAL", "TEXT", "DOUBLE PRECISION", "INT ", "", "INT4", "SMALLINT"}) {
    EXPECT_FALSE(DataType::Resolve(name).has_value()) << name;
  }
}

TEST(ColumnDefinitionTest, Strategy) {
  ColumnConstraint not_null(ColumnConstraint::Type::NOT_NULL, kSpan);
  ColumnConstraint primary_key(ColumnConstraint::Type::PRIMARY_KEY, kSpan);
  EXPECT_EQ(ColumnDefinition::StrategyFor(not_null), Strategy::NOT_NULLABLE);
  EXPECT_EQ(ColumnDefinition::StrategyFor(primary_key), Strategy::NULLABLE);

  EXPECT_TRUE(MakeColumn("a", Strategy::NULLABLE).nullable());
  EXPECT_FALSE(MakeColumn("a", Strategy::NOT_NULLABLE).nullable());
}

TEST(ColumnDefinitionTest, Printing) {
  std::ostringstream os;
  os << Strategy::NOT_NULLABLE << "," << Strategy::NULLABLE << ","
     << CType::INTEGER << "," << ColumnConstraint::Type::PRIMARY_KEY;
  EXPECT_EQ(os.str(), "NOT NULLABLE,NULLABLE,INTEGER,PRIMARY KEY");
}

TEST(CreateTableTest, ColumnLookup) {
  std::vector<ColumnDefinition> columns;
  columns.push_back(MakeColumn("id", Strategy::NULLABLE));
  columns.push_back(MakeColumn("name", Strategy::NOT_NULLABLE));
  columns.push_back(MakeColumn("id", Strategy::NOT_NULLABLE));
  CreateTable table(Identifier("users", kSpan), std::move(columns), false,
                    SourceSpan{1, 1, 1, 40}, SourceSpan{1, 20, 1, 22});

  EXPECT_EQ(table.type(), AbstractStatement::Type::CREATE_TABLE);
  EXPECT_EQ(table.table_name(), "users");
  EXPECT_FALSE(table.if_not_exists());
  EXPECT_EQ(table.span(), (SourceSpan{1, 1, 1, 40}));
  EXPECT_EQ(table.elements_span(), (SourceSpan{1, 20, 1, 22}));

  // Declaration order is kept, duplicates included.
  ASSERT_EQ(table.GetColumns().size(), 3);
  EXPECT_EQ(table.GetColumns().at(0).column_name(), "id");
  EXPECT_EQ(table.GetColumns().at(1).column_name(), "name");
  EXPECT_EQ(table.GetColumns().at(2).column_name(), "id");

  // Lookups find the first declaration.
  EXPECT_TRUE(table.HasColumn("name"));
  EXPECT_FALSE(table.HasColumn("NAME"));
  EXPECT_EQ(table.GetColumn("id").strategy(), Strategy::NULLABLE);
}

}  // namespace sqlast
}  // namespace sqlfront
