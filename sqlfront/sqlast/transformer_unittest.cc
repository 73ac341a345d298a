#include "sqlfront/sqlast/transformer.h"

#include <clocale>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "gtest/gtest.h"
#include "sqlfront/sqlast/cst_testing.h"
#include "sqlfront/sqlast/errors.h"

namespace sqlfront {
namespace sqlast {

using cst_testing::CreateTableBuilder;
using cst_testing::MakeIdentifier;
using cst_testing::TokenCursor;

namespace {

const CreateTable &AsCreateTable(
    const std::unique_ptr<AbstractStatement> &statement) {
  CHECK(statement->type() == AbstractStatement::Type::CREATE_TABLE);
  return *static_cast<const CreateTable *>(statement.get());
}

const cst::ColumnDefinition &ColumnNode(const cst::SingleStatement &statement,
                                        size_t i) {
  const auto &table = std::get<cst::CreateTable>(statement.statement);
  return std::get<cst::ColumnDefinition>(table.elements.at(i));
}

cst::SingleStatement Wrap(cst::Statement statement) {
  cst::SingleStatement single;
  single.start = cst::NodeOf(statement).start;
  single.stop = cst::NodeOf(statement).stop;
  single.statement = std::move(statement);
  return single;
}

cst::TableName TableNameAt(TokenCursor *cursor, const std::string &name) {
  cst::TableName table;
  cst::Token token = cursor->Next(name);
  table.start = table.stop = table.qname.start = table.qname.stop = token;
  table.qname.parts.push_back(MakeIdentifier(token));
  return table;
}

SyntaxError ExpectError(const absl::Status &status, ErrorKind kind) {
  std::optional<SyntaxError> error = ExtractSyntaxError(status);
  CHECK(error.has_value()) << status;
  EXPECT_EQ(error->kind, kind);
  EXPECT_TRUE(absl::StartsWith(status.message(), ErrorKindToString(kind)))
      << status;
  return *error;
}

}  // namespace

TEST(AstTransformerTest, CreateTableNotNull) {
  TokenCursor cursor;
  cst::SingleStatement cst =
      CreateTableBuilder("t").AddColumn("a", "INT", {"NOT NULL"}).Build(
          &cursor);
  EXPECT_EQ(cursor.source(), "CREATE TABLE t (a INT NOT NULL)");

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_TRUE(result.ok()) << result.status();
  const CreateTable &table = AsCreateTable(*result);

  EXPECT_EQ(table.table_name(), "t");
  EXPECT_FALSE(table.if_not_exists());
  ASSERT_EQ(table.GetColumns().size(), 1);
  const ColumnDefinition &column = table.GetColumns().front();
  EXPECT_EQ(column.column_name(), "a");
  EXPECT_EQ(column.column_type(), DataType::Type::INTEGER);
  EXPECT_EQ(column.strategy(), ColumnDefinition::Strategy::NOT_NULLABLE);
  EXPECT_FALSE(column.nullable());

  // Every node points back at the tokens it came from.
  EXPECT_EQ(table.span(), (SourceSpan{1, 1, 1, 31}));
  EXPECT_EQ(table.name().span(), (SourceSpan{1, 14, 1, 14}));
  EXPECT_EQ(column.span(), (SourceSpan{1, 17, 1, 27}));
  EXPECT_EQ(column.name().span(), (SourceSpan{1, 17, 1, 17}));
  EXPECT_EQ(column.data_type().span(), (SourceSpan{1, 19, 1, 19}));
  EXPECT_EQ(table.elements_span(), column.span());
}

TEST(AstTransformerTest, ZeroConstraintsRejected) {
  TokenCursor cursor;
  cst::SingleStatement cst = CreateTableBuilder("t")
                                 .IfNotExists()
                                 .AddColumn("a", "INTEGER", {})
                                 .Build(&cursor);
  EXPECT_EQ(cursor.source(), "CREATE TABLE IF NOT EXISTS t (a INTEGER)");

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::INVALID_CONSTRAINT_CARDINALITY);
  EXPECT_EQ(error.span, SpanOf(ColumnNode(cst, 0)));
  EXPECT_EQ(error.span, (SourceSpan{1, 31, 1, 33}));
  EXPECT_EQ(error.line, 1);
  EXPECT_EQ(error.column, 31);
}

TEST(AstTransformerTest, TwoConstraintsRejected) {
  TokenCursor cursor;
  cst::SingleStatement cst =
      CreateTableBuilder("t")
          .AddColumn("a", "INT", {"PRIMARY KEY", "NOT NULL"})
          .Build(&cursor);

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_FALSE(result.ok());
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::INVALID_CONSTRAINT_CARDINALITY);
  EXPECT_TRUE(absl::StrContains(error.message, "2 constraints"));
  EXPECT_EQ(error.span, SpanOf(ColumnNode(cst, 0)));
}

TEST(AstTransformerTest, UnresolvableTypeName) {
  TokenCursor cursor;
  cst::SingleStatement cst =
      CreateTableBuilder("t").AddColumn("a", "REAL", {"NOT NULL"}).Build(
          &cursor);

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::UNRESOLVABLE_TYPE_NAME);
  EXPECT_TRUE(absl::StrContains(error.message, "REAL"));
  EXPECT_EQ(error.line, 1);
  EXPECT_EQ(error.column, 19);
}

TEST(AstTransformerTest, TableNameCaseFolding) {
  TokenCursor quoted_cursor;
  auto quoted = AstTransformer().TransformStatement(
      CreateTableBuilder("\"MixedCase\"")
          .AddColumn("a", "INT", {"NOT NULL"})
          .Build(&quoted_cursor));
  ASSERT_TRUE(quoted.ok()) << quoted.status();
  EXPECT_EQ(AsCreateTable(*quoted).table_name(), "MixedCase");

  TokenCursor unquoted_cursor;
  auto unquoted = AstTransformer().TransformStatement(
      CreateTableBuilder("MixedCase")
          .AddColumn("a", "INT", {"NOT NULL"})
          .Build(&unquoted_cursor));
  ASSERT_TRUE(unquoted.ok()) << unquoted.status();
  EXPECT_EQ(AsCreateTable(*unquoted).table_name(), "mixedcase");
}

TEST(AstTransformerTest, ColumnNamesCaseFolding) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .AddColumn("UserId", "INT", {"PRIMARY KEY"})
          .AddColumn("\"UserName\"", "INT", {"NOT NULL"})
          .Build(&cursor));
  ASSERT_TRUE(result.ok()) << result.status();
  const CreateTable &table = AsCreateTable(*result);
  EXPECT_TRUE(table.HasColumn("userid"));
  EXPECT_FALSE(table.HasColumn("UserId"));
  EXPECT_TRUE(table.HasColumn("UserName"));
  EXPECT_FALSE(table.HasColumn("username"));
}

TEST(AstTransformerTest, TransformIdentifier) {
  TokenCursor cursor;
  AstTransformer transformer;

  // Only ASCII letters fold, other bytes are kept whatever the locale.
  Identifier unquoted = transformer.TransformIdentifier(
      MakeIdentifier(cursor.Next("\xC3\x84" "Bc_9X")));
  EXPECT_EQ(unquoted.name(), "\xC3\x84" "bc_9x");

  // Escapes are resolved by the parser, the text is kept byte for byte.
  Identifier quoted = transformer.TransformIdentifier(
      MakeIdentifier(cursor.Next("\"Say \"\"Hi\"\"\"")));
  EXPECT_EQ(quoted.name(), "Say \"Hi\"");
  EXPECT_EQ(quoted.span().start_column, quoted.span().end_column);
}

// Folding does not depend on the process locale, I folds to i even under
// tr_TR.
TEST(AstTransformerTest, FoldingIgnoresLocale) {
  std::string saved = std::setlocale(LC_ALL, nullptr);
  std::setlocale(LC_ALL, "tr_TR.UTF-8");
  TokenCursor cursor;
  Identifier folded = AstTransformer().TransformIdentifier(
      MakeIdentifier(cursor.Next("TITLE_INDEX")));
  std::setlocale(LC_ALL, saved.c_str());
  EXPECT_EQ(folded.name(), "title_index");
}

TEST(AstTransformerTest, PrimaryKeyAloneIsNullable) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .AddColumn("id", "INT", {"PRIMARY KEY"})
          .Build(&cursor));
  ASSERT_TRUE(result.ok()) << result.status();
  const ColumnDefinition &column = AsCreateTable(*result).GetColumn("id");
  EXPECT_EQ(column.strategy(), ColumnDefinition::Strategy::NULLABLE);
  EXPECT_TRUE(column.nullable());
}

TEST(AstTransformerTest, ConstraintsCarryTheirSpan) {
  TokenCursor cursor;
  cst::ColumnConstraintNotNull not_null;
  not_null.start = cursor.Next("NOT");
  not_null.stop = cursor.Next("NULL");
  cst::ColumnConstraintPrimaryKey primary_key;
  primary_key.start = cursor.Next("PRIMARY");
  primary_key.stop = cursor.Next("KEY");

  AstTransformer transformer;
  ColumnConstraint first = transformer.TransformConstraint(not_null);
  ColumnConstraint second = transformer.TransformConstraint(primary_key);
  EXPECT_EQ(first.type(), ColumnConstraint::Type::NOT_NULL);
  EXPECT_EQ(first.span(), (SourceSpan{1, 1, 1, 5}));
  EXPECT_EQ(second.type(), ColumnConstraint::Type::PRIMARY_KEY);
  EXPECT_EQ(second.span(), (SourceSpan{1, 10, 1, 18}));
}

TEST(AstTransformerTest, EmptyElementList) {
  TokenCursor cursor;
  cst::SingleStatement cst = CreateTableBuilder("t").Build(&cursor);
  EXPECT_EQ(cursor.source(), "CREATE TABLE t ()");

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_TRUE(result.ok()) << result.status();
  const CreateTable &table = AsCreateTable(*result);
  EXPECT_TRUE(table.GetColumns().empty());
  EXPECT_EQ(table.span(), (SourceSpan{1, 1, 1, 17}));
  EXPECT_EQ(table.elements_span(), table.span());
}

TEST(AstTransformerTest, ColumnOrderPreserved) {
  std::vector<std::string> names = {"zeta", "alpha", "mid", "beta", "omega"};
  CreateTableBuilder builder("t");
  for (const std::string &name : names) {
    builder.AddColumn(name, "INT", {"NOT NULL"});
  }
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(builder.Build(&cursor));
  ASSERT_TRUE(result.ok()) << result.status();

  const std::vector<ColumnDefinition> &columns =
      AsCreateTable(*result).GetColumns();
  ASSERT_EQ(columns.size(), names.size());
  for (size_t i = 0; i < names.size(); i++) {
    EXPECT_EQ(columns.at(i).column_name(), names.at(i));
  }
}

TEST(AstTransformerTest, IfNotExistsReadFromToken) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .IfNotExists()
          .AddColumn("a", "INT", {"NOT NULL"})
          .Build(&cursor));
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_TRUE(AsCreateTable(*result).if_not_exists());
}

TEST(AstTransformerTest, TypeNamesIgnoreCase) {
  for (const std::string &type : {"int", "Int", "INT", "integer", "InTeGeR",
                                  "\"Integer\"", "\"int\""}) {
    TokenCursor cursor;
    auto result = AstTransformer().TransformStatement(
        CreateTableBuilder("t").AddColumn("a", type, {"NOT NULL"}).Build(
            &cursor));
    ASSERT_TRUE(result.ok()) << type << ": " << result.status();
    EXPECT_EQ(AsCreateTable(*result).GetColumns().front().column_type(),
              DataType::Type::INTEGER);
  }
}

TEST(AstTransformerTest, TypeNamesOutsideTableRejected) {
  for (const std::string &type :
       {"REAL", "TEXT", "VARCHAR", "BIGINT", "INTEGERS", "\"INTS\""}) {
    TokenCursor cursor;
    auto result = AstTransformer().TransformStatement(
        CreateTableBuilder("t").AddColumn("a", type, {"NOT NULL"}).Build(
            &cursor));
    ASSERT_FALSE(result.ok()) << type;
    ExpectError(result.status(), ErrorKind::UNRESOLVABLE_TYPE_NAME);
  }
}

TEST(AstTransformerTest, KeywordTypeRejected) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .AddColumn("a", "DOUBLE PRECISION", {"NOT NULL"})
          .Build(&cursor));
  ASSERT_FALSE(result.ok());
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::UNRESOLVABLE_TYPE_NAME);
  EXPECT_TRUE(absl::StrContains(error.message, "DOUBLE PRECISION"));
  EXPECT_EQ(error.span, (SourceSpan{1, 19, 1, 26}));
}

TEST(AstTransformerTest, TypeParametersUnsupported) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .AddColumn("a", "INT(11)", {"NOT NULL"})
          .Build(&cursor));
  EXPECT_EQ(cursor.source(), "CREATE TABLE t (a INT(11) NOT NULL)");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kUnimplemented);
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::UNHANDLED_NODE_KIND);
  EXPECT_EQ(error.span, (SourceSpan{1, 19, 1, 25}));
}

TEST(AstTransformerTest, FirstFailureWins) {
  TokenCursor cursor;
  auto result = AstTransformer().TransformStatement(
      CreateTableBuilder("t")
          .AddColumn("a", "INT", {"NOT NULL"})
          .AddColumn("b", "REAL", {"NOT NULL"})
          .AddColumn("c", "INT", {})
          .Build(&cursor));
  ASSERT_FALSE(result.ok());
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::UNRESOLVABLE_TYPE_NAME);
  EXPECT_TRUE(absl::StrContains(error.message, "REAL"));
}

TEST(AstTransformerTest, MultiLinePositions) {
  TokenCursor cursor;
  cst::SingleStatement cst = CreateTableBuilder("t")
                                 .OneElementPerLine()
                                 .AddColumn("a", "INT", {"NOT NULL"})
                                 .AddColumn("b", "INT", {})
                                 .Build(&cursor);
  EXPECT_EQ(cursor.source(), "CREATE TABLE t (\n  a INT NOT NULL,\n  b INT\n)");

  auto result = AstTransformer().TransformStatement(cst);
  ASSERT_FALSE(result.ok());
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::INVALID_CONSTRAINT_CARDINALITY);
  EXPECT_EQ(error.line, 3);
  EXPECT_EQ(error.column, 3);
  EXPECT_EQ(error.span, (SourceSpan{3, 3, 3, 5}));
}

TEST(AstTransformerTest, UnsupportedCreateTableClauses) {
  struct Case {
    CreateTableBuilder builder;
    size_t column;
  };
  std::vector<Case> cases = {
      {CreateTableBuilder("t")
           .AddColumn("a", "INT", {"NOT NULL"})
           .PartitionedBy("a"),
       33},
      {CreateTableBuilder("t")
           .AddColumn("a", "INT", {"NOT NULL"})
           .ClusteredBy("a"),
       33},
      {CreateTableBuilder("t")
           .AddColumn("a", "INT", {"NOT NULL"})
           .WithProperties("number_of_replicas = 1"),
       33},
      {CreateTableBuilder("t")
           .AddColumn("a", "INT", {"NOT NULL"})
           .AddTableConstraint("PRIMARY KEY (a)"),
       33},
      {CreateTableBuilder("t").AddColumn("a", "INT", {"INDEX OFF"}), 23},
      {CreateTableBuilder("doc.t").AddColumn("a", "INT", {"NOT NULL"}), 14},
  };
  for (const Case &c : cases) {
    TokenCursor cursor;
    auto result = AstTransformer().TransformStatement(c.builder.Build(&cursor));
    ASSERT_FALSE(result.ok()) << cursor.source();
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnimplemented);
    SyntaxError error =
        ExpectError(result.status(), ErrorKind::UNHANDLED_NODE_KIND);
    EXPECT_EQ(error.line, 1) << cursor.source();
    EXPECT_EQ(error.column, c.column) << cursor.source();
  }
}

TEST(AstTransformerTest, UnsupportedStatements) {
  TokenCursor cursor;
  cst::CreateTableAs ctas;
  ctas.start = cursor.Next("CREATE");
  cursor.Next("TABLE");
  ctas.table = TableNameAt(&cursor, "t2");
  cursor.Words("AS SELECT * FROM");
  ctas.stop = cursor.Next("t");

  auto result = AstTransformer().TransformStatement(Wrap(ctas));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kUnimplemented);
  SyntaxError error =
      ExpectError(result.status(), ErrorKind::UNHANDLED_NODE_KIND);
  EXPECT_EQ(error.span, (SourceSpan{1, 1, 1, 34}));

  TokenCursor drop_cursor;
  cst::UnsupportedStatement drop;
  drop.rule = "dropTable";
  drop.start = drop_cursor.Next("DROP");
  drop_cursor.Next("TABLE");
  drop.stop = drop_cursor.Next("t");
  result = AstTransformer().TransformStatement(Wrap(drop));
  ASSERT_FALSE(result.ok());
  error = ExpectError(result.status(), ErrorKind::UNHANDLED_NODE_KIND);
  EXPECT_TRUE(absl::StrContains(error.message, "dropTable"));
}

TEST(AstTransformerTest, DirectDataTypeAlternatives) {
  TokenCursor cursor;
  cst::Token token = cursor.Next("Integer");
  cst::IdentDataType ident_type;
  ident_type.start = ident_type.stop = token;
  ident_type.ident = MakeIdentifier(token);

  auto resolved = AstTransformer().TransformDataType(ident_type);
  ASSERT_TRUE(resolved.ok()) << resolved.status();
  EXPECT_EQ(resolved->type(), DataType::Type::INTEGER);
  EXPECT_EQ(resolved->span(), (SourceSpan{1, 1, 1, 1}));

  cst::KeywordDataType keyword_type;
  keyword_type.keywords = cursor.Words("TIMESTAMP WITH TIME ZONE");
  keyword_type.start = keyword_type.keywords.front();
  keyword_type.stop = keyword_type.keywords.back();
  auto rejected = AstTransformer().TransformDataType(keyword_type);
  ASSERT_FALSE(rejected.ok());
  ExpectError(rejected.status(), ErrorKind::UNRESOLVABLE_TYPE_NAME);
}

TEST(AstTransformerTest, SpansAreStable) {
  TokenCursor cursor;
  cst::SingleStatement cst =
      CreateTableBuilder("t").AddColumn("a", "INT", {"NOT NULL"}).Build(
          &cursor);
  AstTransformer transformer;
  auto first = transformer.TransformStatement(cst);
  auto second = transformer.TransformStatement(cst);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ((*first)->span(), (*second)->span());
  EXPECT_EQ(AsCreateTable(*first).GetColumns().front().span(),
            AsCreateTable(*second).GetColumns().front().span());
}

TEST(AstTransformerTest, ConcurrentTransformations) {
  TokenCursor cursor;
  cst::SingleStatement cst = CreateTableBuilder("t")
                                 .AddColumn("a", "INT", {"NOT NULL"})
                                 .AddColumn("b", "integer", {"PRIMARY KEY"})
                                 .Build(&cursor);
  AstTransformer transformer;
  std::vector<std::thread> threads;
  std::vector<int> failures(4, 0);
  for (size_t t = 0; t < failures.size(); t++) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 200; i++) {
        if (!transformer.TransformStatement(cst).ok()) {
          failures.at(t)++;
        }
      }
    });
  }
  for (std::thread &thread : threads) {
    thread.join();
  }
  for (int count : failures) {
    EXPECT_EQ(count, 0);
  }
}

}  // namespace sqlast
}  // namespace sqlfront

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  FLAGS_logtostderr = true;
  FLAGS_v = 1;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  return RUN_ALL_TESTS();
}
