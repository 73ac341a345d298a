#include "sqlfront/sqlast/batch.h"

#include <optional>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "gtest/gtest.h"
#include "sqlfront/sqlast/cst_testing.h"
#include "sqlfront/sqlast/errors.h"

namespace sqlfront {
namespace sqlast {

using cst_testing::CreateTableBuilder;
using cst_testing::TokenCursor;

namespace {

// good, bad type, good, no constraint, good.
std::vector<cst::SingleStatement> MixedStatements() {
  std::vector<cst::SingleStatement> statements;
  TokenCursor c0, c1, c2, c3, c4;
  statements.push_back(
      CreateTableBuilder("a").AddColumn("x", "INT", {"NOT NULL"}).Build(&c0));
  statements.push_back(
      CreateTableBuilder("b").AddColumn("x", "REAL", {"NOT NULL"}).Build(&c1));
  statements.push_back(
      CreateTableBuilder("c").AddColumn("x", "INT", {"PRIMARY KEY"}).Build(
          &c2));
  statements.push_back(
      CreateTableBuilder("d").AddColumn("x", "INT", {}).Build(&c3));
  statements.push_back(
      CreateTableBuilder("e").AddColumn("x", "INTEGER", {"NOT NULL"}).Build(
          &c4));
  return statements;
}

}  // namespace

TEST(BatchTest, FailuresDoNotStopTheBatch) {
  BatchOptions options;
  options.stop_on_failure = false;
  BatchResult batch = TransformBatch(MixedStatements(), options);

  EXPECT_EQ(batch.succeeded, 3);
  EXPECT_EQ(batch.failed, 2);
  EXPECT_EQ(batch.skipped, 0);
  ASSERT_EQ(batch.results.size(), 5);
  for (size_t i = 0; i < batch.results.size(); i++) {
    EXPECT_EQ(batch.results.at(i).index, i);
  }
  EXPECT_TRUE(batch.results.at(0).result.ok());
  EXPECT_FALSE(batch.results.at(1).result.ok());
  EXPECT_TRUE(batch.results.at(2).result.ok());
  EXPECT_FALSE(batch.results.at(3).result.ok());
  EXPECT_TRUE(batch.results.at(4).result.ok());

  std::optional<SyntaxError> error =
      ExtractSyntaxError(batch.results.at(3).result.status());
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::INVALID_CONSTRAINT_CARDINALITY);
}

TEST(BatchTest, StopOnFailure) {
  BatchOptions options;
  options.stop_on_failure = true;
  BatchResult batch = TransformBatch(MixedStatements(), options);

  EXPECT_EQ(batch.succeeded, 1);
  EXPECT_EQ(batch.failed, 1);
  EXPECT_EQ(batch.skipped, 3);
  ASSERT_EQ(batch.results.size(), 2);
  EXPECT_EQ(batch.results.back().index, 1);
}

TEST(BatchTest, OptionsFollowFlag) {
  EXPECT_FALSE(BatchOptions().stop_on_failure);
  FLAGS_sqlfront_stop_on_failure = true;
  EXPECT_TRUE(BatchOptions().stop_on_failure);
  FLAGS_sqlfront_stop_on_failure = false;
}

TEST(BatchTest, EmptyBatch) {
  BatchResult batch = TransformBatch({});
  EXPECT_TRUE(batch.results.empty());
  EXPECT_EQ(batch.succeeded, 0);
  EXPECT_EQ(batch.failed, 0);
  EXPECT_EQ(batch.skipped, 0);
}

}  // namespace sqlast
}  // namespace sqlfront

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);
  return RUN_ALL_TESTS();
}
