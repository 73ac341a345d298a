#include "sqlfront/sqlast/errors.h"

#include <optional>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/types/optional.h"
#include "gtest/gtest.h"
#include "sqlfront/sqlast/errors.pb.h"
#include "sqlfront/util/status.h"

namespace sqlfront {
namespace sqlast {

namespace {

absl::StatusOr<int> FailsAt(const SourceSpan &span) {
  return MakeSyntaxError(ErrorKind::UNRESOLVABLE_TYPE_NAME,
                         "unsupported type REAL", span);
}

// Errors pass through intermediate callers untouched.
absl::StatusOr<int> Forwards(const SourceSpan &span) {
  ASSIGN_OR_RETURN(int value, FailsAt(span));
  return value + 1;
}

}  // namespace

TEST(ErrorsTest, StatusCodes) {
  SourceSpan span{1, 1, 1, 1};
  EXPECT_EQ(
      MakeSyntaxError(ErrorKind::UNRESOLVABLE_TYPE_NAME, "x", span).code(),
      absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(MakeSyntaxError(ErrorKind::INVALID_CONSTRAINT_CARDINALITY, "x",
                            span)
                .code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(MakeSyntaxError(ErrorKind::UNHANDLED_NODE_KIND, "x", span).code(),
            absl::StatusCode::kUnimplemented);
}

TEST(ErrorsTest, MessageCarriesKind) {
  absl::Status status = MakeSyntaxError(
      ErrorKind::INVALID_CONSTRAINT_CARDINALITY,
      "column a has 0 constraints, exactly one is supported",
      SourceSpan{1, 31, 1, 33});
  EXPECT_EQ(status.message(),
            "invalid constraint cardinality: column a has 0 constraints, "
            "exactly one is supported");
}

TEST(ErrorsTest, ExtractLocation) {
  SourceSpan span{3, 7, 4, 2};
  absl::Status status = MakeSyntaxError(ErrorKind::UNHANDLED_NODE_KIND,
                                        "PARTITIONED BY is not supported",
                                        span);

  std::optional<SyntaxError> error = ExtractSyntaxError(status);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::UNHANDLED_NODE_KIND);
  EXPECT_EQ(error->message,
            "unhandled node kind: PARTITIONED BY is not supported");
  EXPECT_EQ(error->line, 3);
  EXPECT_EQ(error->column, 7);
  EXPECT_EQ(error->span, span);
}

TEST(ErrorsTest, SurvivesPropagation) {
  SourceSpan span{2, 3, 2, 9};
  absl::StatusOr<int> result = Forwards(span);
  ASSERT_FALSE(result.ok());

  std::optional<SyntaxError> error = ExtractSyntaxError(result.status());
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::UNRESOLVABLE_TYPE_NAME);
  EXPECT_EQ(error->span, span);
}

TEST(ErrorsTest, NotASyntaxError) {
  EXPECT_FALSE(ExtractSyntaxError(absl::OkStatus()).has_value());
  EXPECT_FALSE(
      ExtractSyntaxError(absl::InvalidArgumentError("boom")).has_value());

  absl::Status garbled = absl::InvalidArgumentError("boom");
  garbled.SetPayload(kSyntaxErrorPayloadUrl, absl::Cord("1:2:x"));
  EXPECT_FALSE(ExtractSyntaxError(garbled).has_value());

  absl::Status empty = absl::InvalidArgumentError("boom");
  empty.SetPayload(kSyntaxErrorPayloadUrl, absl::Cord());
  EXPECT_FALSE(ExtractSyntaxError(empty).has_value());

  SyntaxErrorLocation location;
  location.set_kind(static_cast<SyntaxErrorLocation::Kind>(9));
  location.set_start_line(1);
  location.set_start_column(1);
  absl::Status bad_kind = absl::InvalidArgumentError("boom");
  bad_kind.SetPayload(kSyntaxErrorPayloadUrl,
                      absl::Cord(location.SerializeAsString()));
  EXPECT_FALSE(ExtractSyntaxError(bad_kind).has_value());
}

// The payload is a SyntaxErrorLocation message, readable without our code.
TEST(ErrorsTest, PayloadIsProto) {
  absl::Status status = MakeSyntaxError(
      ErrorKind::INVALID_CONSTRAINT_CARDINALITY, "x", SourceSpan{1, 31, 1, 33});
  absl::optional<absl::Cord> payload = status.GetPayload(kSyntaxErrorPayloadUrl);
  ASSERT_TRUE(payload.has_value());

  SyntaxErrorLocation location;
  ASSERT_TRUE(location.ParseFromString(std::string(*payload)));
  EXPECT_EQ(location.kind(),
            SyntaxErrorLocation::INVALID_CONSTRAINT_CARDINALITY);
  EXPECT_EQ(location.start_line(), 1);
  EXPECT_EQ(location.start_column(), 31);
  EXPECT_EQ(location.end_line(), 1);
  EXPECT_EQ(location.end_column(), 33);
}

TEST(ErrorsTest, KindToString) {
  std::ostringstream os;
  os << ErrorKind::UNRESOLVABLE_TYPE_NAME;
  EXPECT_EQ(os.str(), "unresolvable type name");
  EXPECT_EQ(ErrorKindToString(ErrorKind::UNHANDLED_NODE_KIND),
            "unhandled node kind");
}

}  // namespace sqlast
}  // namespace sqlfront
