#include "sqlfront/sqlast/source_span.h"

#include <sstream>

#include "gtest/gtest.h"
#include "sqlfront/sqlast/cst.h"

namespace sqlfront {
namespace sqlast {

// Spans come straight from the first and last token of a node.
TEST(SourceSpanTest, SpanOfNode) {
  cst::Node node;
  node.start = cst::Token{"CREATE", 2, 5};
  node.stop = cst::Token{")", 4, 1};

  SourceSpan span = SpanOf(node);
  EXPECT_EQ(span.start_line, 2);
  EXPECT_EQ(span.start_column, 5);
  EXPECT_EQ(span.end_line, 4);
  EXPECT_EQ(span.end_column, 1);

  // Asking twice gives the same answer.
  EXPECT_EQ(SpanOf(node), span);
}

TEST(SourceSpanTest, SingleToken) {
  cst::Node node;
  node.start = node.stop = cst::Token{"t", 1, 14};
  EXPECT_EQ(SpanOf(node), (SourceSpan{1, 14, 1, 14}));
}

TEST(SourceSpanTest, Printing) {
  SourceSpan span{1, 17, 3, 2};
  EXPECT_EQ(span.DebugString(), "1:17-3:2");

  std::ostringstream os;
  os << span;
  EXPECT_EQ(os.str(), "1:17-3:2");
}

TEST(SourceSpanTest, Equality) {
  SourceSpan span{1, 1, 1, 31};
  EXPECT_EQ(span, (SourceSpan{1, 1, 1, 31}));
  EXPECT_NE(span, (SourceSpan{1, 1, 1, 30}));
  EXPECT_NE(span, (SourceSpan{2, 1, 1, 31}));
}

}  // namespace sqlast
}  // namespace sqlfront
