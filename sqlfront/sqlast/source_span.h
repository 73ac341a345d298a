// Source positions carried by every AST node.
#ifndef SQLFRONT_SQLAST_SOURCE_SPAN_H_
#define SQLFRONT_SQLAST_SOURCE_SPAN_H_

#include <cstddef>
#include <ostream>
#include <string>

#include "sqlfront/sqlast/cst.h"

namespace sqlfront {
namespace sqlast {

// Start is the position of the first token of a node, end is the position
// of its last token. All 1-based.
struct SourceSpan {
  size_t start_line;
  size_t start_column;
  size_t end_line;
  size_t end_column;

  std::string DebugString() const;

  bool operator==(const SourceSpan &other) const = default;
};

// The only place spans are derived from the concrete tree.
SourceSpan SpanOf(const cst::Node &node);

std::ostream &operator<<(std::ostream &os, const SourceSpan &span);

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_SOURCE_SPAN_H_
