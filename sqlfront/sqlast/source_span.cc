#include "sqlfront/sqlast/source_span.h"

#include "absl/strings/str_cat.h"

namespace sqlfront {
namespace sqlast {

std::string SourceSpan::DebugString() const {
  return absl::StrCat(this->start_line, ":", this->start_column, "-",
                      this->end_line, ":", this->end_column);
}

SourceSpan SpanOf(const cst::Node &node) {
  return SourceSpan{node.start.line, node.start.column, node.stop.line,
                    node.stop.column};
}

std::ostream &operator<<(std::ostream &os, const SourceSpan &span) {
  return os << span.DebugString();
}

}  // namespace sqlast
}  // namespace sqlfront
