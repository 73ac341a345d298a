#include "sqlfront/sqlast/diagnostics.h"

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace sqlfront {
namespace sqlast {

std::string FormatDiagnostic(const SyntaxError &error,
                             absl::string_view source) {
  std::string result =
      absl::StrCat(error.line, ":", error.column, ": ", error.message);

  std::vector<absl::string_view> lines = absl::StrSplit(source, '\n');
  if (error.line == 0 || error.line > lines.size()) {
    return result;
  }
  absl::string_view line = lines.at(error.line - 1);
  absl::ConsumeSuffix(&line, "\r");
  absl::StrAppend(&result, "\n", line, "\n");

  // Tabs are copied so the caret lines up with the source line.
  for (size_t i = 0; i + 1 < error.column && i < line.size(); i++) {
    result.push_back(line[i] == '\t' ? '\t' : ' ');
  }
  result.push_back('^');
  return result;
}

}  // namespace sqlast
}  // namespace sqlfront
