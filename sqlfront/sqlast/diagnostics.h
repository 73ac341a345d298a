// Renders syntax errors against the statement text they came from.
#ifndef SQLFRONT_SQLAST_DIAGNOSTICS_H_
#define SQLFRONT_SQLAST_DIAGNOSTICS_H_

#include <string>

#include "absl/strings/string_view.h"
#include "sqlfront/sqlast/errors.h"

namespace sqlfront {
namespace sqlast {

// "<line>:<column>: <message>", followed by the offending source line and a
// caret under the column when the line exists in `source`.
std::string FormatDiagnostic(const SyntaxError &error,
                             absl::string_view source);

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_DIAGNOSTICS_H_
