// Position-annotated errors raised while building the AST.
//
// Errors are plain absl::Status values. The kind and the source span where
// the problem was detected travel as a status payload, so they survive any
// number of ASSIGN_OR_RETURN hops unmodified. Callers recover them with
// ExtractSyntaxError() to render a diagnostic.
#ifndef SQLFRONT_SQLAST_ERRORS_H_
#define SQLFRONT_SQLAST_ERRORS_H_

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "sqlfront/sqlast/source_span.h"

namespace sqlfront {
namespace sqlast {

enum class ErrorKind {
  UNRESOLVABLE_TYPE_NAME,
  INVALID_CONSTRAINT_CARDINALITY,
  UNHANDLED_NODE_KIND,
};

// What callers get back: {message, line, column}, plus the full span.
struct SyntaxError {
  ErrorKind kind;
  std::string message;
  size_t line;
  size_t column;
  SourceSpan span;
};

// Type url under which the location payload is stored.
extern const char kSyntaxErrorPayloadUrl[];

std::string ErrorKindToString(ErrorKind kind);

// Unhandled node kinds map to kUnimplemented, everything else to
// kInvalidArgument. The message is prefixed with the kind.
absl::Status MakeSyntaxError(ErrorKind kind, absl::string_view message,
                             const SourceSpan &span);

// std::nullopt for OK statuses and statuses not made by MakeSyntaxError.
std::optional<SyntaxError> ExtractSyntaxError(const absl::Status &status);

std::ostream &operator<<(std::ostream &os, ErrorKind kind);

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_ERRORS_H_
