#include "sqlfront/sqlast/errors.h"

#include <string>

#include "absl/strings/cord.h"
#include "absl/types/optional.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sqlfront/sqlast/errors.pb.h"

namespace sqlfront {
namespace sqlast {

const char kSyntaxErrorPayloadUrl[] =
    "type.googleapis.com/sqlfront.sqlast.SyntaxErrorLocation";

namespace {

absl::Cord EncodeLocation(ErrorKind kind, const SourceSpan &span) {
  SyntaxErrorLocation location;
  switch (kind) {
    case ErrorKind::UNRESOLVABLE_TYPE_NAME:
      location.set_kind(SyntaxErrorLocation::UNRESOLVABLE_TYPE_NAME);
      break;
    case ErrorKind::INVALID_CONSTRAINT_CARDINALITY:
      location.set_kind(SyntaxErrorLocation::INVALID_CONSTRAINT_CARDINALITY);
      break;
    case ErrorKind::UNHANDLED_NODE_KIND:
      location.set_kind(SyntaxErrorLocation::UNHANDLED_NODE_KIND);
      break;
    default:
      LOG(FATAL) << "Unknown error kind " << static_cast<int>(kind);
  }
  location.set_start_line(span.start_line);
  location.set_start_column(span.start_column);
  location.set_end_line(span.end_line);
  location.set_end_column(span.end_column);
  return absl::Cord(location.SerializeAsString());
}

bool DecodeLocation(const std::string &payload, ErrorKind *kind,
                    SourceSpan *span) {
  SyntaxErrorLocation location;
  if (!location.ParseFromString(payload)) {
    return false;
  }
  switch (location.kind()) {
    case SyntaxErrorLocation::UNRESOLVABLE_TYPE_NAME:
      *kind = ErrorKind::UNRESOLVABLE_TYPE_NAME;
      break;
    case SyntaxErrorLocation::INVALID_CONSTRAINT_CARDINALITY:
      *kind = ErrorKind::INVALID_CONSTRAINT_CARDINALITY;
      break;
    case SyntaxErrorLocation::UNHANDLED_NODE_KIND:
      *kind = ErrorKind::UNHANDLED_NODE_KIND;
      break;
    default:
      return false;
  }
  // Positions are 1-based, a zero line means the payload was never filled.
  if (location.start_line() == 0 || location.start_column() == 0) {
    return false;
  }
  *span = SourceSpan{location.start_line(), location.start_column(),
                     location.end_line(), location.end_column()};
  return true;
}

}  // namespace

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UNRESOLVABLE_TYPE_NAME:
      return "unresolvable type name";
    case ErrorKind::INVALID_CONSTRAINT_CARDINALITY:
      return "invalid constraint cardinality";
    case ErrorKind::UNHANDLED_NODE_KIND:
      return "unhandled node kind";
    default:
      LOG(FATAL) << "Unknown error kind " << static_cast<int>(kind);
  }
}

absl::Status MakeSyntaxError(ErrorKind kind, absl::string_view message,
                             const SourceSpan &span) {
  absl::StatusCode code = kind == ErrorKind::UNHANDLED_NODE_KIND
                              ? absl::StatusCode::kUnimplemented
                              : absl::StatusCode::kInvalidArgument;
  absl::Status status(code,
                      absl::StrCat(ErrorKindToString(kind), ": ", message));
  status.SetPayload(kSyntaxErrorPayloadUrl, EncodeLocation(kind, span));
  return status;
}

std::optional<SyntaxError> ExtractSyntaxError(const absl::Status &status) {
  if (status.ok()) {
    return std::nullopt;
  }
  absl::optional<absl::Cord> payload = status.GetPayload(kSyntaxErrorPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  ErrorKind kind;
  SourceSpan span;
  if (!DecodeLocation(std::string(*payload), &kind, &span)) {
    return std::nullopt;
  }
  return SyntaxError{kind, std::string(status.message()), span.start_line,
                     span.start_column, span};
}

std::ostream &operator<<(std::ostream &os, ErrorKind kind) {
  return os << ErrorKindToString(kind);
}

}  // namespace sqlast
}  // namespace sqlfront
