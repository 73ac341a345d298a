// Transforms a sequence of independent statements, one failure does not
// stop the statements after it.
#ifndef SQLFRONT_SQLAST_BATCH_H_
#define SQLFRONT_SQLAST_BATCH_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "gflags/gflags.h"
#include "sqlfront/sqlast/ast.h"
#include "sqlfront/sqlast/cst.h"

DECLARE_bool(sqlfront_stop_on_failure);

namespace sqlfront {
namespace sqlast {

struct BatchOptions {
  // Skip the statements after the first failing one.
  bool stop_on_failure = FLAGS_sqlfront_stop_on_failure;
};

struct StatementResult {
  // Position of the statement in the input.
  size_t index;
  absl::StatusOr<std::unique_ptr<AbstractStatement>> result;
};

struct BatchResult {
  // One entry per statement that was attempted, in input order.
  std::vector<StatementResult> results;
  size_t succeeded = 0;
  size_t failed = 0;
  // Statements never attempted because of stop_on_failure.
  size_t skipped = 0;
};

BatchResult TransformBatch(const std::vector<cst::SingleStatement> &statements,
                           const BatchOptions &options = BatchOptions());

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_BATCH_H_
