#include "sqlfront/sqlast/batch.h"

#include <optional>
#include <utility>

#include "glog/logging.h"
#include "sqlfront/sqlast/errors.h"
#include "sqlfront/sqlast/transformer.h"

DEFINE_bool(sqlfront_stop_on_failure, false,
            "Stop transforming a batch at the first failing statement");

namespace sqlfront {
namespace sqlast {

BatchResult TransformBatch(const std::vector<cst::SingleStatement> &statements,
                           const BatchOptions &options) {
  AstTransformer transformer;
  BatchResult batch;
  for (size_t i = 0; i < statements.size(); i++) {
    StatementResult entry{i, transformer.TransformStatement(statements.at(i))};
    if (entry.result.ok()) {
      batch.succeeded++;
      batch.results.push_back(std::move(entry));
      continue;
    }

    batch.failed++;
    std::optional<SyntaxError> error =
        ExtractSyntaxError(entry.result.status());
    if (error.has_value()) {
      LOG(WARNING) << "Statement " << i << " failed at " << error->line << ":"
                   << error->column << ": " << error->message;
    } else {
      LOG(WARNING) << "Statement " << i
                   << " failed: " << entry.result.status();
    }
    batch.results.push_back(std::move(entry));

    if (options.stop_on_failure) {
      batch.skipped = statements.size() - i - 1;
      break;
    }
  }
  VLOG(1) << "Batch done: " << batch.succeeded << " succeeded, "
          << batch.failed << " failed, " << batch.skipped << " skipped";
  return batch;
}

}  // namespace sqlast
}  // namespace sqlfront
