// Turn a concrete parse tree into our AST.
#ifndef SQLFRONT_SQLAST_TRANSFORMER_H_
#define SQLFRONT_SQLAST_TRANSFORMER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "sqlfront/sqlast/ast.h"
#include "sqlfront/sqlast/cst.h"

namespace sqlfront {
namespace sqlast {

// Builds the AST of one statement bottom-up, children before parents.
//
// Every alternative of every concrete tree sum has a handler here. The ones
// for constructs our AST cannot represent fail with an UNHANDLED_NODE_KIND
// error (absl kUnimplemented) instead of dropping the construct. The first
// error aborts the whole statement and is returned unmodified.
//
// Holds no state, one instance may transform any number of trees, from any
// number of threads.
class AstTransformer {
 public:
  AstTransformer() = default;

  // Entry point for cst to ast transformation / building.
  absl::StatusOr<std::unique_ptr<AbstractStatement>> TransformStatement(
      const cst::SingleStatement &ctx) const;

  // Statements.
  absl::StatusOr<std::unique_ptr<CreateTable>> TransformCreateTable(
      const cst::CreateTable &ctx) const;

  // Column / table definition.
  absl::StatusOr<ColumnDefinition> TransformColumnDefinition(
      const cst::ColumnDefinition &ctx) const;
  ColumnConstraint TransformConstraint(
      const cst::ColumnConstraintPrimaryKey &ctx) const;
  ColumnConstraint TransformConstraint(
      const cst::ColumnConstraintNotNull &ctx) const;

  // Names and types.
  Identifier TransformIdentifier(const cst::Identifier &ctx) const;
  absl::StatusOr<Identifier> TransformTableName(
      const cst::TableName &ctx) const;
  absl::StatusOr<DataType> TransformDataType(const cst::DataType &ctx) const;

 private:
  absl::StatusOr<ColumnDefinition> TransformTableElement(
      const cst::TableElement &ctx) const;
  absl::StatusOr<ColumnConstraint> TransformColumnConstraint(
      const cst::ColumnConstraint &ctx) const;
  absl::StatusOr<DataType> TransformBaseDataType(
      const cst::BaseDataType &ctx) const;
  absl::StatusOr<DataType> TransformIdentDataType(
      const cst::IdentDataType &ctx) const;
  absl::StatusOr<DataType> TransformKeywordDataType(
      const cst::KeywordDataType &ctx) const;
};

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_TRANSFORMER_H_
