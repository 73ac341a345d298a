// Enums shared by the create table AST and its consumers.
#ifndef SQLFRONT_SQLAST_AST_SCHEMA_ENUMS_H_
#define SQLFRONT_SQLAST_AST_SCHEMA_ENUMS_H_

namespace sqlfront {
namespace sqlast {

enum ColumnConstraintTypeEnum { PRIMARY_KEY, NOT_NULL };
enum DataTypeEnum { INTEGER = 0 };
enum ColumnStrategyEnum { NULLABLE, NOT_NULLABLE };

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_AST_SCHEMA_ENUMS_H_
