// Helper visitors for traversing ASTs.
#ifndef SQLFRONT_SQLAST_AST_VISITORS_H_
#define SQLFRONT_SQLAST_AST_VISITORS_H_

#include <string>

#include "glog/logging.h"
#include "sqlfront/sqlast/ast_abstract.h"
#include "sqlfront/sqlast/ast_schema.h"

namespace sqlfront {
namespace sqlast {

// Visit without modification.
template <class T>
class AbstractVisitor {
 public:
  AbstractVisitor() = default;
  virtual ~AbstractVisitor() = default;
  virtual T VisitCreateTable(const CreateTable &ast) = 0;
  virtual T VisitColumnDefinition(const ColumnDefinition &ast) = 0;
};

// Allow us to visit a statement without knowing its exact type.
#define SQLFRONT_VISIT_CAST(type) static_cast<type *>(this)->Visit(visitor)

template <class T>
T AbstractStatement::Visit(AbstractVisitor<T> *visitor) const {
  switch (this->type()) {
    case sqlast::AbstractStatement::Type::CREATE_TABLE:
      return SQLFRONT_VISIT_CAST(const CreateTable);
    default:
      LOG(FATAL) << "Cannot visit statement of type " << this->type();
  }
}

// Turns ASTs back into canonical SQL. Names that would not survive case
// folding are quoted.
class Stringifier : public AbstractVisitor<std::string> {
 public:
  Stringifier() = default;

  std::string VisitCreateTable(const CreateTable &ast) override;
  std::string VisitColumnDefinition(const ColumnDefinition &ast) override;

  static std::string QuoteIdentifier(const Identifier &identifier);
};

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_AST_VISITORS_H_
