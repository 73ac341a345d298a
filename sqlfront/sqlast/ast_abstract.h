// Abstract statement and forward declarations.
#ifndef SQLFRONT_SQLAST_AST_ABSTRACT_H_
#define SQLFRONT_SQLAST_AST_ABSTRACT_H_

#include <ostream>

#include "sqlfront/sqlast/source_span.h"

namespace sqlfront {
namespace sqlast {

// Forward declaration of visitor pattern classes.
template <class T>
class AbstractVisitor;

// Top-level statements derive this class.
class AbstractStatement {
 public:
  enum class Type { CREATE_TABLE };

  // Constructor.
  AbstractStatement(Type type, const SourceSpan &span)
      : type_(type), span_(span) {}
  virtual ~AbstractStatement() {}

  // Accessors.
  const Type &type() const { return this->type_; }
  const SourceSpan &span() const { return this->span_; }

  template <class T>
  T Visit(AbstractVisitor<T> *visitor) const;

  // Printing to screen.
  friend std::ostream &operator<<(std::ostream &os, const AbstractStatement &r);

 protected:
  Type type_;
  SourceSpan span_;
};

std::ostream &operator<<(std::ostream &os, const AbstractStatement::Type &t);

}  // namespace sqlast
}  // namespace sqlfront

#endif  // SQLFRONT_SQLAST_AST_ABSTRACT_H_
