#include "sqlfront/sqlast/ast_abstract.h"

#include <typeinfo>

#include "glog/logging.h"

namespace sqlfront {
namespace sqlast {

std::ostream &operator<<(std::ostream &os, const AbstractStatement::Type &t) {
  switch (t) {
    case AbstractStatement::Type::CREATE_TABLE:
      return os << "CREATE TABLE";
    default:
      LOG(FATAL) << "No string representation defined for an enum variant for "
                 << typeid(t).name();
  }
}

}  // namespace sqlast
}  // namespace sqlfront
