// Defines the AST built from concrete parse trees.
#ifndef SQLFRONT_SQLAST_AST_H_
#define SQLFRONT_SQLAST_AST_H_

#include "sqlfront/sqlast/ast_abstract.h"
#include "sqlfront/sqlast/ast_schema.h"
#include "sqlfront/sqlast/ast_visitors.h"
#include "sqlfront/sqlast/source_span.h"

#endif  // SQLFRONT_SQLAST_AST_H_
