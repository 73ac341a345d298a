// A visitor over the concrete tree that only builds explicitly supported
// syntax and returns an error if unsupported syntax was used.

#include "sqlfront/sqlast/transformer.h"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "sqlfront/sqlast/errors.h"
#include "sqlfront/sqlast/source_span.h"
#include "sqlfront/util/status.h"

namespace sqlfront {
namespace sqlast {

namespace {

// Overload set handed to std::visit. No catch-all: every alternative of a
// sum must have its own handler.
template <class... Ts>
struct Handlers : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Handlers(Ts...) -> Handlers<Ts...>;

using StatementOr = absl::StatusOr<std::unique_ptr<AbstractStatement>>;

absl::Status Unsupported(const cst::Node &node, absl::string_view construct) {
  return MakeSyntaxError(ErrorKind::UNHANDLED_NODE_KIND,
                         absl::StrCat(construct, " is not supported"),
                         SpanOf(node));
}

// Identifier text as the parser saw it, before any case folding.
const std::string &RawText(const cst::Identifier &ident) {
  return std::visit(
      [](const auto &node) -> const std::string & { return node.text; },
      ident);
}

absl::StatusOr<DataType> ResolveType(const std::string &type_name,
                                     const SourceSpan &name_span,
                                     const SourceSpan &type_span) {
  std::optional<DataType::Type> type = DataType::Resolve(type_name);
  if (!type.has_value()) {
    return MakeSyntaxError(ErrorKind::UNRESOLVABLE_TYPE_NAME,
                           absl::StrCat("unsupported type ", type_name),
                           name_span);
  }
  return DataType(*type, type_span);
}

}  // namespace

// Statements.
StatementOr AstTransformer::TransformStatement(
    const cst::SingleStatement &ctx) const {
  auto handlers = Handlers{
      [this](const cst::CreateTable &stmt) -> StatementOr {
        MOVE_OR_RETURN(std::unique_ptr<CreateTable> table,
                       this->TransformCreateTable(stmt));
        return std::unique_ptr<AbstractStatement>(std::move(table));
      },
      [](const cst::CreateTableAs &stmt) -> StatementOr {
        return Unsupported(stmt, "CREATE TABLE ... AS query");
      },
      [](const cst::UnsupportedStatement &stmt) -> StatementOr {
        return Unsupported(stmt, absl::StrCat("statement ", stmt.rule));
      }};

  StatementOr result = std::visit(handlers, ctx.statement);
  if (result.ok()) {
    VLOG(1) << "Transformed " << (*result)->type() << " at "
            << (*result)->span() << ": " << **result;
  }
  return result;
}

absl::StatusOr<std::unique_ptr<CreateTable>>
AstTransformer::TransformCreateTable(const cst::CreateTable &ctx) const {
  // No clustered by / partitioned by / table properties in our AST.
  if (ctx.partitioned_by.has_value()) {
    return Unsupported(*ctx.partitioned_by, "PARTITIONED BY");
  }
  if (ctx.clustered_by.has_value()) {
    return Unsupported(*ctx.clustered_by, "CLUSTERED BY");
  }
  if (ctx.with_properties.has_value()) {
    return Unsupported(*ctx.with_properties, "WITH table properties");
  }
  bool if_not_exists = ctx.exists.has_value();

  // Visit each element (columns) in source order.
  std::vector<ColumnDefinition> columns;
  for (const cst::TableElement &element : ctx.elements) {
    ASSIGN_OR_RETURN(ColumnDefinition column,
                     this->TransformTableElement(element));
    columns.push_back(std::move(column));
  }
  SourceSpan elements_span = ctx.elements.empty()
                                 ? SpanOf(ctx)
                                 : SpanOf(cst::NodeOf(ctx.elements.front()));

  ASSIGN_OR_RETURN(Identifier table_name, this->TransformTableName(ctx.table));
  return std::make_unique<CreateTable>(table_name, std::move(columns),
                                       if_not_exists, SpanOf(ctx),
                                       elements_span);
}

// Column / table definition.
absl::StatusOr<ColumnDefinition> AstTransformer::TransformTableElement(
    const cst::TableElement &ctx) const {
  auto handlers = Handlers{
      [this](const cst::ColumnDefinition &column)
          -> absl::StatusOr<ColumnDefinition> {
        return this->TransformColumnDefinition(column);
      },
      [](const cst::TableConstraint &constraint)
          -> absl::StatusOr<ColumnDefinition> {
        return Unsupported(constraint,
                           absl::StrCat("table constraint ", constraint.rule));
      }};
  return std::visit(handlers, ctx);
}

absl::StatusOr<ColumnDefinition> AstTransformer::TransformColumnDefinition(
    const cst::ColumnDefinition &ctx) const {
  Identifier name = this->TransformIdentifier(ctx.ident);
  ASSIGN_OR_RETURN(DataType type, this->TransformDataType(ctx.type));

  std::vector<ColumnConstraint> constraints;
  for (const cst::ColumnConstraint &constraint_ctx : ctx.constraints) {
    ASSIGN_OR_RETURN(ColumnConstraint constraint,
                     this->TransformColumnConstraint(constraint_ctx));
    constraints.push_back(constraint);
  }

  // Exactly one column constraint for now.
  if (constraints.size() != 1) {
    return MakeSyntaxError(
        ErrorKind::INVALID_CONSTRAINT_CARDINALITY,
        absl::StrCat("column ", name.name(), " has ", constraints.size(),
                     " constraints, exactly one is supported"),
        SpanOf(ctx));
  }
  return ColumnDefinition(name, type,
                          ColumnDefinition::StrategyFor(constraints.front()),
                          SpanOf(ctx));
}

absl::StatusOr<ColumnConstraint> AstTransformer::TransformColumnConstraint(
    const cst::ColumnConstraint &ctx) const {
  auto handlers = Handlers{
      [this](const cst::ColumnConstraintPrimaryKey &constraint)
          -> absl::StatusOr<ColumnConstraint> {
        return this->TransformConstraint(constraint);
      },
      [this](const cst::ColumnConstraintNotNull &constraint)
          -> absl::StatusOr<ColumnConstraint> {
        return this->TransformConstraint(constraint);
      },
      [](const cst::GenericColumnConstraint &constraint)
          -> absl::StatusOr<ColumnConstraint> {
        return Unsupported(constraint,
                           absl::StrCat("column constraint ", constraint.rule));
      }};
  return std::visit(handlers, ctx);
}

ColumnConstraint AstTransformer::TransformConstraint(
    const cst::ColumnConstraintPrimaryKey &ctx) const {
  return ColumnConstraint(ColumnConstraint::Type::PRIMARY_KEY, SpanOf(ctx));
}

ColumnConstraint AstTransformer::TransformConstraint(
    const cst::ColumnConstraintNotNull &ctx) const {
  return ColumnConstraint(ColumnConstraint::Type::NOT_NULL, SpanOf(ctx));
}

// Names.
// Case sensitivity like it is in postgres: unquoted names fold to lower case,
// quoted names are kept as written. This has to happen here, the AST no
// longer knows which kind of token a name came from.
Identifier AstTransformer::TransformIdentifier(
    const cst::Identifier &ctx) const {
  auto handlers = Handlers{
      [](const cst::UnquotedIdentifier &ident) {
        return Identifier(absl::AsciiStrToLower(ident.text), SpanOf(ident));
      },
      [](const cst::QuotedIdentifier &ident) {
        return Identifier(ident.text, SpanOf(ident));
      }};
  return std::visit(handlers, ctx);
}

absl::StatusOr<Identifier> AstTransformer::TransformTableName(
    const cst::TableName &ctx) const {
  if (ctx.qname.parts.size() != 1) {
    return Unsupported(ctx, "qualified table name");
  }
  return this->TransformIdentifier(ctx.qname.parts.front());
}

// Types.
absl::StatusOr<DataType> AstTransformer::TransformDataType(
    const cst::DataType &ctx) const {
  auto handlers = Handlers{
      [this](const cst::IdentDataType &type) {
        return this->TransformIdentDataType(type);
      },
      [this](const cst::KeywordDataType &type) {
        return this->TransformKeywordDataType(type);
      },
      [this](const cst::MaybeParametrizedDataType &type)
          -> absl::StatusOr<DataType> {
        if (!type.parameters.empty()) {
          return Unsupported(type, "type parameters");
        }
        return this->TransformBaseDataType(type.base);
      }};
  return std::visit(handlers, ctx);
}

absl::StatusOr<DataType> AstTransformer::TransformBaseDataType(
    const cst::BaseDataType &ctx) const {
  auto handlers = Handlers{
      [this](const cst::IdentDataType &type) {
        return this->TransformIdentDataType(type);
      },
      [this](const cst::KeywordDataType &type) {
        return this->TransformKeywordDataType(type);
      }};
  return std::visit(handlers, ctx);
}

absl::StatusOr<DataType> AstTransformer::TransformIdentDataType(
    const cst::IdentDataType &ctx) const {
  // Resolution uses the name as written, not the case folded identifier.
  return ResolveType(RawText(ctx.ident), SpanOf(cst::NodeOf(ctx.ident)),
                     SpanOf(ctx));
}

absl::StatusOr<DataType> AstTransformer::TransformKeywordDataType(
    const cst::KeywordDataType &ctx) const {
  std::string type_name = absl::StrJoin(
      ctx.keywords, " ",
      [](std::string *out, const cst::Token &t) { out->append(t.text); });
  return ResolveType(type_name, SpanOf(ctx), SpanOf(ctx));
}

}  // namespace sqlast
}  // namespace sqlfront
