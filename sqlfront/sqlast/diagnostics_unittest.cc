#include "sqlfront/sqlast/diagnostics.h"

#include <string>

#include "gtest/gtest.h"
#include "sqlfront/sqlast/errors.h"

namespace sqlfront {
namespace sqlast {

namespace {

SyntaxError ErrorAt(size_t line, size_t column) {
  return SyntaxError{ErrorKind::UNRESOLVABLE_TYPE_NAME,
                     "unresolvable type name: unsupported type REAL", line,
                     column, SourceSpan{line, column, line, column}};
}

}  // namespace

TEST(DiagnosticsTest, CaretUnderColumn) {
  std::string source = "CREATE TABLE t (a REAL NOT NULL)";
  EXPECT_EQ(FormatDiagnostic(ErrorAt(1, 19), source),
            "1:19: unresolvable type name: unsupported type REAL\n"
            "CREATE TABLE t (a REAL NOT NULL)\n"
            "                  ^");
}

TEST(DiagnosticsTest, PicksTheRightLine) {
  std::string source = "CREATE TABLE t (\r\n  a INT NOT NULL,\r\n  b REAL\r\n)";
  EXPECT_EQ(FormatDiagnostic(ErrorAt(3, 5), source),
            "3:5: unresolvable type name: unsupported type REAL\n"
            "  b REAL\n"
            "    ^");
}

TEST(DiagnosticsTest, TabsKeepAlignment) {
  std::string source = "CREATE TABLE t (\n\ta REAL NOT NULL)";
  EXPECT_EQ(FormatDiagnostic(ErrorAt(2, 4), source),
            "2:4: unresolvable type name: unsupported type REAL\n"
            "\ta REAL NOT NULL)\n"
            "\t  ^");
}

TEST(DiagnosticsTest, LineOutOfRange) {
  EXPECT_EQ(FormatDiagnostic(ErrorAt(4, 1), "CREATE TABLE t ()"),
            "4:1: unresolvable type name: unsupported type REAL");
  EXPECT_EQ(FormatDiagnostic(ErrorAt(0, 1), "CREATE TABLE t ()"),
            "0:1: unresolvable type name: unsupported type REAL");
}

}  // namespace sqlast
}  // namespace sqlfront
