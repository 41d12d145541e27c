#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/diagnostic_printer.hpp"
#include "cfgcat/basic/logging.hpp"
#include "cfgcat/basic/result.hpp"

using cfgcat::Diagnostic;
using cfgcat::DiagnosticBag;
using cfgcat::DiagnosticKind;
using cfgcat::DiagnosticPrinter;
using cfgcat::Severity;

// ============================================================================
// Diagnostic / DiagnosticBag
// ============================================================================

TEST(Diagnostic, CodesAreStable)
{
  EXPECT_EQ(cfgcat::to_code(DiagnosticKind::ParseError), "E0001");
  EXPECT_EQ(cfgcat::to_code(DiagnosticKind::TypeMismatch), "E0003");
  EXPECT_EQ(cfgcat::to_code(DiagnosticKind::UnresolvedReference), "E0011");
  EXPECT_EQ(cfgcat::to_code(DiagnosticKind::CacheComputationError), "E0013");
}

TEST(Diagnostic, SummaryHasCodeAndMessage)
{
  const auto diag = Diagnostic::error(DiagnosticKind::MissingRequired, "parameter 'ip' should be set");
  EXPECT_EQ(diag.summary(), "error[E0004]: parameter 'ip' should be set");
}

TEST(DiagnosticBag, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(DiagnosticKind::ParseError, "expected '}'");
    builder.with_location(cfgcat::SourcePosition{"site.pp", 3, 7}).with_note("in node block");
    EXPECT_TRUE(bag.empty());
  }
  bag.report_warning("unknown variable '$x'");

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_TRUE(bag.has_errors());
  ASSERT_NE(bag.first_error(), nullptr);
  EXPECT_EQ(bag.first_error()->location->line, 3U);
  EXPECT_EQ(bag.first_error()->notes.size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.errors().size(), 1U);
}

TEST(Result, AndThenShortCircuits)
{
  using IntResult = cfgcat::Result<int>;

  int calls = 0;
  auto failed = IntResult::fail(Diagnostic::error(DiagnosticKind::InternalError, "boom"))
                  .and_then([&calls](int v) {
                    ++calls;
                    return IntResult::ok(v + 1);
                  });
  EXPECT_FALSE(failed);
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(failed.error().message, "boom");

  auto chained = IntResult::ok(1).and_then([](int v) { return IntResult::ok(v * 10); });
  ASSERT_TRUE(chained);
  EXPECT_EQ(chained.value(), 10);
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinter, PrintsHeaderLocationSourceAndNotes)
{
  const std::string path = "/virtual/site.pp";

  std::ostringstream out;
  DiagnosticPrinter plain(out, false);
  plain.add_source(cfgcat::SourceFile(path, "node default {\n  user { 'deploy': uid => 'abc' }\n}\n"));

  Diagnostic diag = Diagnostic::error(
    DiagnosticKind::TypeMismatch, "parameter 'uid' must be an integer, not \"abc\"",
    cfgcat::SourcePosition{path, 2, 3});
  diag.notes.push_back("while validating User[deploy]");
  plain.print(diag);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0003]: parameter 'uid'"), std::string::npos);
  EXPECT_NE(text.find("  --> "), std::string::npos);
  EXPECT_NE(text.find(":2:3"), std::string::npos);
  EXPECT_NE(text.find("    2 |   user { 'deploy': uid => 'abc' }"), std::string::npos);
  EXPECT_NE(text.find("|   ^"), std::string::npos);
  EXPECT_NE(text.find("   = note: while validating User[deploy]"), std::string::npos);
}

TEST(DiagnosticPrinter, WarningsHaveNoCode)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);

  Diagnostic diag;
  diag.severity = Severity::Warning;
  diag.kind = DiagnosticKind::InterpreterError;
  diag.message = "unknown variable '$x'";
  printer.print(diag);

  EXPECT_EQ(out.str().rfind("warning: unknown variable '$x'\n", 0), 0U);
}

TEST(DiagnosticPrinter, PrintAllOrdersByLocation)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);

  DiagnosticBag bag;
  bag.report_error(DiagnosticKind::ParseError, "second").with_location({"/nonexistent/a.pp", 9, 1});
  bag.report_error(DiagnosticKind::InternalError, "unlocated");
  bag.report_error(DiagnosticKind::ParseError, "first").with_location({"/nonexistent/a.pp", 2, 1});
  printer.print_all(bag);

  const std::string text = out.str();
  const auto first = text.find("first");
  const auto second = text.find("second");
  const auto unlocated = text.find("unlocated");
  ASSERT_NE(first, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_LT(second, unlocated);
}

// ============================================================================
// Logger
// ============================================================================

TEST(Logger, FiltersBelowLevelAndPrefixesPriority)
{
  std::ostringstream out;
  cfgcat::Logger logger(cfgcat::k_daemon_logger_name, cfgcat::LogLevel::Notice, &out);

  logger.debug("hidden {}", 1);
  logger.info("hidden too");
  logger.notice("{}: {} resources", "web1", 3);
  logger.warning("careful");

  EXPECT_EQ(out.str(), "NOTICE: web1: 3 resources\nWARNING: careful\n");
  EXPECT_EQ(logger.name(), "cfgcat.daemon");
}

TEST(Logger, ParsesLevelsCaseInsensitively)
{
  EXPECT_EQ(cfgcat::parse_log_level("DEBUG"), cfgcat::LogLevel::Debug);
  EXPECT_EQ(cfgcat::parse_log_level("warn"), cfgcat::LogLevel::Warning);
  EXPECT_FALSE(cfgcat::parse_log_level("verbose").has_value());
}
