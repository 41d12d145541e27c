// cfgcat/basic/diagnostic.cpp - Diagnostic implementation
#include "cfgcat/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace cfgcat
{

std::string_view to_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::ParseError:
      return "E0001";
    case DiagnosticKind::UnknownParameter:
      return "E0002";
    case DiagnosticKind::TypeMismatch:
      return "E0003";
    case DiagnosticKind::MissingRequired:
      return "E0004";
    case DiagnosticKind::InvalidEnum:
      return "E0005";
    case DiagnosticKind::OutOfRange:
      return "E0006";
    case DiagnosticKind::InvalidFormat:
      return "E0007";
    case DiagnosticKind::EmptyValue:
      return "E0008";
    case DiagnosticKind::NotAbsolute:
      return "E0009";
    case DiagnosticKind::ConflictingAttributes:
      return "E0010";
    case DiagnosticKind::UnresolvedReference:
      return "E0011";
    case DiagnosticKind::InterpreterError:
      return "E0012";
    case DiagnosticKind::CacheComputationError:
      return "E0013";
    case DiagnosticKind::DuplicateResource:
      return "E0014";
    case DiagnosticKind::CatalogTestFailure:
      return "E0015";
    case DiagnosticKind::ConfigError:
      return "E0016";
    case DiagnosticKind::InternalError:
      return "E0099";
  }
  return "E0099";
}

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::ParseError:
      return "parse-error";
    case DiagnosticKind::UnknownParameter:
      return "unknown-parameter";
    case DiagnosticKind::TypeMismatch:
      return "type-mismatch";
    case DiagnosticKind::MissingRequired:
      return "missing-required";
    case DiagnosticKind::InvalidEnum:
      return "invalid-enum";
    case DiagnosticKind::OutOfRange:
      return "out-of-range";
    case DiagnosticKind::InvalidFormat:
      return "invalid-format";
    case DiagnosticKind::EmptyValue:
      return "empty-value";
    case DiagnosticKind::NotAbsolute:
      return "not-absolute";
    case DiagnosticKind::ConflictingAttributes:
      return "conflicting-attributes";
    case DiagnosticKind::UnresolvedReference:
      return "unresolved-reference";
    case DiagnosticKind::InterpreterError:
      return "interpreter-error";
    case DiagnosticKind::CacheComputationError:
      return "cache-computation-error";
    case DiagnosticKind::DuplicateResource:
      return "duplicate-resource";
    case DiagnosticKind::CatalogTestFailure:
      return "catalog-test-failure";
    case DiagnosticKind::ConfigError:
      return "config-error";
    case DiagnosticKind::InternalError:
      return "internal-error";
  }
  return "internal-error";
}

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Notice:
      return "notice";
  }
  return "error";
}

std::string Diagnostic::summary() const
{
  std::string out(to_string(severity));
  if (severity == Severity::Error) {
    out += "[";
    out += code();
    out += "]";
  }
  out += ": ";
  out += message;
  return out;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_kind(DiagnosticKind kind)
{
  diagnostic_.kind = kind;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_location(SourcePosition location)
{
  diagnostic_.location = std::move(location);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(DiagnosticKind kind, std::string message)
{
  return {*this, Diagnostic::error(kind, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.kind = DiagnosticKind::InterpreterError;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_notice(std::string message)
{
  Diagnostic d;
  d.severity = Severity::Notice;
  d.kind = DiagnosticKind::InterpreterError;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity != Severity::Error; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

const Diagnostic * DiagnosticBag::first_error() const
{
  for (const auto & d : diagnostics_) {
    if (d.severity == Severity::Error) {
      return &d;
    }
  }
  return nullptr;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace cfgcat
