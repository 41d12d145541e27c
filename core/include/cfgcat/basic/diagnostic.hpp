// cfgcat/basic/diagnostic.hpp - Diagnostic types for parsing, validation and compilation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/basic/source_manager.hpp"

namespace cfgcat
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Notice,
};

/**
 * What went wrong. Every failed compilation reports exactly one of these.
 */
enum class DiagnosticKind : uint8_t {
  ParseError,
  UnknownParameter,
  TypeMismatch,
  MissingRequired,
  InvalidEnum,
  OutOfRange,
  InvalidFormat,
  EmptyValue,
  NotAbsolute,
  ConflictingAttributes,
  UnresolvedReference,
  InterpreterError,
  CacheComputationError,
  DuplicateResource,
  CatalogTestFailure,
  ConfigError,
  InternalError,
};

/// Stable code for a kind, e.g. "E0003"
[[nodiscard]] std::string_view to_code(DiagnosticKind kind) noexcept;

/// Human-readable kind name, e.g. "type-mismatch"
[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::InternalError;
  std::string message;

  std::optional<SourcePosition> location;
  std::vector<std::string> notes;

  [[nodiscard]] std::string_view code() const noexcept { return to_code(kind); }

  /// "error[E0003]: message" without location or notes
  [[nodiscard]] std::string summary() const;

  static Diagnostic error(
    DiagnosticKind kind, std::string message, std::optional<SourcePosition> location = std::nullopt)
  {
    Diagnostic d;
    d.severity = Severity::Error;
    d.kind = kind;
    d.message = std::move(message);
    d.location = std::move(location);
    return d;
  }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent interface for a diagnostic; registers it into the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_kind(DiagnosticKind kind);

  DiagnosticBuilder & with_location(SourcePosition location);

  DiagnosticBuilder & with_note(std::string note);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(DiagnosticKind kind, std::string message);
  DiagnosticBuilder report_warning(std::string message);
  DiagnosticBuilder report_notice(std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;

  /// First error in report order, if any
  [[nodiscard]] const Diagnostic * first_error() const;

  // Utilities
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace cfgcat
